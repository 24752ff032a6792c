#pragma once
#include <Arduino.h>
#include <WiFi.h>
#include <esp_now.h>
#include "FrameCodec.h"
#include "RadioDriver.h"

#ifndef RINGSYNC_RX_QUEUE_LEN
    #define RINGSYNC_RX_QUEUE_LEN 8  // Tokens buffered between the WiFi task and a scan burst
#endif

// User callback for ESP-NOW messages that are not sync tokens
typedef void (*ESPNowRecvCallback)(const uint8_t *mac, const uint8_t *data, int len);

// ESP-NOW broadcast transport. The advertised name is sent as the whole
// payload to the broadcast peer each time advertising starts; a scan
// burst drains tokens received while scanning.
class EspNowRadio : public RadioDriver {
public:
    EspNowRadio(bool registerCallback = true);

    RadioStatus begin() override;
    void end() override;
    RadioStatus startAdvertising(const char *name) override;
    RadioStatus stopAdvertising() override;
    RadioStatus scan(uint32_t timeoutMs, bool active, ScanListener &listener) override;
    RadioStatus stopScan() override;
    void reclaim() override;

    // Option 1: Manual receive handling for custom ESP-NOW integration
    bool handleReceive(const uint8_t *mac, const uint8_t *data, int len, int8_t rssi = 0);

    // Option 2: Callback chaining for automatic forwarding of non-sync packets
    void setUserCallback(ESPNowRecvCallback callback);

    uint32_t droppedCount() const { return _dropped; }

private:
    struct RxSlot {
        char   name[RINGSYNC_TOKEN_MAX_LEN + 1];
        int8_t rssi;
    };

    uint8_t bcastAddr[6] = {0xFF,0xFF,0xFF,0xFF,0xFF,0xFF};
    bool     _registerCallback;
    bool     _started;
    bool     _advertising;
    volatile bool _scanning;
    ESPNowRecvCallback _userCallback;

    RxSlot   _queue[RINGSYNC_RX_QUEUE_LEN];
    uint8_t  _head;
    uint8_t  _count;
    uint32_t _dropped;
    portMUX_TYPE _mux = portMUX_INITIALIZER_UNLOCKED;

    #if ESP_IDF_VERSION >= ESP_IDF_VERSION_VAL(5, 0, 0)
    static void _onReceive(const esp_now_recv_info *recv_info, const uint8_t *data, int len);
    #else
    static void _onReceive(const uint8_t *mac, const uint8_t *data, int len);
    #endif
    static EspNowRadio* _instance;

    bool _pop(RxSlot &slot);
    void _clearQueue();
};
