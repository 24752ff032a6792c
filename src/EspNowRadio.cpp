#include "EspNowRadio.h"

EspNowRadio* EspNowRadio::_instance = nullptr;

EspNowRadio::EspNowRadio(bool registerCallback)
    : _registerCallback(registerCallback), _started(false), _advertising(false), _scanning(false),
      _userCallback(nullptr), _head(0), _count(0), _dropped(0)
{
    _instance = this;
}

RadioStatus EspNowRadio::begin() {
    if (_started) return RadioStatus::OK;

    WiFi.mode(WIFI_STA);
    if(esp_now_init() != ESP_OK) {
        Serial.println("[EspNowRadio] ESP-NOW INIT FAILED");
        Serial.flush();
        return RadioStatus::UNAVAILABLE;
    }

    // Only register callback if requested (allows user to handle ESP-NOW manually)
    if (_registerCallback) {
        esp_now_register_recv_cb(_onReceive);
    }

    // Add broadcast peer
    esp_now_peer_info_t peerInfo = {};
    memcpy(peerInfo.peer_addr, bcastAddr, 6);
    peerInfo.channel = 0;
    peerInfo.encrypt = false;
    if(!esp_now_is_peer_exist(bcastAddr) && esp_now_add_peer(&peerInfo) != ESP_OK) {
        Serial.println("[EspNowRadio] Failed to add broadcast peer");
        Serial.flush();
        esp_now_deinit();
        return RadioStatus::UNAVAILABLE;
    }

    _started = true;
    Serial.println("[EspNowRadio] Started.");
    Serial.flush();
    return RadioStatus::OK;
}

void EspNowRadio::end() {
    if (!_started) return;
    _scanning = false;
    _advertising = false;
    if (_registerCallback) esp_now_unregister_recv_cb();
    esp_now_deinit();
    _clearQueue();
    _started = false;
}

RadioStatus EspNowRadio::startAdvertising(const char *name) {
    if (!_started) return RadioStatus::UNAVAILABLE;
    size_t len = strlen(name);
    if (len == 0 || len > RINGSYNC_TOKEN_MAX_LEN) return RadioStatus::TRANSIENT;

    esp_err_t result = esp_now_send(bcastAddr, (const uint8_t*)name, len);
    switch (result) {
        case ESP_OK:
            _advertising = true;
            return RadioStatus::OK;
        case ESP_ERR_ESPNOW_NO_MEM:
            return RadioStatus::NO_MEMORY;
        case ESP_ERR_ESPNOW_NOT_INIT:
            return RadioStatus::UNAVAILABLE;
        default:
            return RadioStatus::TRANSIENT;
    }
}

RadioStatus EspNowRadio::stopAdvertising() {
    if (!_advertising) return RadioStatus::NOT_ADVERTISING;
    _advertising = false;
    return RadioStatus::OK;
}

RadioStatus EspNowRadio::scan(uint32_t timeoutMs, bool active, ScanListener &listener) {
    (void)active;  // ESP-NOW has no scan requests
    if (!_started) return RadioStatus::UNAVAILABLE;

    _clearQueue();
    _scanning = true;

    uint32_t start = millis();
    RxSlot slot;
    while (millis() - start < timeoutMs) {
        if (_pop(slot)) {
            if (listener.onAdvertisement(slot.name, slot.rssi)) break;
            continue;
        }
        delay(1);
    }
    return RadioStatus::OK;
}

RadioStatus EspNowRadio::stopScan() {
    _scanning = false;
    _clearQueue();
    return RadioStatus::OK;
}

void EspNowRadio::reclaim() {
    _clearQueue();
    Serial.printf("[EspNowRadio] Reclaimed rx queue, free heap %u bytes\n", (unsigned)ESP.getFreeHeap());
    Serial.flush();
}

bool EspNowRadio::handleReceive(const uint8_t *mac, const uint8_t *data, int len, int8_t rssi) {
    (void)mac;
    // Only sync tokens are claimed; everything else goes to the user callback
    if(len <= 0 || len > RINGSYNC_TOKEN_MAX_LEN) return false;
    if(!FrameCodec::hasPrefix((const char*)data, (size_t)len)) return false;

    if (!_scanning) return true;  // Claimed but not wanted between bursts

    portENTER_CRITICAL(&_mux);
    if (_count == RINGSYNC_RX_QUEUE_LEN) {
        // Drop the oldest token
        _head = (_head + 1) % RINGSYNC_RX_QUEUE_LEN;
        _count--;
        _dropped++;
    }
    RxSlot &slot = _queue[(_head + _count) % RINGSYNC_RX_QUEUE_LEN];
    memcpy(slot.name, data, len);
    slot.name[len] = '\0';
    slot.rssi = rssi;
    _count++;
    portEXIT_CRITICAL(&_mux);
    return true;
}

void EspNowRadio::setUserCallback(ESPNowRecvCallback callback) {
    _userCallback = callback;
}

bool EspNowRadio::_pop(RxSlot &slot) {
    bool found = false;
    portENTER_CRITICAL(&_mux);
    if (_count > 0) {
        slot = _queue[_head];
        _head = (_head + 1) % RINGSYNC_RX_QUEUE_LEN;
        _count--;
        found = true;
    }
    portEXIT_CRITICAL(&_mux);
    return found;
}

void EspNowRadio::_clearQueue() {
    portENTER_CRITICAL(&_mux);
    _head = 0;
    _count = 0;
    portEXIT_CRITICAL(&_mux);
}

#if ESP_IDF_VERSION >= ESP_IDF_VERSION_VAL(5, 0, 0)
void EspNowRadio::_onReceive(const esp_now_recv_info *recv_info, const uint8_t *data, int len) {
    if(_instance) {
        // Extract MAC address and signal strength from recv_info (new API)
        const uint8_t *mac = recv_info->src_addr;
        int8_t rssi = recv_info->rx_ctrl ? (int8_t)recv_info->rx_ctrl->rssi : 0;

        bool handled = _instance->handleReceive(mac, data, len, rssi);

        // If not a sync token and user callback is set, forward to user
        if (!handled && _instance->_userCallback) {
            _instance->_userCallback(mac, data, len);
        }
    }
}
#else
void EspNowRadio::_onReceive(const uint8_t *mac, const uint8_t *data, int len) {
    if(_instance) {
        // Old API carries no signal strength
        bool handled = _instance->handleReceive(mac, data, len);

        if (!handled && _instance->_userCallback) {
            _instance->_userCallback(mac, data, len);
        }
    }
}
#endif
