#pragma once
#include <stdint.h>

// Result of every radio call. Callers retry TRANSIENT next tick,
// reclaim on NO_MEMORY and fall back to local-only on UNAVAILABLE.
enum class RadioStatus : uint8_t {
    OK,
    NOT_ADVERTISING,  // stopAdvertising() while idle, not an error
    TRANSIENT,        // call failed, retry next tick
    NO_MEMORY,        // allocation failed, run reclaim() before retrying
    UNAVAILABLE       // radio hardware absent or not initialized
};

const char *radioStatusName(RadioStatus status);

class ScanListener {
public:
    virtual ~ScanListener() {}
    // Called once per received advertisement name.
    // Return true to end the scan burst early.
    virtual bool onAdvertisement(const char *name, int8_t rssi) = 0;
};

// Connectionless advertising radio
class RadioDriver {
public:
    virtual ~RadioDriver() {}

    virtual RadioStatus begin() = 0;
    virtual void end() = 0;

    // Replaces the advertised name only after stopAdvertising()
    virtual RadioStatus startAdvertising(const char *name) = 0;
    virtual RadioStatus stopAdvertising() = 0;

    // Blocks for up to timeoutMs delivering names to listener
    virtual RadioStatus scan(uint32_t timeoutMs, bool active, ScanListener &listener) = 0;
    virtual RadioStatus stopScan() = 0;

    // Emergency release of cached scan results and queues
    virtual void reclaim() = 0;
};

// Stand-in for boards without radio hardware; every call is UNAVAILABLE
class NoRadio : public RadioDriver {
public:
    RadioStatus begin() override { return RadioStatus::UNAVAILABLE; }
    void end() override {}
    RadioStatus startAdvertising(const char *) override { return RadioStatus::UNAVAILABLE; }
    RadioStatus stopAdvertising() override { return RadioStatus::NOT_ADVERTISING; }
    RadioStatus scan(uint32_t, bool, ScanListener &) override { return RadioStatus::UNAVAILABLE; }
    RadioStatus stopScan() override { return RadioStatus::OK; }
    void reclaim() override {}
};
