#pragma once
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>
#include "../../src/RadioDriver.h"
#include "FakeClock.h"

// Radio double: records every call, returns scripted statuses and
// replays one scripted list of advertisements per scan burst.
class ScriptedRadio : public RadioDriver {
public:
    typedef std::vector<std::pair<std::string, int8_t> > Burst;

    RadioStatus beginResult = RadioStatus::OK;
    RadioStatus startResult = RadioStatus::OK;
    RadioStatus scanResult = RadioStatus::OK;

    int beginCalls = 0;
    int endCalls = 0;
    int stopAdvertisingCalls = 0;
    int stopScanCalls = 0;
    int scanCalls = 0;
    int reclaimCalls = 0;
    bool advertising = false;
    std::vector<std::string> published;
    std::vector<std::string> calls;    // "stop" / "start" in order
    size_t lastBurstDelivered = 0;     // names handed to the listener in the last burst

    // Back to a fresh radio between tests
    void reset() { *this = ScriptedRadio(); }

    void queueBurst(const Burst &burst) { _bursts.push_back(burst); }

    void queueNames(const std::vector<std::string> &names, int8_t rssi = -50) {
        Burst burst;
        for (size_t i = 0; i < names.size(); i++) burst.push_back(std::make_pair(names[i], rssi));
        queueBurst(burst);
    }

    RadioStatus begin() override {
        beginCalls++;
        return beginResult;
    }

    void end() override {
        endCalls++;
        advertising = false;
    }

    RadioStatus startAdvertising(const char *name) override {
        calls.push_back("start");
        if (startResult != RadioStatus::OK) return startResult;
        advertising = true;
        published.push_back(name);
        return RadioStatus::OK;
    }

    RadioStatus stopAdvertising() override {
        calls.push_back("stop");
        stopAdvertisingCalls++;
        if (!advertising) return RadioStatus::NOT_ADVERTISING;
        advertising = false;
        return RadioStatus::OK;
    }

    RadioStatus scan(uint32_t timeoutMs, bool active, ScanListener &listener) override {
        scanCalls++;
        lastActive = active;
        lastBurstDelivered = 0;
        if (scanResult != RadioStatus::OK) return scanResult;
        if (!_bursts.empty()) {
            Burst burst = _bursts.front();
            _bursts.erase(_bursts.begin());
            for (size_t i = 0; i < burst.size(); i++) {
                lastBurstDelivered++;
                if (listener.onAdvertisement(burst[i].first.c_str(), burst[i].second)) break;
            }
        }
        fakeNowMs += timeoutMs;
        return RadioStatus::OK;
    }

    RadioStatus stopScan() override {
        stopScanCalls++;
        return RadioStatus::OK;
    }

    void reclaim() override { reclaimCalls++; }

    bool lastActive = false;

private:
    std::vector<Burst> _bursts;
};
