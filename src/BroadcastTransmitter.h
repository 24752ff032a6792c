#pragma once
#include <stdint.h>
#include "FrameCodec.h"
#include "RadioDriver.h"
#include "RingSyncConfig.h"
#include "RingSyncLog.h"

// Leader-side publisher. Re-encodes the current frame at most once per
// advertisePeriodMs and replaces the advertisement with stop-then-start.
class BroadcastTransmitter {
public:
    BroadcastTransmitter(const SyncConfig &config, RadioDriver &radio, SyncLog &log);

    void reset();

    // Publishes the all-zero token so followers see the leader immediately
    RadioStatus seed();

    // Publishes frame under the next sequence number if the period has elapsed.
    // Returns OK when nothing was due.
    RadioStatus tick(uint32_t nowMs, const VisualFrame &frame);

    RadioStatus stop();

    uint8_t  sequence() const { return _sequence; }
    uint32_t publishCount() const { return _publishCount; }
    uint32_t failCount() const { return _failCount; }
    uint32_t reclaimCount() const { return _reclaimCount; }
    const char *lastToken() const { return _token; }

private:
    RadioStatus _publish(const char *token);

    const SyncConfig &_config;
    RadioDriver      &_radio;
    SyncLog          &_log;
    uint8_t           _sequence;
    uint32_t          _lastPublishMs;
    bool              _hasPublished;
    uint32_t          _publishCount;
    uint32_t          _failCount;
    uint32_t          _reclaimCount;
    char              _token[RINGSYNC_TOKEN_MAX_LEN + 1];
};
