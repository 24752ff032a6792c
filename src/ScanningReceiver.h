#pragma once
#include <stdint.h>
#include "FrameCodec.h"
#include "RadioDriver.h"
#include "RenderReconstructor.h"
#include "RingSyncConfig.h"
#include "RingSyncLog.h"

// Follower-side peer tracking, owned by the receiver
struct PeerSyncState {
    bool         hasSequence;   // false means "none"
    uint8_t      lastSequence;
    bool         hasPeer;       // false until a frame decodes, and again after loss
    uint32_t     lastSeenMs;
    uint32_t     successCount;  // new frames handed to the renderer
    uint32_t     failCount;     // prefixed tokens that failed to decode
    SmoothedRing smoothed;

    void reset();
    void forgetPeer();
};

// Runs bounded scan bursts, filters and deduplicates tokens,
// and clears the ring once the leader goes quiet.
class ScanningReceiver : public ScanListener {
public:
    ScanningReceiver(const SyncConfig &config, RadioDriver &radio, RenderReconstructor &renderer,
                     ClockFn clock, SyncLog &log);

    void reset();

    // One scan burst followed by the loss check
    RadioStatus burst();

    bool onAdvertisement(const char *name, int8_t rssi) override;

    const PeerSyncState &state() const { return _state; }
    uint32_t lossCount() const { return _lossCount; }
    uint32_t scanErrorCount() const { return _scanErrorCount; }
    uint32_t reclaimCount() const { return _reclaimCount; }

    // Milliseconds since the last decoded frame; false if no peer is tracked
    bool lastSeenAge(uint32_t nowMs, uint32_t &ageMs) const;

private:
    const SyncConfig    &_config;
    RadioDriver         &_radio;
    RenderReconstructor &_renderer;
    ClockFn              _clock;
    SyncLog             &_log;
    PeerSyncState        _state;
    bool                 _validThisBurst;
    uint8_t              _receivedThisBurst;
    uint32_t             _lossCount;
    uint32_t             _scanErrorCount;
    uint32_t             _reclaimCount;
};
