#pragma once
#include <stdint.h>
#include "BroadcastTransmitter.h"
#include "FrameCodec.h"
#include "LeaderAnimator.h"
#include "Palette.h"
#include "PixelSink.h"
#include "RadioDriver.h"
#include "RenderReconstructor.h"
#include "RingSyncConfig.h"
#include "RingSyncLog.h"
#include "RoleStateMachine.h"
#include "ScanningReceiver.h"

// Diagnostic snapshot, does not drive protocol behavior
struct SyncHealth {
    SyncRole role;
    bool     radioActive;
    bool     localOnly;
    uint8_t  sequence;            // Leader: last published sequence
    uint32_t publishCount;
    uint32_t publishFailCount;
    uint32_t successCount;        // Follower: new frames rendered
    uint32_t failCount;           // Follower: malformed tokens
    uint8_t  successRatePercent;
    bool     hasLastSeen;
    uint32_t lastSeenAgeMs;
    uint32_t lossCount;
    uint32_t reclaimCount;
};

// Leader/follower ring synchronization over connectionless broadcasts.
// Call loop() once per main-loop pass with the role chosen by the user;
// a role change takes effect on that call.
class RingSync {
public:
    // radio may be nullptr on boards without radio hardware.
    // clock must return monotonic milliseconds.
    RingSync(RadioDriver *radio, PixelSink &pixels, ClockFn clock, const SyncConfig &config = SyncConfig());

    void begin();
    void loop(SyncRole role, const AudioLevels *audio = nullptr);

    // Stops advertising and scanning and clears the ring. Safe to call repeatedly.
    void cleanup();

    // Retries radio initialization for the current role.
    // Returns true if the radio is active afterwards.
    bool enableRadio();

    void setResponsiveness(Responsiveness mode);
    bool setCustomResponsiveness(uint16_t periodMs, float alpha);

    // Debug log control
    void setDebugLog(uint8_t flags) { _log.setFlags(flags); }
    void setLogSink(LogFn sink) { _log.setSink(sink); }

    const SyncConfig &config() const { return _config; }
    const RoleState &roleState() const { return _state; }
    const VisualFrame &leaderFrame() const { return _animator.currentFrame(); }
    const PeerSyncState &peerState() const { return _receiver.state(); }
    SyncHealth health() const;

private:
    void _apply(const RoleTransition &t);
    void _teardownRadio();
    bool _startRadio();
    void _enterRadioRole();
    void _onRadioStatus(RadioStatus status);
    void _reportHealth(uint32_t nowMs);

    SyncConfig           _config;
    bool                 _configAdjusted;
    SyncLog              _log;
    NoRadio              _noRadio;
    RadioDriver         &_radio;
    PixelSink           &_pixels;
    ClockFn              _clock;
    LeaderAnimator       _animator;
    BroadcastTransmitter _transmitter;
    RenderReconstructor  _renderer;
    ScanningReceiver     _receiver;
    RoleState            _state;
    uint32_t             _lastHealthReportMs;
};
