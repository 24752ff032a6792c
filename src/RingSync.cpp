#include "RingSync.h"

RingSync::RingSync(RadioDriver *radio, PixelSink &pixels, ClockFn clock, const SyncConfig &config)
    : _config(config), _configAdjusted(!_config.validate()), _log(),
      _radio(radio ? *radio : _noRadio), _pixels(pixels), _clock(clock),
      _animator(_config, pixels), _transmitter(_config, _radio, _log),
      _renderer(_config, pixels), _receiver(_config, _radio, _renderer, clock, _log),
      _state(initialRoleState()), _lastHealthReportMs(0)
{
}

void RingSync::begin() {
    uint32_t now = _clock();
    _lastHealthReportMs = now;
    _animator.reset(now);
    clearRing(_pixels);

    if (_configAdjusted) {
        _log.error("[RingSync ERROR] Config out of range, clamped (adv %ums, alpha %.2f)",
                   (unsigned)_config.advertisePeriodMs, (double)_config.smoothingAlpha);
    }
    _log.printf(LOG_ROLE, "[RingSync ROLE] Started. Radio %s, adv %ums, alpha %.2f",
                _config.radioEnabled ? "EN" : "DIS",
                (unsigned)_config.advertisePeriodMs, (double)_config.smoothingAlpha);
}

void RingSync::loop(SyncRole role, const AudioLevels *audio) {
    _apply(nextRoleState(_state, role, _config.radioEnabled));
    if (_state.role == SyncRole::UNINITIALIZED) return;

    uint32_t now = _clock();
    if (!_state.radioActive) {
        // Local fallback: keep the pattern going without sync
        _animator.tick(now, audio);
    } else if (_state.role == SyncRole::LEADING) {
        // Draw first, then advertise, so local visuals stay smooth
        _animator.tick(now, audio);
        _onRadioStatus(_transmitter.tick(now, _animator.currentFrame()));
    } else {
        _onRadioStatus(_receiver.burst());
    }

    _reportHealth(_clock());
}

void RingSync::cleanup() {
    _apply(nextRoleState(_state, SyncRole::UNINITIALIZED, _config.radioEnabled));
    clearRing(_pixels);
    _log.printf(LOG_ROLE, "[RingSync ROLE] Cleanup complete");
}

bool RingSync::enableRadio() {
    _config.radioEnabled = true;
    if (_state.radioActive) {
        _log.printf(LOG_ROLE, "[RingSync ROLE] Radio already active");
        return true;
    }
    if (_state.role == SyncRole::UNINITIALIZED) return false;

    bool ok = _startRadio();
    _state = afterRadioInit(_state, ok);
    if (ok) _enterRadioRole();
    return ok;
}

void RingSync::setResponsiveness(Responsiveness mode) {
    _config.setResponsiveness(mode);
    _config.validate();
    _log.printf(LOG_ROLE, "[RingSync ROLE] Responsiveness set to %s (adv %ums, alpha %.2f)",
                responsivenessName(mode), (unsigned)_config.advertisePeriodMs, (double)_config.smoothingAlpha);
}

bool RingSync::setCustomResponsiveness(uint16_t periodMs, float alpha) {
    if (!_config.setResponsiveness(periodMs, alpha)) {
        _log.error("[RingSync ERROR] Responsiveness out of range (adv 50-%ums, alpha 0.50-0.95)",
                   (unsigned)_config.maxAdvertisePeriodMs());
        return false;
    }
    _config.validate();
    _log.printf(LOG_ROLE, "[RingSync ROLE] Custom responsiveness (adv %ums, alpha %.2f)",
                (unsigned)_config.advertisePeriodMs, (double)_config.smoothingAlpha);
    return true;
}

SyncHealth RingSync::health() const {
    const PeerSyncState &peer = _receiver.state();
    SyncHealth h;
    h.role = _state.role;
    h.radioActive = _state.radioActive;
    h.localOnly = _state.localOnly;
    h.sequence = _transmitter.sequence();
    h.publishCount = _transmitter.publishCount();
    h.publishFailCount = _transmitter.failCount();
    h.successCount = peer.successCount;
    h.failCount = peer.failCount;
    uint32_t total = peer.successCount + peer.failCount;
    h.successRatePercent = total ? (uint8_t)((peer.successCount * 100ull) / total) : 0;
    h.lastSeenAgeMs = 0;
    h.hasLastSeen = _receiver.lastSeenAge(_clock(), h.lastSeenAgeMs);
    h.lossCount = _receiver.lossCount();
    h.reclaimCount = _transmitter.reclaimCount() + _receiver.reclaimCount();
    return h;
}

void RingSync::_apply(const RoleTransition &t) {
    if (t.actions & ACTION_TEARDOWN_RADIO) _teardownRadio();
    _state = t.next;

    uint32_t now = _clock();
    if (t.actions & ACTION_RESET_ANIMATOR) _animator.reset(now);
    if (t.actions & ACTION_RESET_PEER) {
        _receiver.reset();
        _renderer.reset();
        clearRing(_pixels);
    }
    if (t.actions & ACTION_INIT_RADIO) {
        bool ok = _startRadio();
        _state = afterRadioInit(_state, ok);
        if (ok && (t.actions & ACTION_SEED_ADVERTISING)) _enterRadioRole();
    }
    if (t.actions & ACTION_ANNOUNCE) {
        const char *sync = _state.radioActive ? "enabled" : (_state.localOnly ? "local only" : "disabled");
        _log.printf(LOG_ROLE, "[RingSync ROLE] Role: %s (sync %s)", syncRoleName(_state.role), sync);
    }
}

void RingSync::_teardownRadio() {
    RadioStatus status = _transmitter.stop();
    if (status != RadioStatus::OK) {
        _log.printf(LOG_ROLE, "[RingSync ROLE] Stop advertising: %s", radioStatusName(status));
    }
    status = _radio.stopScan();
    if (status != RadioStatus::OK) {
        _log.printf(LOG_ROLE, "[RingSync ROLE] Stop scan: %s", radioStatusName(status));
    }
    _radio.end();
    _state = afterRadioLoss(_state);
}

bool RingSync::_startRadio() {
    RadioStatus status = _radio.begin();
    if (status != RadioStatus::OK) {
        _log.error("[RingSync ERROR] Radio init failed: %s", radioStatusName(status));
        return false;
    }
    _log.printf(LOG_ROLE, "[RingSync ROLE] Radio initialized");
    return true;
}

void RingSync::_enterRadioRole() {
    if (_state.role == SyncRole::LEADING) {
        _transmitter.reset();
        _onRadioStatus(_transmitter.seed());
    } else if (_state.role == SyncRole::FOLLOWING) {
        _receiver.reset();
        _renderer.reset();
        clearRing(_pixels);
    }
}

void RingSync::_onRadioStatus(RadioStatus status) {
    if (status != RadioStatus::UNAVAILABLE || !_state.radioActive) return;
    _log.error("[RingSync ERROR] Radio lost, continuing local only");
    _teardownRadio();
    _animator.reset(_clock());
}

void RingSync::_reportHealth(uint32_t nowMs) {
    if (nowMs - _lastHealthReportMs < _config.healthReportMs) return;
    _lastHealthReportMs = nowMs;
    if (!_log.enabled(LOG_HEALTH)) return;

    if (_state.role == SyncRole::LEADING) {
        _log.printf(LOG_HEALTH, "[RingSync HEALTH] Leader: seq %u, %lu published, %lu failed, %lu reclaims",
                    (unsigned)_transmitter.sequence(), (unsigned long)_transmitter.publishCount(),
                    (unsigned long)_transmitter.failCount(), (unsigned long)_transmitter.reclaimCount());
        return;
    }

    const PeerSyncState &peer = _receiver.state();
    uint32_t total = peer.successCount + peer.failCount;
    if (total == 0) return;
    uint32_t lag = 0;
    _receiver.lastSeenAge(nowMs, lag);
    _log.printf(LOG_HEALTH, "[RingSync HEALTH] Sync: %lu%% success (%lu/%lu), lag: %lums",
                (unsigned long)((peer.successCount * 100ull) / total), (unsigned long)peer.successCount,
                (unsigned long)total, (unsigned long)lag);
}
