#include "ScanningReceiver.h"

void PeerSyncState::reset() {
    hasSequence = false;
    lastSequence = 0;
    hasPeer = false;
    lastSeenMs = 0;
    successCount = 0;
    failCount = 0;
    smoothed.zero();
}

void PeerSyncState::forgetPeer() {
    hasSequence = false;
    hasPeer = false;
    smoothed.zero();
}

ScanningReceiver::ScanningReceiver(const SyncConfig &config, RadioDriver &radio, RenderReconstructor &renderer,
                                   ClockFn clock, SyncLog &log)
    : _config(config), _radio(radio), _renderer(renderer), _clock(clock), _log(log)
{
    reset();
}

void ScanningReceiver::reset() {
    _state.reset();
    _validThisBurst = false;
    _receivedThisBurst = 0;
    _lossCount = 0;
    _scanErrorCount = 0;
    _reclaimCount = 0;
}

bool ScanningReceiver::lastSeenAge(uint32_t nowMs, uint32_t &ageMs) const {
    if (!_state.hasPeer) return false;
    ageMs = nowMs - _state.lastSeenMs;
    return true;
}

RadioStatus ScanningReceiver::burst() {
    _validThisBurst = false;
    _receivedThisBurst = 0;

    RadioStatus status = _radio.scan(_config.scanBurstMs, true, *this);
    RadioStatus stopped = _radio.stopScan();
    if (stopped != RadioStatus::OK) {
        _log.printf(LOG_RX, "[RingSync RX] Stop scan err: %s", radioStatusName(stopped));
    }

    switch (status) {
        case RadioStatus::OK:
            break;
        case RadioStatus::NO_MEMORY:
            _scanErrorCount++;
            _reclaimCount++;
            _log.error("[RingSync ERROR] Out of memory while scanning, reclaiming");
            _radio.reclaim();
            break;
        case RadioStatus::UNAVAILABLE:
            _scanErrorCount++;
            _log.error("[RingSync ERROR] Radio unavailable while scanning");
            return status;
        default:
            _scanErrorCount++;
            _log.printf(LOG_RX, "[RingSync RX] Scan err: %s", radioStatusName(status));
            break;
    }

    if (!_validThisBurst && _state.hasPeer) {
        uint32_t now = _clock();
        if (now - _state.lastSeenMs >= _config.lossTimeoutMs) {
            _log.printf(LOG_RENDER, "[RingSync RENDER] Leader lost, clearing");
            _renderer.clear(_state.smoothed);
            _state.forgetPeer();
            _lossCount++;
        }
    }
    return status;
}

bool ScanningReceiver::onAdvertisement(const char *name, int8_t rssi) {
    // Foreign traffic counts neither as success nor failure
    if (!FrameCodec::hasPrefix(name)) return false;
    if (rssi < _config.minimumRssi) return false;

    if (_receivedThisBurst == 0) {
        _log.printf(LOG_RX, "[RingSync RX] Received: %s", name);
    }
    if (_receivedThisBurst < 0xFF) _receivedThisBurst++;

    VisualFrame frame;
    if (!FrameCodec::decode(name, frame)) {
        _state.failCount++;
        _log.printf(LOG_RX, "[RingSync RX] Parse failed for: %s", name);
        return false;
    }

    uint32_t now = _clock();
    _validThisBurst = true;
    _state.hasPeer = true;
    _state.lastSeenMs = now;

    if (_state.hasSequence && frame.sequence == _state.lastSequence) {
        return false;  // duplicate
    }

    _state.hasSequence = true;
    _state.lastSequence = frame.sequence;
    _state.successCount++;
    _renderer.render(_state.smoothed, frame, now);

    if (frame.sequence % 20 == 0) {
        _log.printf(LOG_RENDER, "[RingSync RENDER] Rendered seq=%u (%u,%u,%u) (%u,%u,%u) (%u,%u,%u)",
                    (unsigned)frame.sequence,
                    (unsigned)frame.triples[0].position, (unsigned)frame.triples[0].intensity,
                    (unsigned)frame.triples[0].colorType,
                    (unsigned)frame.triples[1].position, (unsigned)frame.triples[1].intensity,
                    (unsigned)frame.triples[1].colorType,
                    (unsigned)frame.triples[2].position, (unsigned)frame.triples[2].intensity,
                    (unsigned)frame.triples[2].colorType);
    }
    // One new frame per burst keeps latency low
    return true;
}
