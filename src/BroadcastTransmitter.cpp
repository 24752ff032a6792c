#include "BroadcastTransmitter.h"

BroadcastTransmitter::BroadcastTransmitter(const SyncConfig &config, RadioDriver &radio, SyncLog &log)
    : _config(config), _radio(radio), _log(log)
{
    reset();
}

void BroadcastTransmitter::reset() {
    _sequence = 0;
    _lastPublishMs = 0;
    _hasPublished = false;
    _publishCount = 0;
    _failCount = 0;
    _reclaimCount = 0;
    _token[0] = '\0';
}

RadioStatus BroadcastTransmitter::seed() {
    if (FrameCodec::encode(darkFrame(0), _token, sizeof(_token)) == 0) return RadioStatus::TRANSIENT;
    RadioStatus status = _publish(_token);
    if (status != RadioStatus::OK) {
        _log.printf(LOG_TX, "[RingSync TX] Initial advertising deferred: %s", radioStatusName(status));
    }
    return status;
}

RadioStatus BroadcastTransmitter::tick(uint32_t nowMs, const VisualFrame &frame) {
    if (_hasPublished && nowMs - _lastPublishMs < _config.advertisePeriodMs) {
        return RadioStatus::OK;
    }
    // Failed publishes still wait a full period before retrying
    _lastPublishMs = nowMs;
    _hasPublished = true;

    _sequence = (uint8_t)(_sequence + 1);
    VisualFrame stamped = frame;
    stamped.sequence = _sequence;
    if (FrameCodec::encode(stamped, _token, sizeof(_token)) == 0) {
        _failCount++;
        _log.error("[RingSync ERROR] Token does not fit advertisement");
        return RadioStatus::TRANSIENT;
    }
    if (_sequence % 20 == 0) {
        _log.printf(LOG_TX, "[RingSync TX] ADV: %s", _token);
    }

    RadioStatus status = _publish(_token);
    if (status == RadioStatus::OK && _sequence % 50 == 0) {
        _log.printf(LOG_TX, "[RingSync TX] Broadcasting: %s", _token);
    } else if (status == RadioStatus::TRANSIENT && _sequence % 20 == 0) {
        _log.printf(LOG_TX, "[RingSync TX] ADV err: %s", radioStatusName(status));
    }
    return status;
}

RadioStatus BroadcastTransmitter::stop() {
    RadioStatus status = _radio.stopAdvertising();
    return status == RadioStatus::NOT_ADVERTISING ? RadioStatus::OK : status;
}

RadioStatus BroadcastTransmitter::_publish(const char *token) {
    // The name can only be replaced while advertising is stopped.
    // Not advertising yet, or a transient stop failure, is fine here.
    RadioStatus status = _radio.stopAdvertising();
    if (status == RadioStatus::OK || status == RadioStatus::NOT_ADVERTISING || status == RadioStatus::TRANSIENT) {
        status = _radio.startAdvertising(token);
    }

    switch (status) {
        case RadioStatus::OK:
            _publishCount++;
            break;
        case RadioStatus::NO_MEMORY:
            _failCount++;
            _reclaimCount++;
            _log.error("[RingSync ERROR] Out of memory while advertising, reclaiming");
            _radio.reclaim();
            break;
        case RadioStatus::UNAVAILABLE:
            _failCount++;
            _log.error("[RingSync ERROR] Radio unavailable while advertising");
            break;
        default:
            _failCount++;
            break;
    }
    return status;
}
