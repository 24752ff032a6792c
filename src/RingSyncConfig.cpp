#include "RingSyncConfig.h"

template <typename T>
static bool clampField(T &value, T lo, T hi) {
    if (value < lo) { value = lo; return false; }
    if (value > hi) { value = hi; return false; }
    return true;
}

bool SyncConfig::validate() {
    bool ok = true;
    ok &= clampField<uint16_t>(idleStepMs, RINGSYNC_IDLE_STEP_MIN_MS, RINGSYNC_IDLE_STEP_MAX_MS);
    // Advertising slower than the leader's own step makes followers skip steps
    ok &= clampField<uint16_t>(advertisePeriodMs, RINGSYNC_ADV_PERIOD_MIN_MS, maxAdvertisePeriodMs());
    if (!(smoothingAlpha >= RINGSYNC_ALPHA_MIN)) {  // also catches NaN
        smoothingAlpha = RINGSYNC_ALPHA_MIN;
        ok = false;
    } else if (smoothingAlpha > RINGSYNC_ALPHA_MAX) {
        smoothingAlpha = RINGSYNC_ALPHA_MAX;
        ok = false;
    }
    ok &= clampField<uint16_t>(scanBurstMs, RINGSYNC_SCAN_BURST_MIN_MS, RINGSYNC_SCAN_BURST_MAX_MS);
    // Loss must span several bursts or a single empty burst clears the ring
    uint32_t minLoss = 2u * scanBurstMs;
    if (lossTimeoutMs < minLoss) {
        lossTimeoutMs = minLoss;
        ok = false;
    }
    ok &= clampField<uint16_t>(minRenderMs, 0, 1000);
    if (healthReportMs == 0) {
        healthReportMs = RINGSYNC_HEALTH_REPORT_MS;
        ok = false;
    }
    return ok;
}

bool SyncConfig::setResponsiveness(uint16_t periodMs, float alpha) {
    if (periodMs < RINGSYNC_ADV_PERIOD_MIN_MS || periodMs > maxAdvertisePeriodMs()) return false;
    if (!(alpha >= RINGSYNC_ALPHA_MIN && alpha <= RINGSYNC_ALPHA_MAX)) return false;
    advertisePeriodMs = periodMs;
    smoothingAlpha = alpha;
    return true;
}

void SyncConfig::setResponsiveness(Responsiveness mode) {
    switch (mode) {
        case Responsiveness::FAST:
            advertisePeriodMs = 50;
            smoothingAlpha = 0.95f;
            break;
        case Responsiveness::SMOOTH:
            advertisePeriodMs = 120;
            smoothingAlpha = 0.70f;
            break;
        case Responsiveness::BALANCED:
        default:
            advertisePeriodMs = 80;
            smoothingAlpha = 0.90f;
            break;
    }
}

uint16_t SyncConfig::maxAdvertisePeriodMs() const {
    return idleStepMs < RINGSYNC_ADV_PERIOD_MAX_MS ? idleStepMs : RINGSYNC_ADV_PERIOD_MAX_MS;
}

SyncConfig SyncConfig::preset(Responsiveness mode) {
    SyncConfig config;
    config.setResponsiveness(mode);
    return config;
}

const char *responsivenessName(Responsiveness mode) {
    switch (mode) {
        case Responsiveness::FAST:     return "FAST";
        case Responsiveness::BALANCED: return "BALANCED";
        case Responsiveness::SMOOTH:   return "SMOOTH";
    }
    return "UNKNOWN";
}
