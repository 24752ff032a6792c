#pragma once
#include <stdint.h>

// Tuning defaults, overridable at build time
#ifndef RINGSYNC_ADV_PERIOD_MS
    #define RINGSYNC_ADV_PERIOD_MS 80      // Leader broadcast refresh period
#endif
#ifndef RINGSYNC_SMOOTH_ALPHA
    #define RINGSYNC_SMOOTH_ALPHA 0.90f    // Follower smoothing factor, higher is snappier
#endif
#ifndef RINGSYNC_SCAN_BURST_MS
    #define RINGSYNC_SCAN_BURST_MS 200     // Follower scan burst duration
#endif
#ifndef RINGSYNC_LOSS_TIMEOUT_MS
    #define RINGSYNC_LOSS_TIMEOUT_MS 3000  // Follower clears after this long without frames
#endif
#ifndef RINGSYNC_MIN_RENDER_MS
    #define RINGSYNC_MIN_RENDER_MS 15      // ~66 FPS render ceiling
#endif
#ifndef RINGSYNC_MIN_RSSI
    #define RINGSYNC_MIN_RSSI -90          // Weaker advertisements are ignored
#endif
#ifndef RINGSYNC_HEALTH_REPORT_MS
    #define RINGSYNC_HEALTH_REPORT_MS 30000
#endif
#ifndef RINGSYNC_IDLE_STEP_MS
    #define RINGSYNC_IDLE_STEP_MS 150      // Leader visual step, bounds the advertise period
#endif

#define RINGSYNC_ADV_PERIOD_MIN_MS  50
#define RINGSYNC_ADV_PERIOD_MAX_MS  200
#define RINGSYNC_ALPHA_MIN          0.5f
#define RINGSYNC_ALPHA_MAX          0.95f
#define RINGSYNC_IDLE_STEP_MIN_MS   100
#define RINGSYNC_IDLE_STEP_MAX_MS   1000
#define RINGSYNC_SCAN_BURST_MIN_MS  20
#define RINGSYNC_SCAN_BURST_MAX_MS  1000

// Monotonic millisecond clock
typedef uint32_t (*ClockFn)();

enum class Responsiveness {
    FAST,      // 50ms advertisements, alpha 0.95
    BALANCED,  // 80ms advertisements, alpha 0.90
    SMOOTH     // 120ms advertisements, alpha 0.70
};

struct SyncConfig {
    uint16_t advertisePeriodMs = RINGSYNC_ADV_PERIOD_MS;
    float    smoothingAlpha    = RINGSYNC_SMOOTH_ALPHA;
    uint16_t scanBurstMs       = RINGSYNC_SCAN_BURST_MS;
    uint32_t lossTimeoutMs     = RINGSYNC_LOSS_TIMEOUT_MS;
    uint16_t minRenderMs       = RINGSYNC_MIN_RENDER_MS;
    bool     radioEnabled      = true;
    int8_t   minimumRssi       = RINGSYNC_MIN_RSSI;
    uint32_t healthReportMs    = RINGSYNC_HEALTH_REPORT_MS;
    uint16_t idleStepMs        = RINGSYNC_IDLE_STEP_MS;

    // Clamps every field into its supported range.
    // Returns true if the config was already valid.
    bool validate();

    // Sets advertisePeriodMs and smoothingAlpha together.
    // Leaves the config untouched and returns false if either is out of range
    // or the period is longer than idleStepMs.
    bool setResponsiveness(uint16_t periodMs, float alpha);
    void setResponsiveness(Responsiveness mode);

    // Longest advertise period this config accepts
    uint16_t maxAdvertisePeriodMs() const;

    static SyncConfig preset(Responsiveness mode);
};

const char *responsivenessName(Responsiveness mode);
