#pragma once
#include <stdint.h>
#include "FrameCodec.h"
#include "PixelSink.h"
#include "RingSyncConfig.h"

// Per-channel floating accumulator for the follower's ring
struct SmoothedRing {
    float rgb[RINGSYNC_RING_CELLS][3];

    void zero();
};

// Expands sparse frames into the full ring with exponential smoothing
class RenderReconstructor {
public:
    RenderReconstructor(const SyncConfig &config, PixelSink &pixels);

    void reset();

    // Smooths ring toward frame and draws it.
    // Returns false if skipped because the last render was under minRenderMs ago.
    bool render(SmoothedRing &ring, const VisualFrame &frame, uint32_t nowMs);

    // Zeroes ring and draws an all-dark ring
    void clear(SmoothedRing &ring);

    uint32_t renderCount() const { return _renderCount; }

    // Dense target for every cell, unlisted cells off
    static void expand(const VisualFrame &frame, Rgb target[RINGSYNC_RING_CELLS]);
    // Clamps to 0-255 and rounds half up
    static uint8_t toChannel(float value);

private:
    const SyncConfig &_config;
    PixelSink        &_pixels;
    uint32_t          _lastRenderMs;
    bool              _hasRendered;
    uint32_t          _renderCount;
};
