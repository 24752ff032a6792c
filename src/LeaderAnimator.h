#pragma once
#include <stdint.h>
#include "FrameCodec.h"
#include "PixelSink.h"
#include "RingSyncConfig.h"

// Per-tick reactive input from the audio collaborator
struct AudioLevels {
    uint8_t levels[RINGSYNC_RING_CELLS];  // 0-255 per cell
    float   frequencyHz;                  // dominant frequency, drives rotation
};

// Leader-side synthesis. Draws the pattern on the local ring and caches
// the three brightest cells as the frame the transmitter publishes.
class LeaderAnimator {
public:
    LeaderAnimator(const SyncConfig &config, PixelSink &pixels);

    void reset(uint32_t nowMs);

    // audio may be nullptr when no reactive input is available
    void tick(uint32_t nowMs, const AudioLevels *audio);

    const VisualFrame &currentFrame() const { return _frame; }
    bool reactive() const { return _reactive; }

    // Picks the three brightest cells, ties going to the lower index.
    // Unused slots are filled with darkTriple().
    static void selectBrightest(const uint8_t intensity[RINGSYNC_RING_CELLS],
                                const ColorType colors[RINGSYNC_RING_CELLS],
                                PixelTriple out[RINGSYNC_TRIPLES]);

    static ColorType colorForLevel(uint8_t level);

private:
    void _idleStep(uint32_t nowMs);
    void _reactiveStep(uint32_t nowMs, const AudioLevels &audio);
    void _draw(const uint8_t intensity[], const ColorType colors[]);

    const SyncConfig &_config;
    PixelSink        &_pixels;
    VisualFrame       _frame;
    float             _rotation;
    uint32_t          _lastUpdateMs;
    bool              _reactive;
};
