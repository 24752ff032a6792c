#include "LeaderAnimator.h"
#include <math.h>

#define VISIBLE_LEVEL       50     // Quieter cells stay dark
#define ROTATION_PER_HZ_S   0.01f  // Ring cells advanced per Hz per second
#define MAX_ADVANCE         1.0e6f // Larger per-tick advances are treated as bad input

#define COMET_HEAD   120
#define COMET_TRAIL1 80
#define COMET_TRAIL2 50

LeaderAnimator::LeaderAnimator(const SyncConfig &config, PixelSink &pixels)
    : _config(config), _pixels(pixels), _frame(darkFrame()), _rotation(0.0f), _lastUpdateMs(0), _reactive(false)
{
}

void LeaderAnimator::reset(uint32_t nowMs) {
    _frame = darkFrame();
    _rotation = 0.0f;
    _lastUpdateMs = nowMs;
    _reactive = false;
}

void LeaderAnimator::tick(uint32_t nowMs, const AudioLevels *audio) {
    if (audio) {
        _reactiveStep(nowMs, *audio);
    } else {
        _idleStep(nowMs);
    }
}

ColorType LeaderAnimator::colorForLevel(uint8_t level) {
    if (level > 200) return ColorType::RED;
    if (level > 140) return ColorType::GREEN;
    return ColorType::BLUEISH;
}

void LeaderAnimator::selectBrightest(const uint8_t intensity[RINGSYNC_RING_CELLS],
                                     const ColorType colors[RINGSYNC_RING_CELLS],
                                     PixelTriple out[RINGSYNC_TRIPLES]) {
    bool taken[RINGSYNC_RING_CELLS] = {false};
    for (int slot = 0; slot < RINGSYNC_TRIPLES; slot++) {
        int best = -1;
        for (int i = 0; i < RINGSYNC_RING_CELLS; i++) {
            if (taken[i] || intensity[i] == 0) continue;
            // strict > keeps the lower index on ties
            if (best < 0 || intensity[i] > intensity[best]) best = i;
        }
        if (best < 0) {
            out[slot] = darkTriple();
            continue;
        }
        taken[best] = true;
        out[slot].position = (uint8_t)best;
        out[slot].intensity = intensity[best];
        out[slot].colorType = colors[best];
    }
}

void LeaderAnimator::_idleStep(uint32_t nowMs) {
    if (_reactive) {
        // Audio dropped out; restart the comet from the current rotation
        _reactive = false;
        _lastUpdateMs = nowMs;
        return;
    }
    if (nowMs - _lastUpdateMs < _config.idleStepMs) return;
    _lastUpdateMs = nowMs;

    int head = ((int)_rotation + 1) % RINGSYNC_RING_CELLS;
    _rotation = (float)head;

    uint8_t intensity[RINGSYNC_RING_CELLS] = {0};
    ColorType colors[RINGSYNC_RING_CELLS];
    for (int i = 0; i < RINGSYNC_RING_CELLS; i++) colors[i] = ColorType::BLUEISH;

    intensity[head] = COMET_HEAD;
    intensity[(head + RINGSYNC_RING_CELLS - 1) % RINGSYNC_RING_CELLS] = COMET_TRAIL1;
    intensity[(head + RINGSYNC_RING_CELLS - 2) % RINGSYNC_RING_CELLS] = COMET_TRAIL2;

    _draw(intensity, colors);
    selectBrightest(intensity, colors, _frame.triples);
}

void LeaderAnimator::_reactiveStep(uint32_t nowMs, const AudioLevels &audio) {
    float dt = _reactive ? (float)(nowMs - _lastUpdateMs) / 1000.0f : 0.0f;
    _reactive = true;
    _lastUpdateMs = nowMs;

    // Negative, NaN and infinite inputs do not rotate
    float advance = audio.frequencyHz * dt * ROTATION_PER_HZ_S;
    if (!(advance >= 0.0f && advance < MAX_ADVANCE)) advance = 0.0f;
    _rotation = fmodf(_rotation + advance, (float)RINGSYNC_RING_CELLS);
    if (!(_rotation >= 0.0f && _rotation < (float)RINGSYNC_RING_CELLS)) _rotation = 0.0f;

    uint8_t intensity[RINGSYNC_RING_CELLS] = {0};
    ColorType colors[RINGSYNC_RING_CELLS];
    for (int i = 0; i < RINGSYNC_RING_CELLS; i++) colors[i] = ColorType::BLUEISH;

    for (int i = 0; i < RINGSYNC_RING_CELLS; i++) {
        uint8_t level = audio.levels[i];
        if (level <= VISIBLE_LEVEL) continue;
        int cell = (int)((float)i + _rotation) % RINGSYNC_RING_CELLS;
        intensity[cell] = level;
        colors[cell] = colorForLevel(level);
    }

    _draw(intensity, colors);
    selectBrightest(intensity, colors, _frame.triples);
}

void LeaderAnimator::_draw(const uint8_t intensity[], const ColorType colors[]) {
    for (uint8_t i = 0; i < RINGSYNC_RING_CELLS; i++) {
        _pixels.setCell(i, themedRgb(intensity[i], colors[i]));
    }
    _pixels.present();
}
