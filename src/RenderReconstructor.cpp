#include "RenderReconstructor.h"

void SmoothedRing::zero() {
    for (int i = 0; i < RINGSYNC_RING_CELLS; i++) {
        rgb[i][0] = rgb[i][1] = rgb[i][2] = 0.0f;
    }
}

RenderReconstructor::RenderReconstructor(const SyncConfig &config, PixelSink &pixels)
    : _config(config), _pixels(pixels), _lastRenderMs(0), _hasRendered(false), _renderCount(0)
{
}

void RenderReconstructor::reset() {
    _lastRenderMs = 0;
    _hasRendered = false;
    _renderCount = 0;
}

void RenderReconstructor::expand(const VisualFrame &frame, Rgb target[RINGSYNC_RING_CELLS]) {
    const Rgb off = {0, 0, 0};
    for (int i = 0; i < RINGSYNC_RING_CELLS; i++) target[i] = off;

    for (int i = 0; i < RINGSYNC_TRIPLES; i++) {
        const PixelTriple &t = frame.triples[i];
        if (t.intensity == 0 || t.position >= RINGSYNC_RING_CELLS) continue;
        target[t.position] = themedRgb(t.intensity, t.colorType);
    }
}

uint8_t RenderReconstructor::toChannel(float value) {
    if (!(value > 0.0f)) return 0;
    if (value >= 255.0f) return 255;
    return (uint8_t)(value + 0.5f);
}

bool RenderReconstructor::render(SmoothedRing &ring, const VisualFrame &frame, uint32_t nowMs) {
    if (_hasRendered && nowMs - _lastRenderMs < _config.minRenderMs) return false;

    Rgb target[RINGSYNC_RING_CELLS];
    expand(frame, target);

    const float a = _config.smoothingAlpha;
    for (uint8_t i = 0; i < RINGSYNC_RING_CELLS; i++) {
        float *s = ring.rgb[i];
        s[0] += ((float)target[i].r - s[0]) * a;
        s[1] += ((float)target[i].g - s[1]) * a;
        s[2] += ((float)target[i].b - s[2]) * a;

        Rgb out = {toChannel(s[0]), toChannel(s[1]), toChannel(s[2])};
        _pixels.setCell(i, out);
    }
    _pixels.present();

    _lastRenderMs = nowMs;
    _hasRendered = true;
    _renderCount++;
    return true;
}

void RenderReconstructor::clear(SmoothedRing &ring) {
    ring.zero();
    clearRing(_pixels);
}
