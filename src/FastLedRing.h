#pragma once
#include <FastLED.h>
#include "PixelSink.h"

// PixelSink over a FastLED controller registered by the sketch with
// FastLED.addLeds<>(leds, count)
class FastLedRing : public PixelSink {
public:
    FastLedRing(CRGB *leds, uint8_t count = RINGSYNC_RING_CELLS);

    void setCell(uint8_t index, const Rgb &color) override;
    void present() override;

private:
    CRGB   *_leds;
    uint8_t _count;
};
