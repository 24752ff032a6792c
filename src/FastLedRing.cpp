#include "FastLedRing.h"

FastLedRing::FastLedRing(CRGB *leds, uint8_t count) : _leds(leds), _count(count) {}

void FastLedRing::setCell(uint8_t index, const Rgb &color) {
    if (index >= _count) return;
    _leds[index] = CRGB(color.r, color.g, color.b);
}

void FastLedRing::present() {
    FastLED.show();
}
