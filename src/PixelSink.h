#pragma once
#include <stdint.h>
#include "Palette.h"

// Pixel ring driver. Calls are assumed infallible.
class PixelSink {
public:
    virtual ~PixelSink() {}
    virtual void setCell(uint8_t index, const Rgb &color) = 0;
    virtual void present() = 0;
};

inline void clearRing(PixelSink &pixels) {
    const Rgb off = {0, 0, 0};
    for (uint8_t i = 0; i < RINGSYNC_RING_CELLS; i++) {
        pixels.setCell(i, off);
    }
    pixels.present();
}
