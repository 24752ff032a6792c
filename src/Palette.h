#pragma once
#include <stdint.h>
#include "FrameCodec.h"

struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

inline bool operator==(const Rgb &a, const Rgb &b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

// Maps a coarse color class to RGB at the given intensity.
// Leader and follower share this so mirrored rings match.
Rgb themedRgb(uint8_t intensity, ColorType colorType);
