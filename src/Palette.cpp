#include "Palette.h"

// Fractional channels truncate
static uint8_t scale(uint8_t intensity, uint8_t percent) {
    return (uint8_t)(((uint16_t)intensity * percent) / 100);
}

Rgb themedRgb(uint8_t intensity, ColorType colorType) {
    Rgb rgb = {0, 0, 0};
    if (intensity == 0) return rgb;
    switch (colorType) {
        case ColorType::RED:
            rgb.r = intensity;
            rgb.g = scale(intensity, 15);
            rgb.b = scale(intensity, 15);
            break;
        case ColorType::GREEN:
            rgb.r = scale(intensity, 15);
            rgb.g = intensity;
            rgb.b = scale(intensity, 15);
            break;
        case ColorType::BLUEISH:
        default:
            rgb.r = scale(intensity, 30);
            rgb.g = scale(intensity, 5);
            rgb.b = intensity;
            break;
    }
    return rgb;
}
