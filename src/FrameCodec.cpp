#include "FrameCodec.h"
#include <stdio.h>
#include <string.h>

static const size_t PREFIX_LEN = sizeof(RINGSYNC_PREFIX) - 1;

PixelTriple darkTriple() {
    PixelTriple triple = {0, 0, ColorType::RED};
    return triple;
}

VisualFrame darkFrame(uint8_t sequence) {
    VisualFrame frame;
    frame.sequence = sequence;
    for (int i = 0; i < RINGSYNC_TRIPLES; i++) {
        frame.triples[i] = darkTriple();
    }
    return frame;
}

PixelTriple FrameCodec::sanitize(int32_t position, int32_t intensity, int32_t colorType) {
    if (position < 0 || position >= RINGSYNC_RING_CELLS) return darkTriple();
    if (intensity < 0 || intensity > 255) return darkTriple();
    if (colorType < 0 || colorType > (int32_t)ColorType::BLUEISH) return darkTriple();
    PixelTriple triple = {(uint8_t)position, (uint8_t)intensity, (ColorType)colorType};
    return triple;
}

PixelTriple FrameCodec::sanitize(const PixelTriple &triple) {
    return sanitize(triple.position, triple.intensity, (int32_t)triple.colorType);
}

size_t FrameCodec::encode(const VisualFrame &frame, char *out, size_t outLen) {
    if (!out || outLen == 0) return 0;

    PixelTriple t[RINGSYNC_TRIPLES];
    for (int i = 0; i < RINGSYNC_TRIPLES; i++) {
        t[i] = sanitize(frame.triples[i]);
    }

    int n = snprintf(out, outLen, "%s_%u_%u_%u_%u_%u_%u_%u_%u_%u_%u",
                     RINGSYNC_PREFIX, (unsigned)frame.sequence,
                     (unsigned)t[0].position, (unsigned)t[0].intensity, (unsigned)t[0].colorType,
                     (unsigned)t[1].position, (unsigned)t[1].intensity, (unsigned)t[1].colorType,
                     (unsigned)t[2].position, (unsigned)t[2].intensity, (unsigned)t[2].colorType);
    if (n < 0 || (size_t)n >= outLen) {
        out[0] = '\0';
        return 0;
    }
    return (size_t)n;
}

bool FrameCodec::hasPrefix(const char *name) {
    return name && hasPrefix(name, strlen(name));
}

bool FrameCodec::hasPrefix(const char *data, size_t len) {
    if (!data || len <= PREFIX_LEN) return false;
    // Tokens are sent without a terminator; an embedded NUL would truncate the decoded text
    if (memchr(data, '\0', len)) return false;
    return memcmp(data, RINGSYNC_PREFIX, PREFIX_LEN) == 0 && data[PREFIX_LEN] == RINGSYNC_DELIMITER;
}

bool FrameCodec::decode(const char *token, VisualFrame &frame) {
    return token && decode(token, strlen(token), frame);
}

bool FrameCodec::decode(const char *data, size_t len, VisualFrame &frame) {
    if (!data) return false;

    int32_t values[RINGSYNC_FIELD_COUNT - 1];
    const char *end = data + len;
    const char *fieldStart = data;
    int field = 0;

    for (const char *p = data; ; p++) {
        if (p != end && *p != RINGSYNC_DELIMITER) continue;

        if (field >= RINGSYNC_FIELD_COUNT) return false;  // too many fields
        if (field == 0) {
            size_t n = (size_t)(p - fieldStart);
            if (n != PREFIX_LEN || memcmp(fieldStart, RINGSYNC_PREFIX, PREFIX_LEN) != 0) return false;
        } else if (!_parseField(fieldStart, p, values[field - 1])) {
            return false;
        }
        field++;

        if (p == end) break;
        fieldStart = p + 1;
    }
    if (field != RINGSYNC_FIELD_COUNT) return false;

    frame.sequence = (uint8_t)(((values[0] % 256) + 256) % 256);
    for (int i = 0; i < RINGSYNC_TRIPLES; i++) {
        const int32_t *v = &values[1 + i * 3];
        frame.triples[i] = sanitize(v[0], v[1], v[2]);
    }
    return true;
}

bool FrameCodec::_parseField(const char *begin, const char *end, int32_t &value) {
    bool negative = false;
    if (begin < end && (*begin == '-' || *begin == '+')) {
        negative = (*begin == '-');
        begin++;
    }
    if (begin == end || end - begin > 10) return false;

    int64_t acc = 0;
    for (const char *p = begin; p < end; p++) {
        if (*p < '0' || *p > '9') return false;
        acc = acc * 10 + (*p - '0');
    }
    if (negative) acc = -acc;
    if (acc > INT32_MAX || acc < INT32_MIN) return false;
    value = (int32_t)acc;
    return true;
}
