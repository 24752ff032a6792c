#pragma once
#include <stddef.h>
#include <stdint.h>

// Token layout: ILLO_<seq>_<pos1>_<int1>_<col1>_<pos2>_<int2>_<col2>_<pos3>_<int3>_<col3>
#define RINGSYNC_PREFIX        "ILLO"
#define RINGSYNC_DELIMITER     '_'
#define RINGSYNC_RING_CELLS    10
#define RINGSYNC_TRIPLES       3
#define RINGSYNC_FIELD_COUNT   11   // prefix + sequence + 3 * (position, intensity, color)
#define RINGSYNC_TOKEN_MAX_LEN 32   // "ILLO_255_9_255_2_9_255_2_9_255_2"

// Coarse palette index, not raw RGB
enum class ColorType : uint8_t {
    RED     = 0,
    GREEN   = 1,
    BLUEISH = 2
};

// One highlighted pixel
struct PixelTriple {
    uint8_t   position;   // 0-9
    uint8_t   intensity;  // 0-255
    ColorType colorType;
};

// Unit of synchronization
struct VisualFrame {
    uint8_t     sequence;  // mod-256 ring counter, duplicate detection only
    PixelTriple triples[RINGSYNC_TRIPLES];
};

inline bool operator==(const PixelTriple &a, const PixelTriple &b) {
    return a.position == b.position && a.intensity == b.intensity && a.colorType == b.colorType;
}
inline bool operator!=(const PixelTriple &a, const PixelTriple &b) { return !(a == b); }

inline bool operator==(const VisualFrame &a, const VisualFrame &b) {
    if (a.sequence != b.sequence) return false;
    for (int i = 0; i < RINGSYNC_TRIPLES; i++) {
        if (a.triples[i] != b.triples[i]) return false;
    }
    return true;
}
inline bool operator!=(const VisualFrame &a, const VisualFrame &b) { return !(a == b); }

PixelTriple darkTriple();
VisualFrame darkFrame(uint8_t sequence = 0);

class FrameCodec {
public:
    // Writes a NUL-terminated token into out.
    // Returns the token length, or 0 if outLen cannot hold it.
    static size_t encode(const VisualFrame &frame, char *out, size_t outLen);

    // Parses a token. Fails on a wrong field count, a wrong prefix, or a
    // non-numeric field; out-of-range triples decode as darkTriple().
    static bool decode(const char *token, VisualFrame &frame);
    static bool decode(const char *data, size_t len, VisualFrame &frame);

    // True if name starts with "ILLO_". The sized form also rejects any NUL within len.
    static bool hasPrefix(const char *name);
    static bool hasPrefix(const char *data, size_t len);

    // Range-checks raw values, returning darkTriple() if any is out of range
    static PixelTriple sanitize(int32_t position, int32_t intensity, int32_t colorType);
    static PixelTriple sanitize(const PixelTriple &triple);

private:
    static bool _parseField(const char *begin, const char *end, int32_t &value);
};
