#ifndef SCHEMER_PACKED_COLOR_HPP
#define SCHEMER_PACKED_COLOR_HPP

#include <cstdint>
#include <vector>

// 8-bit-per-channel color as stored by the host preference store.
struct Rgb {
    int red;
    int green;
    int blue;

    bool operator==(const Rgb& other) const {
        return red == other.red && green == other.green && blue == other.blue;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

// Packed colors keep red/green/blue in bits 16-23/8-15/0-7. The top byte is
// alpha (or sign) and is ignored on unpack; ToPacked writes it fully opaque.
Rgb RgbFromPacked(int32_t packed);
int32_t RgbToPacked(const Rgb& color);

// Round half away from zero, then clamp to [0, 255].
int ClampChannel(double value);

// Per-channel arithmetic mean. Requires a non-empty input.
Rgb AverageColors(const std::vector<Rgb>& colors);

// Every channel multiplied by factor, rounded and clamped.
Rgb ScaleColor(const Rgb& color, double factor);

#endif // SCHEMER_PACKED_COLOR_HPP
