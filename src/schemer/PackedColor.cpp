#include "schemer/PackedColor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

Rgb RgbFromPacked(int32_t packed) {
    const uint32_t bits = static_cast<uint32_t>(packed);
    return Rgb{
        static_cast<int>((bits >> 16) & 0xFFu),
        static_cast<int>((bits >> 8) & 0xFFu),
        static_cast<int>(bits & 0xFFu)
    };
}

int32_t RgbToPacked(const Rgb& color) {
    const uint32_t bits = 0xFF000000u
        | (static_cast<uint32_t>(color.red & 0xFF) << 16)
        | (static_cast<uint32_t>(color.green & 0xFF) << 8)
        | static_cast<uint32_t>(color.blue & 0xFF);
    return static_cast<int32_t>(bits);
}

int ClampChannel(double value) {
    // std::round rounds halfway cases away from zero, so 127.5 becomes 128.
    const double rounded = std::round(value);
    return static_cast<int>(std::min(255.0, std::max(0.0, rounded)));
}

Rgb AverageColors(const std::vector<Rgb>& colors) {
    if (colors.empty()) {
        throw std::invalid_argument("Cannot average an empty list of colors");
    }
    double red = 0.0;
    double green = 0.0;
    double blue = 0.0;
    for (const Rgb& color : colors) {
        red += color.red;
        green += color.green;
        blue += color.blue;
    }
    const double count = static_cast<double>(colors.size());
    return Rgb{ClampChannel(red / count), ClampChannel(green / count), ClampChannel(blue / count)};
}

Rgb ScaleColor(const Rgb& color, double factor) {
    return Rgb{
        ClampChannel(color.red * factor),
        ClampChannel(color.green * factor),
        ClampChannel(color.blue * factor)
    };
}
