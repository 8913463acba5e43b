#pragma once

#include <cstdint>
#include <optional>

namespace gridcore {

enum class BorderStyle : std::uint8_t {
    Solid = 0,
    Dotted = 1,
    Dashed = 2,
    Double = 3,
};

// RGBA colour, channels 0-255 and alpha 0-1.
struct Color {
    std::uint8_t red = 0;
    std::uint8_t green = 0;
    std::uint8_t blue = 0;
    float alpha = 1.0f;

    bool operator==(const Color& other) const {
        return red == other.red && green == other.green && blue == other.blue && alpha == other.alpha;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

/**
 * One side of a cell border.
 * The priority is higher for sides set later; it is used to decide which
 * side wins when two neighbouring cells assert different borders on the
 * edge they share.
 */
struct BorderSide {
    BorderStyle style = BorderStyle::Solid;
    double size = 1.0;
    Color color{};
    std::uint32_t priority = 0;
    bool isDefault = false;

    bool operator==(const BorderSide& other) const {
        return style == other.style && size == other.size && color == other.color
            && priority == other.priority && isDefault == other.isDefault;
    }
    bool operator!=(const BorderSide& other) const { return !(*this == other); }
};

struct Border {
    std::optional<BorderSide> top;
    std::optional<BorderSide> bottom;
    std::optional<BorderSide> left;
    std::optional<BorderSide> right;

    bool empty() const { return !top && !bottom && !left && !right; }
};

// Selects the sides setBorderLine() stamps.
struct BorderMask {
    bool top = false;
    bool bottom = false;
    bool left = false;
    bool right = false;
};

} // namespace gridcore
