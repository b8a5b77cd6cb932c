#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace whichkey::config {

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;

    static Color from_rgba_hex(uint32_t rgba);
    // Accepts "#rrggbb" and "#rrggbbaa" (the leading '#' is optional)
    static std::optional<Color> parse(const std::string& text);

    bool operator==(const Color& other) const = default;
};

/**
 * Visual parameters of the overlay. Geometry values are logical pixels.
 */
struct Theme {
    Color background = Color::from_rgba_hex(0x282828ff);
    Color color = Color::from_rgba_hex(0xfbf1c7ff);
    Color border = Color::from_rgba_hex(0x8ec07cff);

    std::string font = "monospace 10";
    std::string separator = " ➜ ";
    double border_width = 4.0;
    double corner_r = 20.0;
    std::optional<double> padding;         // defaults to corner_r
    std::optional<double> column_padding;  // defaults to padding

    double effective_padding() const { return padding.value_or(corner_r); }
    double effective_column_padding() const { return column_padding.value_or(effective_padding()); }
};

}  // namespace whichkey::config
