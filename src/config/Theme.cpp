#include "config/Theme.hpp"
#include <cctype>

namespace whichkey::config {

Color Color::from_rgba_hex(uint32_t rgba) {
    Color c;
    c.r = static_cast<double>((rgba >> 24) & 0xff) / 255.0;
    c.g = static_cast<double>((rgba >> 16) & 0xff) / 255.0;
    c.b = static_cast<double>((rgba >> 8) & 0xff) / 255.0;
    c.a = static_cast<double>(rgba & 0xff) / 255.0;
    return c;
}

std::optional<Color> Color::parse(const std::string& text) {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') {
        hex = hex.substr(1);
    }
    if (hex.size() != 6 && hex.size() != 8) {
        return std::nullopt;
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }

    uint32_t value = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    if (hex.size() == 6) {
        value = (value << 8) | 0xff;
    }
    return from_rgba_hex(value);
}

}  // namespace whichkey::config
