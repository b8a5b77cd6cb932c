#pragma once

#include "ui/TextMeasurer.hpp"
#include <string>

namespace whichkey::test {

// Monospace stand-in: every code point is CHAR_WIDTH wide, lines are LINE_HEIGHT tall
class FakeMeasurer : public ui::TextMeasurer {
public:
    static constexpr double CHAR_WIDTH = 10.0;
    static constexpr double LINE_HEIGHT = 20.0;

    ui::TextExtent measure(const std::string& text) override {
        ++calls;
        return ui::TextExtent{CHAR_WIDTH * static_cast<double>(code_points(text)), LINE_HEIGHT};
    }

    static size_t code_points(const std::string& text) {
        size_t n = 0;
        for (unsigned char c : text) {
            if ((c & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    size_t calls = 0;
};

}  // namespace whichkey::test
