#pragma once

#include <string>

namespace whichkey::ui {

struct TextExtent {
    double width = 0.0;
    double height = 0.0;
};

/**
 * Measurement seam between layout and the text rendering library.
 * Extents are logical pixels for the configured font.
 */
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    virtual TextExtent measure(const std::string& text) = 0;
};

}  // namespace whichkey::ui
