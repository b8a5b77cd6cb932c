#pragma once

#include "config/Config.hpp"
#include "keymap/KeymapTree.hpp"
#include "ui/TextMeasurer.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace whichkey::ui {

/**
 * One positioned menu entry. Coordinates are logical pixels from the
 * top-left corner of the surface; all text baselines share the cell's y.
 */
struct TextRun {
    std::string key;
    std::string separator;
    std::string description;

    double x = 0.0;  // cell origin
    double y = 0.0;
    double width = 0.0;  // cell size
    double height = 0.0;
    double key_x = 0.0;  // keys are right-aligned within their column
    double separator_x = 0.0;
    double description_x = 0.0;

    size_t row = 0;
    size_t column = 0;
    bool is_submenu = false;

    bool operator==(const TextRun& other) const = default;
};

struct Layout {
    std::string title;
    double title_x = 0.0;
    double title_y = 0.0;

    std::vector<TextRun> runs;
    size_t rows = 0;
    size_t columns = 0;
    bool placeholder = false;  // empty submenu, runs holds the placeholder text

    int width = 0;
    int height = 0;

    bool operator==(const Layout& other) const = default;
};

// What one entry shows, before measurement
struct MenuItem {
    std::string key;
    std::string description;
    bool is_submenu = false;
};

class LayoutEngine {
public:
    static constexpr const char* SUBMENU_INDICATOR = "+";
    static constexpr const char* PLACEHOLDER_TEXT = "(empty)";

    LayoutEngine(TextMeasurer& measurer, const config::Config& cfg);

    Layout compute(const keymap::KeymapTree& tree, keymap::NodeId submenu) const;
    Layout compute(const std::string& title, const std::vector<MenuItem>& items) const;

    size_t computations() const { return computations_; }

private:
    struct Item {
        std::string key;
        std::string description;
        bool is_submenu = false;
        double key_width = 0.0;
        double description_width = 0.0;
    };

    struct Geometry {
        size_t columns = 1;
        size_t rows = 0;
        std::vector<double> key_widths;          // per column
        std::vector<double> description_widths;  // per column
        double width = 0.0;
        double height = 0.0;
    };

    void fit_entry(Item& item) const;
    Geometry geometry(const std::vector<Item>& items, size_t columns, double header_height,
                      double title_width) const;
    size_t choose_columns(const std::vector<Item>& items, double header_height, double title_width) const;
    Layout placeholder_layout(const std::string& title) const;

    TextMeasurer& measurer_;
    std::string separator_;
    double padding_;
    double column_padding_;
    config::LayoutOptions options_;

    double separator_width_ = 0.0;
    double line_height_ = 0.0;
    mutable size_t computations_ = 0;
};

}  // namespace whichkey::ui
