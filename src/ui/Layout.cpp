#include "ui/Layout.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace whichkey::ui {

namespace {
    constexpr double TITLE_GAP_RATIO = 0.5;  // blank space under the title, in lines
}

LayoutEngine::LayoutEngine(TextMeasurer& measurer, const config::Config& cfg)
    : measurer_(measurer),
      separator_(cfg.theme.separator),
      padding_(cfg.theme.effective_padding()),
      column_padding_(cfg.theme.effective_column_padding()),
      options_(cfg.layout) {
    auto sep = measurer_.measure(separator_);
    auto sample = measurer_.measure("Ag");
    separator_width_ = sep.width;
    line_height_ = std::max(sep.height, sample.height);
}

void LayoutEngine::fit_entry(Item& item) const {
    const double max_width = options_.max_entry_width;
    if (max_width <= 0.0) return;
    if (item.key_width + separator_width_ + item.description_width <= max_width) return;

    auto width_of = [this](const std::string& s) { return measurer_.measure(s).width; };

    // The key alone is too wide: shorten it and leave room for a bare ellipsis
    double ellipsis_width = width_of("…");
    if (item.key_width + separator_width_ + ellipsis_width > max_width) {
        item.key = util::truncate_with_ellipsis(item.key, [&](const std::string& candidate) {
            return width_of(candidate) + separator_width_ + ellipsis_width <= max_width;
        });
        item.key_width = width_of(item.key);
    }

    double available = max_width - item.key_width - separator_width_;
    item.description = util::truncate_with_ellipsis(item.description, [&](const std::string& candidate) {
        return width_of(candidate) <= available;
    });
    item.description_width = width_of(item.description);
}

LayoutEngine::Geometry LayoutEngine::geometry(const std::vector<Item>& items, size_t columns,
                                              double header_height, double title_width) const {
    Geometry g;
    g.columns = columns;
    g.rows = (items.size() + columns - 1) / columns;
    g.key_widths.assign(columns, 0.0);
    g.description_widths.assign(columns, 0.0);

    // Row-major: entry i sits in row i / columns, column i % columns
    for (size_t i = 0; i < items.size(); ++i) {
        size_t col = i % columns;
        g.key_widths[col] = std::max(g.key_widths[col], items[i].key_width);
        g.description_widths[col] = std::max(g.description_widths[col], items[i].description_width);
    }

    double content_width = 0.0;
    for (size_t col = 0; col < columns; ++col) {
        content_width += g.key_widths[col] + separator_width_ + g.description_widths[col];
    }
    content_width += column_padding_ * static_cast<double>(columns - 1);
    content_width = std::max(content_width, title_width);

    g.width = 2.0 * padding_ + content_width;
    g.height = 2.0 * padding_ + header_height + line_height_ * static_cast<double>(g.rows);
    return g;
}

size_t LayoutEngine::choose_columns(const std::vector<Item>& items, double header_height,
                                    double title_width) const {
    const size_t n = items.size();
    if (options_.columns) {
        return std::clamp<size_t>(*options_.columns, 1, n);
    }
    if (options_.rows_per_column) {
        return std::max<size_t>(1, (n + *options_.rows_per_column - 1) / *options_.rows_per_column);
    }

    // Closest to the target aspect ratio, fewer columns on ties
    size_t best = 1;
    double best_error = std::numeric_limits<double>::infinity();
    for (size_t columns = 1; columns <= n; ++columns) {
        auto g = geometry(items, columns, header_height, title_width);
        if (g.height <= 0.0) continue;
        double error = std::abs(g.width / g.height - options_.target_aspect);
        if (error < best_error) {
            best_error = error;
            best = columns;
        }
    }
    return best;
}

Layout LayoutEngine::placeholder_layout(const std::string& title) const {
    Layout layout;
    layout.title = title;
    layout.placeholder = true;
    layout.rows = 1;
    layout.columns = 1;

    double title_width = title.empty() ? 0.0 : measurer_.measure(title).width;
    double header_height = title.empty() ? 0.0 : line_height_ * (1.0 + TITLE_GAP_RATIO);
    double text_width = measurer_.measure(PLACEHOLDER_TEXT).width;
    double content_width = std::max(title_width, text_width);

    double width = 2.0 * padding_ + content_width;
    double height = 2.0 * padding_ + header_height + line_height_;
    layout.title_x = (width - title_width) / 2.0;
    layout.title_y = padding_;

    TextRun run;
    run.description = PLACEHOLDER_TEXT;
    run.x = padding_;
    run.y = padding_ + header_height;
    run.width = content_width;
    run.height = line_height_;
    run.key_x = run.x;
    run.separator_x = run.x;
    run.description_x = padding_ + (content_width - text_width) / 2.0;
    layout.runs.push_back(run);

    layout.width = static_cast<int>(std::ceil(width));
    layout.height = static_cast<int>(std::ceil(height));
    return layout;
}

Layout LayoutEngine::compute(const keymap::KeymapTree& tree, keymap::NodeId submenu) const {
    const auto& menu = tree.submenu(submenu);

    std::vector<MenuItem> entries;
    entries.reserve(menu.entries.size());
    for (const auto& entry : menu.entries) {
        bool is_submenu = tree.node(entry.child).is_submenu();
        entries.push_back(MenuItem{entry.binding.label, entry.binding.description, is_submenu});
    }
    return compute(menu.title, entries);
}

Layout LayoutEngine::compute(const std::string& title, const std::vector<MenuItem>& entries) const {
    ++computations_;

    if (entries.empty()) {
        return placeholder_layout(title);
    }

    std::vector<Item> items;
    items.reserve(entries.size());
    for (const auto& entry : entries) {
        Item item;
        item.key = entry.key;
        item.is_submenu = entry.is_submenu;
        item.description = entry.is_submenu ? SUBMENU_INDICATOR + entry.description : entry.description;
        item.key_width = measurer_.measure(item.key).width;
        item.description_width = measurer_.measure(item.description).width;
        fit_entry(item);
        items.push_back(std::move(item));
    }

    double title_width = title.empty() ? 0.0 : measurer_.measure(title).width;
    double header_height = title.empty() ? 0.0 : line_height_ * (1.0 + TITLE_GAP_RATIO);

    size_t columns = choose_columns(items, header_height, title_width);
    auto g = geometry(items, columns, header_height, title_width);

    std::vector<double> column_x(columns, padding_);
    for (size_t col = 1; col < columns; ++col) {
        column_x[col] = column_x[col - 1] + g.key_widths[col - 1] + separator_width_ +
                        g.description_widths[col - 1] + column_padding_;
    }

    Layout layout;
    layout.title = title;
    layout.rows = g.rows;
    layout.columns = g.columns;
    layout.title_x = (g.width - title_width) / 2.0;
    layout.title_y = padding_;

    for (size_t i = 0; i < items.size(); ++i) {
        auto& item = items[i];
        size_t row = i / columns;
        size_t col = i % columns;

        TextRun run;
        run.key = std::move(item.key);
        run.separator = separator_;
        run.description = std::move(item.description);
        run.row = row;
        run.column = col;
        run.is_submenu = item.is_submenu;
        run.x = column_x[col];
        run.y = padding_ + header_height + line_height_ * static_cast<double>(row);
        run.width = g.key_widths[col] + separator_width_ + g.description_widths[col];
        run.height = line_height_;
        run.key_x = run.x + (g.key_widths[col] - item.key_width);
        run.separator_x = run.x + g.key_widths[col];
        run.description_x = run.separator_x + separator_width_;
        layout.runs.push_back(std::move(run));
    }

    layout.width = static_cast<int>(std::ceil(g.width));
    layout.height = static_cast<int>(std::ceil(g.height));

    util::Logger::debug(std::format("Layout: {} entries in {}x{} grid, {}x{} px", items.size(), g.rows,
                                    g.columns, layout.width, layout.height));
    return layout;
}

}  // namespace whichkey::ui
