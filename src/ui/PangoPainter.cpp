#include "ui/PangoPainter.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <numbers>
#include <pango/pangocairo.h>
#include <stdexcept>

namespace whichkey::ui {

namespace {

void set_source(cairo_t* cr, const config::Color& c) {
    cairo_set_source_rgba(cr, c.r, c.g, c.b, c.a);
}

void rounded_rectangle(cairo_t* cr, double x, double y, double w, double h, double r) {
    r = std::max(0.0, std::min(r, std::min(w, h) / 2.0));
    cairo_new_sub_path(cr);
    cairo_arc(cr, x + w - r, y + r, r, -std::numbers::pi / 2.0, 0.0);
    cairo_arc(cr, x + w - r, y + h - r, r, 0.0, std::numbers::pi / 2.0);
    cairo_arc(cr, x + r, y + h - r, r, std::numbers::pi / 2.0, std::numbers::pi);
    cairo_arc(cr, x + r, y + r, r, std::numbers::pi, 3.0 * std::numbers::pi / 2.0);
    cairo_close_path(cr);
}

}  // namespace

PangoPainter::PangoPainter(const config::Theme& theme)
    : theme_(theme) {
    font_ = pango_font_description_from_string(theme_.font.c_str());
    measure_surface_ = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
    measure_cr_ = cairo_create(measure_surface_);
    if (cairo_status(measure_cr_) != CAIRO_STATUS_SUCCESS) {
        cairo_destroy(measure_cr_);
        cairo_surface_destroy(measure_surface_);
        pango_font_description_free(font_);
        throw std::runtime_error("PangoPainter: failed to create measuring surface");
    }
    measure_layout_ = pango_cairo_create_layout(measure_cr_);
    pango_layout_set_font_description(measure_layout_, font_);

    const char* debug = std::getenv("WHICHKEY_LAYOUT_DEBUG");
    debug_cells_ = debug && *debug && std::string(debug) != "0";

    util::Logger::info(std::format("PangoPainter: Font '{}'", theme_.font));
}

PangoPainter::~PangoPainter() {
    g_object_unref(measure_layout_);
    cairo_destroy(measure_cr_);
    cairo_surface_destroy(measure_surface_);
    pango_font_description_free(font_);
}

TextExtent PangoPainter::measure(const std::string& text) {
    int width = 0;
    int height = 0;
    pango_layout_set_text(measure_layout_, text.c_str(), static_cast<int>(text.size()));
    pango_layout_get_pixel_size(measure_layout_, &width, &height);
    return TextExtent{static_cast<double>(width), static_cast<double>(height)};
}

void PangoPainter::paint(unsigned char* data, int width, int height, int stride, int scale,
                         const Layout& layout) {
    cairo_surface_t* surface = cairo_image_surface_create_for_data(data, CAIRO_FORMAT_ARGB32, width,
                                                                   height, stride);
    cairo_t* cr = cairo_create(surface);
    cairo_scale(cr, scale, scale);

    // Start from fully transparent pixels, the corners stay see-through
    cairo_save(cr);
    cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
    cairo_set_source_rgba(cr, 0.0, 0.0, 0.0, 0.0);
    cairo_paint(cr);
    cairo_restore(cr);

    draw_frame(cr, layout);

    PangoLayout* pango = pango_cairo_create_layout(cr);
    pango_layout_set_font_description(pango, font_);
    set_source(cr, theme_.color);

    if (!layout.title.empty()) {
        draw_text(cr, pango, layout.title, layout.title_x, layout.title_y);
    }
    for (const auto& run : layout.runs) {
        if (!run.key.empty()) draw_text(cr, pango, run.key, run.key_x, run.y);
        if (!run.separator.empty()) draw_text(cr, pango, run.separator, run.separator_x, run.y);
        draw_text(cr, pango, run.description, run.description_x, run.y);
    }

    if (debug_cells_) {
        draw_debug_cells(cr, layout);
    }

    g_object_unref(pango);
    cairo_destroy(cr);
    cairo_surface_flush(surface);
    cairo_surface_destroy(surface);
}

void PangoPainter::draw_frame(cairo_t* cr, const Layout& layout) {
    // The border is stroked inside the surface bounds
    double inset = theme_.border_width / 2.0;
    rounded_rectangle(cr, inset, inset, layout.width - theme_.border_width,
                      layout.height - theme_.border_width, theme_.corner_r);
    set_source(cr, theme_.background);
    cairo_fill_preserve(cr);

    if (theme_.border_width > 0.0) {
        set_source(cr, theme_.border);
        cairo_set_line_width(cr, theme_.border_width);
        cairo_stroke(cr);
    } else {
        cairo_new_path(cr);
    }
}

void PangoPainter::draw_text(cairo_t* cr, PangoLayout* pango, const std::string& text, double x, double y) {
    pango_layout_set_text(pango, text.c_str(), static_cast<int>(text.size()));
    cairo_move_to(cr, x, y);
    pango_cairo_show_layout(cr, pango);
}

void PangoPainter::draw_debug_cells(cairo_t* cr, const Layout& layout) {
    cairo_set_line_width(cr, 1.0);
    for (const auto& run : layout.runs) {
        cairo_set_source_rgba(cr, 1.0, 0.0, 0.0, 0.8);
        cairo_rectangle(cr, run.x, run.y, run.width, run.height);
        cairo_stroke(cr);
        cairo_set_source_rgba(cr, 0.0, 0.6, 1.0, 0.8);
        cairo_move_to(cr, run.separator_x, run.y);
        cairo_line_to(cr, run.separator_x, run.y + run.height);
        cairo_move_to(cr, run.description_x, run.y);
        cairo_line_to(cr, run.description_x, run.y + run.height);
        cairo_stroke(cr);
    }
}

}  // namespace whichkey::ui
