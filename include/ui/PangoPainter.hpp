#pragma once

#include "config/Theme.hpp"
#include "ui/Layout.hpp"
#include "ui/TextMeasurer.hpp"

typedef struct _cairo cairo_t;
typedef struct _cairo_surface cairo_surface_t;
typedef struct _PangoLayout PangoLayout;
typedef struct _PangoFontDescription PangoFontDescription;

namespace whichkey::ui {

/**
 * Text measurement and drawing with Pango on Cairo image surfaces.
 * Measurement runs on a private 1x1 surface so it works before any
 * compositor buffer exists.
 */
class PangoPainter : public TextMeasurer {
public:
    explicit PangoPainter(const config::Theme& theme);
    ~PangoPainter() override;

    PangoPainter(const PangoPainter&) = delete;
    PangoPainter& operator=(const PangoPainter&) = delete;

    TextExtent measure(const std::string& text) override;

    // Renders `layout` into an ARGB32 pixel buffer of width x height device
    // pixels. `scale` maps the layout's logical pixels to device pixels.
    void paint(unsigned char* data, int width, int height, int stride, int scale, const Layout& layout);

private:
    void draw_frame(cairo_t* cr, const Layout& layout);
    void draw_text(cairo_t* cr, PangoLayout* pango, const std::string& text, double x, double y);
    void draw_debug_cells(cairo_t* cr, const Layout& layout);

    config::Theme theme_;
    PangoFontDescription* font_ = nullptr;
    cairo_surface_t* measure_surface_ = nullptr;
    cairo_t* measure_cr_ = nullptr;
    PangoLayout* measure_layout_ = nullptr;
    bool debug_cells_ = false;
};

}  // namespace whichkey::ui
