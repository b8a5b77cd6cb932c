#pragma once

#include "ui/Layout.hpp"
#include "wayland/Compositor.hpp"
#include <cstdint>

namespace whichkey::session {

/**
 * Owns the overlay surface and decides when a frame may be drawn: only
 * once the compositor configured the current size, and only when the
 * content changed since the last frame.
 */
class OverlaySurface {
public:
    OverlaySurface(wayland::Compositor& compositor, int width, int height);
    ~OverlaySurface();

    OverlaySurface(const OverlaySurface&) = delete;
    OverlaySurface& operator=(const OverlaySurface&) = delete;

    // Requests a new size if it differs; drawing waits for the configure
    void resize(int width, int height);
    void on_configure(uint32_t width, uint32_t height);

    void mark_dirty() { dirty_ = true; }
    bool dirty() const { return dirty_; }
    bool configured() const { return configured_ && !awaiting_configure_; }

    // Presents `layout` when configured and dirty. Returns whether it drew.
    bool draw(const ui::Layout& layout);

    void destroy();
    bool alive() const { return alive_; }

    // Requested size
    int width() const { return width_; }
    int height() const { return height_; }
    // Size from the last configure; the compositor may pick a different one
    int configured_width() const { return configured_width_; }
    int configured_height() const { return configured_height_; }
    size_t frames() const { return frames_; }

private:
    wayland::Compositor& compositor_;
    int width_;
    int height_;
    int configured_width_ = 0;
    int configured_height_ = 0;
    bool alive_ = false;
    bool configured_ = false;
    bool awaiting_configure_ = true;
    bool dirty_ = true;
    size_t frames_ = 0;
};

}  // namespace whichkey::session
