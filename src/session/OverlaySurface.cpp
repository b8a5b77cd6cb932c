#include "session/OverlaySurface.hpp"
#include "util/Logger.hpp"
#include <format>

namespace whichkey::session {

OverlaySurface::OverlaySurface(wayland::Compositor& compositor, int width, int height)
    : compositor_(compositor), width_(width), height_(height) {
    compositor_.create_surface(width_, height_);
    alive_ = true;
}

OverlaySurface::~OverlaySurface() {
    destroy();
}

void OverlaySurface::resize(int width, int height) {
    if (width == width_ && height == height_) return;
    width_ = width;
    height_ = height;
    awaiting_configure_ = true;
    compositor_.resize_surface(width_, height_);
    util::Logger::debug(std::format("OverlaySurface: Resize requested {}x{}", width_, height_));
}

void OverlaySurface::on_configure(uint32_t width, uint32_t height) {
    // Zero means the compositor leaves the size to us
    if ((width != 0 && static_cast<int>(width) != width_) || (height != 0 && static_cast<int>(height) != height_)) {
        util::Logger::debug(std::format("OverlaySurface: Compositor configured {}x{}, requested {}x{}", width,
                                        height, width_, height_));
    }
    configured_width_ = width != 0 ? static_cast<int>(width) : width_;
    configured_height_ = height != 0 ? static_cast<int>(height) : height_;
    configured_ = true;
    awaiting_configure_ = false;
    dirty_ = true;
}

bool OverlaySurface::draw(const ui::Layout& layout) {
    if (!alive_ || !configured() || !dirty_) return false;
    compositor_.present(layout, configured_width_, configured_height_);
    dirty_ = false;
    ++frames_;
    return true;
}

void OverlaySurface::destroy() {
    if (!alive_) return;
    alive_ = false;
    compositor_.destroy_surface();
    compositor_.flush();
    util::Logger::debug("OverlaySurface: Destroyed");
}

}  // namespace whichkey::session
