#pragma once

#include "events/EventSource.hpp"
#include "ui/Layout.hpp"

namespace whichkey::wayland {

/**
 * What the overlay session needs from the display server: one overlay
 * surface, an exclusive keyboard grab and a stream of events.
 *
 * Sizes are logical pixels. The backend applies the output scale itself and
 * reports changes with ScaleChanged.
 */
class Compositor : public events::EventSource {
public:
    // Creates the overlay surface; a Configure event follows
    virtual void create_surface(int width, int height) = 0;
    // Requests a new size; a Configure event follows
    virtual void resize_surface(int width, int height) = 0;
    // Draws `layout` into a buffer of the configured surface size
    virtual void present(const ui::Layout& layout, int width, int height) = 0;
    virtual void destroy_surface() = 0;

    // Throws util::GrabError when exclusive keyboard focus cannot be had,
    // util::ProtocolError when the connection fails meanwhile
    virtual void acquire_keyboard_grab() = 0;
    // Best effort, never throws
    virtual void release_keyboard_grab() = 0;

    virtual void flush() = 0;
};

}  // namespace whichkey::wayland
