#pragma once

#include "keymap/Key.hpp"
#include <cstdint>

namespace whichkey::events {

/**
 * Everything the session reacts to, whatever its origin (compositor,
 * timers, signals). Sources enqueue these; the session pulls them one at a
 * time from the event loop.
 */
struct Event {
    enum class Type {
        Configure,       // surface configured, width/height set
        FrameDone,       // frame callback fired
        ScaleChanged,    // buffer scale changed, scale set
        SurfaceClosed,   // compositor closed the layer surface
        KeyboardEnter,
        KeyboardLeave,
        Key,             // key set
        RepeatInfo,      // repeat_rate/repeat_delay set
        IdleTimeout,
        RepeatTick,
        Signal,          // signal set
    };

    Type type;
    uint32_t width = 0;
    uint32_t height = 0;
    int32_t scale = 1;
    keymap::KeyInput key;
    int32_t repeat_rate = 0;    // keys per second, 0 disables repeat
    int32_t repeat_delay = 0;   // milliseconds
    int signal = 0;
};

const char* to_string(Event::Type type);

}  // namespace whichkey::events
