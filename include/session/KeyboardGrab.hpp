#pragma once

#include "wayland/Compositor.hpp"

namespace whichkey::session {

// Holds the exclusive keyboard grab for its lifetime. Construction throws
// util::GrabError; release is idempotent.
class KeyboardGrab {
public:
    explicit KeyboardGrab(wayland::Compositor& compositor);
    ~KeyboardGrab();

    KeyboardGrab(const KeyboardGrab&) = delete;
    KeyboardGrab& operator=(const KeyboardGrab&) = delete;

    void release();
    bool held() const { return held_; }

private:
    wayland::Compositor& compositor_;
    bool held_ = false;
};

}  // namespace whichkey::session
