#include "session/KeyboardGrab.hpp"
#include "util/Logger.hpp"
#include <format>

namespace whichkey::session {

KeyboardGrab::KeyboardGrab(wayland::Compositor& compositor)
    : compositor_(compositor) {
    compositor_.acquire_keyboard_grab();
    held_ = true;
}

KeyboardGrab::~KeyboardGrab() {
    release();
}

void KeyboardGrab::release() {
    if (!held_) return;
    held_ = false;
    compositor_.release_keyboard_grab();
    util::Logger::debug("KeyboardGrab: Released");
}

}  // namespace whichkey::session
