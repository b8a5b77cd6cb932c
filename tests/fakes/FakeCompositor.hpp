#pragma once

#include "events/Event.hpp"
#include "util/Errors.hpp"
#include "wayland/Compositor.hpp"
#include <csignal>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <unistd.h>
#include <vector>
#include <xkbcommon/xkbcommon-keysyms.h>

namespace whichkey::test {

/**
 * In-memory compositor. Scripted events are delivered one per dispatch, in
 * order; surface requests answer with a Configure like a real compositor.
 * The fd is a pipe nobody writes to, so an empty script blocks the loop
 * until a timer or signal fires (when `when_exhausted` is Block).
 */
class FakeCompositor : public wayland::Compositor {
public:
    enum class Exhausted { CloseSurface, Disconnect, Block };

    std::deque<events::Event> script;
    Exhausted when_exhausted = Exhausted::CloseSurface;
    bool fail_grab = false;
    bool disconnect_on_grab = false;
    // Configure replies carry this size instead of the requested one
    std::optional<std::pair<int, int>> forced_size;
    int raise_on_grab = 0;  // signal raised while the grab is acquired

    // Observations
    std::vector<std::string> calls;
    std::vector<ui::Layout> presented;
    std::vector<std::pair<int, int>> presented_sizes;
    int surface_width = 0;
    int surface_height = 0;
    bool surface_alive = false;
    bool grab_held = false;

    FakeCompositor() {
        if (pipe(pipe_) < 0) {
            throw std::runtime_error("FakeCompositor: pipe failed");
        }
    }

    ~FakeCompositor() override {
        close(pipe_[0]);
        close(pipe_[1]);
    }

    FakeCompositor(const FakeCompositor&) = delete;
    FakeCompositor& operator=(const FakeCompositor&) = delete;

    int fd() const override { return pipe_[0]; }

    void dispatch_pending(events::EventQueue& out) override {
        for (const auto& event : replies_) out.push(event);
        replies_.clear();
        if (!script.empty()) {
            out.push(script.front());
            script.pop_front();
        }
    }

    bool prepare_read(events::EventQueue& out) override {
        dispatch_pending(out);
        if (!out.empty()) return false;

        switch (when_exhausted) {
            case Exhausted::CloseSurface:
                out.push(events::Event{events::Event::Type::SurfaceClosed});
                return false;
            case Exhausted::Disconnect:
                throw util::ProtocolError("fake compositor disconnected");
            case Exhausted::Block:
                break;
        }
        return true;
    }

    void read_events(events::EventQueue& out) override { dispatch_pending(out); }
    void cancel_read() override {}

    void create_surface(int width, int height) override {
        calls.push_back("create_surface");
        surface_alive = true;
        surface_width = width;
        surface_height = height;
        configure(width, height);
    }

    void resize_surface(int width, int height) override {
        calls.push_back("resize_surface");
        surface_width = width;
        surface_height = height;
        configure(width, height);
    }

    void present(const ui::Layout& layout, int width, int height) override {
        calls.push_back("present");
        presented.push_back(layout);
        presented_sizes.emplace_back(width, height);
    }

    void destroy_surface() override {
        calls.push_back("destroy_surface");
        surface_alive = false;
    }

    void acquire_keyboard_grab() override {
        calls.push_back("acquire_keyboard_grab");
        if (fail_grab) {
            throw util::GrabError("keyboard already grabbed by another client");
        }
        if (disconnect_on_grab) {
            throw util::ProtocolError("keyboard grab: connection closed");
        }
        grab_held = true;
        if (raise_on_grab) {
            ::raise(raise_on_grab);
        }
    }

    void release_keyboard_grab() override {
        calls.push_back("release_keyboard_grab");
        grab_held = false;
    }

    void flush() override { calls.push_back("flush"); }

    size_t count(const std::string& call) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c == call) ++n;
        }
        return n;
    }

    // Index of the first occurrence of `call`, or calls.size()
    size_t first(const std::string& call) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i] == call) return i;
        }
        return calls.size();
    }

    // ========== SCRIPT HELPERS ==========

    void press(xkb_keysym_t keysym, keymap::ModifierSet mods = {}, uint32_t keycode = 0) {
        script.push_back(key_event(keysym, mods, true, keycode));
    }

    void release(xkb_keysym_t keysym, keymap::ModifierSet mods = {}, uint32_t keycode = 0) {
        script.push_back(key_event(keysym, mods, false, keycode));
    }

    void tap(xkb_keysym_t keysym, keymap::ModifierSet mods = {}) {
        uint32_t keycode = next_keycode_++;
        press(keysym, mods, keycode);
        release(keysym, mods, keycode);
    }

    static events::Event key_event(xkb_keysym_t keysym, keymap::ModifierSet mods, bool pressed,
                                   uint32_t keycode) {
        events::Event event{events::Event::Type::Key};
        event.key.keysym = keysym;
        event.key.modifiers = mods;
        event.key.pressed = pressed;
        event.key.keycode = keycode == 0 ? 100 : keycode;
        return event;
    }

private:
    void configure(int width, int height) {
        events::Event event{events::Event::Type::Configure};
        event.width = static_cast<uint32_t>(forced_size ? forced_size->first : width);
        event.height = static_cast<uint32_t>(forced_size ? forced_size->second : height);
        replies_.push_back(event);
    }

    int pipe_[2] = {-1, -1};
    std::vector<events::Event> replies_;
    uint32_t next_keycode_ = 200;
};

}  // namespace whichkey::test
