#pragma once

#include "config/Config.hpp"
#include "events/Event.hpp"
#include "exec/ActionExecutor.hpp"
#include "keymap/KeymapTree.hpp"
#include "keymap/Matcher.hpp"
#include "ui/Layout.hpp"
#include "util/Errors.hpp"
#include "wayland/Compositor.hpp"
#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <vector>

namespace whichkey::events {
class EventLoop;
}

namespace whichkey::session {

class OverlaySurface;

enum class SessionState {
    Initializing,
    Visible,
    Closing,
    Closed,
};

enum class CloseReason {
    None,
    Cancelled,
    ActionDispatched,
    IdleTimeout,
    Signal,
    SurfaceClosed,
    GrabFailed,
    ProtocolFailed,
};

const char* to_string(SessionState state);
const char* to_string(CloseReason reason);

// WHICHKEY_KEY, WHICHKEY_PATH and WHICHKEY_DESC for running `action`
exec::Environment action_environment(const keymap::KeymapTree& tree, keymap::NodeId action,
                                     const std::string& key_label);

struct SessionOptions {
    std::chrono::milliseconds idle_timeout{0};  // zero disables
    std::vector<int> termination_signals{SIGINT, SIGTERM, SIGHUP};
    std::optional<keymap::NodeId> start;  // effective root, defaults to the tree root
};

/**
 * One overlay from keyboard grab to surface destruction. Owns the keymap
 * tree and the matcher; drives the compositor through scoped surface and
 * grab guards.
 */
class OverlaySession {
public:
    OverlaySession(keymap::KeymapTree tree, keymap::MatchPolicy policy, const config::Config& cfg,
                   SessionOptions options, wayland::Compositor& compositor, ui::TextMeasurer& measurer,
                   exec::ActionExecutor& executor);

    OverlaySession(const OverlaySession&) = delete;
    OverlaySession& operator=(const OverlaySession&) = delete;

    // Runs to Closed. Only callable once.
    util::ExitCode run();

    SessionState state() const { return state_; }
    CloseReason close_reason() const { return close_reason_; }
    keymap::NodeId current_menu() const { return matcher_.current(); }
    const keymap::MatcherState& matcher_state() const { return matcher_.state(); }
    const keymap::KeymapTree& tree() const { return tree_; }
    const ui::Layout& layout() const { return layout_; }
    size_t layout_computations() const { return layout_engine_.computations(); }
    size_t actions_dispatched() const { return actions_dispatched_; }

private:
    struct Repeat {
        keymap::NodeId action = 0;
        uint32_t keycode = 0;
        std::string key_label;
    };

    void handle(const events::Event& event, OverlaySurface& surface, events::EventLoop& loop);
    void handle_key(const keymap::KeyInput& key, OverlaySurface& surface, events::EventLoop& loop);
    void invoke(const keymap::Outcome& outcome, const keymap::KeyInput& key, events::EventLoop& loop);
    void dispatch(keymap::NodeId action, const std::string& key_label);
    void relayout(OverlaySurface& surface);
    void arm_idle_timer(events::EventLoop& loop);
    void stop_repeat(events::EventLoop& loop);
    void begin_closing(CloseReason reason);

    keymap::KeymapTree tree_;
    keymap::Matcher matcher_;
    ui::LayoutEngine layout_engine_;
    SessionOptions options_;
    wayland::Compositor& compositor_;
    exec::ActionExecutor& executor_;

    SessionState state_ = SessionState::Initializing;
    CloseReason close_reason_ = CloseReason::None;
    ui::Layout layout_;
    size_t actions_dispatched_ = 0;

    std::optional<Repeat> repeat_;
    int32_t repeat_rate_ = 25;     // keys per second, compositor default
    int32_t repeat_delay_ = 600;   // milliseconds
};

}  // namespace whichkey::session
