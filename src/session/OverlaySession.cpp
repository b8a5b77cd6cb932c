#include "session/OverlaySession.hpp"
#include "events/EventLoop.hpp"
#include "session/KeyboardGrab.hpp"
#include "session/OverlaySurface.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace whichkey::session {

namespace {

// The spelling of the alias that fired, or the whole label
std::string fired_key_label(const keymap::Entry& entry, const keymap::KeyInput& key) {
    for (const auto& chord : entry.binding.any_of) {
        if (key.matches(chord)) return chord.repr;
    }
    return entry.binding.label;
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += sep;
        out += part;
    }
    return out;
}

}  // namespace

exec::Environment action_environment(const keymap::KeymapTree& tree, keymap::NodeId action,
                                     const std::string& key_label) {
    const auto* entry = tree.entry_for(action);
    return {
        {"WHICHKEY_KEY", key_label},
        {"WHICHKEY_PATH", join(tree.path_to(action), " ")},
        {"WHICHKEY_DESC", entry ? entry->binding.description : std::string()},
    };
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Initializing: return "Initializing";
        case SessionState::Visible:      return "Visible";
        case SessionState::Closing:      return "Closing";
        case SessionState::Closed:       return "Closed";
    }
    return "?";
}

const char* to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::None:             return "none";
        case CloseReason::Cancelled:        return "cancelled";
        case CloseReason::ActionDispatched: return "action dispatched";
        case CloseReason::IdleTimeout:      return "idle timeout";
        case CloseReason::Signal:           return "signal";
        case CloseReason::SurfaceClosed:    return "surface closed by compositor";
        case CloseReason::GrabFailed:       return "keyboard grab failed";
        case CloseReason::ProtocolFailed:   return "protocol error";
    }
    return "?";
}

OverlaySession::OverlaySession(keymap::KeymapTree tree, keymap::MatchPolicy policy, const config::Config& cfg,
                               SessionOptions options, wayland::Compositor& compositor,
                               ui::TextMeasurer& measurer, exec::ActionExecutor& executor)
    : tree_(std::move(tree)),
      matcher_(tree_, std::move(policy)),
      layout_engine_(measurer, cfg),
      options_(std::move(options)),
      compositor_(compositor),
      executor_(executor) {
    if (options_.start) {
        matcher_.reroot(*options_.start);
    }
}

util::ExitCode OverlaySession::run() {
    if (state_ != SessionState::Initializing) {
        throw std::logic_error("OverlaySession: run() called twice");
    }

    try {
        events::EventLoop loop(compositor_, options_.termination_signals);

        layout_ = layout_engine_.compute(tree_, matcher_.current());

        // Declaration order matters: the grab is released before the surface
        // goes away, on every exit path
        OverlaySurface surface(compositor_, layout_.width, layout_.height);
        KeyboardGrab grab(compositor_);

        state_ = SessionState::Visible;
        util::Logger::info(std::format("Session: Visible at '{}' ({} entries)",
                                       tree_.submenu(matcher_.current()).title,
                                       tree_.submenu(matcher_.current()).entries.size()));
        matcher_.touch();
        arm_idle_timer(loop);

        while (state_ == SessionState::Visible) {
            handle(loop.next(), surface, loop);
        }

        loop.idle_timer().disarm();
        loop.repeat_timer().disarm();
        grab.release();
        surface.destroy();
    } catch (const util::GrabError& e) {
        util::Logger::error(std::format("Session: Keyboard grab failed: {}", e.what()));
        close_reason_ = CloseReason::GrabFailed;
        state_ = SessionState::Closed;
        return util::ExitCode::Grab;
    } catch (const util::ProtocolError& e) {
        util::Logger::error(std::format("Session: Compositor protocol error: {}", e.what()));
        close_reason_ = CloseReason::ProtocolFailed;
        state_ = SessionState::Closed;
        return util::ExitCode::Protocol;
    }

    state_ = SessionState::Closed;
    util::Logger::info(std::format("Session: Closed ({})", to_string(close_reason_)));
    return util::ExitCode::Ok;
}

void OverlaySession::handle(const events::Event& event, OverlaySurface& surface, events::EventLoop& loop) {
    using Type = events::Event::Type;

    switch (event.type) {
        case Type::Configure:
            surface.on_configure(event.width, event.height);
            surface.draw(layout_);
            break;

        case Type::FrameDone:
            surface.draw(layout_);
            break;

        case Type::ScaleChanged:
            surface.mark_dirty();
            surface.draw(layout_);
            break;

        case Type::SurfaceClosed:
            begin_closing(CloseReason::SurfaceClosed);
            break;

        case Type::KeyboardEnter:
            break;

        case Type::KeyboardLeave:
            stop_repeat(loop);
            break;

        case Type::RepeatInfo:
            repeat_rate_ = event.repeat_rate;
            repeat_delay_ = event.repeat_delay;
            break;

        case Type::Key:
            handle_key(event.key, surface, loop);
            break;

        case Type::IdleTimeout: {
            // A key accepted in the same wake-up may already have restarted the clock
            auto idle = std::chrono::steady_clock::now() - matcher_.state().last_input;
            if (options_.idle_timeout.count() > 0 && idle >= options_.idle_timeout) {
                begin_closing(CloseReason::IdleTimeout);
            }
            break;
        }

        case Type::RepeatTick:
            if (repeat_) {
                dispatch(repeat_->action, repeat_->key_label);
                matcher_.touch();
                arm_idle_timer(loop);
            }
            break;

        case Type::Signal:
            util::Logger::info(std::format("Session: Terminating on signal {}", event.signal));
            begin_closing(CloseReason::Signal);
            break;
    }
}

void OverlaySession::handle_key(const keymap::KeyInput& key, OverlaySurface& surface, events::EventLoop& loop) {
    if (!key.pressed && repeat_ && key.keycode == repeat_->keycode) {
        stop_repeat(loop);
    }

    auto outcome = matcher_.feed(key);
    switch (outcome.kind) {
        case keymap::Outcome::Kind::NoMatch:
            break;

        case keymap::Outcome::Kind::Cancel:
            begin_closing(CloseReason::Cancelled);
            break;

        case keymap::Outcome::Kind::Descend:
            stop_repeat(loop);
            relayout(surface);
            arm_idle_timer(loop);
            break;

        case keymap::Outcome::Kind::Invoke:
            stop_repeat(loop);
            invoke(outcome, key, loop);
            break;
    }
}

void OverlaySession::invoke(const keymap::Outcome& outcome, const keymap::KeyInput& key, events::EventLoop& loop) {
    const auto& action = tree_.action(outcome.target);
    std::string label = outcome.entry ? fired_key_label(*outcome.entry, key) : std::string();

    dispatch(outcome.target, label);

    if (!action.keep_open) {
        begin_closing(CloseReason::ActionDispatched);
        return;
    }

    arm_idle_timer(loop);
    if (action.repeatable && repeat_rate_ > 0 && key.keycode != 0) {
        repeat_ = Repeat{outcome.target, key.keycode, label};
        loop.repeat_timer().arm(std::chrono::milliseconds(repeat_delay_),
                                std::chrono::milliseconds(std::max(1, 1000 / repeat_rate_)));
    }
}

void OverlaySession::dispatch(keymap::NodeId action, const std::string& key_label) {
    const auto& command = tree_.action(action).command;
    ++actions_dispatched_;
    if (auto error = executor_.run(command, action_environment(tree_, action, key_label))) {
        util::Logger::error(std::format("Session: Failed to run '{}': {}", command, error->message));
    }
}

void OverlaySession::relayout(OverlaySurface& surface) {
    layout_ = layout_engine_.compute(tree_, matcher_.current());
    surface.resize(layout_.width, layout_.height);
    surface.mark_dirty();
    surface.draw(layout_);
}

void OverlaySession::arm_idle_timer(events::EventLoop& loop) {
    if (options_.idle_timeout.count() > 0) {
        loop.idle_timer().arm(options_.idle_timeout);
    }
}

void OverlaySession::stop_repeat(events::EventLoop& loop) {
    if (!repeat_) return;
    repeat_.reset();
    loop.repeat_timer().disarm();
}

void OverlaySession::begin_closing(CloseReason reason) {
    state_ = SessionState::Closing;
    close_reason_ = reason;
    util::Logger::info(std::format("Session: Closing ({})", to_string(reason)));
}

}  // namespace whichkey::session
