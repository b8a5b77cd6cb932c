#pragma once

#include "config/Config.hpp"
#include "keymap/KeymapTree.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace whichkey::keymap {

struct Outcome {
    enum class Kind {
        Descend,  // target is a Submenu (a child, or the parent for the back key)
        Invoke,   // target is an Action
        NoMatch,
        Cancel,
    };

    Kind kind = Kind::NoMatch;
    NodeId target = 0;
    const Entry* entry = nullptr;  // the binding that fired, null for back/cancel

    static Outcome no_match() { return {}; }
    static Outcome cancel() { return {Kind::Cancel, 0, nullptr}; }
};

const char* to_string(Outcome::Kind kind);

struct MatchPolicy {
    std::vector<KeyChord> cancel_keys;
    std::vector<KeyChord> back_keys;
    config::KeyPolicy on_unmatched = config::KeyPolicy::Ignore;
    config::KeyPolicy on_modifier_release = config::KeyPolicy::Ignore;

    // Throws util::ConfigError if a cancel/back key does not parse
    static MatchPolicy from_config(const config::Config& cfg);
};

struct MatcherState {
    NodeId current = 0;
    std::chrono::steady_clock::time_point last_input{};
};

/**
 * Interprets key events against the children of the current Submenu.
 * Purely reactive: timeouts are the session's business.
 */
class Matcher {
public:
    Matcher(const KeymapTree& tree, MatchPolicy policy);

    Outcome transition(NodeId current, const KeyInput& key) const;

    // transition() on the stored state; Descend outcomes move the cursor
    Outcome feed(const KeyInput& key);

    const MatcherState& state() const { return state_; }
    NodeId current() const { return state_.current; }
    NodeId effective_root() const { return root_; }

    // Restarts the idle clock without a transition (overlay shown, action repeated)
    void touch() { state_.last_input = std::chrono::steady_clock::now(); }

    // Makes `submenu` the effective root and the current node. The back key
    // never leaves the effective root.
    void reroot(NodeId submenu);

    // Walks a key sequence from the effective root. Returns the final
    // Descend/Invoke outcome, or an error message for an invalid sequence.
    // Submenus passed through become current.
    struct Navigation {
        std::optional<Outcome> outcome;
        std::string error;
    };
    Navigation navigate(const std::vector<KeyChord>& sequence);

private:
    const KeymapTree& tree_;
    MatchPolicy policy_;
    NodeId root_;
    MatcherState state_;
};

}  // namespace whichkey::keymap
