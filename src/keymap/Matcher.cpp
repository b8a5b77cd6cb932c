#include "keymap/Matcher.hpp"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace whichkey::keymap {

namespace {

std::vector<KeyChord> parse_keys(const std::vector<std::string>& spellings, const char* field) {
    std::vector<KeyChord> chords;
    for (const auto& spelling : spellings) {
        std::string error;
        auto chord = parse_chord(spelling, &error);
        if (!chord) {
            throw util::ConfigError(std::format("{}: {}", field, error));
        }
        chords.push_back(std::move(*chord));
    }
    return chords;
}

bool any_matches(const std::vector<KeyChord>& chords, const KeyInput& key) {
    return std::any_of(chords.begin(), chords.end(), [&key](const KeyChord& c) { return key.matches(c); });
}

}  // namespace

const char* to_string(Outcome::Kind kind) {
    switch (kind) {
        case Outcome::Kind::Descend: return "Descend";
        case Outcome::Kind::Invoke:  return "Invoke";
        case Outcome::Kind::NoMatch: return "NoMatch";
        case Outcome::Kind::Cancel:  return "Cancel";
    }
    return "?";
}

MatchPolicy MatchPolicy::from_config(const config::Config& cfg) {
    MatchPolicy policy;
    policy.cancel_keys = parse_keys(cfg.cancel_keys, "cancel_keys");
    policy.back_keys = parse_keys(cfg.back_keys, "back_keys");
    policy.on_unmatched = cfg.on_unmatched;
    policy.on_modifier_release = cfg.on_modifier_release;
    return policy;
}

Matcher::Matcher(const KeymapTree& tree, MatchPolicy policy)
    : tree_(tree), policy_(std::move(policy)), root_(tree.root()) {
    state_.current = root_;
    state_.last_input = std::chrono::steady_clock::now();
}

Outcome Matcher::transition(NodeId current, const KeyInput& key) const {
    if (!key.pressed) {
        if (key.is_modifier_key() && policy_.on_modifier_release == config::KeyPolicy::Cancel) {
            return Outcome::cancel();
        }
        return Outcome::no_match();
    }

    // Explicit bindings take precedence over the implicit cancel/back keys
    const auto& menu = tree_.submenu(current);
    for (const auto& entry : menu.entries) {
        if (entry.binding.matches(key)) {
            auto kind = tree_.node(entry.child).is_submenu() ? Outcome::Kind::Descend : Outcome::Kind::Invoke;
            return Outcome{kind, entry.child, &entry};
        }
    }

    if (any_matches(policy_.cancel_keys, key)) {
        return Outcome::cancel();
    }

    if (any_matches(policy_.back_keys, key)) {
        auto parent = tree_.parent(current);
        if (current != root_ && parent) {
            return Outcome{Outcome::Kind::Descend, *parent, nullptr};
        }
        return Outcome::no_match();
    }

    // A held modifier is not a choice
    if (key.is_modifier_key()) {
        return Outcome::no_match();
    }

    if (policy_.on_unmatched == config::KeyPolicy::Cancel) {
        return Outcome::cancel();
    }
    return Outcome::no_match();
}

Outcome Matcher::feed(const KeyInput& key) {
    auto outcome = transition(state_.current, key);
    if (outcome.kind == Outcome::Kind::Descend) {
        state_.current = outcome.target;
    }
    if (outcome.kind == Outcome::Kind::Descend || outcome.kind == Outcome::Kind::Invoke) {
        state_.last_input = std::chrono::steady_clock::now();
    }
    util::Logger::debug(std::format("Matcher: {} -> {}", describe(key), to_string(outcome.kind)));
    return outcome;
}

void Matcher::reroot(NodeId submenu) {
    (void)tree_.submenu(submenu);  // throws if not a submenu
    root_ = submenu;
    state_.current = submenu;
}

Matcher::Navigation Matcher::navigate(const std::vector<KeyChord>& sequence) {
    Navigation result;
    NodeId current = root_;

    for (size_t i = 0; i < sequence.size(); ++i) {
        const auto& chord = sequence[i];
        const auto& menu = tree_.submenu(current);
        KeyInput key{chord.keysym, chord.modifiers, true, 0};

        auto it = std::find_if(menu.entries.begin(), menu.entries.end(),
                               [&key](const Entry& e) { return e.binding.matches(key); });
        if (it == menu.entries.end()) {
            result.error = std::format("key '{}' is not bound in this menu", chord.repr);
            return result;
        }

        if (tree_.node(it->child).is_action()) {
            if (i + 1 != sequence.size()) {
                result.error = std::format("key '{}' runs a command, the remaining keys cannot be used",
                                           chord.repr);
                return result;
            }
            result.outcome = Outcome{Outcome::Kind::Invoke, it->child, &*it};
            return result;
        }

        current = it->child;
        result.outcome = Outcome{Outcome::Kind::Descend, current, &*it};
    }

    state_.current = current;
    return result;
}

}  // namespace whichkey::keymap
