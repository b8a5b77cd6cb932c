#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <xkbcommon/xkbcommon.h>

namespace whichkey::keymap {

// Modifiers that take part in matching. Shift is folded into the keysym.
struct ModifierSet {
    bool ctrl = false;
    bool alt = false;
    bool logo = false;

    bool operator==(const ModifierSet& other) const = default;
    bool empty() const { return !ctrl && !alt && !logo; }
};

/**
 * One physical key as written in the configuration: a keysym plus the
 * modifiers that must be held. `repr` keeps the user's spelling for display.
 */
struct KeyChord {
    xkb_keysym_t keysym = XKB_KEY_NoSymbol;
    ModifierSet modifiers;
    std::string repr;

    // Identity ignores the spelling: "ctrl+a" and "Ctrl+a" are the same chord
    bool same_key(const KeyChord& other) const {
        return keysym == other.keysym && modifiers == other.modifiers;
    }
};

/**
 * A key event as delivered by the compositor, already translated to a keysym
 * through the active xkb state.
 */
struct KeyInput {
    xkb_keysym_t keysym = XKB_KEY_NoSymbol;
    ModifierSet modifiers;
    bool pressed = true;
    uint32_t keycode = 0;

    bool matches(const KeyChord& chord) const {
        return chord.keysym == keysym && chord.modifiers == modifiers;
    }

    bool is_modifier_key() const;
};

// Parses "[mod+]*key". Returns std::nullopt and fills `error` on failure.
std::optional<KeyChord> parse_chord(const std::string& spelling, std::string* error = nullptr);

// Parses a whitespace separated chord sequence ("p s", "ctrl+x b").
std::optional<std::vector<KeyChord>> parse_sequence(const std::string& sequence,
                                                    std::string* error = nullptr);

// Human readable form of a key input, for logs.
std::string describe(const KeyInput& input);

}  // namespace whichkey::keymap
