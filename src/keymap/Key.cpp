#include "keymap/Key.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <format>
#include <sstream>

namespace whichkey::keymap {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

// Decodes `s` if it holds exactly one UTF-8 code point.
std::optional<uint32_t> single_code_point(const std::string& s) {
    if (s.empty()) return std::nullopt;
    unsigned char c = s[0];
    size_t len;
    uint32_t cp;
    if ((c & 0x80) == 0) { len = 1; cp = c; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return std::nullopt;

    if (s.size() != len) return std::nullopt;
    for (size_t i = 1; i < len; ++i) {
        unsigned char cc = s[i];
        if ((cc & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (cc & 0x3F);
    }
    return cp;
}

xkb_keysym_t to_keysym(const std::string& key) {
    if (auto cp = single_code_point(key)) {
        return xkb_utf32_to_keysym(*cp);
    }
    xkb_keysym_t sym = xkb_keysym_from_name(key.c_str(), XKB_KEYSYM_NO_FLAGS);
    if (sym == XKB_KEY_NoSymbol) {
        sym = xkb_keysym_from_name(key.c_str(), XKB_KEYSYM_CASE_INSENSITIVE);
    }
    return sym;
}

void set_error(std::string* error, std::string message) {
    if (error) *error = std::move(message);
}

}  // namespace

bool KeyInput::is_modifier_key() const {
    if (keysym >= XKB_KEY_Shift_L && keysym <= XKB_KEY_Hyper_R) return true;
    switch (keysym) {
        case XKB_KEY_ISO_Level3_Shift:
        case XKB_KEY_ISO_Level5_Shift:
        case XKB_KEY_ISO_Group_Shift:
        case XKB_KEY_Mode_switch:
        case XKB_KEY_Num_Lock:
            return true;
        default:
            return false;
    }
}

std::optional<KeyChord> parse_chord(const std::string& spelling, std::string* error) {
    if (spelling.empty()) {
        set_error(error, "empty key");
        return std::nullopt;
    }

    // The plus key itself: "+" or "<mods>++"
    std::string prefix;
    std::string key;
    if (spelling == "+") {
        key = "+";
    } else if (spelling.size() >= 2 && spelling.ends_with("++")) {
        key = "+";
        prefix = spelling.substr(0, spelling.size() - 2);
    } else {
        auto pos = spelling.rfind('+');
        if (pos == std::string::npos) {
            key = spelling;
        } else {
            key = spelling.substr(pos + 1);
            prefix = spelling.substr(0, pos);
        }
    }

    KeyChord chord;
    chord.repr = spelling;
    chord.keysym = key.empty() ? XKB_KEY_NoSymbol : to_keysym(key);
    if (chord.keysym == XKB_KEY_NoSymbol) {
        set_error(error, std::format("invalid key '{}'", key));
        return std::nullopt;
    }

    if (!prefix.empty()) {
        std::stringstream ss(prefix);
        std::string modifier;
        while (std::getline(ss, modifier, '+')) {
            if (iequals(modifier, "ctrl") || iequals(modifier, "control")) {
                chord.modifiers.ctrl = true;
            } else if (iequals(modifier, "alt")) {
                chord.modifiers.alt = true;
            } else if (iequals(modifier, "mod4") || iequals(modifier, "logo") || iequals(modifier, "super")) {
                chord.modifiers.logo = true;
            } else {
                set_error(error, std::format("unknown modifier '{}'", modifier));
                return std::nullopt;
            }
        }
    }

    return chord;
}

std::optional<std::vector<KeyChord>> parse_sequence(const std::string& sequence, std::string* error) {
    std::vector<KeyChord> chords;
    std::istringstream ss(sequence);
    std::string token;
    while (ss >> token) {
        auto chord = parse_chord(token, error);
        if (!chord) return std::nullopt;
        chords.push_back(std::move(*chord));
    }
    return chords;
}

std::string describe(const KeyInput& input) {
    char name[64];
    if (xkb_keysym_get_name(input.keysym, name, sizeof(name)) < 0) {
        std::snprintf(name, sizeof(name), "0x%x", input.keysym);
    }
    std::string out;
    if (input.modifiers.ctrl) out += "ctrl+";
    if (input.modifiers.alt) out += "alt+";
    if (input.modifiers.logo) out += "logo+";
    out += name;
    if (!input.pressed) out += " (release)";
    return out;
}

}  // namespace whichkey::keymap
