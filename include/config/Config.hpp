#pragma once

#include "config/Theme.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace whichkey::config {

enum class Anchor {
    Center,
    Top,
    Bottom,
    Left,
    Right,
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
};

// What a key event outside the bindings does
enum class KeyPolicy {
    Ignore,
    Cancel,
};

/**
 * One menu entry exactly as written in the configuration. Validation
 * (cmd xor submenu, key spelling, duplicates) happens in KeymapTree::build.
 */
struct EntrySpec {
    std::vector<std::string> keys;
    std::string desc;
    std::optional<std::string> cmd;
    bool has_submenu = false;
    std::vector<EntrySpec> submenu;
    std::optional<bool> keep_open;
    bool repeatable = false;
};

struct LayoutOptions {
    std::optional<size_t> rows_per_column;
    std::optional<size_t> columns;
    double target_aspect = 3.0;
    double max_entry_width = 0.0;  // 0 = unlimited
};

struct Config {
    Theme theme;

    Anchor anchor = Anchor::Center;
    int32_t margin_top = 0;
    int32_t margin_right = 0;
    int32_t margin_bottom = 0;
    int32_t margin_left = 0;

    LayoutOptions layout;
    std::string title;

    // Idle timeout, zero disables it
    std::chrono::milliseconds timeout{0};

    std::vector<std::string> cancel_keys{"Escape", "ctrl+["};
    std::vector<std::string> back_keys{"BackSpace"};
    KeyPolicy on_unmatched = KeyPolicy::Ignore;
    KeyPolicy on_modifier_release = KeyPolicy::Ignore;

    bool inhibit_compositor_keyboard_shortcuts = false;
    bool auto_kbd_layout = false;

    std::vector<EntrySpec> menu;
};

// Longest accepted idle timeout
constexpr std::chrono::seconds MAX_TIMEOUT{24 * 60 * 60};

// Seconds (fractions allowed) to an idle timeout. Empty for negative, NaN or
// values above MAX_TIMEOUT.
std::optional<std::chrono::milliseconds> timeout_from_seconds(double seconds);

class ConfigLoader {
public:
    // Loads `name` from the config directory (see Platform::resolve_config_file)
    static Config load(const std::string& name);
    static Config load_from_file(const std::filesystem::path& path);
    static Config parse(const std::string& yaml_text);
};

}  // namespace whichkey::config
