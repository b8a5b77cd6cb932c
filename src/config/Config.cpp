#include "config/Config.hpp"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace whichkey::config {

using util::ConfigError;
using util::Logger;

namespace {

std::string where(const YAML::Node& node, const std::string& path) {
    auto mark = node.Mark();
    if (mark.line >= 0) {
        return std::format("{} (line {})", path, mark.line + 1);
    }
    return path;
}

template <typename T>
T scalar(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError(std::format("{}: invalid value", where(node, path)));
    }
}

Color color(const YAML::Node& node, const std::string& path) {
    auto text = scalar<std::string>(node, path);
    auto parsed = Color::parse(text);
    if (!parsed) {
        throw ConfigError(std::format("{}: invalid color '{}'", where(node, path), text));
    }
    return *parsed;
}

Anchor anchor(const YAML::Node& node, const std::string& path) {
    auto text = scalar<std::string>(node, path);
    if (text == "center") return Anchor::Center;
    if (text == "top") return Anchor::Top;
    if (text == "bottom") return Anchor::Bottom;
    if (text == "left") return Anchor::Left;
    if (text == "right") return Anchor::Right;
    if (text == "top-left") return Anchor::TopLeft;
    if (text == "top-right") return Anchor::TopRight;
    if (text == "bottom-left") return Anchor::BottomLeft;
    if (text == "bottom-right") return Anchor::BottomRight;
    throw ConfigError(std::format("{}: unknown anchor '{}'", where(node, path), text));
}

KeyPolicy policy(const YAML::Node& node, const std::string& path) {
    auto text = scalar<std::string>(node, path);
    if (text == "ignore") return KeyPolicy::Ignore;
    if (text == "cancel") return KeyPolicy::Cancel;
    throw ConfigError(std::format("{}: expected 'ignore' or 'cancel', got '{}'", where(node, path), text));
}

std::vector<std::string> key_list(const YAML::Node& node, const std::string& path) {
    std::vector<std::string> keys;
    if (node.IsScalar()) {
        keys.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (size_t i = 0; i < node.size(); ++i) {
            keys.push_back(scalar<std::string>(node[i], std::format("{}[{}]", path, i)));
        }
    } else {
        throw ConfigError(std::format("{}: expected a key or a list of keys", where(node, path)));
    }
    return keys;
}

size_t positive_count(const YAML::Node& node, const std::string& path) {
    auto value = scalar<long long>(node, path);
    if (value <= 0) {
        throw ConfigError(std::format("{}: must be a positive number", where(node, path)));
    }
    return static_cast<size_t>(value);
}

std::vector<EntrySpec> parse_entries(const YAML::Node& node, const std::string& path);
std::vector<EntrySpec> parse_compat_entries(const YAML::Node& node, const std::string& path);

EntrySpec parse_entry(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw ConfigError(std::format("{}: expected a mapping", where(node, path)));
    }

    EntrySpec entry;
    bool has_key = false;
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto field = scalar<std::string>(it->first, path);
        const YAML::Node& value = it->second;
        auto field_path = std::format("{}.{}", path, field);

        if (field == "key") {
            entry.keys = key_list(value, field_path);
            has_key = true;
        } else if (field == "desc") {
            entry.desc = scalar<std::string>(value, field_path);
        } else if (field == "cmd") {
            entry.cmd = scalar<std::string>(value, field_path);
        } else if (field == "submenu") {
            entry.has_submenu = true;
            entry.submenu = parse_entries(value, field_path);
        } else if (field == "keep_open" || field == "keep-open") {
            entry.keep_open = scalar<bool>(value, field_path);
        } else if (field == "repeatable") {
            entry.repeatable = scalar<bool>(value, field_path);
        } else {
            throw ConfigError(std::format("{}: unknown field '{}'", where(it->first, path), field));
        }
    }

    if (!has_key) {
        throw ConfigError(std::format("{}: missing field 'key'", where(node, path)));
    }
    return entry;
}

std::vector<EntrySpec> parse_entries(const YAML::Node& node, const std::string& path) {
    if (node.IsNull()) {
        return {};
    }
    if (node.IsMap()) {
        return parse_compat_entries(node, path);
    }
    if (!node.IsSequence()) {
        throw ConfigError(std::format("{}: expected a list of entries", where(node, path)));
    }

    std::vector<EntrySpec> entries;
    for (size_t i = 0; i < node.size(); ++i) {
        entries.push_back(parse_entry(node[i], std::format("{}[{}]", path, i)));
    }
    return entries;
}

// Old format: a mapping from key to {desc, cmd|submenu, keep_open}
std::vector<EntrySpec> parse_compat_entries(const YAML::Node& node, const std::string& path) {
    static bool warned = false;
    if (!warned) {
        Logger::warn("Using the old config format, which will be removed in a future version");
        warned = true;
    }

    std::vector<EntrySpec> entries;
    for (auto it = node.begin(); it != node.end(); ++it) {
        auto key = scalar<std::string>(it->first, path);
        auto entry_path = std::format("{}.{}", path, key);
        const YAML::Node& value = it->second;
        if (!value.IsMap()) {
            throw ConfigError(std::format("{}: expected a mapping", where(value, entry_path)));
        }
        if (value["key"]) {
            throw ConfigError(std::format("{}: 'key' is not allowed in the old format", where(value, entry_path)));
        }

        YAML::Node with_key = YAML::Clone(value);
        with_key["key"] = key;
        entries.push_back(parse_entry(with_key, entry_path));
    }
    return entries;
}

}  // namespace

std::optional<std::chrono::milliseconds> timeout_from_seconds(double seconds) {
    // Also rejects NaN
    if (!(seconds >= 0.0 && seconds <= static_cast<double>(MAX_TIMEOUT.count()))) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(std::llround(seconds * 1000.0));
}

Config ConfigLoader::load(const std::string& name) {
    auto path = util::Platform::resolve_config_file(name);
    Logger::info(std::format("Config: Loading {}", path.string()));

    if (!std::filesystem::exists(path)) {
        throw ConfigError(std::format("config file not found: {}", path.string()));
    }
    return load_from_file(path);
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError(std::format("failed to read configuration: {}", path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parse(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(std::format("{}: {}", path.string(), e.what()));
    }
}

Config ConfigLoader::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::format("failed to deserialize configuration: {}", e.what()));
    }

    Config cfg;
    if (root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration must be a mapping");
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        auto key = scalar<std::string>(it->first, "config");
        const YAML::Node& value = it->second;

        if (key == "background") cfg.theme.background = color(value, key);
        else if (key == "color") cfg.theme.color = color(value, key);
        else if (key == "border") cfg.theme.border = color(value, key);
        else if (key == "font") cfg.theme.font = scalar<std::string>(value, key);
        else if (key == "separator") cfg.theme.separator = scalar<std::string>(value, key);
        else if (key == "border_width") cfg.theme.border_width = scalar<double>(value, key);
        else if (key == "corner_r") cfg.theme.corner_r = scalar<double>(value, key);
        else if (key == "padding") cfg.theme.padding = scalar<double>(value, key);
        else if (key == "column_padding") cfg.theme.column_padding = scalar<double>(value, key);
        else if (key == "anchor") cfg.anchor = anchor(value, key);
        else if (key == "margin_top") cfg.margin_top = scalar<int32_t>(value, key);
        else if (key == "margin_right") cfg.margin_right = scalar<int32_t>(value, key);
        else if (key == "margin_bottom") cfg.margin_bottom = scalar<int32_t>(value, key);
        else if (key == "margin_left") cfg.margin_left = scalar<int32_t>(value, key);
        else if (key == "rows_per_column") cfg.layout.rows_per_column = positive_count(value, key);
        else if (key == "columns") cfg.layout.columns = positive_count(value, key);
        else if (key == "target_aspect") {
            cfg.layout.target_aspect = scalar<double>(value, key);
            if (!(cfg.layout.target_aspect > 0.0)) {
                throw ConfigError(std::format("{}: must be greater than zero", where(value, key)));
            }
        }
        else if (key == "max_entry_width") cfg.layout.max_entry_width = scalar<double>(value, key);
        else if (key == "title") cfg.title = scalar<std::string>(value, key);
        else if (key == "timeout") {
            auto timeout = timeout_from_seconds(scalar<double>(value, key));
            if (!timeout) {
                throw ConfigError(std::format("{}: must be between 0 and {} seconds", where(value, key),
                                              MAX_TIMEOUT.count()));
            }
            cfg.timeout = *timeout;
        }
        else if (key == "cancel_keys") cfg.cancel_keys = key_list(value, key);
        else if (key == "back_keys") cfg.back_keys = key_list(value, key);
        else if (key == "on_unmatched") cfg.on_unmatched = policy(value, key);
        else if (key == "on_modifier_release") cfg.on_modifier_release = policy(value, key);
        else if (key == "inhibit_compositor_keyboard_shortcuts") {
            cfg.inhibit_compositor_keyboard_shortcuts = scalar<bool>(value, key);
        }
        else if (key == "auto_kbd_layout") cfg.auto_kbd_layout = scalar<bool>(value, key);
        else if (key == "menu") cfg.menu = parse_entries(value, key);
        else {
            throw ConfigError(std::format("{}: unknown field '{}'", where(it->first, "config"), key));
        }
    }

    Logger::debug(std::format("Config: Parsed {} top-level entries", cfg.menu.size()));
    return cfg;
}

}  // namespace whichkey::config
