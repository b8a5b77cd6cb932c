#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "config/Theme.hpp"
#include "util/Errors.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace whichkey::config;
using whichkey::util::ConfigError;

// ========== DEFAULTS ==========

TEST_CASE(test_empty_document_yields_defaults) {
    auto cfg = ConfigLoader::parse("");
    ASSERT_TRUE(cfg.menu.empty());
    ASSERT_TRUE(cfg.anchor == Anchor::Center);
    ASSERT_EQ(cfg.timeout.count(), 0);
    ASSERT_EQ(cfg.cancel_keys.size(), 2u);
    ASSERT_EQ(cfg.back_keys.size(), 1u);
    ASSERT_TRUE(cfg.on_unmatched == KeyPolicy::Ignore);
    ASSERT_FALSE(cfg.inhibit_compositor_keyboard_shortcuts);
    ASSERT_NEAR(cfg.theme.effective_padding(), cfg.theme.corner_r, 1e-9);
}

TEST_CASE(test_full_menu_entry) {
    auto cfg = ConfigLoader::parse(R"(
menu:
  - key: a
    desc: apps
    submenu:
      - key: [f, "ctrl+f"]
        desc: firefox
        cmd: firefox
        keep_open: true
  - key: v
    desc: volume up
    cmd: pactl set-sink-volume @DEFAULT_SINK@ +5%
    repeatable: true
)");
    ASSERT_EQ(cfg.menu.size(), 2u);

    const auto& apps = cfg.menu[0];
    ASSERT_TRUE(apps.has_submenu);
    ASSERT_FALSE(apps.cmd.has_value());
    ASSERT_EQ(apps.submenu.size(), 1u);

    const auto& firefox = apps.submenu[0];
    ASSERT_EQ(firefox.keys.size(), 2u);
    ASSERT_EQ(firefox.keys[1], std::string("ctrl+f"));
    ASSERT_EQ(*firefox.cmd, std::string("firefox"));
    ASSERT_TRUE(firefox.keep_open.has_value() && *firefox.keep_open);

    ASSERT_TRUE(cfg.menu[1].repeatable);
    ASSERT_FALSE(cfg.menu[1].keep_open.has_value());
}

TEST_CASE(test_keep_open_spelling_alias) {
    auto cfg = ConfigLoader::parse("menu:\n  - {key: a, desc: x, cmd: x, keep-open: true}\n");
    ASSERT_TRUE(cfg.menu[0].keep_open.value_or(false));
}

TEST_CASE(test_old_mapping_format) {
    auto cfg = ConfigLoader::parse(R"(
menu:
  p:
    desc: power
    submenu:
      s: {desc: suspend, cmd: systemctl suspend}
  l: {desc: lock, cmd: swaylock}
)");
    ASSERT_EQ(cfg.menu.size(), 2u);
    ASSERT_EQ(cfg.menu[0].keys[0], std::string("p"));
    ASSERT_EQ(cfg.menu[0].submenu[0].keys[0], std::string("s"));
    ASSERT_EQ(*cfg.menu[1].cmd, std::string("swaylock"));
}

TEST_CASE(test_old_format_rejects_key_field) {
    ASSERT_THROWS(ConfigLoader::parse("menu:\n  a: {key: b, desc: x, cmd: x}\n"), ConfigError);
}

// ========== TOP-LEVEL FIELDS ==========

TEST_CASE(test_theme_and_placement_fields) {
    auto cfg = ConfigLoader::parse(R"(
background: "#00000080"
color: "#ffffff"
border: "ff0000"
font: "JetBrains Mono 12"
separator: " -> "
border_width: 2
corner_r: 8
padding: 12
anchor: bottom-right
margin_bottom: 40
margin_right: 30
title: Leader
)");
    ASSERT_NEAR(cfg.theme.background.a, 128.0 / 255.0, 1e-9);
    ASSERT_NEAR(cfg.theme.color.r, 1.0, 1e-9);
    ASSERT_NEAR(cfg.theme.border.r, 1.0, 1e-9);
    ASSERT_NEAR(cfg.theme.border.g, 0.0, 1e-9);
    ASSERT_EQ(cfg.theme.font, std::string("JetBrains Mono 12"));
    ASSERT_EQ(cfg.theme.separator, std::string(" -> "));
    ASSERT_NEAR(cfg.theme.effective_padding(), 12.0, 1e-9);
    ASSERT_NEAR(cfg.theme.effective_column_padding(), 12.0, 1e-9);
    ASSERT_TRUE(cfg.anchor == Anchor::BottomRight);
    ASSERT_EQ(cfg.margin_bottom, 40);
    ASSERT_EQ(cfg.margin_right, 30);
    ASSERT_EQ(cfg.title, std::string("Leader"));
}

TEST_CASE(test_layout_fields) {
    auto cfg = ConfigLoader::parse("rows_per_column: 4\ntarget_aspect: 2.5\nmax_entry_width: 300\n");
    ASSERT_TRUE(cfg.layout.rows_per_column.has_value());
    ASSERT_EQ(*cfg.layout.rows_per_column, 4u);
    ASSERT_FALSE(cfg.layout.columns.has_value());
    ASSERT_NEAR(cfg.layout.target_aspect, 2.5, 1e-9);
    ASSERT_NEAR(cfg.layout.max_entry_width, 300.0, 1e-9);
}

TEST_CASE(test_timeout_in_seconds) {
    auto cfg = ConfigLoader::parse("timeout: 1.5\n");
    ASSERT_EQ(cfg.timeout.count(), 1500);
}

TEST_CASE(test_timeout_bounds) {
    ASSERT_EQ(timeout_from_seconds(0.25)->count(), 250);
    ASSERT_EQ(timeout_from_seconds(0.0)->count(), 0);
    ASSERT_EQ(timeout_from_seconds(86400.0)->count(), 86400000);
    ASSERT_FALSE(timeout_from_seconds(-1.0).has_value());
    ASSERT_FALSE(timeout_from_seconds(86401.0).has_value());
    ASSERT_FALSE(timeout_from_seconds(1e300).has_value());
    ASSERT_FALSE(timeout_from_seconds(std::nan("")).has_value());
}

TEST_CASE(test_key_lists_and_policies) {
    auto cfg = ConfigLoader::parse(R"(
cancel_keys: q
back_keys: [BackSpace, h]
on_unmatched: cancel
on_modifier_release: cancel
inhibit_compositor_keyboard_shortcuts: true
auto_kbd_layout: true
)");
    ASSERT_EQ(cfg.cancel_keys.size(), 1u);
    ASSERT_EQ(cfg.cancel_keys[0], std::string("q"));
    ASSERT_EQ(cfg.back_keys.size(), 2u);
    ASSERT_TRUE(cfg.on_unmatched == KeyPolicy::Cancel);
    ASSERT_TRUE(cfg.on_modifier_release == KeyPolicy::Cancel);
    ASSERT_TRUE(cfg.inhibit_compositor_keyboard_shortcuts);
    ASSERT_TRUE(cfg.auto_kbd_layout);
}

// ========== INVALID INPUT ==========

TEST_CASE(test_invalid_values_are_config_errors) {
    ASSERT_THROWS(ConfigLoader::parse("menu: [\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("- a\n- b\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("colour: \"#ffffff\"\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("background: blue\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("anchor: middle\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("columns: 0\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("columns: many\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("timeout: -1\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("timeout: 100000\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("timeout: 1e300\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("timeout: .nan\n"), ConfigError);
    // Keys must be scalars
    ASSERT_THROWS(ConfigLoader::parse("? [oops]\n: 1\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("target_aspect: 0\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("on_unmatched: maybe\n"), ConfigError);
}

TEST_CASE(test_invalid_entries_are_config_errors) {
    ASSERT_THROWS(ConfigLoader::parse("menu:\n  - {desc: x, cmd: x}\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("menu:\n  - {key: a, desc: x, command: x}\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("menu:\n  - {key: a, desc: x, cmd: x, keep_open: sometimes}\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("menu:\n  - 42\n"), ConfigError);
    ASSERT_THROWS(ConfigLoader::parse("menu:\n  - key: a\n    desc: x\n    cmd: x\n    ? [bad]\n    : 1\n"),
                  ConfigError);
}

TEST_CASE(test_error_message_names_the_line) {
    bool caught = false;
    try {
        ConfigLoader::parse("title: x\nmenu:\n  - {key: a, desc: x, bogus: 1}\n");
    } catch (const ConfigError& e) {
        caught = true;
        std::string message = e.what();
        ASSERT_TRUE(message.find("bogus") != std::string::npos);
        ASSERT_TRUE(message.find("line 3") != std::string::npos);
    }
    ASSERT_TRUE(caught);
}

// ========== FILES ==========

TEST_CASE(test_load_from_xdg_config_home) {
    auto dir = std::filesystem::temp_directory_path() / ("whichkey-test-" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir / "whichkey");
    {
        std::ofstream out(dir / "whichkey" / "leader.yaml");
        out << "title: From file\nmenu:\n  - {key: a, desc: x, cmd: x}\n";
    }
    ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);

    auto cfg = ConfigLoader::load("leader");
    ASSERT_EQ(cfg.title, std::string("From file"));
    ASSERT_EQ(cfg.menu.size(), 1u);

    ASSERT_THROWS(ConfigLoader::load("missing"), ConfigError);

    ::unsetenv("XDG_CONFIG_HOME");
    std::filesystem::remove_all(dir);
}

int main() {
    return whichkey::test::TestRunner::instance().run_all();
}
