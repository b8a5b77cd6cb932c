#include "../framework/SimpleTest.hpp"
#include "config/Theme.hpp"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <cstdlib>
#include <string>

using namespace whichkey::util;
using whichkey::config::Color;
using whichkey::config::Theme;

namespace {

auto bytes_at_most(size_t n) {
    return [n](const std::string& s) { return s.size() <= n; };
}

}  // namespace

// ========== GRAPHEMES ==========

TEST_CASE(test_grapheme_boundaries_ascii) {
    auto bounds = grapheme_boundaries("abc");
    ASSERT_EQ(bounds.size(), 4u);
    ASSERT_EQ(bounds.front(), 0u);
    ASSERT_EQ(bounds.back(), 3u);
}

TEST_CASE(test_grapheme_boundaries_keep_combining_marks) {
    // "e" + COMBINING ACUTE ACCENT is one grapheme of three bytes
    std::string text = "e\xCC\x81x";
    auto bounds = grapheme_boundaries(text);
    ASSERT_EQ(bounds.size(), 3u);
    ASSERT_EQ(bounds[1], 3u);
}

TEST_CASE(test_truncate_returns_fitting_text_unchanged) {
    ASSERT_EQ(truncate_with_ellipsis("short", bytes_at_most(10)), std::string("short"));
}

TEST_CASE(test_truncate_appends_ellipsis) {
    // "…" is three bytes
    ASSERT_EQ(truncate_with_ellipsis("abcdefgh", bytes_at_most(6)), std::string("abc…"));
    ASSERT_EQ(truncate_with_ellipsis("abcdefgh", bytes_at_most(6), "..."), std::string("abc..."));
}

TEST_CASE(test_truncate_never_splits_a_grapheme) {
    std::string text = "e\xCC\x81" "abcd";
    ASSERT_EQ(truncate_with_ellipsis(text, bytes_at_most(5)), std::string("…"));
    ASSERT_EQ(truncate_with_ellipsis(text, bytes_at_most(6)), std::string("e\xCC\x81…"));
}

TEST_CASE(test_truncate_bare_ellipsis_when_nothing_fits) {
    ASSERT_EQ(truncate_with_ellipsis("abc", bytes_at_most(1)), std::string("…"));
}

// ========== LOGGER ==========

TEST_CASE(test_logger_parse_level) {
    ASSERT_TRUE(Logger::parse_level("debug", Logger::Level::Info) == Logger::Level::Debug);
    ASSERT_TRUE(Logger::parse_level("WARNING", Logger::Level::Info) == Logger::Level::Warn);
    ASSERT_TRUE(Logger::parse_level("Error", Logger::Level::Info) == Logger::Level::Error);
    ASSERT_TRUE(Logger::parse_level("chatty", Logger::Level::Info) == Logger::Level::Info);
}

TEST_CASE(test_logger_set_level) {
    auto previous = Logger::level();
    Logger::set_level(Logger::Level::Error);
    ASSERT_TRUE(Logger::level() == Logger::Level::Error);
    Logger::debug("not written");
    Logger::set_level(previous);
}

// ========== PLATFORM ==========

TEST_CASE(test_config_directory_prefers_xdg) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    ASSERT_TRUE(Platform::get_config_directory() == std::filesystem::path("/tmp/xdg-test/whichkey"));

    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/tester", 1);
    ASSERT_TRUE(Platform::get_config_directory() == std::filesystem::path("/home/tester/.config/whichkey"));
}

TEST_CASE(test_resolve_config_file) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    ASSERT_TRUE(Platform::resolve_config_file("config") == std::filesystem::path("/tmp/xdg-test/whichkey/config.yaml"));
    ASSERT_TRUE(Platform::resolve_config_file("print-screen.yml") ==
                std::filesystem::path("/tmp/xdg-test/whichkey/print-screen.yml"));
    ASSERT_TRUE(Platform::resolve_config_file("/etc/whichkey/menu") == std::filesystem::path("/etc/whichkey/menu.yaml"));
    ::unsetenv("XDG_CONFIG_HOME");
}

// ========== COLORS AND THEME ==========

TEST_CASE(test_color_parse) {
    auto opaque = Color::parse("#ff8000");
    ASSERT_TRUE(opaque.has_value());
    ASSERT_NEAR(opaque->r, 1.0, 1e-9);
    ASSERT_NEAR(opaque->g, 128.0 / 255.0, 1e-9);
    ASSERT_NEAR(opaque->b, 0.0, 1e-9);
    ASSERT_NEAR(opaque->a, 1.0, 1e-9);

    auto translucent = Color::parse("00000000");
    ASSERT_TRUE(translucent.has_value());
    ASSERT_NEAR(translucent->a, 0.0, 1e-9);

    ASSERT_FALSE(Color::parse("#fff").has_value());
    ASSERT_FALSE(Color::parse("#gggggg").has_value());
    ASSERT_FALSE(Color::parse("").has_value());
}

TEST_CASE(test_theme_padding_fallbacks) {
    Theme theme;
    theme.corner_r = 15.0;
    ASSERT_NEAR(theme.effective_padding(), 15.0, 1e-9);
    ASSERT_NEAR(theme.effective_column_padding(), 15.0, 1e-9);

    theme.padding = 6.0;
    ASSERT_NEAR(theme.effective_column_padding(), 6.0, 1e-9);
    theme.column_padding = 30.0;
    ASSERT_NEAR(theme.effective_column_padding(), 30.0, 1e-9);
}

TEST_CASE(test_exit_codes) {
    ASSERT_EQ(to_int(ExitCode::Ok), 0);
    ASSERT_EQ(to_int(ExitCode::Config), 2);
    ASSERT_EQ(to_int(ExitCode::Grab), 3);
    ASSERT_EQ(to_int(ExitCode::Protocol), 4);
}

int main() {
    return whichkey::test::TestRunner::instance().run_all();
}
