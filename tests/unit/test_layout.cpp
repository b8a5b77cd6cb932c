#include "../fakes/FakeMeasurer.hpp"
#include "../fakes/MenuBuilder.hpp"
#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "keymap/KeymapTree.hpp"
#include "ui/Layout.hpp"

using namespace whichkey::ui;
using namespace whichkey::test;
using whichkey::keymap::KeymapTree;

// Default theme with FakeMeasurer: padding 20, column padding 20,
// separator " ➜ " 30 px wide, 20 px lines.

namespace {

std::vector<whichkey::config::EntrySpec> six_entries() {
    std::vector<whichkey::config::EntrySpec> menu;
    for (const char* key : {"a", "b", "c", "d", "e", "f"}) {
        menu.push_back(cmd(key, "xxxx", std::string("run-") + key));
    }
    return menu;
}

}  // namespace

TEST_CASE(test_layout_is_deterministic) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    LayoutEngine engine(measurer, cfg);
    auto tree = KeymapTree::build(window_menu());

    auto first = engine.compute(tree, tree.root());
    auto second = engine.compute(tree, tree.root());
    ASSERT_TRUE(first == second);
    ASSERT_EQ(engine.computations(), 2u);
}

TEST_CASE(test_single_column_geometry) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    cfg.layout.columns = 1;
    LayoutEngine engine(measurer, cfg);
    auto tree = KeymapTree::build(window_menu());

    auto layout = engine.compute(tree, tree.root());
    ASSERT_EQ(layout.columns, 1u);
    ASSERT_EQ(layout.rows, 2u);
    ASSERT_EQ(layout.runs.size(), 2u);
    ASSERT_EQ(layout.width, 150);   // 20 + (10 + 30 + 70) + 20
    ASSERT_EQ(layout.height, 80);   // 20 + 2 * 20 + 20

    const auto& window = layout.runs[0];
    ASSERT_EQ(window.key, std::string("a"));
    ASSERT_EQ(window.description, std::string("+window"));
    ASSERT_TRUE(window.is_submenu);
    ASSERT_NEAR(window.x, 20.0, 1e-9);
    ASSERT_NEAR(window.y, 20.0, 1e-9);
    ASSERT_NEAR(window.separator_x, 30.0, 1e-9);
    ASSERT_NEAR(window.description_x, 60.0, 1e-9);

    const auto& quit = layout.runs[1];
    ASSERT_EQ(quit.description, std::string("quit"));
    ASSERT_FALSE(quit.is_submenu);
    ASSERT_NEAR(quit.y, 40.0, 1e-9);
}

TEST_CASE(test_keys_are_right_aligned_per_column) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    cfg.layout.columns = 1;
    LayoutEngine engine(measurer, cfg);
    std::vector<whichkey::config::EntrySpec> menu = {cmd("a", "short", "x"), cmd("ctrl+a", "long", "y")};
    auto tree = KeymapTree::build(menu);

    auto layout = engine.compute(tree, tree.root());
    ASSERT_NEAR(layout.runs[0].key_x, 70.0, 1e-9);  // 20 + (60 - 10)
    ASSERT_NEAR(layout.runs[1].key_x, 20.0, 1e-9);
    ASSERT_NEAR(layout.runs[0].separator_x, layout.runs[1].separator_x, 1e-9);
}

TEST_CASE(test_columns_follow_target_aspect) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    LayoutEngine engine(measurer, cfg);
    auto tree = KeymapTree::build(six_entries());

    // 2 columns: 220x100 (2.2), 3 columns: 320x80 (4.0); 2.2 is closer to 3.0
    auto layout = engine.compute(tree, tree.root());
    ASSERT_EQ(layout.columns, 2u);
    ASSERT_EQ(layout.rows, 3u);
    ASSERT_EQ(layout.width, 220);
    ASSERT_EQ(layout.height, 100);

    // Row-major packing in declaration order
    ASSERT_EQ(layout.runs[1].row, 0u);
    ASSERT_EQ(layout.runs[1].column, 1u);
    ASSERT_EQ(layout.runs[2].row, 1u);
    ASSERT_EQ(layout.runs[2].column, 0u);
    ASSERT_NEAR(layout.runs[1].x, 120.0, 1e-9);  // 20 + 80 + 20
}

TEST_CASE(test_rows_per_column_and_fixed_columns) {
    FakeMeasurer measurer;
    auto tree = KeymapTree::build(six_entries());

    whichkey::config::Config by_rows;
    by_rows.layout.rows_per_column = 2;
    LayoutEngine rows_engine(measurer, by_rows);
    auto layout = rows_engine.compute(tree, tree.root());
    ASSERT_EQ(layout.columns, 3u);
    ASSERT_EQ(layout.rows, 2u);

    whichkey::config::Config fixed;
    fixed.layout.columns = 10;  // clamped to the entry count
    LayoutEngine fixed_engine(measurer, fixed);
    layout = fixed_engine.compute(tree, tree.root());
    ASSERT_EQ(layout.columns, 6u);
    ASSERT_EQ(layout.rows, 1u);
}

TEST_CASE(test_title_is_centred_above_entries) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    cfg.layout.columns = 1;
    LayoutEngine engine(measurer, cfg);
    auto tree = KeymapTree::build(window_menu(), {"Main"});

    auto layout = engine.compute(tree, tree.root());
    ASSERT_EQ(layout.title, std::string("Main"));
    ASSERT_NEAR(layout.title_x, 55.0, 1e-9);  // (150 - 40) / 2
    ASSERT_NEAR(layout.title_y, 20.0, 1e-9);
    ASSERT_NEAR(layout.runs[0].y, 50.0, 1e-9);  // below a 1.5 line header
    ASSERT_EQ(layout.height, 110);
}

TEST_CASE(test_long_descriptions_are_truncated) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    cfg.layout.max_entry_width = 100.0;
    LayoutEngine engine(measurer, cfg);
    std::vector<whichkey::config::EntrySpec> menu = {cmd("a", "abcdefghij", "x"), cmd("b", "ok", "y")};
    auto tree = KeymapTree::build(menu);

    auto layout = engine.compute(tree, tree.root());
    ASSERT_EQ(layout.runs[0].description, std::string("abcde…"));
    ASSERT_EQ(layout.runs[1].description, std::string("ok"));
    for (const auto& run : layout.runs) {
        ASSERT_TRUE(run.width <= 100.0);
    }
}

TEST_CASE(test_empty_submenu_shows_placeholder) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    LayoutEngine engine(measurer, cfg);

    auto layout = engine.compute("Nothing here", {});
    ASSERT_TRUE(layout.placeholder);
    ASSERT_EQ(layout.runs.size(), 1u);
    ASSERT_EQ(layout.runs[0].description, std::string(LayoutEngine::PLACEHOLDER_TEXT));
    ASSERT_TRUE(layout.width > 0);
    ASSERT_TRUE(layout.height > 0);
}

TEST_CASE(test_submenu_layout_after_descend) {
    FakeMeasurer measurer;
    whichkey::config::Config cfg;
    LayoutEngine engine(measurer, cfg);
    auto tree = KeymapTree::build(window_menu());
    auto window = tree.submenu(tree.root()).entries[0].child;

    auto layout = engine.compute(tree, window);
    ASSERT_EQ(layout.title, std::string("window"));
    ASSERT_EQ(layout.runs.size(), 1u);
    ASSERT_EQ(layout.runs[0].key, std::string("c"));
    ASSERT_EQ(layout.runs[0].description, std::string("close"));
}

int main() {
    return whichkey::test::TestRunner::instance().run_all();
}
