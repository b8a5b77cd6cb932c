#pragma once

#include "config/Config.hpp"
#include "keymap/Key.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace whichkey::keymap {

using NodeId = size_t;

struct KeyBinding {
    std::vector<KeyChord> any_of;  // aliases, at least one
    std::string label;             // "a | ctrl+a"
    std::string description;

    bool matches(const KeyInput& input) const;
};

struct Entry {
    KeyBinding binding;
    NodeId child = 0;
};

struct Submenu {
    std::string title;
    bool keep_open = false;  // default keep_open for actions below it
    std::vector<Entry> entries;
};

struct Action {
    std::string command;
    bool keep_open = false;
    bool repeatable = false;
};

struct Node {
    std::variant<Submenu, Action> body;
    std::optional<NodeId> parent;  // non-owning back link, empty for the root
    std::optional<size_t> entry_index;  // position in the parent's entry list

    bool is_submenu() const { return std::holds_alternative<Submenu>(body); }
    bool is_action() const { return std::holds_alternative<Action>(body); }
};

/**
 * Immutable keymap tree. Nodes live in one arena and refer to each other by
 * index: parent -> child edges through Entry::child, child -> parent through
 * Node::parent. Built once from the configuration, never mutated afterwards.
 */
class KeymapTree {
public:
    struct BuildOptions {
        std::string root_title;
    };

    // Throws util::ConfigError on duplicate chords, empty submenus,
    // entries with both or neither of cmd/submenu, or unparsable keys.
    static KeymapTree build(const std::vector<config::EntrySpec>& menu, const BuildOptions& options);
    static KeymapTree build(const std::vector<config::EntrySpec>& menu);

    NodeId root() const { return 0; }
    size_t size() const { return nodes_.size(); }

    const Node& node(NodeId id) const;
    const Submenu& submenu(NodeId id) const;
    const Action& action(NodeId id) const;
    std::optional<NodeId> parent(NodeId id) const;

    // The entry through which `id` is reached from its parent
    const Entry* entry_for(NodeId id) const;

    // Binding labels from the root down to `id`
    std::vector<std::string> path_to(NodeId id) const;

private:
    KeymapTree() = default;

    NodeId add_submenu(const std::vector<config::EntrySpec>& specs, std::string title, bool keep_open,
                       std::optional<NodeId> parent, std::optional<size_t> entry_index,
                       const std::string& path);

    std::vector<Node> nodes_;
};

}  // namespace whichkey::keymap
