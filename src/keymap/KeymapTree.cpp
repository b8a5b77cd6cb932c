#include "keymap/KeymapTree.hpp"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace whichkey::keymap {

using util::ConfigError;

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string describe_path(const std::string& path) {
    return path.empty() ? "menu" : std::format("entry '{}'", path);
}

}  // namespace

bool KeyBinding::matches(const KeyInput& input) const {
    return std::any_of(any_of.begin(), any_of.end(),
                       [&input](const KeyChord& chord) { return input.matches(chord); });
}

KeymapTree KeymapTree::build(const std::vector<config::EntrySpec>& menu) {
    return build(menu, BuildOptions{});
}

KeymapTree KeymapTree::build(const std::vector<config::EntrySpec>& menu, const BuildOptions& options) {
    KeymapTree tree;
    tree.add_submenu(menu, options.root_title, false, std::nullopt, std::nullopt, "");
    util::Logger::debug(std::format("KeymapTree: Built {} nodes", tree.nodes_.size()));
    return tree;
}

NodeId KeymapTree::add_submenu(const std::vector<config::EntrySpec>& specs, std::string title, bool keep_open,
                               std::optional<NodeId> parent, std::optional<size_t> entry_index,
                               const std::string& path) {
    if (specs.empty()) {
        throw ConfigError(std::format("{}: submenu is empty", describe_path(path)));
    }

    // Reserve the slot first so children can point back at it
    NodeId id = nodes_.size();
    nodes_.push_back(Node{Submenu{std::move(title), keep_open, {}}, parent, entry_index});

    std::vector<Entry> entries;
    entries.reserve(specs.size());
    std::vector<const KeyChord*> seen;

    for (size_t i = 0; i < specs.size(); ++i) {
        const auto& spec = specs[i];
        if (spec.keys.empty()) {
            throw ConfigError(std::format("{}: entry {} has no key", describe_path(path), i));
        }

        KeyBinding binding;
        binding.description = spec.desc;
        for (const auto& spelling : spec.keys) {
            std::string error;
            auto chord = parse_chord(spelling, &error);
            if (!chord) {
                throw ConfigError(std::format("{}: {}", describe_path(path), error));
            }
            if (!binding.label.empty()) binding.label += " | ";
            binding.label += chord->repr;
            binding.any_of.push_back(std::move(*chord));
        }

        // Duplicates across aliases of this entry and all earlier entries
        std::vector<const KeyChord*> mine;
        for (const auto& chord : binding.any_of) {
            auto clash = [&chord](const KeyChord* other) { return other->same_key(chord); };
            if (std::any_of(seen.begin(), seen.end(), clash) || std::any_of(mine.begin(), mine.end(), clash)) {
                throw ConfigError(std::format("{}: duplicate binding '{}'", describe_path(path), chord.repr));
            }
            mine.push_back(&chord);
        }

        std::string entry_path = path.empty() ? binding.any_of.front().repr
                                              : path + " " + binding.any_of.front().repr;

        bool has_cmd = spec.cmd.has_value();
        if (has_cmd && spec.has_submenu) {
            throw ConfigError(std::format("{}: has both 'cmd' and 'submenu'", describe_path(entry_path)));
        }
        if (!has_cmd && !spec.has_submenu) {
            throw ConfigError(std::format("{}: needs either 'cmd' or 'submenu'", describe_path(entry_path)));
        }

        NodeId child;
        if (has_cmd) {
            if (is_blank(*spec.cmd)) {
                throw ConfigError(std::format("{}: 'cmd' is empty", describe_path(entry_path)));
            }
            child = nodes_.size();
            nodes_.push_back(Node{Action{*spec.cmd, spec.keep_open.value_or(keep_open), spec.repeatable}, id, i});
        } else {
            if (spec.repeatable) {
                throw ConfigError(std::format("{}: 'repeatable' only applies to commands",
                                              describe_path(entry_path)));
            }
            child = add_submenu(spec.submenu, spec.desc, spec.keep_open.value_or(keep_open), id, i, entry_path);
        }

        entries.push_back(Entry{std::move(binding), child});
        // Chords are stable now that the entry lives in `entries`' reserved storage
        for (const auto& chord : entries.back().binding.any_of) {
            seen.push_back(&chord);
        }
    }

    std::get<Submenu>(nodes_[id].body).entries = std::move(entries);
    return id;
}

const Node& KeymapTree::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range(std::format("KeymapTree: no node {}", id));
    }
    return nodes_[id];
}

const Submenu& KeymapTree::submenu(NodeId id) const {
    const auto* menu = std::get_if<Submenu>(&node(id).body);
    if (!menu) {
        throw std::logic_error(std::format("KeymapTree: node {} is not a submenu", id));
    }
    return *menu;
}

const Action& KeymapTree::action(NodeId id) const {
    const auto* act = std::get_if<Action>(&node(id).body);
    if (!act) {
        throw std::logic_error(std::format("KeymapTree: node {} is not an action", id));
    }
    return *act;
}

std::optional<NodeId> KeymapTree::parent(NodeId id) const {
    return node(id).parent;
}

const Entry* KeymapTree::entry_for(NodeId id) const {
    const auto& n = node(id);
    if (!n.parent || !n.entry_index) {
        return nullptr;
    }
    return &submenu(*n.parent).entries.at(*n.entry_index);
}

std::vector<std::string> KeymapTree::path_to(NodeId id) const {
    std::vector<std::string> labels;
    for (auto current = std::optional<NodeId>(id); current; current = node(*current).parent) {
        if (const auto* entry = entry_for(*current)) {
            labels.push_back(entry->binding.any_of.front().repr);
        }
    }
    std::reverse(labels.begin(), labels.end());
    return labels;
}

}  // namespace whichkey::keymap
