#pragma once

#include "exec/ActionExecutor.hpp"
#include "keymap/KeymapTree.hpp"
#include "keymap/Matcher.hpp"
#include "util/Errors.hpp"
#include <optional>
#include <string>

namespace whichkey::session {

/**
 * Result of walking `--initial-keys` before any surface exists. Exactly one
 * of `start` and `exit` is set.
 */
struct Preselection {
    std::optional<keymap::NodeId> start;  // open the overlay at this submenu
    std::optional<util::ExitCode> exit;   // finished without an overlay
    std::string error;                    // usage message when exit is Failure
};

// Walks `keys` ("p s") from the root. A sequence that ends on an action runs
// it through `executor` and finishes; keep-open actions, unbound or
// unparsable keys and empty sequences are usage errors.
Preselection preselect(const keymap::KeymapTree& tree, const keymap::MatchPolicy& policy, const std::string& keys,
                       exec::ActionExecutor& executor);

}  // namespace whichkey::session
