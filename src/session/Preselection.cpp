#include "session/Preselection.hpp"
#include "session/OverlaySession.hpp"
#include "util/Logger.hpp"
#include <format>

namespace whichkey::session {

namespace {

Preselection usage_error(std::string message) {
    Preselection result;
    result.exit = util::ExitCode::Failure;
    result.error = std::move(message);
    return result;
}

}  // namespace

Preselection preselect(const keymap::KeymapTree& tree, const keymap::MatchPolicy& policy, const std::string& keys,
                       exec::ActionExecutor& executor) {
    std::string error;
    auto sequence = keymap::parse_sequence(keys, &error);
    if (!sequence) {
        return usage_error(error);
    }

    keymap::Matcher matcher(tree, policy);
    auto nav = matcher.navigate(*sequence);
    if (!nav.outcome) {
        return usage_error(nav.error.empty() ? std::string("empty key sequence") : nav.error);
    }

    if (nav.outcome->kind == keymap::Outcome::Kind::Descend) {
        util::Logger::info(std::format("Preselection: Starting at '{}'", tree.submenu(nav.outcome->target).title));
        Preselection result;
        result.start = nav.outcome->target;
        return result;
    }

    const auto& action = tree.action(nav.outcome->target);
    if (action.keep_open) {
        return usage_error("a keep-open action needs the overlay");
    }

    auto env = action_environment(tree, nav.outcome->target, sequence->back().repr);
    if (auto spawn_error = executor.run(action.command, env)) {
        util::Logger::error(std::format("Preselection: Failed to run '{}': {}", action.command, spawn_error->message));
    }

    Preselection result;
    result.exit = util::ExitCode::Ok;
    return result;
}

}  // namespace whichkey::session
