#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace whichkey::exec {

using Environment = std::vector<std::pair<std::string, std::string>>;

struct SpawnError {
    int error_code = 0;  // errno of the failed step
    std::string message;
};

/**
 * Runs action commands. Returns once the command is launched, never waits
 * for it to finish.
 */
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;

    // `extra` is added to the inherited environment, overriding duplicates
    virtual std::optional<SpawnError> run(const std::string& command, const Environment& extra) = 0;
};

/**
 * Launches commands through `sh -c` as detached daemons: new session,
 * stdio on /dev/null, reparented to init so no zombie is left behind.
 */
class ShellExecutor : public ActionExecutor {
public:
    explicit ShellExecutor(std::string shell = "/bin/sh");

    std::optional<SpawnError> run(const std::string& command, const Environment& extra) override;

private:
    std::string shell_;
};

}  // namespace whichkey::exec
