#pragma once

#include <stdexcept>
#include <string>

namespace whichkey::util {

// Malformed configuration or keymap tree. Raised before any surface exists.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// The exclusive keyboard grab could not be acquired.
class GrabError : public std::runtime_error {
public:
    explicit GrabError(const std::string& msg) : std::runtime_error(msg) {}
};

// Compositor connection lost or missing a required global.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

// Process exit codes
enum class ExitCode : int {
    Ok = 0,
    Failure = 1,
    Config = 2,
    Grab = 3,
    Protocol = 4,
};

inline int to_int(ExitCode code) {
    return static_cast<int>(code);
}

}  // namespace whichkey::util
