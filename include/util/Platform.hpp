#pragma once

#include <filesystem>
#include <string>

namespace whichkey::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();

    // Resolves a config name ("config", "print-screen", "/abs/path.yaml") to a file path.
    static std::filesystem::path resolve_config_file(const std::string& name);
};

}  // namespace whichkey::util
