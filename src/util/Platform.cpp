#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>

namespace whichkey::util {

std::filesystem::path Platform::get_config_directory() {
    Logger::debug("Platform: Detecting config directory");
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "whichkey";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "whichkey";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/whichkey");
    return ".config/whichkey";
}

std::filesystem::path Platform::resolve_config_file(const std::string& name) {
    std::filesystem::path path(name);
    if (!path.is_absolute()) {
        path = get_config_directory() / path;
    }
    if (path.extension() != ".yml") {
        path.replace_extension(".yaml");
    }
    return path;
}

}  // namespace whichkey::util
