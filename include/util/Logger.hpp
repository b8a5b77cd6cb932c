#pragma once

#include <string>

namespace whichkey::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens the log file and reads the minimum level from WHICHKEY_LOG.
    static void init();
    static void set_level(Level level);
    static Level level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static Level parse_level(const std::string& name, Level fallback);
};

}  // namespace whichkey::util
