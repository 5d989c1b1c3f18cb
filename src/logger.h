#pragma once
#include <string>

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Diagnostics sink. Everything goes to stderr; stdout is reserved for the report.
namespace logger {
    void set_level(LogLevel lvl);
    LogLevel get_level();
    void set_json(bool on);
    bool is_json();
    // Map the number of -v flags to a level (0 -> Warn, 1 -> Info, 2+ -> Debug).
    LogLevel level_for_verbosity(int verbose_count);
    void error(const std::string& msg);
    void warn(const std::string& msg);
    void info(const std::string& msg);
    void debug(const std::string& msg);
}
