#pragma once

#include <ostream>
#include <string>

namespace gitv {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Diagnostics only: every level writes to the diagnostic stream (stderr by
 * default) so that rendered output on stdout is never interleaved with logs.
 * Initial level comes from the GITV_LOG environment variable.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;

    /// Redirect diagnostics (tests capture them); nullptr restores stderr
    void setStream(std::ostream* stream);

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse "error|warn|info|debug" or "0".."3"; unknown text yields Info
    static LogLevel parseLevel(const std::string& text);

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    std::ostream* out;
};

}
