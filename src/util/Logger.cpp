#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace gitv {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("GITV_LOG");
    if (!env) return LogLevel::Info;
    return Logger::parseLevel(env);
}

LogLevel Logger::parseLevel(const std::string& v) {
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()), out(&std::cerr) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setStream(std::ostream* stream) { out = stream ? stream : &std::cerr; }

void Logger::write(LogLevel level, const char* tag, const std::string& msg) const {
    if (currentLevel < level) return;
    (*out) << tag << ' ' << msg << '\n';
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error]", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ]", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ]", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug]", msg); }

}
