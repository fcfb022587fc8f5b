#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitv {

/**
 * @brief Runtime settings, read from the environment
 *
 *   GITV_REGISTRY  registry file (default: $HOME/.gogitlocalstats)
 *   GITV_IGNORE    extra ':'-separated directory globs skipped while scanning
 *   GITV_LOG       log level, see Logger
 */
struct AppConfig {
    std::filesystem::path registryPath;
    std::vector<std::string> ignorePatterns;  // built-in names first
};

/// Returns the value of an environment variable, or nullptr if unset
using EnvLookup = std::function<const char*(const char*)>;

/// Build config from the process environment
Expected<AppConfig> loadConfig();

/// Build config through an explicit lookup (tests pass a fake environment)
Expected<AppConfig> loadConfig(const EnvLookup& getenvFn);

/// Split a ':'-separated list, dropping empty items
std::vector<std::string> splitPatternList(const std::string& text);

}
