#include "util/Config.hpp"

#include <cstdlib>
#include <sstream>

#include "core/Constants.hpp"

namespace gitv {

std::vector<std::string> splitPatternList(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ':')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

Expected<AppConfig> loadConfig() {
    return loadConfig([](const char* name) -> const char* { return std::getenv(name); });
}

Expected<AppConfig> loadConfig(const EnvLookup& getenvFn) {
    AppConfig cfg;

    const char* registry = getenvFn("GITV_REGISTRY");
    if (registry && *registry) {
        cfg.registryPath = registry;
    } else {
        const char* home = getenvFn("HOME");
        if (!home || !*home) {
            return Error{ErrorCode::ConfigError, "HOME is not set and GITV_REGISTRY is empty"};
        }
        cfg.registryPath = std::filesystem::path(home) / Constants::REGISTRY_FILE_NAME;
    }

    for (const char* name : Constants::DEFAULT_IGNORED_DIRS) {
        cfg.ignorePatterns.emplace_back(name);
    }
    if (const char* ignore = getenvFn("GITV_IGNORE")) {
        for (auto& p : splitPatternList(ignore)) cfg.ignorePatterns.push_back(std::move(p));
    }
    return cfg;
}

}
