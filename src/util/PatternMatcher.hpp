#pragma once

#include <regex>
#include <string>
#include <vector>

namespace gitv {

/**
 * @brief Glob matching for directory-name ignore patterns
 *
 * Supported patterns:
 *   * -> any run of characters except '/'
 *   ? -> a single character except '/'
 *   everything else matches literally
 *
 * Examples:
 *   node_modules -> only "node_modules"
 *   *.cache      -> "build.cache", ".cache"
 *   tmp?         -> "tmp1", "tmpA"
 */
namespace PatternMatcher {

/**
 * @brief Convert glob pattern to an anchored std::regex
 *
 * Example: "*.cache" -> "^[^/]*\.cache$"
 */
std::regex globToRegex(const std::string& pattern);

/// True if the string contains '*', '?' or '['
bool isPattern(const std::string& text);

/**
 * @brief Compiled set of ignore patterns
 *
 * Plain names are compared exactly; only patterns with glob characters pay
 * for a regex.
 */
class IgnoreSet {
public:
    IgnoreSet() = default;
    explicit IgnoreSet(const std::vector<std::string>& patterns);

    void add(const std::string& pattern);
    bool matches(const std::string& name) const;
    bool empty() const { return literals.empty() && globs.empty(); }

private:
    std::vector<std::string> literals;
    std::vector<std::regex> globs;
};

}  // namespace PatternMatcher

}  // namespace gitv
