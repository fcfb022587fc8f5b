#include "util/PatternMatcher.hpp"

#include <algorithm>

namespace gitv {
namespace PatternMatcher {

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (char c : pattern) {
        if (c == '*') {
            regexStr += "[^/]*";
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.') {
            regexStr += "\\.";
        } else if (c == '+' || c == '[' || c == ']' || c == '(' || c == ')' ||
                   c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    regexStr += "$";
    return std::regex(regexStr);
}

bool isPattern(const std::string& text) {
    return text.find('*') != std::string::npos ||
           text.find('?') != std::string::npos ||
           text.find('[') != std::string::npos;
}

IgnoreSet::IgnoreSet(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) add(p);
}

void IgnoreSet::add(const std::string& pattern) {
    if (pattern.empty()) return;
    if (isPattern(pattern)) {
        globs.push_back(globToRegex(pattern));
    } else if (std::find(literals.begin(), literals.end(), pattern) == literals.end()) {
        literals.push_back(pattern);
    }
}

bool IgnoreSet::matches(const std::string& name) const {
    if (std::find(literals.begin(), literals.end(), name) != literals.end()) return true;
    return std::any_of(globs.begin(), globs.end(),
                       [&](const std::regex& re) { return std::regex_match(name, re); });
}

}  // namespace PatternMatcher
}  // namespace gitv
