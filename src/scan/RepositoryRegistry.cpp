#include "scan/RepositoryRegistry.hpp"

#include <fstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace gitv {

RepositoryRegistry::RepositoryRegistry(fs::path file) : filePath(std::move(file)) {}

Expected<std::vector<std::string>> RepositoryRegistry::load() const {
    std::vector<std::string> repos;
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        return repos;
    }

    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open registry: " + filePath.string()};
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        repos.push_back(line);
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read registry: " + filePath.string()};
    }
    return repos;
}

Expected<void> RepositoryRegistry::save(const std::vector<std::string>& repos) const {
    std::error_code ec;
    if (filePath.has_parent_path()) {
        fs::create_directories(filePath.parent_path(), ec);
        if (ec) return Error{ErrorCode::IoError, "Failed to create " + filePath.parent_path().string() + ": " + ec.message()};
    }

    std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to write registry: " + filePath.string()};
    }
    for (size_t i = 0; i < repos.size(); ++i) {
        if (i) out << '\n';
        out << repos[i];
    }
    out.flush();
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to write registry: " + filePath.string()};
    }
    return {};
}

std::vector<std::string> RepositoryRegistry::joinUnique(const std::vector<std::string>& first,
                                                        const std::vector<std::string>& second) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto* list : {&first, &second}) {
        for (const auto& item : *list) {
            if (seen.insert(item).second) out.push_back(item);
        }
    }
    return out;
}

Expected<std::vector<std::string>> RepositoryRegistry::merge(const std::vector<std::string>& newRepos) const {
    auto existing = load();
    if (!existing) return existing.error();
    std::vector<std::string> merged = joinUnique(newRepos, existing.value());
    auto saved = save(merged);
    if (!saved) return saved.error();
    return merged;
}

Expected<std::vector<fs::path>> RepositoryRegistry::repositories() const {
    auto lines = load();
    if (!lines) return lines.error();
    std::vector<fs::path> paths;
    paths.reserve(lines.value().size());
    for (const auto& l : lines.value()) paths.emplace_back(l);
    return paths;
}

}
