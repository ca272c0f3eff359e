#include "signals/ConventionStrategy.hpp"
#include "core/PathResolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>

namespace obs_sitter {

ConventionStrategy::ConventionStrategy(std::filesystem::path repo_root)
    : repo_root_(std::move(repo_root)) {
}

std::filesystem::path ConventionStrategy::file_path_for(const std::string& name) {
    static const std::regex acronym_boundary("([A-Z]+)([A-Z][a-z])");
    static const std::regex word_boundary("([a-z\\d])([A-Z])");

    std::string path = name;
    for (auto pos = path.find("::"); pos != std::string::npos; pos = path.find("::", pos + 1)) {
        path.replace(pos, 2, "/");
    }

    path = std::regex_replace(path, acronym_boundary, "$1_$2");
    path = std::regex_replace(path, word_boundary, "$1_$2");
    std::transform(path.begin(), path.end(), path.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    return std::filesystem::path(path + ".rb");
}

std::optional<std::filesystem::path> ConventionStrategy::resolve(
    const std::string& name,
    const std::filesystem::path& current_file
) {
    std::filesystem::path relative = file_path_for(name);
    std::filesystem::path current_dir = current_file.parent_path();

    const std::filesystem::path local_candidates[] = {
        current_dir / relative,
        current_dir / ".." / relative,
        current_dir / "concerns" / relative
    };

    for (const auto& candidate : local_candidates) {
        if (auto found = probe(candidate)) {
            return found;
        }
    }

    if (auto found = search_tree("app", relative)) {
        return found;
    }
    if (auto found = search_tree("app", std::filesystem::path("concerns") / relative)) {
        return found;
    }
    return search_tree("lib", relative);
}

std::optional<std::filesystem::path> ConventionStrategy::probe(
    const std::filesystem::path& candidate
) const {
    std::filesystem::path normal = candidate.lexically_normal();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(normal, ec)) {
        return std::nullopt;
    }
    if (PathResolver::is_test_path(normal, repo_root_)) {
        return std::nullopt;
    }
    return normal;
}

std::optional<std::filesystem::path> ConventionStrategy::search_tree(
    const std::filesystem::path& top,
    const std::filesystem::path& relative
) {
    std::filesystem::path dir = repo_root_ / top;

    auto it = listings_.find(dir);
    if (it == listings_.end()) {
        it = listings_.emplace(dir, PathResolver::ruby_files(dir)).first;
        spdlog::debug("Indexed {} Ruby files under {}", it->second.size(), dir.string());
    }

    for (const auto& file : it->second) {
        if (PathResolver::ends_with_components(file, relative) &&
            !PathResolver::is_test_path(file, repo_root_)) {
            return file;
        }
    }
    return std::nullopt;
}

} // namespace obs_sitter
