#include "core/PathResolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <set>

namespace obs_sitter {

bool PathResolver::matches_pattern(const std::filesystem::path& path, const std::string& pattern) {
    // Convert glob pattern to regex
    // Example: "*.rb" -> ".*\.rb"
    std::string escaped;
    for (char c : pattern) {
        if (c == '*') {
            escaped += ".*";
        } else if (c == '?') {
            escaped += ".";
        } else {
            escaped += regex_escape(std::string(1, c));
        }
    }

    std::regex re("^" + escaped + "$");
    return std::regex_match(path.filename().string(), re);
}

void PathResolver::scan_directory(
    const std::filesystem::path& dir,
    const std::string& pattern,
    std::vector<std::filesystem::path>& results
) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return;
    }

    try {
        auto options = std::filesystem::directory_options::skip_permission_denied;
        std::filesystem::recursive_directory_iterator it(dir, options);
        for (; it != std::filesystem::recursive_directory_iterator(); ++it) {
            const auto& entry = *it;
            std::string name = entry.path().filename().string();

            if (entry.is_directory() && !name.empty() && name.front() == '.') {
                it.disable_recursion_pending();
                continue;
            }

            if (entry.is_regular_file() && matches_pattern(entry.path(), pattern)) {
                results.push_back(entry.path());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("Error scanning directory {}: {}", dir.string(), e.what());
    }
}

std::vector<std::filesystem::path> PathResolver::ruby_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> results;
    scan_directory(dir, "*.rb", results);
    std::sort(results.begin(), results.end());
    return results;
}

std::vector<std::filesystem::path> PathResolver::resolve_paths(
    const std::vector<std::string>& paths,
    const std::filesystem::path& base
) {
    std::vector<std::filesystem::path> results;
    std::set<std::filesystem::path> seen;

    auto add = [&](const std::filesystem::path& file) {
        std::filesystem::path normal = file.lexically_normal();
        if (seen.insert(normal).second) {
            results.push_back(normal);
        }
    };

    for (const auto& path_str : paths) {
        std::filesystem::path path(path_str);
        if (path.is_relative()) {
            path = base / path;
        }

        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            for (const auto& file : ruby_files(path)) {
                add(file);
            }
        } else {
            // Missing files are passed through; the collector reports them
            add(path);
        }
    }

    spdlog::debug("Resolved {} paths from {} input paths", results.size(), paths.size());

    return results;
}

bool PathResolver::ends_with_components(const std::filesystem::path& path,
                                        const std::filesystem::path& suffix) {
    std::vector<std::string> path_parts;
    for (const auto& part : path) {
        path_parts.push_back(part.string());
    }

    std::vector<std::string> suffix_parts;
    for (const auto& part : suffix) {
        suffix_parts.push_back(part.string());
    }

    if (suffix_parts.empty() || suffix_parts.size() > path_parts.size()) {
        return false;
    }

    return std::equal(suffix_parts.rbegin(), suffix_parts.rend(), path_parts.rbegin());
}

bool PathResolver::is_test_path(const std::filesystem::path& path,
                                const std::filesystem::path& root) {
    std::string name = path.filename().string();
    auto has_suffix = [&name](const std::string& suffix) {
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (has_suffix("_spec.rb") || has_suffix("_test.rb")) {
        return true;
    }

    std::filesystem::path relative = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        relative = path;
    }

    for (const auto& part : relative.parent_path()) {
        if (part == "spec" || part == "test") {
            return true;
        }
    }
    return false;
}

std::optional<std::filesystem::path> PathResolver::find_first_line_match(
    const std::vector<std::filesystem::path>& files,
    const std::regex& pattern
) {
    for (const auto& file_path : files) {
        std::ifstream file(file_path);
        if (!file) {
            spdlog::debug("Cannot open {} for search", file_path.string());
            continue;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (std::regex_search(line, pattern)) {
                return file_path;
            }
        }
    }
    return std::nullopt;
}

std::string PathResolver::regex_escape(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

} // namespace obs_sitter
