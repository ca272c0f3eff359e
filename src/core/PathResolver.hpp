#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace obs_sitter {

/**
 * @brief File-system helpers for locating Ruby sources in a repository
 *
 * Handles input expansion (files and directories), repository-wide globbing
 * by relative path suffix, spec/test exclusion and line-oriented text search.
 */
class PathResolver {
public:
    /**
     * @brief Expand input paths into Ruby files
     *
     * Files are kept in input order; directories expand to their *.rb files
     * (sorted). Duplicates are dropped, first occurrence wins.
     *
     * @param paths File or directory paths
     * @param base Directory that relative paths are resolved against
     * @return Vector of resolved file paths
     */
    static std::vector<std::filesystem::path> resolve_paths(
        const std::vector<std::string>& paths,
        const std::filesystem::path& base
    );

    /**
     * @brief All *.rb files below a directory, sorted
     *
     * Hidden directories are skipped. A missing directory yields an empty list.
     */
    static std::vector<std::filesystem::path> ruby_files(const std::filesystem::path& dir);

    /**
     * @brief Check whether the trailing components of path equal suffix
     *
     * ends_with_components("app/models/admin/user.rb", "admin/user.rb") is true,
     * ends_with_components("app/models/superuser.rb", "user.rb") is false.
     */
    static bool ends_with_components(const std::filesystem::path& path,
                                     const std::filesystem::path& suffix);

    /**
     * @brief Check if a path points at spec/test code
     *
     * Matches a spec/ or test/ directory component below root, or a
     * _spec.rb / _test.rb file name.
     */
    static bool is_test_path(const std::filesystem::path& path,
                             const std::filesystem::path& root);

    /**
     * @brief First file (in list order) with a line matching pattern
     */
    static std::optional<std::filesystem::path> find_first_line_match(
        const std::vector<std::filesystem::path>& files,
        const std::regex& pattern
    );

    /**
     * @brief Escape regex metacharacters in literal text
     */
    static std::string regex_escape(const std::string& text);

private:
    /**
     * @brief Check if filename matches glob pattern
     *
     * Supports simple wildcards: *.rb, test_*.rb, etc.
     */
    static bool matches_pattern(const std::filesystem::path& path, const std::string& pattern);

    static void scan_directory(
        const std::filesystem::path& dir,
        const std::string& pattern,
        std::vector<std::filesystem::path>& results
    );
};

} // namespace obs_sitter
