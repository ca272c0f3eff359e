#pragma once

#include "core/SourceParser.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace obs_sitter {

/**
 * @brief Cached parse result for a file
 *
 * tree is nullptr when the file was read but failed to parse.
 */
struct ParsedFile {
    std::unique_ptr<Tree> tree;
    std::string source;
    std::filesystem::file_time_type mtime;
};

/**
 * @brief Per-run cache of parsed Ruby files
 *
 * Files shared by several ancestor walks are read and parsed once. Entries
 * are invalidated when the file's modification time changes.
 */
class ParseCache {
public:
    ParseCache();

    /**
     * @brief Get or parse a file
     * @param filepath Path to the file
     * @return Cached entry, or nullptr when the file does not exist or cannot be read
     */
    const ParsedFile* get(const std::filesystem::path& filepath);

    /**
     * @brief Read a whole file into a string
     * @return File contents, or nullopt if it cannot be opened
     */
    static std::optional<std::string> read_file(const std::filesystem::path& filepath);

    void clear();

    size_t size() const { return cache_.size(); }

private:
    SourceParser parser_;
    std::map<std::filesystem::path, ParsedFile> cache_;

    bool is_cache_valid(const std::filesystem::path& filepath,
                        const ParsedFile& cached) const;
};

} // namespace obs_sitter
