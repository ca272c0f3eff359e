#include "core/ParseCache.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace obs_sitter {

ParseCache::ParseCache()
    : parser_(), cache_() {
    spdlog::debug("ParseCache created");
}

std::optional<std::string> ParseCache::read_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

const ParsedFile* ParseCache::get(const std::filesystem::path& filepath) {
    std::filesystem::path key = filepath.lexically_normal();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(key, ec)) {
        spdlog::debug("Not a readable file: {}", key.string());
        return nullptr;
    }

    auto mtime = std::filesystem::last_write_time(key, ec);
    if (ec) {
        spdlog::debug("Failed to get file mtime for {}: {}", key.string(), ec.message());
        return nullptr;
    }

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        if (is_cache_valid(key, it->second)) {
            spdlog::debug("Using cached parse for {}", key.string());
            return &it->second;
        }
        spdlog::debug("Cache invalid for {}, re-parsing", key.string());
        cache_.erase(it);
    }

    auto source = read_file(key);
    if (!source) {
        spdlog::debug("Failed to open file: {}", key.string());
        return nullptr;
    }

    ParsedFile parsed;
    parsed.tree = parser_.parse(*source, key.string());
    parsed.source = std::move(*source);
    parsed.mtime = mtime;

    auto [cache_it, inserted] = cache_.emplace(key, std::move(parsed));

    spdlog::debug("Cached parse for {} (cache size: {})", key.string(), cache_.size());

    return &cache_it->second;
}

void ParseCache::clear() {
    cache_.clear();
    spdlog::debug("Cache cleared");
}

bool ParseCache::is_cache_valid(const std::filesystem::path& filepath,
                                const ParsedFile& cached) const {
    std::error_code ec;
    auto current_mtime = std::filesystem::last_write_time(filepath, ec);
    if (ec) {
        spdlog::warn("Failed to check file mtime: {}", ec.message());
        return false;
    }
    return current_mtime == cached.mtime;
}

} // namespace obs_sitter
