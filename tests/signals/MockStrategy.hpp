#pragma once

#include "signals/ResolutionStrategy.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace obs_sitter {

/**
 * @brief Mock resolution strategy for testing the ancestor walk
 *
 * Resolves names from a fixed table and records every lookup, so tests can
 * check memoization without touching the repository layout.
 */
class MockStrategy : public ResolutionStrategy {
public:
    MockStrategy() = default;

    std::optional<std::filesystem::path> resolve(
        const std::string& name,
        const std::filesystem::path& current_file
    ) override;

    std::string_view name() const override { return "mock"; }

    /**
     * @brief Map a constant name to a file
     */
    void add_mapping(const std::string& name, const std::filesystem::path& file);

    /**
     * @brief Names looked up so far, in call order
     */
    const std::vector<std::string>& lookups() const { return lookups_; }

    /**
     * @brief Number of lookups for one name
     */
    size_t lookup_count(const std::string& name) const;

private:
    std::map<std::string, std::filesystem::path> mappings_;
    std::vector<std::string> lookups_;
};

} // namespace obs_sitter
