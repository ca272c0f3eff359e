#pragma once

#include "signals/ResolutionStrategy.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace obs_sitter {

/**
 * @brief Resolves names by searching app/ and lib/ for their definition line
 *
 * Looks for `class <Name>` first, then `module <Name>`, at the start of a
 * line. Files are searched in sorted order; spec and test files are skipped.
 */
class TextSearchStrategy : public ResolutionStrategy {
public:
    explicit TextSearchStrategy(std::filesystem::path repo_root);

    std::optional<std::filesystem::path> resolve(
        const std::string& name,
        const std::filesystem::path& current_file
    ) override;

    std::string_view name() const override { return "text-search"; }

private:
    std::filesystem::path repo_root_;
    std::optional<std::vector<std::filesystem::path>> files_;

    const std::vector<std::filesystem::path>& searchable_files();
};

} // namespace obs_sitter
