#pragma once

#include "signals/ResolutionStrategy.hpp"
#include <filesystem>
#include <map>
#include <vector>

namespace obs_sitter {

/**
 * @brief Resolves names through Rails file naming conventions
 *
 * Payments::BaseService becomes payments/base_service.rb, which is probed
 * next to the referencing file, one directory up and in its concerns/
 * subdirectory, then anywhere below app/ (plain, then concerns/) and lib/.
 * Spec and test files never match.
 */
class ConventionStrategy : public ResolutionStrategy {
public:
    explicit ConventionStrategy(std::filesystem::path repo_root);

    std::optional<std::filesystem::path> resolve(
        const std::string& name,
        const std::filesystem::path& current_file
    ) override;

    std::string_view name() const override { return "convention"; }

    /**
     * @brief Relative file path a constant name maps to
     *
     * "HTTPClient" -> "http_client.rb", "Admin::UserPolicy" -> "admin/user_policy.rb"
     */
    static std::filesystem::path file_path_for(const std::string& name);

private:
    std::filesystem::path repo_root_;

    // Directory listings reused across lookups
    std::map<std::filesystem::path, std::vector<std::filesystem::path>> listings_;

    std::optional<std::filesystem::path> probe(const std::filesystem::path& candidate) const;

    std::optional<std::filesystem::path> search_tree(
        const std::filesystem::path& top,
        const std::filesystem::path& relative
    );
};

} // namespace obs_sitter
