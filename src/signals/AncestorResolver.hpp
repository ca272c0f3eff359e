#pragma once

#include "config/DetectorConfig.hpp"
#include "core/ParseCache.hpp"
#include "signals/ResolutionStrategy.hpp"
#include "signals/SignalTypes.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace obs_sitter {

/**
 * @brief Resolves superclasses and mixins to files and walks them
 *
 * Names are resolved through an ordered list of strategies; the first hit
 * wins. Results (misses included) are memoized by name for the lifetime of
 * the resolver, so the same name always maps to the same file regardless of
 * the referencing file.
 */
class AncestorResolver {
public:
    /**
     * @param config Supplies max_depth (must outlive the resolver)
     * @param cache Parse cache shared with the caller (must outlive the resolver)
     * @param strategies Resolution strategies in priority order
     */
    AncestorResolver(const DetectorConfig& config,
                     ParseCache& cache,
                     std::vector<std::unique_ptr<ResolutionStrategy>> strategies);

    /**
     * @brief Convention lookup followed by text search
     */
    static std::vector<std::unique_ptr<ResolutionStrategy>> default_strategies(
        const std::filesystem::path& repo_root);

    /**
     * @brief Defining file of a class or module
     * @return File path, or nullopt if no strategy finds one
     */
    std::optional<std::filesystem::path> resolve(const std::string& name,
                                                 const std::filesystem::path& current_file);

    /**
     * @brief Depth-first walk over parents, included and prepended modules
     *
     * Each resolved name is emitted once per visited set, at depth + 1, and
     * its own structure is walked recursively. Extended modules are not
     * walked. Nothing is returned once depth reaches max_depth.
     *
     * @param structure Structure of current_file
     * @param current_file File the structure was read from
     * @param depth Depth of current_file (0 for a changed file)
     * @param visited Names already emitted in this traversal; updated in place
     */
    std::vector<AncestorNode> collect_ancestors(const FileStructure& structure,
                                                const std::filesystem::path& current_file,
                                                int depth,
                                                std::set<std::string>& visited);

    size_t memo_size() const { return memo_.size(); }

private:
    const DetectorConfig& config_;
    ParseCache& cache_;
    std::vector<std::unique_ptr<ResolutionStrategy>> strategies_;
    std::map<std::string, std::optional<std::filesystem::path>> memo_;

    /**
     * @brief Structure of an ancestor file, nullopt if it cannot be read or parsed
     */
    std::optional<FileStructure> structure_of(const std::filesystem::path& file, int depth);

    void visit_ancestor(const std::string& name,
                        DefinitionKind kind,
                        const std::filesystem::path& current_file,
                        int depth,
                        std::set<std::string>& visited,
                        std::vector<AncestorNode>& ancestors);
};

} // namespace obs_sitter
