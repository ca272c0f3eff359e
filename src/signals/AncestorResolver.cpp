#include "signals/AncestorResolver.hpp"
#include "signals/ConventionStrategy.hpp"
#include "signals/SignalVisitor.hpp"
#include "signals/TextSearchStrategy.hpp"
#include <spdlog/spdlog.h>

namespace obs_sitter {

AncestorResolver::AncestorResolver(const DetectorConfig& config,
                                   ParseCache& cache,
                                   std::vector<std::unique_ptr<ResolutionStrategy>> strategies)
    : config_(config),
      cache_(cache),
      strategies_(std::move(strategies)) {
}

std::vector<std::unique_ptr<ResolutionStrategy>> AncestorResolver::default_strategies(
    const std::filesystem::path& repo_root
) {
    std::vector<std::unique_ptr<ResolutionStrategy>> strategies;
    strategies.push_back(std::make_unique<ConventionStrategy>(repo_root));
    strategies.push_back(std::make_unique<TextSearchStrategy>(repo_root));
    return strategies;
}

std::optional<std::filesystem::path> AncestorResolver::resolve(
    const std::string& name,
    const std::filesystem::path& current_file
) {
    auto it = memo_.find(name);
    if (it != memo_.end()) {
        return it->second;
    }

    std::optional<std::filesystem::path> resolved;
    for (const auto& strategy : strategies_) {
        resolved = strategy->resolve(name, current_file);
        if (resolved) {
            spdlog::debug("Resolved {} to {} ({})", name, resolved->string(), strategy->name());
            break;
        }
    }

    if (!resolved) {
        spdlog::debug("Could not resolve {}", name);
    }

    memo_.emplace(name, resolved);
    return resolved;
}

std::vector<AncestorNode> AncestorResolver::collect_ancestors(
    const FileStructure& structure,
    const std::filesystem::path& current_file,
    int depth,
    std::set<std::string>& visited
) {
    std::vector<AncestorNode> ancestors;
    if (depth >= config_.max_depth) {
        return ancestors;
    }

    for (const auto& definition : structure.classes) {
        if (definition.parent_name) {
            visit_ancestor(*definition.parent_name, DefinitionKind::Class,
                           current_file, depth, visited, ancestors);
        }
    }

    for (RelationKind kind : {RelationKind::Include, RelationKind::Prepend}) {
        for (const auto& relation : structure.relations) {
            if (relation.kind == kind) {
                visit_ancestor(relation.module_name, DefinitionKind::Module,
                               current_file, depth, visited, ancestors);
            }
        }
    }

    return ancestors;
}

void AncestorResolver::visit_ancestor(const std::string& name,
                                      DefinitionKind kind,
                                      const std::filesystem::path& current_file,
                                      int depth,
                                      std::set<std::string>& visited,
                                      std::vector<AncestorNode>& ancestors) {
    if (visited.count(name)) {
        return;
    }

    auto file = resolve(name, current_file);
    std::error_code ec;
    if (!file || !std::filesystem::exists(*file, ec)) {
        return;
    }

    visited.insert(name);
    ancestors.push_back(AncestorNode{name, file->string(), depth + 1, kind});

    auto ancestor_structure = structure_of(*file, depth + 1);
    if (!ancestor_structure) {
        return;
    }

    auto deeper = collect_ancestors(*ancestor_structure, *file, depth + 1, visited);
    ancestors.insert(ancestors.end(),
                     std::make_move_iterator(deeper.begin()),
                     std::make_move_iterator(deeper.end()));
}

std::optional<FileStructure> AncestorResolver::structure_of(const std::filesystem::path& file,
                                                            int depth) {
    const ParsedFile* parsed = cache_.get(file);
    if (!parsed) {
        spdlog::debug("Skipping unreadable ancestor {}", file.string());
        return std::nullopt;
    }
    if (!parsed->tree) {
        spdlog::debug("Skipping ancestor with syntax errors {}", file.string());
        return std::nullopt;
    }

    SignalVisitor visitor(config_, file.string(), depth);
    visitor.visit(*parsed->tree, parsed->source);
    return visitor.structure();
}

} // namespace obs_sitter
