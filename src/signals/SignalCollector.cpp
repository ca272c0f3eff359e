#include "signals/SignalCollector.hpp"
#include "signals/SignalExtractor.hpp"
#include <spdlog/spdlog.h>
#include <set>
#include <tuple>

namespace obs_sitter {

/**
 * @brief State private to one collect() call
 */
struct SignalCollector::Run {
    ParseCache cache;
    ConstantResolver constants;
    AncestorResolver ancestors;

    Run(const DetectorConfig& config, std::vector<std::unique_ptr<ResolutionStrategy>> strategies)
        : cache(),
          constants(config),
          ancestors(config, cache, std::move(strategies)) {
    }
};

SignalCollector::SignalCollector(std::filesystem::path repo_root, DetectorConfig config)
    : repo_root_(std::filesystem::absolute(repo_root).lexically_normal()),
      config_(std::move(config)) {
}

void SignalCollector::set_strategy_factory(StrategyFactory factory) {
    strategy_factory_ = std::move(factory);
}

CollectionResult SignalCollector::collect(const std::vector<std::filesystem::path>& files) {
    Run run(config_, strategy_factory_ ? strategy_factory_()
                                       : AncestorResolver::default_strategies(repo_root_));

    load_metric_definitions(run, files);

    CollectionResult result;

    for (const auto& file : files) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            spdlog::warn("Skipping missing file: {}", file.string());
            continue;
        }

        auto visitor = collect_file(run, file, 0, result);
        if (!visitor) {
            spdlog::warn("Skipping file with syntax errors: {}", file.string());
            continue;
        }

        std::set<std::string> visited;
        auto ancestors = run.ancestors.collect_ancestors(visitor->structure(), file, 0, visited);
        spdlog::debug("{} has {} ancestors", file.string(), ancestors.size());

        for (const auto& ancestor : ancestors) {
            collect_file(run, ancestor.file, ancestor.depth, result);
        }
    }

    deduplicate(result.signals);

    spdlog::info("Collected {} signals ({} dynamic metric calls) from {} files",
                 result.signals.size(), result.dynamic_calls.size(), files.size());

    return result;
}

void SignalCollector::load_metric_definitions(Run& run,
                                              const std::vector<std::filesystem::path>& files) {
    std::vector<std::filesystem::path> sources;
    for (const auto& relative : config_.metric_definition_paths) {
        sources.push_back(repo_root_ / relative);
    }
    sources.insert(sources.end(), files.begin(), files.end());

    for (const auto& source_file : sources) {
        const ParsedFile* parsed = run.cache.get(source_file);
        if (!parsed || !parsed->tree) {
            continue;
        }
        run.constants.scan(*parsed->tree, parsed->source);
    }

    spdlog::debug("Metric constant map has {} entries", run.constants.constant_map().size());
}

std::unique_ptr<SignalVisitor> SignalCollector::collect_file(Run& run,
                                                             const std::filesystem::path& file,
                                                             int depth,
                                                             CollectionResult& result) {
    const ParsedFile* parsed = run.cache.get(file);
    if (!parsed || !parsed->tree) {
        spdlog::debug("No signals from {}", file.string());
        return nullptr;
    }

    auto visitor = std::make_unique<SignalVisitor>(config_, file.lexically_normal().string(), depth);
    visitor->visit(*parsed->tree, parsed->source);

    SignalExtractor extractor(&run.constants);
    auto signals = extractor.extract(*visitor);
    result.signals.insert(result.signals.end(),
                          std::make_move_iterator(signals.begin()),
                          std::make_move_iterator(signals.end()));

    const auto& dynamic = visitor->dynamic_metric_calls();
    result.dynamic_calls.insert(result.dynamic_calls.end(), dynamic.begin(), dynamic.end());

    return visitor;
}

void SignalCollector::deduplicate(std::vector<Signal>& signals) {
    std::set<std::tuple<SignalType, std::string, std::string, std::string>> seen;
    std::vector<Signal> unique;
    unique.reserve(signals.size());

    for (auto& signal : signals) {
        auto key = std::make_tuple(signal.type, signal.name, signal.source_file, signal.defining_class);
        if (seen.insert(key).second) {
            unique.push_back(std::move(signal));
        }
    }

    signals = std::move(unique);
}

} // namespace obs_sitter
