#pragma once

#include "config/DetectorConfig.hpp"
#include "core/ParseCache.hpp"
#include "signals/AncestorResolver.hpp"
#include "signals/ConstantResolver.hpp"
#include "signals/SignalTypes.hpp"
#include "signals/SignalVisitor.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace obs_sitter {

/**
 * @brief Collects the signals of changed files and of everything they inherit
 *
 * Each collect() call is an independent run: the parse cache, the constant
 * map and the resolution memo are rebuilt from scratch, so repeated runs on
 * unchanged inputs give identical results.
 */
class SignalCollector {
public:
    /**
     * @param repo_root Repository root; metric definition paths and
     *        repository-wide lookups are relative to it
     * @param config Detection settings
     */
    explicit SignalCollector(std::filesystem::path repo_root, DetectorConfig config = {});

    /**
     * @brief Optional override of the resolution strategies
     *
     * The factory is called once per run. Without one the convention and
     * text-search strategies rooted at repo_root are used.
     */
    using StrategyFactory = std::function<std::vector<std::unique_ptr<ResolutionStrategy>>()>;
    void set_strategy_factory(StrategyFactory factory);

    /**
     * @brief Collect signals from changed files and their ancestors
     * @param files Changed Ruby files; missing files are skipped with a warning
     * @return Deduplicated signals and all dynamic metric calls
     */
    CollectionResult collect(const std::vector<std::filesystem::path>& files);

    const std::filesystem::path& repo_root() const { return repo_root_; }
    const DetectorConfig& config() const { return config_; }

private:
    std::filesystem::path repo_root_;
    DetectorConfig config_;
    StrategyFactory strategy_factory_;

    struct Run;

    void load_metric_definitions(Run& run, const std::vector<std::filesystem::path>& files);

    /**
     * @brief Visit one file and append its signals and dynamic calls
     * @return The visitor, or nullptr if the file is missing or does not parse
     */
    std::unique_ptr<SignalVisitor> collect_file(Run& run, const std::filesystem::path& file,
                                                int depth, CollectionResult& result);

    static void deduplicate(std::vector<Signal>& signals);
};

} // namespace obs_sitter
