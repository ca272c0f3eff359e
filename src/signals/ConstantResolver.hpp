#pragma once

#include "config/DetectorConfig.hpp"
#include "core/QueryEngine.hpp"
#include "core/SourceParser.hpp"
#include "signals/SignalTypes.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace obs_sitter {

/**
 * @brief Maps metric constants to the metric they register
 *
 * Handles definitions such as:
 *   module Metrics
 *     RequestTotal = Hesiod.register_counter("request_total")
 *   end
 *   CACHE_HIT = StatsD.counter(:cache_hit)
 *
 * so that Metrics::RequestTotal.increment can be reported as request_total.
 * The map accumulates across scans; redefinitions replace earlier entries.
 */
class ConstantResolver {
public:
    /**
     * @param config Supplies the metric client allow-list (must outlive the resolver)
     * @throws std::runtime_error if the definition query cannot be compiled
     */
    explicit ConstantResolver(const DetectorConfig& config);

    /**
     * @brief Record every metric constant defined in a parsed file
     * @return Number of constants recorded from this file
     */
    size_t scan(const Tree& tree, std::string_view source);

    /**
     * @brief Look up a constant
     *
     * The name is tried as written, then prefixed with each enclosing scope
     * of lexical_scope from innermost to outermost, following Ruby's lexical
     * constant lookup.
     *
     * @param constant_name e.g. "Metrics::RequestTotal"
     * @param lexical_scope Qualified name of the referencing class, if any
     * @return Registered metric, or nullopt when unknown
     */
    std::optional<MetricConstantEntry> resolve(
        const std::string& constant_name,
        const std::string& lexical_scope = ""
    ) const;

    const std::map<std::string, MetricConstantEntry>& constant_map() const {
        return constant_map_;
    }

    /**
     * @brief Metric type registered by a factory method
     * @return nullopt if method is not a metric factory
     */
    static std::optional<MetricType> factory_type(std::string_view method);

private:
    const DetectorConfig& config_;
    QueryEngine engine_;
    std::unique_ptr<Query> query_;
    std::map<std::string, MetricConstantEntry> constant_map_;

    static std::string lexical_namespace(TSNode node, std::string_view source);
};

} // namespace obs_sitter
