#pragma once

#include "config/DetectorConfig.hpp"
#include "core/RubyNodes.hpp"
#include "core/SourceParser.hpp"
#include "signals/SignalTypes.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace obs_sitter {

/**
 * @brief A detected log call site
 */
struct LogCall {
    std::string level;
    std::optional<std::string> event_name;
    bool interpolated = false;
    std::string defining_class;
    uint32_t line = 0;
};

/**
 * @brief A metric call site with a literal name
 */
struct MetricCall {
    std::string name;
    MetricType metric_type = MetricType::Counter;
    std::string receiver;
    std::string defining_class;
    uint32_t line = 0;
};

/**
 * @brief A metric action on a constant that is not a known client
 *
 * Metrics::RequestTotal.increment; resolved later against the constant map.
 */
struct ConstantMetricReference {
    std::string constant;
    std::string method;
    std::string defining_class;
    uint32_t line = 0;
};

/**
 * @brief Single-pass visitor extracting structure and signal call sites
 *
 * Walks one file's tree depth-first, tracking the active class/module
 * namespace. Detection never stops recursion, so nested call sites are
 * all reported.
 *
 * Recognized shapes:
 * - logs: logger.info "x", Rails.logger.warn, @logger.error, LOGGER.debug,
 *   logger.add(:info, "x"), logger.add(Logger::WARN, "x"), logger.log(2, "x"),
 *   and bare log(:info, "x") inside a class mixing in a structured logging trait
 * - metrics: StatsD.increment("x") (direct), Prometheus.counter(:x).increment
 *   (chained); non-literal names become DynamicMetricCall entries
 * - structure: class/module definitions and include/prepend/extend statements
 */
class SignalVisitor {
public:
    /**
     * @param config Detection settings (must outlive the visitor)
     * @param file_path Path recorded on every structure and detection
     * @param inheritance_depth Hops from the changed file to this one
     */
    SignalVisitor(const DetectorConfig& config, std::string file_path, int inheritance_depth = 0);

    /**
     * @brief Visit a parsed tree
     * @param tree Tree produced by SourceParser from source
     * @param source Source text the tree was parsed from
     */
    void visit(const Tree& tree, std::string_view source);

    const std::string& file_path() const { return file_path_; }
    int inheritance_depth() const { return inheritance_depth_; }

    const std::vector<LogCall>& log_calls() const { return log_calls_; }
    const std::vector<MetricCall>& metric_calls() const { return metric_calls_; }
    const std::vector<DynamicMetricCall>& dynamic_metric_calls() const { return dynamic_calls_; }
    const std::vector<ConstantMetricReference>& constant_references() const { return constant_refs_; }
    const FileStructure& structure() const { return structure_; }

    /**
     * @brief Relations of one kind, in source order
     */
    std::vector<ModuleRelation> relations(RelationKind kind) const;

    /**
     * @brief Stable event name from a log message
     *
     * Lowercases, collapses runs of characters outside [a-z0-9] into one
     * underscore, trims underscores at both ends and truncates to 50
     * characters. Returns nullopt when nothing is left.
     */
    static std::optional<std::string> derive_event_name(std::string_view message);

    /**
     * @brief Metric type implied by a method name (counter by default)
     */
    static MetricType infer_metric_type(std::string_view method);

private:
    void visit_node(TSNode node);
    void visit_definition(TSNode node, DefinitionKind kind);
    void visit_call(TSNode node);
    void visit_children(TSNode node);

    bool record_log_call(TSNode node, const std::optional<TSNode>& receiver,
                         const std::string& method, const std::vector<TSNode>& args);
    bool record_metric_call(TSNode node, const std::optional<TSNode>& receiver,
                            const std::string& method, const std::vector<TSNode>& args);
    bool record_module_relation(const std::optional<TSNode>& receiver,
                                const std::string& method, const std::vector<TSNode>& args);

    bool is_log_receiver(TSNode receiver) const;
    bool includes_logging_trait(const std::string& class_name) const;

    std::optional<std::string> severity_of(TSNode arg, bool symbols_only) const;
    std::optional<std::string> event_name_of(TSNode message) const;

    void add_metric(TSNode node, const std::string& receiver, MetricType type,
                    const std::optional<std::string>& name);

    std::string active_name() const;

    const DetectorConfig& config_;
    std::string file_path_;
    int inheritance_depth_;
    std::string_view source_;

    std::vector<std::string> namespace_stack_;

    std::vector<LogCall> log_calls_;
    std::vector<MetricCall> metric_calls_;
    std::vector<DynamicMetricCall> dynamic_calls_;
    std::vector<ConstantMetricReference> constant_refs_;
    FileStructure structure_;
};

} // namespace obs_sitter
