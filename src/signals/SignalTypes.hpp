#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using json = nlohmann::json;

namespace obs_sitter {

/**
 * @brief defining_class value for code outside any class or module
 */
inline constexpr std::string_view TOP_LEVEL = "(top-level)";

enum class MetricType {
    Counter,
    Gauge,
    Histogram,
    Summary
};

enum class SignalType {
    Log,
    Counter,
    Gauge,
    Histogram,
    Summary
};

enum class RelationKind {
    Include,
    Prepend,
    Extend
};

enum class DefinitionKind {
    Class,
    Module
};

std::string_view to_string(MetricType type);
std::string_view to_string(SignalType type);

SignalType signal_type_for(MetricType type);

/**
 * @brief Level/line details attached to a signal
 *
 * level and interpolated are meaningful for logs, metric_type for metrics.
 */
struct SignalMetadata {
    std::string level;
    bool interpolated = false;
    std::optional<MetricType> metric_type;
    uint32_t line = 0;
};

/**
 * @brief One detected observability call site
 */
struct Signal {
    SignalType type = SignalType::Log;
    std::string name;
    std::string source_file;
    std::string defining_class;
    int inheritance_depth = 0;
    SignalMetadata metadata;

    bool is_log() const { return type == SignalType::Log; }
};

/**
 * @brief A class or module definition found in one file
 */
struct ClassStructure {
    std::string qualified_name;
    std::optional<std::string> parent_name;  // always empty for modules
    std::string file;
    DefinitionKind kind = DefinitionKind::Class;
};

/**
 * @brief An include/prepend/extend statement
 */
struct ModuleRelation {
    std::string module_name;
    std::string including_class;
    RelationKind kind = RelationKind::Include;
    std::string file;
};

/**
 * @brief Structural facts of one file, the input of the ancestor walk
 */
struct FileStructure {
    std::vector<ClassStructure> classes;
    std::vector<ModuleRelation> relations;
};

struct AncestorNode {
    std::string name;
    std::string file;
    int depth = 0;
    DefinitionKind kind = DefinitionKind::Class;
};

/**
 * @brief Metric-shaped call whose name is not a literal
 */
struct DynamicMetricCall {
    std::string receiver;
    MetricType metric_type = MetricType::Counter;
    std::string defining_class;
    std::string file;
    uint32_t line = 0;
};

struct MetricConstantEntry {
    std::string name;
    MetricType type = MetricType::Counter;
};

/**
 * @brief Collector output
 */
struct CollectionResult {
    std::vector<Signal> signals;
    std::vector<DynamicMetricCall> dynamic_calls;
};

bool operator==(const MetricConstantEntry& lhs, const MetricConstantEntry& rhs);

void to_json(json& j, const SignalMetadata& metadata);
void to_json(json& j, const Signal& signal);
void to_json(json& j, const DynamicMetricCall& call);
void to_json(json& j, const CollectionResult& result);

/**
 * @brief Serialize a collection result as JSON text
 *
 * Names are copied byte for byte from Ruby sources, which need not be UTF-8.
 * Invalid sequences are written as U+FFFD instead of failing the dump.
 *
 * @param indent Spaces per level, or -1 for a single line
 */
std::string dump_result(const CollectionResult& result, int indent = -1);

} // namespace obs_sitter
