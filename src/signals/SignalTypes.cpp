#include "signals/SignalTypes.hpp"

namespace obs_sitter {

std::string_view to_string(MetricType type) {
    switch (type) {
        case MetricType::Counter:
            return "counter";
        case MetricType::Gauge:
            return "gauge";
        case MetricType::Histogram:
            return "histogram";
        case MetricType::Summary:
            return "summary";
    }
    return "counter";
}

std::string_view to_string(SignalType type) {
    switch (type) {
        case SignalType::Log:
            return "log";
        case SignalType::Counter:
            return "counter";
        case SignalType::Gauge:
            return "gauge";
        case SignalType::Histogram:
            return "histogram";
        case SignalType::Summary:
            return "summary";
    }
    return "log";
}

SignalType signal_type_for(MetricType type) {
    switch (type) {
        case MetricType::Counter:
            return SignalType::Counter;
        case MetricType::Gauge:
            return SignalType::Gauge;
        case MetricType::Histogram:
            return SignalType::Histogram;
        case MetricType::Summary:
            return SignalType::Summary;
    }
    return SignalType::Counter;
}

bool operator==(const MetricConstantEntry& lhs, const MetricConstantEntry& rhs) {
    return lhs.name == rhs.name && lhs.type == rhs.type;
}

void to_json(json& j, const SignalMetadata& metadata) {
    j = json::object();
    if (!metadata.level.empty()) {
        j["level"] = metadata.level;
        j["interpolated"] = metadata.interpolated;
    }
    if (metadata.metric_type) {
        j["metric_type"] = std::string(to_string(*metadata.metric_type));
    }
    j["line"] = metadata.line;
}

void to_json(json& j, const Signal& signal) {
    j = {
        {"type", std::string(to_string(signal.type))},
        {"name", signal.name},
        {"source_file", signal.source_file},
        {"defining_class", signal.defining_class},
        {"inheritance_depth", signal.inheritance_depth},
        {"metadata", signal.metadata}
    };
}

void to_json(json& j, const DynamicMetricCall& call) {
    j = {
        {"receiver", call.receiver},
        {"metric_type", std::string(to_string(call.metric_type))},
        {"defining_class", call.defining_class},
        {"file", call.file},
        {"line", call.line}
    };
}

void to_json(json& j, const CollectionResult& result) {
    j = {
        {"signals", result.signals},
        {"dynamic_metrics", result.dynamic_calls}
    };
}

std::string dump_result(const CollectionResult& result, int indent) {
    json output = result;
    return output.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace obs_sitter
