#include "signals/ConstantResolver.hpp"
#include "core/RubyNodes.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace obs_sitter {

ConstantResolver::ConstantResolver(const DetectorConfig& config)
    : config_(config),
      query_(engine_.compile_query(QueryEngine::PredefinedQueries::METRIC_CONSTANT_DEFINITIONS)) {
    if (!query_) {
        throw std::runtime_error("Failed to compile metric constant query");
    }
}

std::optional<MetricType> ConstantResolver::factory_type(std::string_view method) {
    if (method == "counter" || method == "register_counter") {
        return MetricType::Counter;
    }
    if (method == "gauge" || method == "register_gauge") {
        return MetricType::Gauge;
    }
    if (method == "histogram" || method == "register_histogram") {
        return MetricType::Histogram;
    }
    if (method == "summary" || method == "register_summary") {
        return MetricType::Summary;
    }
    return std::nullopt;
}

size_t ConstantResolver::scan(const Tree& tree, std::string_view source) {
    size_t recorded = 0;

    for (const auto& match : engine_.execute(tree, *query_, source)) {
        const QueryCapture* target = match.find("target");
        const QueryCapture* client = match.find("client");
        const QueryCapture* factory = match.find("factory");
        const QueryCapture* name = match.find("name");
        const QueryCapture* definition = match.find("definition");
        if (!target || !client || !factory || !name || !definition) {
            continue;
        }

        auto client_name = RubyNodes::constant_path(client->node, source);
        if (!client_name || !config_.metric_receivers.count(*client_name)) {
            continue;
        }

        auto type = factory_type(factory->text);
        if (!type) {
            continue;
        }

        auto metric_name = RubyNodes::literal_name(name->node, source);
        auto target_name = RubyNodes::constant_path(target->node, source);
        if (!metric_name || !target_name) {
            continue;
        }

        std::string scope = lexical_namespace(definition->node, source);
        std::string qualified = scope.empty() ? *target_name : scope + "::" + *target_name;

        spdlog::debug("Metric constant {} -> {} ({})", qualified, *metric_name, to_string(*type));
        constant_map_[qualified] = MetricConstantEntry{*metric_name, *type};
        recorded++;
    }

    return recorded;
}

std::optional<MetricConstantEntry> ConstantResolver::resolve(
    const std::string& constant_name,
    const std::string& lexical_scope
) const {
    auto it = constant_map_.find(constant_name);
    if (it != constant_map_.end()) {
        return it->second;
    }

    std::string scope = lexical_scope == TOP_LEVEL ? std::string() : lexical_scope;
    while (!scope.empty()) {
        it = constant_map_.find(scope + "::" + constant_name);
        if (it != constant_map_.end()) {
            return it->second;
        }

        auto pos = scope.rfind("::");
        scope = pos == std::string::npos ? std::string() : scope.substr(0, pos);
    }

    return std::nullopt;
}

std::string ConstantResolver::lexical_namespace(TSNode node, std::string_view source) {
    std::string scope;

    for (TSNode parent = ts_node_parent(node); !ts_node_is_null(parent);
         parent = ts_node_parent(parent)) {
        NodeKind kind = RubyNodes::classify(parent);
        if (kind != NodeKind::Class && kind != NodeKind::Module) {
            continue;
        }

        auto name_node = RubyNodes::field(parent, "name");
        if (!name_node) {
            continue;
        }
        auto name = RubyNodes::constant_path(*name_node, source);
        if (!name) {
            continue;
        }
        scope = scope.empty() ? *name : *name + "::" + scope;
    }

    return scope;
}

} // namespace obs_sitter
