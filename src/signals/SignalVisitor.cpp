#include "signals/SignalVisitor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>

namespace obs_sitter {

namespace {

// Logger methods that name their level
const std::set<std::string> LOG_METHODS = {
    "debug", "info", "warn", "error", "fatal", "unknown"
};

// Logger methods that take the level as first argument
const std::set<std::string> GENERIC_LOG_METHODS = {"add", "log"};

// Severities in Logger::Severity order (0..5)
const std::vector<std::string> SEVERITY_LEVELS = {
    "debug", "info", "warn", "error", "fatal", "unknown"
};

// Methods that perform a metric action
const std::set<std::string> METRIC_ACTION_METHODS = {
    "increment", "incr", "decrement", "decr", "set", "observe", "time", "timing", "emit"
};

// Methods that create metric objects
const std::set<std::string> METRIC_FACTORY_METHODS = {
    "counter", "gauge", "histogram", "summary",
    "register_counter", "register_gauge", "register_histogram", "register_summary"
};

constexpr std::string_view REGISTER_PREFIX = "register_";

constexpr size_t MAX_EVENT_NAME_LENGTH = 50;

std::string last_segment(const std::string& path) {
    auto pos = path.rfind("::");
    return pos == std::string::npos ? path : path.substr(pos + 2);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool is_severity(const std::string& level) {
    return std::find(SEVERITY_LEVELS.begin(), SEVERITY_LEVELS.end(), level) != SEVERITY_LEVELS.end();
}

} // namespace

SignalVisitor::SignalVisitor(const DetectorConfig& config, std::string file_path, int inheritance_depth)
    : config_(config),
      file_path_(std::move(file_path)),
      inheritance_depth_(inheritance_depth) {
}

void SignalVisitor::visit(const Tree& tree, std::string_view source) {
    source_ = source;
    visit_node(tree.root_node());

    spdlog::debug("Visited {} (depth {}): {} logs, {} metrics, {} dynamic, {} definitions",
                  file_path_, inheritance_depth_, log_calls_.size(), metric_calls_.size(),
                  dynamic_calls_.size(), structure_.classes.size());
}

std::vector<ModuleRelation> SignalVisitor::relations(RelationKind kind) const {
    std::vector<ModuleRelation> result;
    for (const auto& relation : structure_.relations) {
        if (relation.kind == kind) {
            result.push_back(relation);
        }
    }
    return result;
}

void SignalVisitor::visit_node(TSNode node) {
    if (ts_node_is_null(node)) {
        return;
    }

    switch (RubyNodes::classify(node)) {
        case NodeKind::Class:
            visit_definition(node, DefinitionKind::Class);
            break;
        case NodeKind::Module:
            visit_definition(node, DefinitionKind::Module);
            break;
        case NodeKind::Call:
            visit_call(node);
            break;
        case NodeKind::Sequence:
        case NodeKind::Other:
            visit_children(node);
            break;
    }
}

void SignalVisitor::visit_children(TSNode node) {
    for (TSNode child : RubyNodes::named_children(node)) {
        visit_node(child);
    }
}

void SignalVisitor::visit_definition(TSNode node, DefinitionKind kind) {
    auto name_node = RubyNodes::field(node, "name");
    if (!name_node) {
        visit_children(node);
        return;
    }

    std::string name = RubyNodes::constant_path(*name_node, source_)
                           .value_or(RubyNodes::text(*name_node, source_));

    std::optional<TSNode> superclass_node;
    std::optional<std::string> parent_name;
    if (kind == DefinitionKind::Class) {
        superclass_node = RubyNodes::field(node, "superclass");
        if (superclass_node) {
            auto parent_children = RubyNodes::named_children(*superclass_node);
            if (!parent_children.empty()) {
                parent_name = RubyNodes::constant_path(parent_children.front(), source_);
            }
        }
    }

    std::string qualified_name = namespace_stack_.empty()
        ? name
        : active_name() + "::" + name;

    structure_.classes.push_back(ClassStructure{qualified_name, parent_name, file_path_, kind});

    // A::B::C folds into a single frame
    namespace_stack_.push_back(name);

    for (TSNode child : RubyNodes::named_children(node)) {
        if (ts_node_eq(child, *name_node)) {
            continue;
        }
        if (superclass_node && ts_node_eq(child, *superclass_node)) {
            continue;
        }
        visit_node(child);
    }

    namespace_stack_.pop_back();
}

void SignalVisitor::visit_call(TSNode node) {
    auto receiver = RubyNodes::field(node, "receiver");
    std::string method = RubyNodes::method_name(node, source_);
    std::vector<TSNode> args = RubyNodes::positional_arguments(node);

    if (!record_log_call(node, receiver, method, args)) {
        if (!record_metric_call(node, receiver, method, args)) {
            record_module_relation(receiver, method, args);
        }
    }

    // Detections nest (a log inside a block passed to a metric call)
    visit_children(node);
}

// ============================================================================
// Log calls
// ============================================================================

bool SignalVisitor::record_log_call(TSNode node, const std::optional<TSNode>& receiver,
                                    const std::string& method, const std::vector<TSNode>& args) {
    std::string level;
    std::optional<TSNode> message;

    if (receiver) {
        if (!is_log_receiver(*receiver)) {
            return false;
        }

        if (LOG_METHODS.count(method)) {
            level = method;
            if (!args.empty()) {
                message = args[0];
            }
        } else if (GENERIC_LOG_METHODS.count(method)) {
            if (args.empty()) {
                return false;
            }
            auto severity = severity_of(args[0], false);
            if (!severity) {
                return false;
            }
            level = *severity;
            if (args.size() > 1) {
                message = args[1];
            }
        } else {
            return false;
        }
    } else {
        if (method != "log" || !includes_logging_trait(active_name())) {
            return false;
        }

        auto severity = args.empty() ? std::nullopt : severity_of(args[0], true);
        if (severity) {
            level = *severity;
            if (args.size() > 1) {
                message = args[1];
            }
        } else {
            level = "info";
            if (!args.empty()) {
                message = args[0];
            }
        }
    }

    LogCall call;
    call.level = level;
    call.event_name = message ? event_name_of(*message) : std::nullopt;
    call.interpolated = message && RubyNodes::is_interpolated_string(*message);
    call.defining_class = active_name();
    call.line = RubyNodes::line(node);

    log_calls_.push_back(std::move(call));
    return true;
}

bool SignalVisitor::is_log_receiver(TSNode receiver) const {
    std::string_view receiver_type = RubyNodes::type(receiver);

    // logger.info, self.logger.info, Rails.logger.info
    if (receiver_type == "call") {
        if (RubyNodes::method_name(receiver, source_) != "logger") {
            return false;
        }
        auto owner = RubyNodes::field(receiver, "receiver");
        if (!owner || RubyNodes::type(*owner) == "self") {
            return true;
        }
        auto owner_name = RubyNodes::constant_path(*owner, source_);
        return owner_name && config_.log_namespace_receivers.count(*owner_name) > 0;
    }

    // logger, @logger, @@logger, $logger, request_logger
    if (RubyNodes::is_variable(receiver)) {
        return RubyNodes::text(receiver, source_).find("logger") != std::string::npos;
    }

    // LOG, LOGGER, AuditLogger
    if (auto constant = RubyNodes::constant_path(receiver, source_)) {
        std::string name = last_segment(*constant);
        return name == "LOG" || to_lower(name).find("logger") != std::string::npos;
    }

    return false;
}

bool SignalVisitor::includes_logging_trait(const std::string& class_name) const {
    for (const auto& relation : structure_.relations) {
        if (relation.including_class == class_name &&
            config_.structured_log_traits.count(relation.module_name)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> SignalVisitor::severity_of(TSNode arg, bool symbols_only) const {
    if (auto symbol = RubyNodes::symbol_value(arg, source_)) {
        if (is_severity(*symbol)) {
            return *symbol;
        }
        return std::nullopt;
    }

    if (symbols_only) {
        return std::nullopt;
    }

    std::string_view arg_type = RubyNodes::type(arg);

    if (arg_type == "integer") {
        std::string digits = RubyNodes::text(arg, source_);
        if (digits.size() == 1 && digits[0] >= '0' && digits[0] <= '5') {
            return SEVERITY_LEVELS[digits[0] - '0'];
        }
        return std::nullopt;
    }

    // Logger::WARN, Logger::Severity::ERROR
    if (auto constant = RubyNodes::constant_path(arg, source_)) {
        auto pos = constant->rfind("::");
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        std::string scope = last_segment(constant->substr(0, pos));
        std::string level = to_lower(constant->substr(pos + 2));
        if ((scope == "Logger" || scope == "Severity") && is_severity(level)) {
            return level;
        }
    }

    return std::nullopt;
}

std::optional<std::string> SignalVisitor::event_name_of(TSNode message) const {
    if (RubyNodes::is_string(message)) {
        std::string literal;
        for (const auto& fragment : RubyNodes::string_fragments(message, source_)) {
            literal += fragment;
        }
        return derive_event_name(literal);
    }

    return RubyNodes::symbol_value(message, source_);
}

std::optional<std::string> SignalVisitor::derive_event_name(std::string_view message) {
    std::string slug;
    bool pending_separator = false;

    for (char raw : message) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (!keep) {
            pending_separator = true;
            continue;
        }
        if (pending_separator && !slug.empty()) {
            slug += '_';
        }
        pending_separator = false;
        slug += c;
    }

    if (slug.size() > MAX_EVENT_NAME_LENGTH) {
        slug.resize(MAX_EVENT_NAME_LENGTH);
    }

    if (slug.empty()) {
        return std::nullopt;
    }
    return slug;
}

// ============================================================================
// Metric calls
// ============================================================================

MetricType SignalVisitor::infer_metric_type(std::string_view method) {
    if (method == "increment" || method == "incr") {
        return MetricType::Counter;
    }
    if (method == "gauge" || method == "set") {
        return MetricType::Gauge;
    }
    if (method == "histogram" || method == "observe" || method == "timing" || method == "time") {
        return MetricType::Histogram;
    }
    if (method == "summary") {
        return MetricType::Summary;
    }
    return MetricType::Counter;
}

bool SignalVisitor::record_metric_call(TSNode node, const std::optional<TSNode>& receiver,
                                       const std::string& method, const std::vector<TSNode>& args) {
    if (!receiver || !METRIC_ACTION_METHODS.count(method)) {
        return false;
    }

    // StatsD.increment("name"), Metrics::RequestTotal.increment
    if (auto constant = RubyNodes::constant_path(*receiver, source_)) {
        if (config_.metric_receivers.count(*constant)) {
            std::optional<std::string> name;
            if (!args.empty()) {
                name = RubyNodes::literal_name(args[0], source_);
            }
            add_metric(node, *constant, infer_metric_type(method), name);
            return true;
        }
        if (config_.log_namespace_receivers.count(*constant)) {
            return false;
        }

        constant_refs_.push_back(ConstantMetricReference{
            *constant, method, active_name(), RubyNodes::line(node)
        });
        return true;
    }

    // Prometheus.counter(:name).increment
    if (RubyNodes::type(*receiver) == "call") {
        auto client = RubyNodes::field(*receiver, "receiver");
        if (!client) {
            return false;
        }

        auto client_name = RubyNodes::constant_path(*client, source_);
        std::string factory = RubyNodes::method_name(*receiver, source_);
        if (!client_name || !config_.metric_receivers.count(*client_name) ||
            !METRIC_FACTORY_METHODS.count(factory)) {
            return false;
        }

        if (factory.compare(0, REGISTER_PREFIX.size(), REGISTER_PREFIX) == 0) {
            factory.erase(0, REGISTER_PREFIX.size());
        }

        auto factory_args = RubyNodes::positional_arguments(*receiver);
        std::optional<std::string> name;
        if (!factory_args.empty()) {
            name = RubyNodes::literal_name(factory_args[0], source_);
        }
        add_metric(node, *client_name, infer_metric_type(factory), name);
        return true;
    }

    return false;
}

void SignalVisitor::add_metric(TSNode node, const std::string& receiver, MetricType type,
                               const std::optional<std::string>& name) {
    if (name) {
        metric_calls_.push_back(MetricCall{
            *name, type, receiver, active_name(), RubyNodes::line(node)
        });
        return;
    }

    dynamic_calls_.push_back(DynamicMetricCall{
        receiver, type, active_name(), file_path_, RubyNodes::line(node)
    });
}

// ============================================================================
// Structure
// ============================================================================

bool SignalVisitor::record_module_relation(const std::optional<TSNode>& receiver,
                                           const std::string& method,
                                           const std::vector<TSNode>& args) {
    if (receiver) {
        return false;
    }

    RelationKind kind;
    if (method == "include") {
        kind = RelationKind::Include;
    } else if (method == "prepend") {
        kind = RelationKind::Prepend;
    } else if (method == "extend") {
        kind = RelationKind::Extend;
    } else {
        return false;
    }

    for (TSNode arg : args) {
        auto module_name = RubyNodes::constant_path(arg, source_);
        if (!module_name) {
            continue;
        }
        structure_.relations.push_back(ModuleRelation{*module_name, active_name(), kind, file_path_});
    }
    return true;
}

std::string SignalVisitor::active_name() const {
    if (namespace_stack_.empty()) {
        return std::string(TOP_LEVEL);
    }

    std::string name;
    for (const auto& segment : namespace_stack_) {
        if (!name.empty()) {
            name += "::";
        }
        name += segment;
    }
    return name;
}

} // namespace obs_sitter
