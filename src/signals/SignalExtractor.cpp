#include "signals/SignalExtractor.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace obs_sitter {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

uint64_t fnv1a_64(const std::string& text) {
    uint64_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

} // namespace

SignalExtractor::SignalExtractor(const ConstantResolver* constants)
    : constants_(constants) {
}

std::vector<Signal> SignalExtractor::extract(const SignalVisitor& visitor) const {
    std::vector<Signal> signals = extract_logs(visitor);
    std::vector<Signal> metrics = extract_metrics(visitor);
    signals.insert(signals.end(),
                   std::make_move_iterator(metrics.begin()),
                   std::make_move_iterator(metrics.end()));
    return signals;
}

std::vector<Signal> SignalExtractor::extract_logs(const SignalVisitor& visitor) const {
    std::vector<Signal> signals;
    signals.reserve(visitor.log_calls().size());

    for (const auto& call : visitor.log_calls()) {
        Signal signal;
        signal.type = SignalType::Log;
        signal.name = call.event_name
            ? *call.event_name
            : fallback_log_name(call.defining_class, call.level, call.line);
        signal.source_file = visitor.file_path();
        signal.defining_class = call.defining_class;
        signal.inheritance_depth = visitor.inheritance_depth();
        signal.metadata.level = call.level;
        signal.metadata.interpolated = call.interpolated;
        signal.metadata.line = call.line;
        signals.push_back(std::move(signal));
    }

    return signals;
}

std::vector<Signal> SignalExtractor::extract_metrics(const SignalVisitor& visitor) const {
    std::vector<Signal> signals;

    auto make_signal = [&visitor](const std::string& name, MetricType type,
                                  const std::string& defining_class, uint32_t line) {
        Signal signal;
        signal.type = signal_type_for(type);
        signal.name = name;
        signal.source_file = visitor.file_path();
        signal.defining_class = defining_class;
        signal.inheritance_depth = visitor.inheritance_depth();
        signal.metadata.metric_type = type;
        signal.metadata.line = line;
        return signal;
    };

    for (const auto& call : visitor.metric_calls()) {
        signals.push_back(make_signal(call.name, call.metric_type, call.defining_class, call.line));
    }

    if (constants_) {
        for (const auto& reference : visitor.constant_references()) {
            auto entry = constants_->resolve(reference.constant, reference.defining_class);
            if (!entry) {
                spdlog::debug("Unresolved metric constant {} at {}:{}",
                              reference.constant, visitor.file_path(), reference.line);
                continue;
            }
            signals.push_back(make_signal(entry->name, entry->type,
                                          reference.defining_class, reference.line));
        }
    }

    std::stable_sort(signals.begin(), signals.end(),
                     [](const Signal& a, const Signal& b) {
                         return a.metadata.line < b.metadata.line;
                     });

    return signals;
}

std::string SignalExtractor::fallback_log_name(const std::string& defining_class,
                                               const std::string& level,
                                               uint32_t line) {
    uint64_t hash = fnv1a_64(defining_class + ":" + level + ":" + std::to_string(line));

    return "log_" + fmt::format("{:016x}", hash).substr(0, 8);
}

} // namespace obs_sitter
