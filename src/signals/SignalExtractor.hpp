#pragma once

#include "signals/ConstantResolver.hpp"
#include "signals/SignalTypes.hpp"
#include "signals/SignalVisitor.hpp"
#include <string>
#include <vector>

namespace obs_sitter {

/**
 * @brief Turns one visitor's detections into Signals
 *
 * Logs come first, then metrics in source order. Constant metric
 * references are resolved in place through the ConstantResolver; the ones
 * it does not know are dropped.
 */
class SignalExtractor {
public:
    /**
     * @param constants Resolver for constant metric references, or nullptr to drop them
     */
    explicit SignalExtractor(const ConstantResolver* constants = nullptr);

    std::vector<Signal> extract(const SignalVisitor& visitor) const;

    std::vector<Signal> extract_logs(const SignalVisitor& visitor) const;
    std::vector<Signal> extract_metrics(const SignalVisitor& visitor) const;

    /**
     * @brief Stable name for a log call without a usable message
     *
     * "log_" followed by the first 8 hex digits of the 64-bit FNV-1a hash
     * of "defining_class:level:line".
     */
    static std::string fallback_log_name(const std::string& defining_class,
                                         const std::string& level,
                                         uint32_t line);

private:
    const ConstantResolver* constants_;
};

} // namespace obs_sitter
