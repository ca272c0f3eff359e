#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace obs_sitter {

/**
 * @brief Raised for unreadable, malformed or wrongly typed configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Detection settings shared by the visitor, resolvers and collector
 *
 * Every field has a working default; a JSON document only overrides the
 * keys it names.
 */
struct DetectorConfig {
    // Namespace constants allowed in front of .logger (Rails.logger.info)
    std::set<std::string> log_namespace_receivers = {"Rails"};

    // Mixins that make a bare log(...) call a structured log call
    std::set<std::string> structured_log_traits = {
        "Loggy::ClassLogger",
        "Loggy::InstanceLogger"
    };

    // Constants recognized as metric clients
    std::set<std::string> metric_receivers = {
        "Prometheus", "StatsD", "Statsd", "Hesiod", "Datadog", "DogStatsD"
    };

    // Repo-relative files scanned for metric constant registrations
    std::vector<std::string> metric_definition_paths = {
        "app/services/metrics.rb",
        "app/lib/metrics.rb",
        "app/models/metrics.rb",
        "lib/metrics.rb",
        "config/initializers/metrics.rb"
    };

    // Ancestor walk stops once this depth is reached
    int max_depth = 5;

    /**
     * @brief Overlay the keys present in a JSON object on the defaults
     * @throws ConfigError if the document is not an object or a value has the wrong type
     */
    static DetectorConfig from_json(const json& document);

    /**
     * @brief Read and parse a JSON configuration file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static DetectorConfig load_file(const std::filesystem::path& filepath);

    json to_json() const;
};

} // namespace obs_sitter
