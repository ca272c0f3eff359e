#include "config/DetectorConfig.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace obs_sitter {

namespace {

constexpr int MAX_DEPTH_LIMIT = 32;

std::vector<std::string> string_list(const json& document, const std::string& key) {
    const json& value = document.at(key);
    if (!value.is_array()) {
        throw ConfigError("'" + key + "' must be an array of strings");
    }

    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigError("'" + key + "' must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::set<std::string> string_set(const json& document, const std::string& key) {
    auto items = string_list(document, key);
    return std::set<std::string>(items.begin(), items.end());
}

} // namespace

DetectorConfig DetectorConfig::from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    DetectorConfig config;

    for (const auto& [key, value] : document.items()) {
        if (key == "log_namespace_receivers") {
            config.log_namespace_receivers = string_set(document, key);
        } else if (key == "structured_log_traits") {
            config.structured_log_traits = string_set(document, key);
        } else if (key == "metric_receivers") {
            config.metric_receivers = string_set(document, key);
        } else if (key == "metric_definition_paths") {
            config.metric_definition_paths = string_list(document, key);
        } else if (key == "max_depth") {
            if (!value.is_number_integer()) {
                throw ConfigError("'max_depth' must be an integer");
            }
            int depth = value.get<int>();
            if (depth < 0 || depth > MAX_DEPTH_LIMIT) {
                throw ConfigError("'max_depth' must be between 0 and " +
                                  std::to_string(MAX_DEPTH_LIMIT));
            }
            config.max_depth = depth;
        } else {
            spdlog::warn("Ignoring unknown configuration key: {}", key);
        }
    }

    return config;
}

DetectorConfig DetectorConfig::load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ConfigError("Failed to open configuration file: " + filepath.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + filepath.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", filepath.string());
    return from_json(document);
}

json DetectorConfig::to_json() const {
    return {
        {"log_namespace_receivers", log_namespace_receivers},
        {"structured_log_traits", structured_log_traits},
        {"metric_receivers", metric_receivers},
        {"metric_definition_paths", metric_definition_paths},
        {"max_depth", max_depth}
    };
}

} // namespace obs_sitter
