#include "config/DetectorConfig.hpp"
#include "core/PathResolver.hpp"
#include "signals/SignalCollector.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>

namespace {

bool configure_logging(const std::string& log_level) {
    // stdout carries the JSON result only
    spdlog::set_default_logger(spdlog::stderr_color_mt("obs_sitter"));

    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"obs_sitter - observability signal detection for Ruby sources"};

    std::vector<std::string> files;
    app.add_option("files", files, "Changed Ruby files or directories");

    std::string repo_root = std::filesystem::current_path().string();
    app.add_option("--repo-root", repo_root, "Repository root (default: current directory)");

    std::string config_path;
    app.add_option("--config", config_path, "JSON detector configuration");

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("warn");

    bool skip_interpolated = false;
    app.add_flag("--skip-interpolated-logs", skip_interpolated,
                 "Drop log signals whose message is an interpolated string");

    bool pretty = false;
    app.add_flag("--pretty", pretty, "Indent JSON output");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "obs_sitter version 1.0.0" << std::endl;
        return 0;
    }

    if (!configure_logging(log_level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    try {
        obs_sitter::DetectorConfig config;
        if (!config_path.empty()) {
            config = obs_sitter::DetectorConfig::load_file(config_path);
        }

        obs_sitter::SignalCollector collector(repo_root, std::move(config));
        auto paths = obs_sitter::PathResolver::resolve_paths(files, collector.repo_root());

        spdlog::info("Analyzing {} files under {}", paths.size(), collector.repo_root().string());

        auto result = collector.collect(paths);

        if (skip_interpolated) {
            auto& signals = result.signals;
            signals.erase(std::remove_if(signals.begin(), signals.end(),
                                         [](const obs_sitter::Signal& signal) {
                                             return signal.is_log() && signal.metadata.interpolated;
                                         }),
                          signals.end());
        }

        std::cout << obs_sitter::dump_result(result, pretty ? 2 : -1) << std::endl;
        return 0;

    } catch (const obs_sitter::ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
