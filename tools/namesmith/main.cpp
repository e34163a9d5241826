// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <namesmith/config/config_helpers.h>
#include <namesmith/config/save_config.h>
#include <namesmith/pipeline/save_pipeline.h>
#include <namesmith/version.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>

namespace {

using namesmith::Error;
using namesmith::ErrorCode;
using namesmith::Result;
using namesmith::TimePoint;
using namesmith::naming::ParameterTree;

void setupLogging(const std::string& level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 5 * 1024 * 1024, 3));
    }
    auto logger = std::make_shared<spdlog::logger>("namesmith", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (level == "trace")
        spdlog::set_level(spdlog::level::trace);
    else if (level == "debug")
        spdlog::set_level(spdlog::level::debug);
    else if (level == "info")
        spdlog::set_level(spdlog::level::info);
    else if (level == "warn")
        spdlog::set_level(spdlog::level::warn);
    else if (level == "error")
        spdlog::set_level(spdlog::level::err);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
}

Result<ParameterTree> readParameters(const std::string& path) {
    if (path.empty())
        return ParameterTree::object();
    std::ifstream in(path);
    if (!in)
        return Error{ErrorCode::FileNotFound, "Cannot open parameter file: " + path};
    auto tree = ParameterTree::parse(in, nullptr, false);
    if (tree.is_discarded())
        return Error{ErrorCode::InvalidData, "Parameter file is not valid JSON: " + path};
    return tree;
}

Result<namesmith::config::SaveConfig> resolveConfig(const std::string& configOverride,
                                                    const std::string& preset) {
    namesmith::config::SaveConfig config;
    const auto path = namesmith::config::get_config_path(configOverride);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto loaded = namesmith::config::loadSaveConfig(path);
        if (!loaded)
            return loaded.error();
        config = std::move(loaded).value();
        spdlog::debug("Loaded config from {}", path.string());
    } else if (!configOverride.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }
    if (!preset.empty()) {
        if (auto applied = namesmith::config::applyPreset(config, preset); !applied)
            return applied.error();
    }
    return config;
}

TimePoint eventTime(std::optional<std::int64_t> epochSeconds) {
    if (epochSeconds)
        return TimePoint{std::chrono::seconds(*epochSeconds)};
    return std::chrono::system_clock::now();
}

int fail(const Error& error) {
    spdlog::error("{} ({})", error.message, error.code);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"namesmith - file and folder names for generated images"};
    app.set_version_flag("--version", NAMESMITH_VERSION_STRING);
    app.require_subcommand(1);

    std::string configPath;
    std::string preset;
    std::string logLevel = "warn";
    std::string logFile;
    std::string paramsPath;
    std::optional<std::int64_t> timestamp;

    app.add_option("-c,--config", configPath, "Config file (TOML, [naming] section)");
    app.add_option("-p,--preset", preset, "Apply a template preset")
        ->check(CLI::IsMember({"simple", "detailed", "organized", "minimal"}));
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("warn");
    app.add_option("--log-file", logFile, "Log file path (optional)");

    auto* previewCmd = app.add_subcommand("preview", "Show the names a save would use");
    std::uint64_t counter = 1;
    previewCmd->add_option("--params", paramsPath, "Parameter tree (JSON)")
        ->check(CLI::ExistingFile);
    previewCmd->add_option("--counter", counter, "Counter value to show")->default_val(1);
    previewCmd->add_option("--timestamp", timestamp, "Event time as Unix seconds");

    auto* planCmd =
        app.add_subcommand("plan", "Create folders and claim counters, print final paths");
    std::size_t count = 1;
    planCmd->add_option("--params", paramsPath, "Parameter tree (JSON)")->check(CLI::ExistingFile);
    planCmd->add_option("-n,--count", count, "Number of images")->default_val(1);
    planCmd->add_option("--timestamp", timestamp, "Event time as Unix seconds");

    auto* validateCmd = app.add_subcommand("validate", "Check the configuration and templates");
    validateCmd->add_option("--params", paramsPath, "Parameter tree (JSON) to check tokens against")
        ->check(CLI::ExistingFile);
    validateCmd->add_option("--timestamp", timestamp, "Event time as Unix seconds");

    auto* presetsCmd = app.add_subcommand("presets", "List template presets");

    CLI11_PARSE(app, argc, argv);

    try {
        setupLogging(logLevel, logFile);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    if (presetsCmd->parsed()) {
        for (const auto& p : namesmith::config::presets()) {
            std::cout << p.name << ": " << p.description << "\n  filename:   " << p.filenameTemplate
                      << "\n  foldername: " << p.foldernameTemplate << "\n  delimiter:  '"
                      << p.delimiter << "'\n";
        }
        return 0;
    }

    try {
        auto config = resolveConfig(configPath, preset);
        if (!config)
            return fail(config.error());
        auto tree = readParameters(paramsPath);
        if (!tree)
            return fail(tree.error());
        const TimePoint when = eventTime(timestamp);

        if (validateCmd->parsed()) {
            const auto report = namesmith::config::validateConfig(config.value());
            for (const auto& e : report.errors)
                std::cout << "error: " << e << "\n";
            for (const auto& w : report.warnings)
                std::cout << "warning: " << w << "\n";
            if (!paramsPath.empty()) {
                namesmith::naming::TemplateResolver resolver;
                for (const auto* tmpl : {&config.value().filenameTemplate,
                                         &config.value().foldernameTemplate}) {
                    for (const auto& issue : resolver.diagnose(
                             namesmith::naming::Template::parse(*tmpl), tree.value(), when)) {
                        std::cout << "unresolved: " << issue.token << " ("
                                  << namesmith::naming::tokenKindToString(issue.kind)
                                  << "): " << issue.message << "\n";
                    }
                }
            }
            std::cout << (report.valid ? "config OK" : "config invalid") << std::endl;
            return report.valid ? 0 : 2;
        }

        namesmith::pipeline::SavePipeline pipeline(config.value(), nullptr);

        if (previewCmd->parsed()) {
            const auto out = pipeline.preview(tree.value(), counter, when);
            std::cout << "file:   " << out.filePath.string() << "\n"
                      << "folder: " << out.folderPath.string() << std::endl;
            return 0;
        }

        if (planCmd->parsed()) {
            auto reserved = pipeline.reserve(count, tree.value(), when);
            if (!reserved)
                return fail(reserved.error());
            for (const auto& entry : reserved.value()) {
                std::cout << entry.path.string() << std::endl;
            }
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
