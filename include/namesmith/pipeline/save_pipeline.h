// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <namesmith/config/save_config.h>
#include <namesmith/core/types.h>
#include <namesmith/naming/counter_registry.h>
#include <namesmith/naming/parameter_tree.h>
#include <namesmith/naming/path_resolver.h>
#include <namesmith/naming/template_resolver.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace namesmith::pipeline {

// Decoded pixels as handed over by the host. The pipeline never looks inside.
struct DecodedImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t channels = 0;
    ByteVector pixels;
};

/**
 * @brief Writes one image in the format implied by the path's extension.
 *
 * Implementations own pixel encoding and metadata embedding. An error return (for example
 * ErrorCode::StorageFull) aborts the current save event.
 */
class IImageEncoder {
public:
    virtual ~IImageEncoder() = default;

    virtual Result<void> encode(const DecodedImage& image, const std::filesystem::path& path,
                                const nlohmann::json& metadata, int quality) = 0;
};

struct SavedImage {
    std::string filename;
    std::string subfolder; // Relative to the base output directory, '/'-separated
    std::filesystem::path path;
    std::uint64_t counter = 0;
};

// Names a save event would use, without touching the filesystem.
struct SavePreview {
    std::filesystem::path filePath;
    std::filesystem::path folderPath;
};

// Base name and folder spec after template resolution.
struct NamePlan {
    std::string baseName;
    std::string folderSpec;
};

/**
 * @brief Runs template resolution, directory creation and counter assignment for each save
 * event, then hands every image to the encoder.
 *
 * Owns the counter registry, so counters stay unique across events for the pipeline's
 * lifetime. save() may be called from several threads; the registry serializes counter
 * claims per scope.
 */
class SavePipeline {
public:
    SavePipeline(config::SaveConfig config, std::shared_ptr<IImageEncoder> encoder);

    SavePipeline(const SavePipeline&) = delete;
    SavePipeline& operator=(const SavePipeline&) = delete;

    [[nodiscard]] NamePlan planNames(const naming::ParameterTree& tree, TimePoint when) const;

    /**
     * @brief Save every image of one event.
     *
     * Each image claims its own counter. Template problems and directory failures degrade
     * gracefully; an encoder error stops the event and is returned.
     */
    Result<std::vector<SavedImage>> save(const std::vector<DecodedImage>& images,
                                         const naming::ParameterTree& tree,
                                         const nlohmann::json& metadata, TimePoint when);

    /**
     * @brief Claim counters and create directories for @p count images without encoding.
     */
    Result<std::vector<SavedImage>> reserve(std::size_t count, const naming::ParameterTree& tree,
                                            TimePoint when);

    [[nodiscard]] SavePreview preview(const naming::ParameterTree& tree, std::uint64_t counter,
                                      TimePoint when) const;

    void clearCaches();
    // Replaces the configuration and drops cached counters. Not safe while save() runs.
    void updateConfig(config::SaveConfig config);

    const config::SaveConfig& config() const noexcept { return config_; }
    naming::CounterRegistry& counters() noexcept { return counters_; }
    const naming::PathResolver& paths() const noexcept { return *paths_; }

private:
    struct Target {
        std::filesystem::path directory;
        std::string baseName;
    };

    Target prepareTarget(const naming::ParameterTree& tree, TimePoint when);
    Result<SavedImage> claim(const Target& target);

    config::SaveConfig config_;
    naming::Template filenameTemplate_;
    naming::Template foldernameTemplate_;
    std::shared_ptr<IImageEncoder> encoder_;
    naming::TemplateResolver resolver_;
    std::unique_ptr<naming::PathResolver> paths_;
    naming::CounterRegistry counters_;
};

} // namespace namesmith::pipeline
