// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <namesmith/core/types.h>
#include <namesmith/naming/name_builder.h>
#include <namesmith/naming/template.h>

#include <array>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace namesmith::config {

inline constexpr std::array<std::string_view, 8> kSupportedExtensions = {
    ".avif", ".webp", ".png", ".jpg", ".jpeg", ".gif", ".tiff", ".bmp"};

[[nodiscard]] bool isSupportedExtension(std::string_view extension);

// Naming options for one save node.
struct SaveConfig {
    std::string filenamePrefix = "ComfyUI";
    std::string filenameTemplate = "sampler_name, cfg, steps, %F %H-%M-%S";
    std::string foldernamePrefix;
    std::string foldernameTemplate = "ckpt_name";
    std::string delimiter = "-";
    std::string extension = ".webp";
    int quality = 75;
    bool saveMetadata = true;
    int counterDigits = 4;
    naming::CounterPosition counterPosition = naming::CounterPosition::Last;
    bool perDirectoryCounter = true;
    std::filesystem::path baseOutputDirectory = "output";
    bool allowParentEscape = false;

    naming::Template filenameTokens() const { return naming::Template::parse(filenameTemplate); }
    naming::Template foldernameTokens() const {
        return naming::Template::parse(foldernameTemplate);
    }
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(std::string message) {
        errors.push_back(std::move(message));
        valid = false;
    }

    void addWarning(std::string message) { warnings.push_back(std::move(message)); }
};

// Named template bundles.
struct Preset {
    std::string_view name;
    std::string_view filenameTemplate;
    std::string_view foldernameTemplate;
    std::string_view delimiter;
    std::string_view description;
};

[[nodiscard]] std::span<const Preset> presets();

// Overwrites the templates and delimiter of @p config; InvalidArgument for unknown names.
Result<void> applyPreset(SaveConfig& config, std::string_view name);

/**
 * @brief Check ranges and template syntax.
 *
 * Errors: unsupported extension, quality outside 1-100, digits outside 1-8, malformed node
 * references ("5.", "5.seed.x"), invalid date directives. Warnings: delimiter empty or longer
 * than 3 characters, path markers that are not simple names, path markers in file names.
 */
[[nodiscard]] ValidationResult validateConfig(const SaveConfig& config);

/**
 * @brief Apply flat "naming.<key>" (or bare "<key>") entries onto @p base.
 *
 * Unknown keys are ignored. Values that do not parse yield ErrorCode::ValidationError.
 */
Result<SaveConfig> applyConfigValues(const std::map<std::string, std::string>& values,
                                     SaveConfig base = {});

// parse_simple_toml_flat + applyConfigValues; FileNotFound when @p path does not exist.
Result<SaveConfig> loadSaveConfig(const std::filesystem::path& path, SaveConfig base = {});

} // namespace namesmith::config
