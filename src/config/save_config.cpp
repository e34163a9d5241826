// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/config/config_helpers.h>
#include <namesmith/config/save_config.h>
#include <namesmith/naming/template_resolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace namesmith::config {

namespace {

constexpr std::array<Preset, 4> kPresets = {{
    {"simple", "sampler_name, steps", "ckpt_name", "-", "Sampler and step count"},
    {"detailed", "sampler_name, cfg, steps, %Y-%m-%d_%H-%M-%S", "ckpt_name, ./sampler_name", "_",
     "Sampler settings with timestamp, one subfolder per sampler"},
    {"organized", "ckpt_name, sampler_name, cfg, steps", "%Y-%m-%d, ./ckpt_name", "-",
     "Grouped by date, then by model"},
    {"minimal", "%Y%m%d_%H%M%S", "", "", "Timestamp only"},
}};

std::optional<int> parseInt(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

bool isSimpleMarkerName(std::string_view segment) {
    if (segment.empty())
        return false;
    return std::all_of(segment.begin(), segment.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-';
    });
}

bool startsWithDigitsThenDot(std::string_view text) {
    const auto dot = text.find('.');
    if (dot == std::string_view::npos || dot == 0)
        return false;
    return std::all_of(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(dot),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

void validateTemplate(const naming::Template& tmpl, std::string_view field, bool isFolder,
                      ValidationResult& result) {
    for (const auto& token : tmpl) {
        switch (token.kind) {
            case naming::TokenKind::DateDirective:
                if (!naming::isValidDateDirective(token.key))
                    result.addError(std::string(field) + ": invalid date directive '" +
                                    token.raw + "'");
                break;
            case naming::TokenKind::PathMarker:
                if (!isFolder) {
                    result.addWarning(std::string(field) + ": path marker '" + token.raw +
                                      "' creates a subfolder");
                } else if (!isSimpleMarkerName(token.key)) {
                    result.addWarning(std::string(field) + ": path marker '" + token.raw +
                                      "' is not a simple folder name");
                }
                break;
            case naming::TokenKind::Literal:
                if (startsWithDigitsThenDot(token.raw))
                    result.addError(std::string(field) + ": malformed node reference '" +
                                    token.raw + "' (expected <node id>.<parameter>)");
                break;
            case naming::TokenKind::NodeReference:
                break;
        }
    }
}

} // namespace

bool isSupportedExtension(std::string_view extension) {
    return std::find(kSupportedExtensions.begin(), kSupportedExtensions.end(), extension) !=
           kSupportedExtensions.end();
}

std::span<const Preset> presets() {
    return kPresets;
}

Result<void> applyPreset(SaveConfig& config, std::string_view name) {
    for (const auto& preset : kPresets) {
        if (preset.name == name) {
            config.filenameTemplate = std::string(preset.filenameTemplate);
            config.foldernameTemplate = std::string(preset.foldernameTemplate);
            config.delimiter = std::string(preset.delimiter);
            return {};
        }
    }
    return Error{ErrorCode::InvalidArgument, "Unknown preset: " + std::string(name)};
}

ValidationResult validateConfig(const SaveConfig& config) {
    ValidationResult result;

    validateTemplate(config.filenameTokens(), "filename_template", false, result);
    validateTemplate(config.foldernameTokens(), "foldername_template", true, result);

    if (!isSupportedExtension(config.extension))
        result.addError("unsupported extension: " + config.extension);
    if (config.quality < 1 || config.quality > 100)
        result.addError("quality must be between 1 and 100");
    if (config.counterDigits < 1 || config.counterDigits > 8)
        result.addError("counter_digits must be between 1 and 8");
    if (config.delimiter.empty() || config.delimiter.size() > 3)
        result.addWarning("a short delimiter such as '-' or '_' is recommended");

    return result;
}

Result<SaveConfig> applyConfigValues(const std::map<std::string, std::string>& values,
                                     SaveConfig base) {
    SaveConfig config = std::move(base);

    for (const auto& [rawKey, value] : values) {
        std::string_view key = rawKey;
        if (key.starts_with("naming."))
            key.remove_prefix(7);
        else if (key.find('.') != std::string_view::npos)
            continue;

        auto invalid = [&](std::string_view what) {
            return Error{ErrorCode::ValidationError,
                         std::string(key) + ": " + std::string(what) + " '" + value + "'"};
        };

        if (key == "filename_prefix") {
            config.filenamePrefix = value;
        } else if (key == "filename_template") {
            config.filenameTemplate = value;
        } else if (key == "foldername_prefix") {
            config.foldernamePrefix = value;
        } else if (key == "foldername_template") {
            config.foldernameTemplate = value;
        } else if (key == "delimiter") {
            config.delimiter = value;
        } else if (key == "extension") {
            config.extension = (!value.empty() && value.front() != '.') ? "." + value : value;
        } else if (key == "quality") {
            auto parsed = parseInt(value);
            if (!parsed)
                return invalid("expected an integer, got");
            config.quality = *parsed;
        } else if (key == "counter_digits") {
            auto parsed = parseInt(value);
            if (!parsed)
                return invalid("expected an integer, got");
            config.counterDigits = *parsed;
        } else if (key == "counter_position") {
            auto parsed = naming::parseCounterPosition(value);
            if (!parsed)
                return invalid("expected 'first' or 'last', got");
            config.counterPosition = *parsed;
        } else if (key == "save_metadata" || key == "per_directory_counter" ||
                   key == "allow_parent_escape") {
            auto parsed = parse_bool(value);
            if (!parsed)
                return invalid("expected a boolean, got");
            if (key == "save_metadata")
                config.saveMetadata = *parsed;
            else if (key == "per_directory_counter")
                config.perDirectoryCounter = *parsed;
            else
                config.allowParentEscape = *parsed;
        } else if (key == "base_output_directory") {
            config.baseOutputDirectory = expand_tilde(value);
        } else {
            spdlog::debug("Ignoring unknown config key '{}'", rawKey);
        }
    }
    return config;
}

Result<SaveConfig> loadSaveConfig(const std::filesystem::path& path, SaveConfig base) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }
    return applyConfigValues(parse_simple_toml_flat(path), std::move(base));
}

} // namespace namesmith::config
