// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <namesmith/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace namesmith::naming {

/**
 * @brief Split a folder spec on '/' and '\\' into sanitized segments.
 *
 * Empty and "." segments are dropped, ".." is kept verbatim, every other segment goes
 * through sanitizeSegment (segments that sanitize to nothing are dropped).
 */
[[nodiscard]] std::vector<std::string> splitFolderSpec(std::string_view spec);

/**
 * @brief Join the segments of @p spec onto @p base and normalize lexically.
 *
 * No containment check; see PathResolver::resolveDirectory.
 */
[[nodiscard]] std::filesystem::path joinFolderSpec(const std::filesystem::path& base,
                                                   std::string_view spec);

/**
 * @brief Maps generated folder specs onto directories under a fixed base output directory.
 *
 * Folder specs come from user-controlled parameter values, so ".." segments are only
 * honoured while the result stays under the base directory. A spec that would escape is
 * clamped to the base directory unless Config::allowParentEscape is set.
 */
class PathResolver {
public:
    struct Config {
        std::filesystem::path baseDirectory;
        bool allowParentEscape = false;
    };

    // The base directory is created lazily by createOutputPath.
    explicit PathResolver(Config config);

    const std::filesystem::path& baseDirectory() const noexcept { return base_; }

    // Absolute directory for @p folderSpec. Nothing is created.
    [[nodiscard]] std::filesystem::path resolveDirectory(std::string_view folderSpec) const;

    // Create @p dir and any missing parents.
    [[nodiscard]] Result<void> ensureExists(const std::filesystem::path& dir) const;

    /**
     * @brief Resolve and create the directory for @p folderSpec.
     *
     * When creation fails the failure is logged and the base directory is returned instead.
     */
    std::filesystem::path createOutputPath(std::string_view folderSpec) const;

    // True when @p path lies at or below the base directory (lexical check).
    [[nodiscard]] bool isWithinBase(const std::filesystem::path& path) const;

    // Parent directory of @p filePath relative to the base, '/'-separated; empty when the
    // file sits directly in the base or outside it.
    [[nodiscard]] std::string subfolderOf(const std::filesystem::path& filePath) const;

    [[nodiscard]] std::optional<std::uintmax_t> availableSpace() const;

    // Remove empty directories below the base, visiting at most @p maxDepth levels.
    std::size_t removeEmptyDirectories(int maxDepth = 3) const;

private:
    Config config_;
    std::filesystem::path base_;
};

} // namespace namesmith::naming
