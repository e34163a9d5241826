// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace namesmith::naming {

// Longest path segment (in code points) produced by sanitizeSegment.
inline constexpr std::size_t kMaxSegmentLength = 200;

// Byte limit for one segment, the usual NAME_MAX.
inline constexpr std::size_t kMaxSegmentBytes = 255;

// Replacement for every character that is illegal in a portable file name.
inline constexpr char kPlaceholderChar = '_';

/**
 * @brief True for characters Windows forbids in file names: < > : " | ? * backslash and
 * the ASCII control characters (0x00-0x1F, 0x7F).
 */
[[nodiscard]] constexpr bool isForbiddenChar(char c) noexcept {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F)
        return true;
    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '|':
        case '?':
        case '*':
        case '\\':
            return true;
        default:
            return false;
    }
}

/**
 * @brief Case-insensitive match against the DOS device names (CON, PRN, AUX, NUL,
 * COM1-COM9, LPT1-LPT9).
 */
[[nodiscard]] bool isReservedName(std::string_view name);

/**
 * @brief Normalize one file or directory name segment.
 *
 * - leading and trailing whitespace and '.' are stripped
 * - invalid UTF-8 bytes, control characters and forbidden characters become '_'
 * - the result is cut to kMaxSegmentLength code points and kMaxSegmentBytes bytes
 * - reserved device names get a '_' prefix
 *
 * The function is idempotent. Path separators ('/') are left alone; callers split paths
 * before sanitizing their components.
 */
[[nodiscard]] std::string sanitizeSegment(std::string_view segment);

/**
 * @brief Remove one trailing model-weights extension (.safetensors, .ckpt, .pt, .bin, .pth).
 *
 * Applied to parameter values before they become part of a name so that checkpoint names
 * read as plain model names.
 */
[[nodiscard]] std::string stripModelExtension(std::string_view value);

} // namespace namesmith::naming
