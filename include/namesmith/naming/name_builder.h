// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <namesmith/naming/template.h>
#include <namesmith/naming/template_resolver.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace namesmith::naming {

// Substituted when a template produces an empty name.
inline constexpr std::string_view kDefaultName = "ComfyUI";

inline constexpr char kPathSeparator = '/';

enum class CounterPosition { First, Last };

constexpr const char* counterPositionToString(CounterPosition position) {
    return position == CounterPosition::First ? "first" : "last";
}

[[nodiscard]] std::optional<CounterPosition> parseCounterPosition(std::string_view text);

/**
 * @brief Assemble a base name or folder path from resolved template tokens.
 *
 * Starts from the sanitized prefix. Resolved values are cleaned of model-weights
 * extensions, sanitized, and joined with @p delimiter (no delimiter right after a '/').
 * Path markers are joined with '/'. Unresolved tokens contribute nothing. Leading and
 * trailing delimiter characters, dots and slashes are stripped; an empty result becomes
 * kDefaultName.
 */
[[nodiscard]] std::string buildName(const Template& tmpl, const ResolvedValues& resolved,
                                    std::string_view prefix, std::string_view delimiter);

// Zero-padded to at least @p digits characters.
[[nodiscard]] std::string formatCounter(std::uint64_t counter, int digits);

/**
 * @brief Final file name: "<counter><delim><base><ext>" or "<base><delim><counter><ext>".
 */
[[nodiscard]] std::string buildFilename(std::string_view baseName, std::uint64_t counter,
                                        int digits, CounterPosition position,
                                        std::string_view extension, std::string_view delimiter);

} // namespace namesmith::naming
