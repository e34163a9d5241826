// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/common/utf8_utils.h>
#include <namesmith/naming/sanitizer.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace namesmith::naming {

namespace {

constexpr std::array<std::string_view, 22> kReservedNames = {
    "CON",  "PRN",  "AUX",  "NUL",  "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7",
    "COM8", "COM9", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

constexpr std::array<std::string_view, 5> kModelExtensions = {".safetensors", ".ckpt", ".pt",
                                                              ".bin", ".pth"};

bool isStripChar(char c) {
    return c == '.' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view stripDotsAndSpace(std::string_view s) {
    while (!s.empty() && isStripChar(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isStripChar(s.back()))
        s.remove_suffix(1);
    return s;
}

} // namespace

bool isReservedName(std::string_view name) {
    if (name.size() < 3 || name.size() > 4)
        return false;
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::find(kReservedNames.begin(), kReservedNames.end(), upper) != kReservedNames.end();
}

std::string sanitizeSegment(std::string_view segment) {
    // Strip before replacing so edge newlines and tabs vanish instead of becoming '_'.
    std::string out = common::sanitizeUtf8(stripDotsAndSpace(segment));
    std::replace_if(out.begin(), out.end(), isForbiddenChar, kPlaceholderChar);

    if (common::utf8Length(out) > kMaxSegmentLength || out.size() > kMaxSegmentBytes) {
        // The cut can expose trailing dots or spaces again.
        out = common::utf8TruncateBytes(common::utf8Truncate(out, kMaxSegmentLength),
                                        kMaxSegmentBytes);
        out = std::string(stripDotsAndSpace(out));
    }

    if (isReservedName(out))
        out.insert(out.begin(), kPlaceholderChar);
    return out;
}

std::string stripModelExtension(std::string_view value) {
    for (auto ext : kModelExtensions) {
        if (value.size() >= ext.size() && value.substr(value.size() - ext.size()) == ext) {
            value.remove_suffix(ext.size());
            break;
        }
    }
    return std::string(value);
}

} // namespace namesmith::naming
