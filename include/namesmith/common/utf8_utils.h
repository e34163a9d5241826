// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace namesmith::common {

// Length in bytes of the well-formed UTF-8 sequence starting at input[i], or 0 when the bytes
// there do not form one.
inline std::size_t utf8SequenceLength(std::string_view input, std::size_t i) noexcept {
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    const std::size_t n = input.size();
    const unsigned char c = data[i];
    auto cont = [&](std::size_t k) { return i + k < n && (data[i + k] & 0xC0) == 0x80; };

    if (c < 0x80)
        return 1;
    if (c >= 0xC2 && c <= 0xDF)
        return cont(1) ? 2 : 0;
    if (c >= 0xE0 && c <= 0xEF)
        return (cont(1) && cont(2)) ? 3 : 0;
    if (c >= 0xF0 && c <= 0xF4)
        return (cont(1) && cont(2) && cont(3)) ? 4 : 0;
    return 0;
}

// Replace invalid UTF-8 byte sequences with '?'. Valid input is returned unchanged.
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    std::size_t i = 0;
    while (i < input.size()) {
        const std::size_t len = utf8SequenceLength(input, i);
        if (len == 0) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }
    return out;
}

// Number of code points in well-formed UTF-8 (each invalid byte counts as one).
inline std::size_t utf8Length(std::string_view input) noexcept {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < input.size()) {
        const std::size_t len = utf8SequenceLength(input, i);
        i += len == 0 ? 1 : len;
        ++count;
    }
    return count;
}

// Keep at most maxCodePoints code points, never splitting a multibyte sequence.
inline std::string utf8Truncate(std::string_view input, std::size_t maxCodePoints) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < input.size() && count < maxCodePoints) {
        const std::size_t len = utf8SequenceLength(input, i);
        i += len == 0 ? 1 : len;
        ++count;
    }
    return std::string(input.substr(0, i));
}

/**
 * @brief Longest prefix of @p input that fits in @p maxBytes without splitting a sequence.
 */
inline std::string utf8TruncateBytes(std::string_view input, std::size_t maxBytes) {
    std::size_t i = 0;
    while (i < input.size()) {
        const std::size_t len = utf8SequenceLength(input, i);
        const std::size_t step = len == 0 ? 1 : len;
        if (i + step > maxBytes)
            break;
        i += step;
    }
    return std::string(input.substr(0, i));
}

} // namespace namesmith::common
