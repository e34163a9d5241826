// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/name_builder.h>
#include <namesmith/naming/sanitizer.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace namesmith::naming {

namespace {

bool endsWithSeparator(const std::string& s) {
    return !s.empty() && s.back() == kPathSeparator;
}

// Prefixes may carry folder structure ("renders/portraits"); sanitize each component.
std::string sanitizePrefix(std::string_view prefix) {
    std::string out;
    std::size_t start = 0;
    while (start <= prefix.size()) {
        const auto pos = prefix.find(kPathSeparator, start);
        const auto part = pos == std::string_view::npos ? prefix.substr(start)
                                                        : prefix.substr(start, pos - start);
        const std::string clean = part == ".." ? std::string(part) : sanitizeSegment(part);
        if (!clean.empty()) {
            if (!out.empty())
                out.push_back(kPathSeparator);
            out += clean;
        }
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

std::string_view stripEdges(std::string_view name, std::string_view delimiter) {
    auto strip = [&](char c) {
        return c == '.' || c == kPathSeparator || delimiter.find(c) != std::string_view::npos;
    };
    while (!name.empty() && strip(name.front()))
        name.remove_prefix(1);
    while (!name.empty() && strip(name.back()))
        name.remove_suffix(1);
    return name;
}

} // namespace

std::optional<CounterPosition> parseCounterPosition(std::string_view text) {
    if (text == "first")
        return CounterPosition::First;
    if (text == "last")
        return CounterPosition::Last;
    return std::nullopt;
}

std::string buildName(const Template& tmpl, const ResolvedValues& resolved,
                      std::string_view prefix, std::string_view delimiter) {
    std::string name = sanitizePrefix(prefix);

    for (const auto& token : tmpl) {
        if (token.kind == TokenKind::PathMarker) {
            const std::string segment = sanitizeSegment(token.key);
            if (segment.empty())
                continue;
            if (!name.empty() && !endsWithSeparator(name))
                name.push_back(kPathSeparator);
            name += segment;
            continue;
        }

        auto it = resolved.find(token.raw);
        if (it == resolved.end() || !it->second)
            continue;
        const std::string value = sanitizeSegment(stripModelExtension(*it->second));
        if (value.empty())
            continue;
        if (!name.empty() && !endsWithSeparator(name))
            name += delimiter;
        name += value;
    }

    const auto stripped = stripEdges(name, delimiter);
    return stripped.empty() ? std::string(kDefaultName) : std::string(stripped);
}

std::string formatCounter(std::uint64_t counter, int digits) {
    return fmt::format("{:0{}}", counter, std::max(digits, 1));
}

std::string buildFilename(std::string_view baseName, std::uint64_t counter, int digits,
                          CounterPosition position, std::string_view extension,
                          std::string_view delimiter) {
    const std::string number = formatCounter(counter, digits);
    if (position == CounterPosition::First)
        return fmt::format("{}{}{}{}", number, delimiter, baseName, extension);
    return fmt::format("{}{}{}{}", baseName, delimiter, number, extension);
}

} // namespace namesmith::naming
