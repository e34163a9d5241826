// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/template.h>

#include <cctype>

namespace namesmith::naming {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentChar(char c) {
    return isIdentStart(c) || isDigit(c);
}

} // namespace

bool isNodeReference(std::string_view text) noexcept {
    const auto dot = text.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= text.size())
        return false;
    for (std::size_t i = 0; i < dot; ++i) {
        if (!isDigit(text[i]))
            return false;
    }
    if (!isIdentStart(text[dot + 1]))
        return false;
    for (std::size_t i = dot + 2; i < text.size(); ++i) {
        if (!isIdentChar(text[i]))
            return false;
    }
    return true;
}

Token classifyToken(std::string_view raw) {
    Token token;
    token.raw = std::string(raw);

    if (!raw.empty() && raw.front() == '%') {
        token.kind = TokenKind::DateDirective;
        token.key = token.raw;
    } else if (raw.starts_with("./")) {
        token.kind = TokenKind::PathMarker;
        token.key = std::string(raw.substr(2));
    } else if (raw.starts_with("../")) {
        token.kind = TokenKind::PathMarker;
        token.key = std::string(raw.substr(3));
    } else if (isNodeReference(raw)) {
        const auto dot = raw.find('.');
        token.kind = TokenKind::NodeReference;
        token.nodeId = std::string(raw.substr(0, dot));
        token.key = std::string(raw.substr(dot + 1));
    } else {
        token.kind = TokenKind::Literal;
        token.key = token.raw;
    }
    return token;
}

Template Template::parse(std::string_view csv) {
    std::vector<Token> tokens;
    std::size_t start = 0;
    while (start <= csv.size()) {
        const auto pos = csv.find(',', start);
        auto entry = trim(pos == std::string_view::npos ? csv.substr(start)
                                                        : csv.substr(start, pos - start));
        if (!entry.empty()) {
            tokens.push_back(classifyToken(entry));
        }
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return Template(std::move(tokens));
}

} // namespace namesmith::naming
