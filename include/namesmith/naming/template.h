// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace namesmith::naming {

enum class TokenKind {
    DateDirective, // "%Y-%m-%d": strftime-style pattern applied to the event timestamp
    PathMarker,    // "./name" or "../name": literal folder segment, forces a '/' before it
    NodeReference, // "5.seed": tree["5"]["inputs"]["seed"]
    Literal        // "sampler_name": first match of a deep search through the tree
};

constexpr const char* tokenKindToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::DateDirective: return "date";
        case TokenKind::PathMarker: return "path";
        case TokenKind::NodeReference: return "node";
        case TokenKind::Literal: return "literal";
    }
    return "literal";
}

struct Token {
    TokenKind kind = TokenKind::Literal;
    std::string raw;    // Token text as written in the template
    std::string key;    // Date pattern, marker segment, parameter name or literal key
    std::string nodeId; // NodeReference only

    bool operator==(const Token&) const = default;
};

/**
 * @brief Classify one trimmed, non-empty template entry.
 *
 * Checked in order: a leading '%' makes a DateDirective, a leading "./" or "../" a
 * PathMarker, "<digits>.<identifier>" a NodeReference; everything else is a Literal.
 */
[[nodiscard]] Token classifyToken(std::string_view raw);

/**
 * @brief True when @p text has the form "<digits>.<identifier>".
 */
[[nodiscard]] bool isNodeReference(std::string_view text) noexcept;

/**
 * @brief Immutable, ordered list of tokens parsed from a comma-separated template.
 */
class Template {
public:
    Template() = default;
    explicit Template(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    // Entries are split on ',', trimmed, and empty entries dropped.
    static Template parse(std::string_view csv);

    const std::vector<Token>& tokens() const noexcept { return tokens_; }
    bool empty() const noexcept { return tokens_.empty(); }
    std::size_t size() const noexcept { return tokens_.size(); }

    auto begin() const noexcept { return tokens_.begin(); }
    auto end() const noexcept { return tokens_.end(); }

private:
    std::vector<Token> tokens_;
};

} // namespace namesmith::naming
