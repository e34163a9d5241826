// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <namesmith/core/types.h>
#include <namesmith/naming/parameter_tree.h>
#include <namesmith/naming/template.h>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace namesmith::naming {

// Token text -> resolved value. A token that resolved to nothing maps to nullopt. Built fresh
// for every save event.
using ResolvedValues = std::unordered_map<std::string, std::optional<std::string>>;

// A token that will contribute nothing to generated names.
struct TemplateIssue {
    std::string token;
    TokenKind kind = TokenKind::Literal;
    std::string message;
};

/**
 * @brief True when every '%' in @p pattern starts a conversion std::put_time understands
 * (optionally with the E or O modifier where the standard allows one).
 */
[[nodiscard]] bool isValidDateDirective(std::string_view pattern) noexcept;

/**
 * @brief Format @p when in local time with a strftime-style pattern.
 *
 * @return nullopt for an invalid pattern; never throws.
 */
[[nodiscard]] std::optional<std::string> formatDateDirective(std::string_view pattern,
                                                             TimePoint when);

/**
 * @brief Turns template tokens into strings using a parameter tree and a timestamp.
 *
 * Resolution is pure: nothing is cached between calls and unresolvable tokens yield
 * nullopt rather than an error.
 */
class TemplateResolver {
public:
    [[nodiscard]] ResolvedValues resolve(const Template& tmpl, const ParameterTree& tree,
                                         TimePoint when) const;

    [[nodiscard]] std::optional<std::string>
    resolveToken(const Token& token, const ParameterTree& tree, TimePoint when) const;

    /**
     * @brief List the tokens that would be dropped from generated names.
     *
     * Meant for configuration validation; generation itself never reports these.
     */
    [[nodiscard]] std::vector<TemplateIssue> diagnose(const Template& tmpl,
                                                      const ParameterTree& tree,
                                                      TimePoint when) const;
};

} // namespace namesmith::naming
