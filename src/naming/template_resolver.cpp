// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/template_resolver.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace namesmith::naming {

namespace {

constexpr std::string_view kPlainSpecifiers = "%ntYyCGgbhBmUWVjdeaAwuHIMScxXDFrRTpzZ";
constexpr std::string_view kEModified = "YyCcxX";
constexpr std::string_view kOModified = "ymUWVdewuHIMS";

std::tm toLocalTm(TimePoint when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

} // namespace

bool isValidDateDirective(std::string_view pattern) noexcept {
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%')
            continue;
        if (++i >= pattern.size())
            return false;
        const char c = pattern[i];
        if (c == 'E' || c == 'O') {
            if (++i >= pattern.size())
                return false;
            const auto allowed = (c == 'E') ? kEModified : kOModified;
            if (allowed.find(pattern[i]) == std::string_view::npos)
                return false;
        } else if (kPlainSpecifiers.find(c) == std::string_view::npos) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> formatDateDirective(std::string_view pattern, TimePoint when) {
    if (!isValidDateDirective(pattern))
        return std::nullopt;
    const std::tm tm = toLocalTm(when);
    std::ostringstream ss;
    ss << std::put_time(&tm, std::string(pattern).c_str());
    if (ss.fail())
        return std::nullopt;
    return ss.str();
}

std::optional<std::string> TemplateResolver::resolveToken(const Token& token,
                                                          const ParameterTree& tree,
                                                          TimePoint when) const {
    switch (token.kind) {
        case TokenKind::DateDirective:
            return formatDateDirective(token.key, when);
        case TokenKind::PathMarker:
            return token.key;
        case TokenKind::NodeReference:
            if (const auto* value = findNodeInput(tree, token.nodeId, token.key))
                return valueToString(*value);
            return std::nullopt;
        case TokenKind::Literal:
            if (const auto* value = findFirstKey(tree, token.key))
                return valueToString(*value);
            return std::nullopt;
    }
    return std::nullopt;
}

ResolvedValues TemplateResolver::resolve(const Template& tmpl, const ParameterTree& tree,
                                         TimePoint when) const {
    ResolvedValues values;
    values.reserve(tmpl.size());
    for (const auto& token : tmpl) {
        if (values.contains(token.raw))
            continue;
        values.emplace(token.raw, resolveToken(token, tree, when));
    }
    return values;
}

std::vector<TemplateIssue> TemplateResolver::diagnose(const Template& tmpl,
                                                      const ParameterTree& tree,
                                                      TimePoint when) const {
    std::vector<TemplateIssue> issues;
    for (const auto& token : tmpl) {
        if (resolveToken(token, tree, when))
            continue;
        TemplateIssue issue{token.raw, token.kind, {}};
        switch (token.kind) {
            case TokenKind::DateDirective:
                issue.message = "invalid date directive";
                break;
            case TokenKind::NodeReference:
                issue.message = "node '" + token.nodeId + "' has no input '" + token.key + "'";
                break;
            case TokenKind::Literal:
                issue.message = "no parameter named '" + token.key + "'";
                break;
            case TokenKind::PathMarker:
                break;
        }
        issues.push_back(std::move(issue));
    }
    return issues;
}

} // namespace namesmith::naming
