// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#include <namesmith/naming/parameter_tree.h>

namespace namesmith::naming {

std::optional<std::string> valueToString(const ParameterTree& value) {
    switch (value.type()) {
        case ParameterTree::value_t::null:
        case ParameterTree::value_t::discarded:
            return std::nullopt;
        case ParameterTree::value_t::string:
            return value.get<std::string>();
        default:
            // Numbers, booleans and containers; replace invalid UTF-8 instead of throwing.
            return value.dump(-1, ' ', false, ParameterTree::error_handler_t::replace);
    }
}

const ParameterTree* findFirstKey(const ParameterTree& tree, const std::string& key) {
    if (!tree.is_structured())
        return nullptr;
    if (tree.is_object()) {
        if (auto it = tree.find(key); it != tree.end()) {
            return &*it;
        }
    }
    // Iterating an object yields its values in insertion order; an array yields its elements.
    for (const auto& child : tree) {
        if (const auto* hit = findFirstKey(child, key)) {
            return hit;
        }
    }
    return nullptr;
}

const ParameterTree* findNodeInput(const ParameterTree& tree, const std::string& nodeId,
                                   const std::string& param) {
    if (!tree.is_object())
        return nullptr;
    auto node = tree.find(nodeId);
    if (node == tree.end() || !node->is_object())
        return nullptr;
    auto inputs = node->find("inputs");
    if (inputs == node->end() || !inputs->is_object())
        return nullptr;
    auto value = inputs->find(param);
    if (value == inputs->end())
        return nullptr;
    return &*value;
}

} // namespace namesmith::naming
