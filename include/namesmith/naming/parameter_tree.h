// Copyright 2025 The namesmith Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace namesmith::naming {

// Generation parameters as supplied by the host pipeline. ordered_json keeps object keys in
// insertion order, which the deep search below relies on for its first-match tie-break.
using ParameterTree = nlohmann::ordered_json;

/**
 * @brief Render a tree value as name text.
 *
 * Strings are returned verbatim, numbers and booleans in their JSON spelling, arrays and
 * objects as compact JSON. Null has no text and yields nullopt.
 */
[[nodiscard]] std::optional<std::string> valueToString(const ParameterTree& value);

/**
 * @brief Depth-first, pre-order search for the first object entry named @p key.
 *
 * An object that directly contains the key answers before any of its children are visited;
 * otherwise object values are searched in insertion order and array elements in index order.
 *
 * @return Pointer into @p tree, or nullptr when no object in the tree has the key.
 */
[[nodiscard]] const ParameterTree* findFirstKey(const ParameterTree& tree,
                                                const std::string& key);

/**
 * @brief Look up tree[nodeId]["inputs"][param].
 *
 * @return nullptr when the node is missing, is not an object, has no object-valued "inputs",
 * or the inputs lack the parameter.
 */
[[nodiscard]] const ParameterTree* findNodeInput(const ParameterTree& tree,
                                                 const std::string& nodeId,
                                                 const std::string& param);

} // namespace namesmith::naming
