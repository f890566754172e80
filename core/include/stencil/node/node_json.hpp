// stencil/node/node_json.hpp - JSON export of built trees
#pragma once

#include <nlohmann/json.hpp>

#include "stencil/node/layout_node.hpp"

namespace stencil
{

/**
 * Export a node and its subtree.
 *
 * Output contains class, outlet, state, resolved properties (as applied to
 * the target), merge error and children.
 */
[[nodiscard]] nlohmann::ordered_json to_json(const LayoutNode & node);

}  // namespace stencil
