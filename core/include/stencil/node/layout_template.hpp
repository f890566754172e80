// stencil/node/layout_template.hpp - Declarative node description
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stencil/types/value.hpp"

namespace stencil
{

/// Property name and its source expression
using Expression = std::pair<std::string, std::string>;

/**
 * Declarative description of a node tree, as read from a template file.
 */
struct LayoutTemplate
{
  std::string class_name;
  std::string outlet;
  ValueMap constants;
  std::vector<Expression> expressions;  ///< Evaluated in declaration order
  std::vector<LayoutTemplate> children;

  /// External template whose children are merged into this node
  std::string template_path;

  /// Path of the file this template was read from; `template_path` is
  /// resolved relative to it
  std::string relative_path;

  [[nodiscard]] bool has_deferred_subtree() const noexcept { return !template_path.empty(); }

  [[nodiscard]] const std::string * find_expression(std::string_view name) const
  {
    for (const auto & [key, source] : expressions) {
      if (key == name) {
        return &source;
      }
    }
    return nullptr;
  }
};

}  // namespace stencil
