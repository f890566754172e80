// stencil/loader/template_json.hpp - JSON template documents
//
// Template document format:
//
//   {
//     "class": "Label",
//     "outlet": "titleLabel",
//     "constants": {"mode": "center", "insets": {"top": 4, "left": 8}},
//     "expressions": {"text": "Hello {name}", "contentMode": "mode"},
//     "children": [ ... ],
//     "template": "header.json"
//   }
//
// Enum instances are written as {"$enum": "ContentMode", "$raw": 4}.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "stencil/basic/result.hpp"
#include "stencil/node/layout_template.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

/**
 * Convert a JSON constant to a Value.
 *
 * @return TypeMismatch for arrays and malformed enum objects
 */
[[nodiscard]] ResolveResult<Value> value_from_json(const nlohmann::ordered_json & j);

/// Convert a Value to JSON (inverse of value_from_json for plain values)
[[nodiscard]] nlohmann::ordered_json value_to_json(const Value & value);

/**
 * Build a template tree from a parsed JSON document.
 *
 * @param source_path Recorded as `relative_path` on every node of the tree
 */
[[nodiscard]] ResolveResult<LayoutTemplate> template_from_json(
  const nlohmann::ordered_json & j, const std::string & source_path);

/**
 * Parse template text.
 *
 * @return ResourceError for malformed JSON
 */
[[nodiscard]] ResolveResult<LayoutTemplate> parse_template(
  std::string_view text, const std::string & source_path);

}  // namespace stencil
