// stencil/resolution/expression_evaluator.hpp - External expression evaluator
#pragma once

#include <string_view>

#include "stencil/basic/result.hpp"
#include "stencil/resolution/symbol_table.hpp"
#include "stencil/types/type_descriptor.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

/**
 * Evaluator for composed expressions (arithmetic, function calls, ...).
 *
 * The ExpressionResolver handles literals, symbol references, enum case
 * names and text interpolation itself and hands everything else here. The
 * returned value is coerced with `expected` afterwards, so evaluators may
 * return any raw value.
 */
class ExpressionEvaluator
{
public:
  virtual ~ExpressionEvaluator() = default;

  [[nodiscard]] virtual ResolveResult<Value> evaluate(
    std::string_view expression, const TypeDescriptor & expected,
    const SymbolLookup & symbols) const = 0;
};

}  // namespace stencil
