// stencil/resolution/expression_resolver.hpp - Property source evaluation
//
// Turns a property's source string (or a constant/state value) into a value
// that satisfies the property's type descriptor.
//
#pragma once

#include <memory>
#include <string_view>

#include "stencil/basic/result.hpp"
#include "stencil/resolution/expression_evaluator.hpp"
#include "stencil/resolution/symbol_table.hpp"
#include "stencil/types/type_descriptor.hpp"
#include "stencil/types/type_registry.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

/**
 * Evaluates property sources against a symbol lookup.
 *
 * Source forms, in order of precedence:
 * - `nil` / `null`: absence
 * - `true` / `false` and numeric literals
 * - `$name`: forced symbol lookup
 * - bare identifiers (`mode`, `layer.cornerRadius`): enum case name of the
 *   descriptor if one matches, otherwise a symbol
 * - anything else: handed to the ExpressionEvaluator
 *
 * Text descriptors treat the source as a template: literal text with
 * `{expr}` segments evaluated and stringified.
 *
 * Every error leaving this class is tagged with the target type and
 * property. Evaluation is pure: the same inputs give the same result.
 */
class ExpressionResolver
{
public:
  explicit ExpressionResolver(std::shared_ptr<const ExpressionEvaluator> evaluator = nullptr);

  /**
   * Evaluate a source string and coerce the result.
   *
   * @return The coerced value (the Null marker for an absent optional), or
   *         MissingRequiredValue(property) when a required value is absent
   */
  [[nodiscard]] ResolveResult<Value> evaluate(
    std::string_view target_type, std::string_view property, std::string_view source,
    const TypeDescriptor & descriptor, const SymbolLookup & symbols) const;

  /**
   * Look up the property's descriptor and evaluate.
   *
   * @return UnknownProperty if `descriptors` does not declare `name`
   */
  [[nodiscard]] ResolveResult<Value> resolve_property(
    std::string_view name, std::string_view source, const PropertyTypes & descriptors,
    const SymbolLookup & symbols, std::string_view target_type = {}) const;

  /**
   * Coerce an already-evaluated value (constant or state) the same way.
   */
  [[nodiscard]] ResolveResult<Value> coerce(
    std::string_view target_type, std::string_view property, const Value & value,
    const TypeDescriptor & descriptor) const;

  [[nodiscard]] bool has_evaluator() const noexcept { return evaluator_ != nullptr; }

private:
  ResolveResult<Value> evaluate_source(
    std::string_view source, const TypeDescriptor & descriptor, const SymbolLookup & symbols) const;

  ResolveResult<Value> evaluate_template(std::string_view source, const SymbolLookup & symbols) const;

  ResolveResult<Value> resolve_symbol(std::string_view name, const SymbolLookup & symbols) const;

  ResolveResult<Value> delegate(
    std::string_view source, const TypeDescriptor & descriptor, const SymbolLookup & symbols) const;

  static ResolveResult<Value> finish(
    const Value & raw, const TypeDescriptor & descriptor, std::string_view property);

  std::shared_ptr<const ExpressionEvaluator> evaluator_;
  TypeDescriptorPtr text_descriptor_;
};

}  // namespace stencil
