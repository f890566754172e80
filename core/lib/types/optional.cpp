// stencil/types/optional.cpp - Optional wrapper normalization
//
#include "stencil/types/optional.hpp"

namespace stencil
{

namespace
{

/// Innermost non-optional value, nullptr for absence. Iterative so any
/// finite nesting depth terminates without growing the stack.
const Value * innermost(const Value & value) noexcept
{
  const Value * current = &value;
  while (current != nullptr && current->is_optional()) {
    current = current->optional_value();
  }
  if (current != nullptr && current->is_null()) {
    return nullptr;
  }
  return current;
}

}  // namespace

ResolveResult<Value> unwrap_or_fail(const Value & value)
{
  const Value * inner = innermost(value);
  if (inner == nullptr) {
    return ResolveError::unexpected_absent_value();
  }
  return *inner;
}

std::optional<Value> unwrap_or_absent(const Value & value)
{
  const Value * inner = innermost(value);
  if (inner == nullptr) {
    return std::nullopt;
  }
  return *inner;
}

bool is_absent(const Value & value) noexcept { return innermost(value) == nullptr; }

}  // namespace stencil
