// stencil/types/optional.hpp - Optional wrapper normalization
//
// Strips optional layers from runtime values so callers only ever see a
// concrete value or an explicit absence.
//
#pragma once

#include <optional>

#include "stencil/basic/result.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

/**
 * Remove all optional layers.
 *
 * @return The innermost concrete value, or UnexpectedAbsentValue when the
 *         innermost value is empty or the Null marker.
 */
[[nodiscard]] ResolveResult<Value> unwrap_or_fail(const Value & value);

/**
 * Remove all optional layers, returning std::nullopt for absence.
 */
[[nodiscard]] std::optional<Value> unwrap_or_absent(const Value & value);

/**
 * Check for absence without copying the innermost value.
 */
[[nodiscard]] bool is_absent(const Value & value) noexcept;

}  // namespace stencil
