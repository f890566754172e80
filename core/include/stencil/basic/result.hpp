// stencil/basic/result.hpp - Value-or-error result type
#pragma once

#include <utility>
#include <variant>

#include "stencil/basic/error.hpp"

namespace stencil
{

/**
 * Result type holding either a value T or a ResolveError.
 *
 * Library code never throws; every fallible operation returns a
 * ResolveResult and the caller decides how to surface the error.
 */
template <typename T>
class ResolveResult
{
public:
  using ValueType = T;
  using ErrorType = ResolveError;

  // Construct with success value
  ResolveResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}

  // Construct with error
  ResolveResult(ResolveError error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }

  [[nodiscard]] bool has_error() const { return data_.index() == 1; }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  ErrorType & error() & { return std::get<1>(data_); }
  [[nodiscard]] const ErrorType & error() const & { return std::get<1>(data_); }
  ErrorType && error() && { return std::get<1>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ResolveError> data_;
};

}  // namespace stencil
