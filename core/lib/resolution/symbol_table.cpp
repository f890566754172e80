// stencil/resolution/symbol_table.cpp - Symbol table implementation
//
#include "stencil/resolution/symbol_table.hpp"

#include <mutex>
#include <utility>

namespace stencil
{

std::optional<Value> SymbolLookup::lookup(std::string_view name) const
{
  auto result = resolve(name);
  if (!result) {
    return std::nullopt;
  }
  return std::move(result).value();
}

// ============================================================================
// Definition
// ============================================================================

std::optional<ResolveError> SymbolTable::define(std::string name, Value value, bool as_constant)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (constants_.count(name) > 0 || (as_constant && state_.count(name) > 0)) {
    return ResolveError::duplicate_symbol(name);
  }
  if (as_constant) {
    constants_.emplace(std::move(name), std::move(value));
  } else {
    state_[std::move(name)] = std::move(value);
  }
  return std::nullopt;
}

std::optional<ResolveError> SymbolTable::replace_state(ValueMap state)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);

  for (const auto & [key, value] : state) {
    if (constants_.count(key) > 0) {
      return ResolveError::duplicate_symbol(key);
    }
  }
  state_ = std::move(state);
  return std::nullopt;
}

// ============================================================================
// Lookup
// ============================================================================

ResolveResult<Value> SymbolTable::resolve(std::string_view name) const
{
  if (auto local = lookup_local(name)) {
    return std::move(*local);
  }
  if (auto parent = parent_.lock()) {
    return parent->resolve(name);
  }
  return ResolveError::undefined_symbol(name);
}

std::optional<Value> SymbolTable::lookup_local(std::string_view name) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const std::string key(name);

  auto it = constants_.find(key);
  if (it != constants_.end()) {
    return it->second;
  }
  it = state_.find(key);
  if (it != state_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool SymbolTable::has_local(std::string_view name) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const std::string key(name);
  return constants_.count(key) > 0 || state_.count(key) > 0;
}

bool SymbolTable::is_constant(std::string_view name) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return constants_.count(std::string(name)) > 0;
}

ValueMap SymbolTable::constants() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return constants_;
}

ValueMap SymbolTable::state() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_;
}

}  // namespace stencil
