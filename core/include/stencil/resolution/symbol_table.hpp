// stencil/resolution/symbol_table.hpp - Constants, state and symbol lookup
//
// Each node owns a SymbolTable; lookups fall through to the ancestor
// table without ever caching ancestor values.
//
#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stencil/basic/result.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

// ============================================================================
// Symbol Lookup
// ============================================================================

/**
 * Read-only symbol source consulted by the ExpressionResolver.
 */
class SymbolLookup
{
public:
  virtual ~SymbolLookup() = default;

  /**
   * Resolve a symbol.
   *
   * @return The bound value, or UndefinedSymbol(name)
   */
  [[nodiscard]] virtual ResolveResult<Value> resolve(std::string_view name) const = 0;

  /// Like resolve(), but any failure is reported as std::nullopt
  [[nodiscard]] std::optional<Value> lookup(std::string_view name) const;
};

// ============================================================================
// Symbol Table
// ============================================================================

/**
 * Per-node constants and state.
 *
 * Constants and state share one namespace. Lookup order is local constants,
 * local state, then the parent table. The parent is held weakly; once it
 * is released the chain ends at this table.
 */
class SymbolTable : public SymbolLookup
{
public:
  explicit SymbolTable(std::weak_ptr<const SymbolTable> parent = {}) : parent_(std::move(parent)) {}

  SymbolTable(const SymbolTable &) = delete;
  SymbolTable & operator=(const SymbolTable &) = delete;

  // ===========================================================================
  // Definition
  // ===========================================================================

  /**
   * Define a constant or state value in this table.
   *
   * A constant may not reuse any local name. State may not reuse a constant
   * name; redefining existing state replaces it.
   *
   * @return DuplicateSymbol(name) on collision
   */
  std::optional<ResolveError> define(std::string name, Value value, bool as_constant);

  /**
   * Replace the whole state map.
   *
   * Validated against the constants first; on collision nothing changes.
   *
   * @return DuplicateSymbol(name) for the first colliding key
   */
  std::optional<ResolveError> replace_state(ValueMap state);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] ResolveResult<Value> resolve(std::string_view name) const override;

  /// Look up a name in this table only
  [[nodiscard]] std::optional<Value> lookup_local(std::string_view name) const;

  [[nodiscard]] bool has_local(std::string_view name) const;

  [[nodiscard]] bool is_constant(std::string_view name) const;

  /// Snapshot of the local constants
  [[nodiscard]] ValueMap constants() const;

  /// Snapshot of the local state
  [[nodiscard]] ValueMap state() const;

  /// Parent table, nullptr for a root or a released parent
  [[nodiscard]] std::shared_ptr<const SymbolTable> parent() const noexcept { return parent_.lock(); }

private:
  std::weak_ptr<const SymbolTable> parent_;

  // Guards constants_ and state_; state may be replaced while a loader
  // thread reads through this table.
  mutable std::shared_mutex mutex_;
  ValueMap constants_;
  ValueMap state_;
};

}  // namespace stencil
