// stencil/node/property_target.hpp - Target object capability interface
//
// The engine never touches concrete widgets; it only reads and writes named
// properties through this interface.
//
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "stencil/basic/error.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

/**
 * Capability to get/set named properties on an opaque target object.
 *
 * One target is created per node by the factory registered for the node's
 * target type. Only NodeBuilder calls set(); get() is the last fallback of
 * symbol lookup on the owning node.
 */
class PropertyTarget
{
public:
  virtual ~PropertyTarget() = default;

  /// Target type this object was created for
  [[nodiscard]] virtual const std::string & type_name() const = 0;

  /// Current value of a property, std::nullopt if never set or unsupported
  [[nodiscard]] virtual std::optional<Value> get(std::string_view name) const = 0;

  /// Apply a coerced value. Returns the error if the target rejects it.
  [[nodiscard]] virtual std::optional<ResolveError> set(std::string_view name, const Value & value) = 0;

  /// Called after the target of a child node has been attached at `index`
  virtual void did_insert_child(PropertyTarget & child, size_t index)
  {
    (void)child;
    (void)index;
  }
};

// ============================================================================
// Recording Target
// ============================================================================

/**
 * Generic target that stores applied values.
 *
 * Used when no toolkit is linked (CLI, tests).
 */
class RecordingTarget : public PropertyTarget
{
public:
  explicit RecordingTarget(std::string type_name) : type_name_(std::move(type_name)) {}

  [[nodiscard]] const std::string & type_name() const override { return type_name_; }

  [[nodiscard]] std::optional<Value> get(std::string_view name) const override;

  [[nodiscard]] std::optional<ResolveError> set(std::string_view name, const Value & value) override;

  void did_insert_child(PropertyTarget & child, size_t index) override;

  /// Make every subsequent set() of `name` fail with TypeMismatch
  void reject(std::string name) { rejected_.insert(std::move(name)); }

  [[nodiscard]] const std::map<std::string, Value, std::less<>> & values() const noexcept
  {
    return values_;
  }

  /// Number of successful set() calls
  [[nodiscard]] size_t set_count() const noexcept { return set_count_; }

  /// Targets of attached children, in attachment order (non-owning)
  [[nodiscard]] const std::vector<PropertyTarget *> & children() const noexcept { return children_; }

private:
  std::string type_name_;
  std::map<std::string, Value, std::less<>> values_;
  std::set<std::string, std::less<>> rejected_;
  std::vector<PropertyTarget *> children_;
  size_t set_count_ = 0;
};

}  // namespace stencil
