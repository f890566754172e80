// stencil/node/layout_node.hpp - Layout tree node
//
// A node owns its children, its symbol table and its target object. Nodes
// are created by NodeBuilder; everything else only reads them.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "stencil/basic/result.hpp"
#include "stencil/node/layout_template.hpp"
#include "stencil/node/property_target.hpp"
#include "stencil/resolution/expression_resolver.hpp"
#include "stencil/resolution/symbol_table.hpp"
#include "stencil/types/type_registry.hpp"

namespace stencil
{

class LayoutNode;

// ============================================================================
// Node State
// ============================================================================

/**
 * Construction / merge state of a node.
 *
 * Building -> Ready, or Building -> AwaitingMerge -> Merged | MergeFailed.
 */
enum class NodeState : uint8_t {
  Building,
  Ready,
  AwaitingMerge,
  Merged,
  MergeFailed,
};

[[nodiscard]] std::string_view to_string(NodeState state) noexcept;

/**
 * Notification that children were appended to a node.
 */
struct TreeChanged
{
  const LayoutNode * node = nullptr;
  size_t first_index = 0;  ///< Index of the first appended child
  size_t count = 0;        ///< Number of appended children
};

using TreeObserver = std::function<void(const TreeChanged &)>;

// ============================================================================
// Layout Node
// ============================================================================

/**
 * A node of the layout tree.
 *
 * Besides its symbol table, a node exposes its own properties as symbols:
 * an expression may reference another property of the same node by name.
 *
 * Thread safety: children, state and observers are guarded by a per-node
 * mutex and returned as snapshots. Property evaluation is serialized per
 * node.
 */
class LayoutNode : public std::enable_shared_from_this<LayoutNode>, public SymbolLookup
{
public:
  /**
   * Create a node in the Building state. Use NodeBuilder instead of calling
   * this directly.
   *
   * @param parent Parent node (held weakly), nullptr for a root
   */
  LayoutNode(
    std::string class_name, std::string outlet, const std::shared_ptr<LayoutNode> & parent,
    std::unique_ptr<PropertyTarget> target, PropertyTypesPtr descriptors,
    std::shared_ptr<const ExpressionResolver> resolver);

  LayoutNode(const LayoutNode &) = delete;
  LayoutNode & operator=(const LayoutNode &) = delete;

  // ===========================================================================
  // Identity
  // ===========================================================================

  [[nodiscard]] const std::string & class_name() const noexcept { return class_name_; }

  [[nodiscard]] const std::string & outlet() const noexcept { return outlet_; }

  /// Parent node; nullptr for a root or once the parent is released
  [[nodiscard]] std::shared_ptr<LayoutNode> parent() const noexcept { return parent_.lock(); }

  [[nodiscard]] const std::vector<Expression> & expressions() const noexcept { return expressions_; }

  [[nodiscard]] const PropertyTypes & descriptors() const noexcept { return *descriptors_; }

  [[nodiscard]] PropertyTarget & target() noexcept { return *target_; }
  [[nodiscard]] const PropertyTarget & target() const noexcept { return *target_; }

  // ===========================================================================
  // Symbols
  // ===========================================================================

  [[nodiscard]] SymbolTable & symbols() noexcept { return symbols_; }
  [[nodiscard]] const SymbolTable & symbols() const noexcept { return symbols_; }

  /// Same as value_for_symbol()
  [[nodiscard]] ResolveResult<Value> resolve(std::string_view name) const override;

  /**
   * Value of a symbol as seen from this node.
   *
   * A declared property of this node wins (evaluated on demand); otherwise
   * the symbol table chain is consulted, then the target object's get().
   *
   * @return InvalidExpression for a circular property reference
   */
  [[nodiscard]] ResolveResult<Value> value_for_symbol(std::string_view name) const;

  /// Resolved value of a declared property, std::nullopt if not resolved
  [[nodiscard]] std::optional<Value> property_value(std::string_view name) const;

  /// Snapshot of all resolved property values
  [[nodiscard]] std::map<std::string, Value> property_values() const;

  // ===========================================================================
  // Tree
  // ===========================================================================

  /// Snapshot of the children, declared children first
  [[nodiscard]] std::vector<std::shared_ptr<LayoutNode>> children() const;

  [[nodiscard]] size_t child_count() const;

  /// First node in this subtree (pre-order, self included) with the outlet
  [[nodiscard]] std::shared_ptr<LayoutNode> find_outlet(std::string_view name);

  // ===========================================================================
  // Merge State
  // ===========================================================================

  [[nodiscard]] NodeState state() const;

  /// Error of a failed deferred merge
  [[nodiscard]] std::optional<ResolveError> merge_error() const;

  /// Number of children appended by a deferred merge
  [[nodiscard]] size_t merged_child_count() const;

  // ===========================================================================
  // Observers
  // ===========================================================================

  /// Register a TreeChanged observer; returns an id for remove_observer()
  size_t add_observer(TreeObserver observer);

  void remove_observer(size_t id);

private:
  friend class NodeBuilder;

  void set_expressions(std::vector<Expression> expressions) { expressions_ = std::move(expressions); }

  /// Evaluate (or return the cached value of) a declared property
  ResolveResult<Value> evaluate_property(std::string_view name) const;

  /// Drop cached property values; returns the previous values
  std::map<std::string, Value> clear_property_cache();

  void restore_property(const std::string & name, Value value);

  void set_state(NodeState state);

  /// Attach a declared child during construction
  void attach_child(std::shared_ptr<LayoutNode> child);

  /// Append merged children in one step and notify observers
  void append_merged(std::vector<std::shared_ptr<LayoutNode>> children);

  void fail_merge(ResolveError error);

  std::string class_name_;
  std::string outlet_;
  std::weak_ptr<LayoutNode> parent_;
  std::unique_ptr<PropertyTarget> target_;
  PropertyTypesPtr descriptors_;
  std::shared_ptr<const ExpressionResolver> resolver_;
  std::vector<Expression> expressions_;
  SymbolTable symbols_;

  // Property evaluation (recursive: properties may reference each other)
  mutable std::recursive_mutex eval_mutex_;
  mutable std::map<std::string, Value, std::less<>> resolved_;
  mutable std::set<std::string, std::less<>> evaluating_;

  // Tree and merge state
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<LayoutNode>> children_;
  NodeState state_ = NodeState::Building;
  std::optional<ResolveError> merge_error_;
  size_t merged_children_ = 0;
  std::map<size_t, TreeObserver> observers_;
  size_t next_observer_id_ = 1;
};

using LayoutNodePtr = std::shared_ptr<LayoutNode>;

}  // namespace stencil
