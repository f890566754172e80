// stencil/node/layout_node.cpp - Layout tree node implementation
//
#include "stencil/node/layout_node.hpp"

#include <utility>

namespace stencil
{

std::string_view to_string(NodeState state) noexcept
{
  switch (state) {
    case NodeState::Building:
      return "building";
    case NodeState::Ready:
      return "ready";
    case NodeState::AwaitingMerge:
      return "awaiting-merge";
    case NodeState::Merged:
      return "merged";
    case NodeState::MergeFailed:
      return "merge-failed";
  }
  return "unknown";
}

LayoutNode::LayoutNode(
  std::string class_name, std::string outlet, const std::shared_ptr<LayoutNode> & parent,
  std::unique_ptr<PropertyTarget> target, PropertyTypesPtr descriptors,
  std::shared_ptr<const ExpressionResolver> resolver)
: class_name_(std::move(class_name)),
  outlet_(std::move(outlet)),
  parent_(parent),
  target_(std::move(target)),
  descriptors_(std::move(descriptors)),
  resolver_(std::move(resolver)),
  symbols_(
    parent != nullptr ? std::shared_ptr<const SymbolTable>(parent, &parent->symbols_)
                      : std::shared_ptr<const SymbolTable>())
{
}

// ============================================================================
// Symbols
// ============================================================================

ResolveResult<Value> LayoutNode::resolve(std::string_view name) const
{
  return value_for_symbol(name);
}

ResolveResult<Value> LayoutNode::value_for_symbol(std::string_view name) const
{
  for (const auto & [key, source] : expressions_) {
    if (key == name) {
      return evaluate_property(name);
    }
  }

  auto found = symbols_.resolve(name);
  if (found || found.error().kind != ErrorKind::UndefinedSymbol) {
    return found;
  }
  // Values the target object already holds (toolkit defaults, presets)
  if (auto live = target_->get(name)) {
    return std::move(*live);
  }
  return found;
}

std::optional<Value> LayoutNode::property_value(std::string_view name) const
{
  std::lock_guard<std::recursive_mutex> lock(eval_mutex_);
  auto it = resolved_.find(name);
  if (it == resolved_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, Value> LayoutNode::property_values() const
{
  std::lock_guard<std::recursive_mutex> lock(eval_mutex_);
  return std::map<std::string, Value>(resolved_.begin(), resolved_.end());
}

ResolveResult<Value> LayoutNode::evaluate_property(std::string_view name) const
{
  std::lock_guard<std::recursive_mutex> lock(eval_mutex_);

  auto cached = resolved_.find(name);
  if (cached != resolved_.end()) {
    return cached->second;
  }

  const std::string * source = nullptr;
  for (const auto & [key, expr] : expressions_) {
    if (key == name) {
      source = &expr;
      break;
    }
  }
  auto descriptor = descriptors_->find(name);
  if (source == nullptr || descriptor == descriptors_->end()) {
    return ResolveError::unknown_property(name, class_name_);
  }

  if (evaluating_.find(name) != evaluating_.end()) {
    ResolveError err = ResolveError::invalid_expression(
      *source, "circular reference to property '" + std::string(name) + "'");
    err.in_property(class_name_, name);
    return err;
  }

  const std::string key(name);
  evaluating_.insert(key);
  auto result = resolver_->evaluate(class_name_, name, *source, *descriptor->second, *this);
  evaluating_.erase(key);

  if (result) {
    resolved_.emplace(key, result.value());
  }
  return result;
}

std::map<std::string, Value> LayoutNode::clear_property_cache()
{
  std::lock_guard<std::recursive_mutex> lock(eval_mutex_);
  std::map<std::string, Value> previous(resolved_.begin(), resolved_.end());
  resolved_.clear();
  return previous;
}

void LayoutNode::restore_property(const std::string & name, Value value)
{
  std::lock_guard<std::recursive_mutex> lock(eval_mutex_);
  resolved_[name] = std::move(value);
}

// ============================================================================
// Tree
// ============================================================================

std::vector<std::shared_ptr<LayoutNode>> LayoutNode::children() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return children_;
}

size_t LayoutNode::child_count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return children_.size();
}

std::shared_ptr<LayoutNode> LayoutNode::find_outlet(std::string_view name)
{
  if (outlet_ == name) {
    return shared_from_this();
  }
  for (const auto & child : children()) {
    if (auto found = child->find_outlet(name)) {
      return found;
    }
  }
  return nullptr;
}

void LayoutNode::attach_child(std::shared_ptr<LayoutNode> child)
{
  size_t index = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    index = children_.size();
    children_.push_back(child);
  }
  target_->did_insert_child(child->target(), index);
}

void LayoutNode::append_merged(std::vector<std::shared_ptr<LayoutNode>> children)
{
  TreeChanged event;
  std::vector<TreeObserver> observers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    event.node = this;
    event.first_index = children_.size();
    event.count = children.size();
    children_.insert(children_.end(), children.begin(), children.end());
    merged_children_ += event.count;
    state_ = NodeState::Merged;
    observers.reserve(observers_.size());
    for (const auto & [id, observer] : observers_) {
      observers.push_back(observer);
    }
  }

  // Target and observers run unlocked so they can read the new children
  for (size_t i = 0; i < children.size(); ++i) {
    target_->did_insert_child(children[i]->target(), event.first_index + i);
  }
  for (const auto & observer : observers) {
    observer(event);
  }
}

// ============================================================================
// Merge State
// ============================================================================

NodeState LayoutNode::state() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void LayoutNode::set_state(NodeState state)
{
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = state;
}

std::optional<ResolveError> LayoutNode::merge_error() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return merge_error_;
}

size_t LayoutNode::merged_child_count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return merged_children_;
}

void LayoutNode::fail_merge(ResolveError error)
{
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = NodeState::MergeFailed;
  merge_error_ = std::move(error);
}

// ============================================================================
// Observers
// ============================================================================

size_t LayoutNode::add_observer(TreeObserver observer)
{
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t id = next_observer_id_++;
  observers_.emplace(id, std::move(observer));
  return id;
}

void LayoutNode::remove_observer(size_t id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  observers_.erase(id);
}

}  // namespace stencil
