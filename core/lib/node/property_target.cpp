// stencil/node/property_target.cpp - Recording target implementation
//
#include "stencil/node/property_target.hpp"

namespace stencil
{

std::optional<Value> RecordingTarget::get(std::string_view name) const
{
  auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<ResolveError> RecordingTarget::set(std::string_view name, const Value & value)
{
  if (rejected_.find(name) != rejected_.end()) {
    return ResolveError::type_mismatch(
      type_name_ + " does not accept a value for '" + std::string(name) + "'");
  }
  auto it = values_.find(name);
  if (it != values_.end()) {
    it->second = value;
  } else {
    values_.emplace(std::string(name), value);
  }
  ++set_count_;
  return std::nullopt;
}

void RecordingTarget::did_insert_child(PropertyTarget & child, size_t index)
{
  if (index >= children_.size()) {
    children_.push_back(&child);
  } else {
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), &child);
  }
}

}  // namespace stencil
