// stencil/types/type_registry.cpp - Target type catalog implementation
//
#include "stencil/types/type_registry.hpp"

#include <utility>

namespace stencil
{

namespace
{

ResolveError unknown_type(std::string_view name)
{
  ResolveError err = ResolveError::undefined_symbol(name);
  err.message = "unknown target type '" + std::string(name) + "'";
  return err;
}

}  // namespace

std::optional<ResolveError> TypeRegistry::register_type(
  std::string name, std::string parent, PropertyTypesProvider provider, TargetFactory factory)
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (find_locked(name) != nullptr) {
    ResolveError err = ResolveError::duplicate_symbol(name);
    err.message = "target type '" + name + "' is already registered";
    return err;
  }
  const TypeEntry * parent_entry = parent.empty() ? nullptr : find_locked(parent);
  if (!parent.empty() && parent_entry == nullptr) {
    return unknown_type(parent);
  }

  auto entry = std::make_unique<TypeEntry>();
  entry->name = std::move(name);
  entry->parent = std::move(parent);
  entry->provider = std::move(provider);
  entry->factory = std::move(factory);
  entry->parent_entry = parent_entry;
  index_.emplace(entry->name, entry.get());
  entries_.push_back(std::move(entry));
  return std::nullopt;
}

bool TypeRegistry::has_type(std::string_view name) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return find_locked(name) != nullptr;
}

std::vector<std::string> TypeRegistry::type_names() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto & e : entries_) {
    names.push_back(e->name);
  }
  return names;
}

std::string TypeRegistry::parent_of(std::string_view name) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  const TypeEntry * entry = find_locked(name);
  return entry != nullptr ? entry->parent : std::string();
}

bool TypeRegistry::is_kind_of(std::string_view type, std::string_view ancestor) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  // Parents are registered before children, so the chain is acyclic
  const TypeEntry * entry = find_locked(type);
  while (entry != nullptr) {
    if (entry->name == ancestor) {
      return true;
    }
    entry = entry->parent.empty() ? nullptr : find_locked(entry->parent);
  }
  return false;
}

ResolveResult<PropertyTypesPtr> TypeRegistry::descriptors_for(std::string_view type) const
{
  const TypeEntry * entry = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry = find_locked(type);
  }
  if (entry == nullptr) {
    return unknown_type(type);
  }
  return descriptors_of(*entry);
}

ResolveResult<TypeDescriptorPtr> TypeRegistry::descriptor_for(
  std::string_view type, std::string_view property) const
{
  auto set = descriptors_for(type);
  if (!set) {
    return std::move(set).error();
  }
  auto it = set.value()->find(property);
  if (it == set.value()->end()) {
    return ResolveError::unknown_property(property, type);
  }
  return it->second;
}

ResolveResult<std::unique_ptr<PropertyTarget>> TypeRegistry::create_target(
  std::string_view type) const
{
  TargetFactory factory;
  std::string type_name(type);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const TypeEntry * entry = find_locked(type);
    if (entry == nullptr) {
      return unknown_type(type);
    }
    for (; entry != nullptr; entry = entry->parent.empty() ? nullptr : find_locked(entry->parent)) {
      if (entry->factory) {
        factory = entry->factory;
        break;
      }
    }
  }

  // Factories run outside the lock; they may call back into the registry
  if (!factory) {
    return std::unique_ptr<PropertyTarget>(std::make_unique<RecordingTarget>(type_name));
  }
  std::unique_ptr<PropertyTarget> target = factory(type_name);
  if (!target) {
    return ResolveError::type_mismatch("no target object could be created for '" + type_name + "'");
  }
  return std::move(target);
}

size_t TypeRegistry::cached_count() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

// ============================================================================
// Private
// ============================================================================

const TypeRegistry::TypeEntry * TypeRegistry::find_locked(std::string_view name) const
{
  auto it = index_.find(std::string(name));
  return it != index_.end() ? it->second : nullptr;
}

PropertyTypesPtr TypeRegistry::descriptors_of(const TypeEntry & entry) const
{
  // Entries are never removed, so the entry and its parent chain stay valid
  // while providers run unlocked. Concurrent first lookups wait here.
  std::call_once(entry.descriptors_once, [this, &entry] {
    PropertyTypes merged;
    if (entry.parent_entry != nullptr) {
      merged = *descriptors_of(*entry.parent_entry);
    }
    if (entry.provider) {
      for (auto & [name, descriptor] : entry.provider()) {
        merged[name] = std::move(descriptor);
      }
    }
    entry.descriptors = std::make_shared<const PropertyTypes>(std::move(merged));

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(entry.name, entry.descriptors);
  });
  return entry.descriptors;
}

}  // namespace stencil
