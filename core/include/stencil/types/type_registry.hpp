// stencil/types/type_registry.hpp - Target type catalog and descriptor cache
//
// Maps (target type, property name) to property type descriptors, with
// target-type inheritance and a read-through descriptor cache.
//
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "stencil/basic/result.hpp"
#include "stencil/node/property_target.hpp"
#include "stencil/types/type_descriptor.hpp"

namespace stencil
{

/// Descriptor set of a target type, ordered by property name
using PropertyTypes = std::map<std::string, TypeDescriptorPtr, std::less<>>;
using PropertyTypesPtr = std::shared_ptr<const PropertyTypes>;

/// Produces the properties a target type declares itself (not inherited ones)
using PropertyTypesProvider = std::function<PropertyTypes()>;

/// Creates the target object for a node of the given type
using TargetFactory = std::function<std::unique_ptr<PropertyTarget>(const std::string & type_name)>;

/**
 * Catalog of target types.
 *
 * Descriptor sets are computed on first request, merging the parent's set
 * with the type's own entries (own entries win), and cached for the lifetime
 * of the registry. Each set is computed once; providers run without the
 * registry lock held and may query the registry. Returned sets are immutable
 * and may be read without locking.
 */
class TypeRegistry
{
public:
  TypeRegistry() = default;

  TypeRegistry(const TypeRegistry &) = delete;
  TypeRegistry & operator=(const TypeRegistry &) = delete;

  /**
   * Register a target type.
   *
   * @param name Type name, unique within the registry
   * @param parent Base type name (empty for a root type); must already be registered
   * @param provider Own property descriptors
   * @param factory Target factory; when empty, the nearest ancestor's factory is used
   * @return DuplicateSymbol or UndefinedSymbol(parent) on failure
   */
  std::optional<ResolveError> register_type(
    std::string name, std::string parent, PropertyTypesProvider provider,
    TargetFactory factory = {});

  [[nodiscard]] bool has_type(std::string_view name) const;

  /// Registered type names, in registration order
  [[nodiscard]] std::vector<std::string> type_names() const;

  /// Parent type name; empty for root or unknown types
  [[nodiscard]] std::string parent_of(std::string_view name) const;

  /// True if `type` equals `ancestor` or inherits from it
  [[nodiscard]] bool is_kind_of(std::string_view type, std::string_view ancestor) const;

  /**
   * Full descriptor set of a target type, including inherited properties.
   *
   * @return UndefinedSymbol if the type is not registered
   */
  [[nodiscard]] ResolveResult<PropertyTypesPtr> descriptors_for(std::string_view type) const;

  /**
   * Single property descriptor.
   *
   * @return UnknownProperty if the type does not declare the property
   */
  [[nodiscard]] ResolveResult<TypeDescriptorPtr> descriptor_for(
    std::string_view type, std::string_view property) const;

  /**
   * Create the target object for a node of `type`.
   *
   * Falls back to a RecordingTarget when no factory exists on the type chain.
   */
  [[nodiscard]] ResolveResult<std::unique_ptr<PropertyTarget>> create_target(
    std::string_view type) const;

  /// Number of cached descriptor sets
  [[nodiscard]] size_t cached_count() const;

private:
  struct TypeEntry
  {
    std::string name;
    std::string parent;
    PropertyTypesProvider provider;
    TargetFactory factory;
    const TypeEntry * parent_entry = nullptr;

    mutable std::once_flag descriptors_once;
    mutable PropertyTypesPtr descriptors;
  };

  const TypeEntry * find_locked(std::string_view name) const;
  PropertyTypesPtr descriptors_of(const TypeEntry & entry) const;

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<TypeEntry>> entries_;
  std::unordered_map<std::string, TypeEntry *> index_;
  mutable std::unordered_map<std::string, PropertyTypesPtr> cache_;
};

}  // namespace stencil
