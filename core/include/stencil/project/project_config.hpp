// stencil/project/project_config.hpp - Project configuration (stencil.yaml)
//
// Parses stencil.yaml: package metadata, template locations, root
// constants and the target type catalog.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stencil/basic/error.hpp"
#include "stencil/basic/result.hpp"
#include "stencil/types/type_descriptor.hpp"
#include "stencil/types/type_registry.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Declared type of one property (or struct field).
 */
struct PropertySpec
{
  /// Property or field name
  std::string name;

  /// "bool" | "int" | "float" | "text" | "object" | "enum" | "struct"
  std::string kind;

  bool optional = false;

  /// Enum or struct name (defaults to the property name)
  std::string type_name;

  /// Enum cases in declaration order
  std::vector<std::pair<std::string, int64_t>> enum_cases;

  /// Struct fields in declaration order
  std::vector<PropertySpec> fields;

  /// Object type tag
  std::string object_tag;
};

/**
 * A target type of the catalog.
 */
struct TypeSpec
{
  std::string name;
  std::string parent;
  std::vector<PropertySpec> properties;
};

/**
 * Template location section.
 */
struct TemplatesConfig
{
  /// Templates rendered in project mode
  std::vector<std::filesystem::path> entry_points;

  /// Directories searched for referenced templates
  std::vector<std::filesystem::path> search_paths;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (stencil.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  TemplatesConfig templates;

  /// Constants seeded on every root node
  ValueMap constants;

  std::vector<TypeSpec> types;

  /// Directory containing stencil.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a stencil.yaml file.
 *
 * Relative entry points and search paths are resolved against the
 * directory containing the file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text.
 *
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @return Path to stencil.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

// ============================================================================
// Type Catalog
// ============================================================================

/**
 * Build the descriptor for a property spec.
 *
 * The property name is used as the enum/struct name when none is given.
 */
[[nodiscard]] ResolveResult<TypeDescriptorPtr> make_descriptor(const PropertySpec & spec);

/**
 * Register the catalog's types with a registry.
 *
 * Types may be listed in any order; a parent is registered before its
 * children.
 *
 * @return UndefinedSymbol for an unknown parent (or an inheritance cycle),
 *         DuplicateSymbol for a type registered twice, or the first
 *         descriptor error
 */
std::optional<ResolveError> register_project_types(TypeRegistry & registry, const ProjectConfig & config);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "stencil.yaml";

}  // namespace stencil
