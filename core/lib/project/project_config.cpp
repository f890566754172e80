// stencil/project/project_config.cpp - Project configuration implementation
//
#include "stencil/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace stencil
{

namespace
{

namespace fs = std::filesystem;

bool is_primitive_kind(const std::string & kind)
{
  return kind == "bool" || kind == "int" || kind == "float" || kind == "text" || kind == "object";
}

/// Split a trailing '?' off a kind name
std::string strip_optional(std::string kind, bool & optional)
{
  if (!kind.empty() && kind.back() == '?') {
    kind.pop_back();
    optional = true;
  }
  return kind;
}

/// Parse a property spec: a kind name, or a map
std::optional<PropertySpec> parse_property(
  const YAML::Node & node, const std::string & name, std::string & error)
{
  PropertySpec spec;
  spec.name = name;

  if (node.IsScalar()) {
    spec.kind = strip_optional(node.as<std::string>(), spec.optional);
    if (!is_primitive_kind(spec.kind)) {
      error = "property '" + name + "' has unknown type '" + spec.kind + "'";
      return std::nullopt;
    }
    return spec;
  }

  if (!node.IsMap()) {
    error = "property '" + name + "' must be a type name or a map";
    return std::nullopt;
  }

  if (node["type"]) {
    spec.kind = strip_optional(node["type"].as<std::string>(), spec.optional);
  }
  if (node["optional"]) {
    spec.optional = node["optional"].as<bool>();
  }
  if (node["name"]) {
    spec.type_name = node["name"].as<std::string>();
  }

  if (node["enum"]) {
    if (!node["enum"].IsMap()) {
      error = "property '" + name + "': enum cases must be a map of name to integer";
      return std::nullopt;
    }
    spec.kind = "enum";
    for (const auto & entry : node["enum"]) {
      spec.enum_cases.emplace_back(entry.first.as<std::string>(), entry.second.as<int64_t>());
    }
  } else if (node["fields"]) {
    if (!node["fields"].IsMap()) {
      error = "property '" + name + "': fields must be a map";
      return std::nullopt;
    }
    spec.kind = "struct";
    for (const auto & entry : node["fields"]) {
      auto field = parse_property(entry.second, entry.first.as<std::string>(), error);
      if (!field) {
        return std::nullopt;
      }
      spec.fields.push_back(std::move(*field));
    }
  } else if (node["object"]) {
    spec.kind = "object";
    spec.object_tag = node["object"].as<std::string>();
  }

  if (spec.kind.empty()) {
    error = "property '" + name + "' has no type";
    return std::nullopt;
  }
  if (spec.kind != "enum" && spec.kind != "struct" && !is_primitive_kind(spec.kind)) {
    error = "property '" + name + "' has unknown type '" + spec.kind + "'";
    return std::nullopt;
  }
  return spec;
}

/// Parse a constant value; plain scalars are typed, quoted scalars are text
std::optional<Value> parse_constant(const YAML::Node & node, std::string & error)
{
  if (node.IsNull()) {
    return Value::make_null();
  }

  if (node.IsScalar()) {
    const std::string text = node.Scalar();
    if (node.Tag() != "!") {
      if (text == "true" || text == "false") {
        return Value::make_bool(text == "true");
      }
      int64_t i = 0;
      if (YAML::convert<int64_t>::decode(node, i)) {
        return Value::make_integer(i);
      }
      double d = 0.0;
      if (YAML::convert<double>::decode(node, d)) {
        return Value::make_float(d);
      }
    }
    return Value::make_string(text);
  }

  if (node.IsMap()) {
    if (node["$enum"]) {
      if (!node["$raw"]) {
        error = "enum constant needs '$raw'";
        return std::nullopt;
      }
      return Value::make_enum(node["$enum"].as<std::string>(), node["$raw"].as<int64_t>());
    }
    std::vector<StructField> fields;
    for (const auto & entry : node) {
      auto v = parse_constant(entry.second, error);
      if (!v) {
        return std::nullopt;
      }
      fields.push_back(StructField{entry.first.as<std::string>(), std::move(*v)});
    }
    return Value::make_struct(std::move(fields));
  }

  error = "lists are not supported as constant values";
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root, const fs::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'templates' section
  if (root["templates"]) {
    const auto & tpl = root["templates"];
    for (const char * key : {"entry_points", "search_paths"}) {
      if (!tpl[key]) {
        continue;
      }
      if (!tpl[key].IsSequence()) {
        return ConfigLoadResult::fail("templates." + std::string(key) + " must be a list");
      }
      auto & out = std::string(key) == "entry_points" ? config.templates.entry_points
                                                      : config.templates.search_paths;
      for (const auto & entry : tpl[key]) {
        fs::path p = entry.as<std::string>();
        out.push_back(p.is_absolute() ? p : project_root / p);
      }
    }
  }

  // Parse 'constants' section
  if (root["constants"]) {
    if (!root["constants"].IsMap()) {
      return ConfigLoadResult::fail("constants must be a map");
    }
    for (const auto & entry : root["constants"]) {
      const std::string name = entry.first.as<std::string>();
      std::string error;
      auto value = parse_constant(entry.second, error);
      if (!value) {
        return ConfigLoadResult::fail("invalid constant '" + name + "': " + error);
      }
      config.constants.emplace(name, std::move(*value));
    }
  }

  // Parse 'types' section
  if (root["types"]) {
    if (!root["types"].IsMap()) {
      return ConfigLoadResult::fail("types must be a map");
    }
    for (const auto & entry : root["types"]) {
      TypeSpec type;
      type.name = entry.first.as<std::string>();
      const auto & body = entry.second;
      if (!body.IsNull() && !body.IsMap()) {
        return ConfigLoadResult::fail("type '" + type.name + "' must be a map");
      }
      if (body["parent"]) {
        type.parent = body["parent"].as<std::string>();
      }
      if (body["properties"]) {
        if (!body["properties"].IsMap()) {
          return ConfigLoadResult::fail("properties of '" + type.name + "' must be a map");
        }
        for (const auto & prop : body["properties"]) {
          std::string error;
          auto spec = parse_property(prop.second, prop.first.as<std::string>(), error);
          if (!spec) {
            return ConfigLoadResult::fail("invalid type '" + type.name + "': " + error);
          }
          type.properties.push_back(std::move(*spec));
        }
      }
      config.types.push_back(std::move(type));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(std::string_view yaml_text, const fs::path & project_root)
{
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_text));
    return parse_root(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

// ============================================================================
// Type Catalog
// ============================================================================

ResolveResult<TypeDescriptorPtr> make_descriptor(const PropertySpec & spec)
{
  const std::string type_name = spec.type_name.empty() ? spec.name : spec.type_name;
  TypeDescriptorPtr base;

  if (spec.kind == "bool") {
    base = TypeDescriptor::make_bool();
  } else if (spec.kind == "int") {
    base = TypeDescriptor::make_integer();
  } else if (spec.kind == "float") {
    base = TypeDescriptor::make_float();
  } else if (spec.kind == "text") {
    base = TypeDescriptor::make_text();
  } else if (spec.kind == "object") {
    base = TypeDescriptor::make_object(spec.object_tag);
  } else if (spec.kind == "enum") {
    auto e = TypeDescriptor::make_int_enum(type_name, spec.enum_cases);
    if (!e) {
      return e;
    }
    base = std::move(e).value();
  } else if (spec.kind == "struct") {
    std::vector<FieldDescriptor> fields;
    for (const auto & field_spec : spec.fields) {
      auto field = make_descriptor(field_spec);
      if (!field) {
        return field;
      }
      fields.push_back(FieldDescriptor{field_spec.name, std::move(field).value()});
    }
    base = TypeDescriptor::make_struct(type_name, std::move(fields));
  } else {
    return ResolveError::type_mismatch("unknown property type '" + spec.kind + "'");
  }

  return spec.optional ? TypeDescriptor::make_optional(base) : base;
}

std::optional<ResolveError> register_project_types(TypeRegistry & registry, const ProjectConfig & config)
{
  std::vector<const TypeSpec *> remaining;
  remaining.reserve(config.types.size());
  for (const auto & type : config.types) {
    remaining.push_back(&type);
  }

  while (!remaining.empty()) {
    bool progress = false;
    for (auto it = remaining.begin(); it != remaining.end();) {
      const TypeSpec & type = **it;
      if (!type.parent.empty() && !registry.has_type(type.parent)) {
        ++it;
        continue;
      }

      PropertyTypes properties;
      for (const auto & spec : type.properties) {
        auto descriptor = make_descriptor(spec);
        if (!descriptor) {
          ResolveError err = std::move(descriptor).error();
          err.in_property(type.name, spec.name);
          return err;
        }
        properties[spec.name] = std::move(descriptor).value();
      }

      if (auto err = registry.register_type(
            type.name, type.parent, [properties]() { return properties; })) {
        return err;
      }
      it = remaining.erase(it);
      progress = true;
    }

    if (!progress) {
      const TypeSpec & blocked = *remaining.front();
      ResolveError err = ResolveError::undefined_symbol(blocked.parent);
      err.message =
        "unknown parent type '" + blocked.parent + "' of '" + blocked.name + "' (or inheritance cycle)";
      return err;
    }
  }
  return std::nullopt;
}

}  // namespace stencil
