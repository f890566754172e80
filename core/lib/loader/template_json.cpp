// stencil/loader/template_json.cpp - JSON template documents
//
#include "stencil/loader/template_json.hpp"

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace stencil
{
namespace
{

using nlohmann::ordered_json;

ResolveError malformed(const std::string & path, const std::string & message)
{
  return ResolveError::resource_error(path, "malformed template '" + path + "': " + message);
}

ResolveResult<LayoutTemplate> parse_node(const ordered_json & j, const std::string & path)
{
  if (!j.is_object()) {
    return malformed(path, "node must be an object");
  }

  LayoutTemplate tmpl;
  tmpl.relative_path = path;

  for (const auto & [key, field] : j.items()) {
    if (key == "class") {
      if (!field.is_string()) return malformed(path, "'class' must be a string");
      tmpl.class_name = field.get<std::string>();
    } else if (key == "outlet") {
      if (!field.is_string()) return malformed(path, "'outlet' must be a string");
      tmpl.outlet = field.get<std::string>();
    } else if (key == "template") {
      if (!field.is_string()) return malformed(path, "'template' must be a string");
      tmpl.template_path = field.get<std::string>();
    } else if (key == "constants") {
      if (!field.is_object()) return malformed(path, "'constants' must be an object");
      for (const auto & [name, value] : field.items()) {
        auto v = value_from_json(value);
        if (!v) {
          return malformed(path, "constant '" + name + "': " + v.error().message);
        }
        tmpl.constants.emplace(name, std::move(v).value());
      }
    } else if (key == "expressions") {
      if (!field.is_object()) return malformed(path, "'expressions' must be an object");
      for (const auto & [name, source] : field.items()) {
        if (source.is_string()) {
          tmpl.expressions.emplace_back(name, source.get<std::string>());
        } else if (source.is_primitive() && !source.is_null()) {
          // Numbers and booleans are written without quotes
          tmpl.expressions.emplace_back(name, source.dump());
        } else {
          return malformed(path, "expression '" + name + "' must be a string");
        }
      }
    } else if (key == "children") {
      if (!field.is_array()) return malformed(path, "'children' must be an array");
      for (const auto & child : field) {
        auto c = parse_node(child, path);
        if (!c) {
          return c;
        }
        tmpl.children.push_back(std::move(c).value());
      }
    } else {
      return malformed(path, "unknown key '" + key + "'");
    }
  }

  if (tmpl.class_name.empty()) {
    return malformed(path, "node has no 'class'");
  }
  return tmpl;
}

}  // namespace

ResolveResult<Value> value_from_json(const ordered_json & j)
{
  switch (j.type()) {
    case ordered_json::value_t::null:
      return Value::make_null();
    case ordered_json::value_t::boolean:
      return Value::make_bool(j.get<bool>());
    case ordered_json::value_t::number_integer:
      return Value::make_integer(j.get<int64_t>());
    case ordered_json::value_t::number_unsigned: {
      const auto u = j.get<uint64_t>();
      // Above int64 range: floating point, as for expression literals
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Value::make_float(static_cast<double>(u));
      }
      return Value::make_integer(static_cast<int64_t>(u));
    }
    case ordered_json::value_t::number_float:
      return Value::make_float(j.get<double>());
    case ordered_json::value_t::string:
      return Value::make_string(j.get<std::string>());
    case ordered_json::value_t::object: {
      if (j.contains("$enum")) {
        if (j.size() != 2 || !j["$enum"].is_string() || !j.contains("$raw") ||
            !j["$raw"].is_number_integer() ||
            (j["$raw"].is_number_unsigned() &&
             j["$raw"].get<uint64_t>() >
               static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
          return ResolveError::type_mismatch(
            "enum constant must be {\"$enum\": name, \"$raw\": integer}");
        }
        return Value::make_enum(j["$enum"].get<std::string>(), j["$raw"].get<int64_t>());
      }
      std::vector<StructField> fields;
      for (const auto & [name, field] : j.items()) {
        auto v = value_from_json(field);
        if (!v) {
          return v;
        }
        fields.push_back(StructField{name, std::move(v).value()});
      }
      return Value::make_struct(std::move(fields));
    }
    default:
      break;
  }
  return ResolveError::type_mismatch("unsupported constant value " + j.dump());
}

ordered_json value_to_json(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Null:
      return nullptr;
    case ValueKind::Optional:
      return value.optional_value() != nullptr ? value_to_json(*value.optional_value())
                                               : ordered_json(nullptr);
    case ValueKind::Bool:
      return value.as_bool();
    case ValueKind::Integer:
      return value.as_integer();
    case ValueKind::Float:
      return value.as_float();
    case ValueKind::String:
      return value.as_string();
    case ValueKind::Enum:
      return ordered_json{{"$enum", value.enum_name()}, {"$raw", value.as_integer()}};
    case ValueKind::Struct: {
      ordered_json j = ordered_json::object();
      for (const auto & f : value.as_struct()) {
        j[f.name] = value_to_json(f.value);
      }
      return j;
    }
    case ValueKind::Object:
      return ordered_json{{"$object", value.object_tag()}};
  }
  return nullptr;
}

ResolveResult<LayoutTemplate> template_from_json(const ordered_json & j, const std::string & source_path)
{
  return parse_node(j, source_path);
}

ResolveResult<LayoutTemplate> parse_template(std::string_view text, const std::string & source_path)
{
  ordered_json j;
  try {
    j = ordered_json::parse(text.begin(), text.end());
  } catch (const ordered_json::parse_error & e) {
    return ResolveError::resource_error(
      source_path, "failed to parse '" + source_path + "': " + std::string(e.what()));
  }
  return parse_node(j, source_path);
}

}  // namespace stencil
