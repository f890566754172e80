// stencil/types/value.cpp - Runtime value implementation
//
#include "stencil/types/value.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <utility>

#include "stencil/types/optional.hpp"

namespace stencil
{

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Null:
      return "nil";
    case ValueKind::Optional:
      return "optional";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Integer:
      return "integer";
    case ValueKind::Float:
      return "float";
    case ValueKind::String:
      return "text";
    case ValueKind::Enum:
      return "enum";
    case ValueKind::Struct:
      return "struct";
    case ValueKind::Object:
      return "object";
  }
  return "unknown";
}

// ============================================================================
// Factory Methods
// ============================================================================

Value Value::make_optional(Value inner)
{
  Value v;
  v.kind_ = ValueKind::Optional;
  v.inner_ = std::make_shared<const Value>(std::move(inner));
  return v;
}

Value Value::make_empty_optional()
{
  Value v;
  v.kind_ = ValueKind::Optional;
  return v;
}

Value Value::make_bool(bool value)
{
  Value v;
  v.kind_ = ValueKind::Bool;
  v.bool_value_ = value;
  return v;
}

Value Value::make_integer(int64_t value)
{
  Value v;
  v.kind_ = ValueKind::Integer;
  v.int_value_ = value;
  return v;
}

Value Value::make_float(double value)
{
  Value v;
  v.kind_ = ValueKind::Float;
  v.float_value_ = value;
  return v;
}

Value Value::make_string(std::string value)
{
  Value v;
  v.kind_ = ValueKind::String;
  v.text_ = std::move(value);
  return v;
}

Value Value::make_enum(std::string enum_name, int64_t raw_value)
{
  Value v;
  v.kind_ = ValueKind::Enum;
  v.text_ = std::move(enum_name);
  v.int_value_ = raw_value;
  return v;
}

Value Value::make_struct(std::vector<StructField> fields)
{
  Value v;
  v.kind_ = ValueKind::Struct;
  v.fields_ = std::make_shared<const std::vector<StructField>>(std::move(fields));
  return v;
}

Value Value::make_object(std::shared_ptr<void> object, std::string type_tag)
{
  Value v;
  v.kind_ = ValueKind::Object;
  v.object_ = std::move(object);
  v.text_ = std::move(type_tag);
  return v;
}

// ============================================================================
// Accessors
// ============================================================================

gsl::span<const StructField> Value::as_struct() const noexcept
{
  if (!fields_) {
    return {};
  }
  return gsl::span<const StructField>(fields_->data(), fields_->size());
}

const Value * Value::field(std::string_view name) const noexcept
{
  for (const auto & f : as_struct()) {
    if (f.name == name) {
      return &f.value;
    }
  }
  return nullptr;
}

std::optional<int64_t> Value::to_integer() const
{
  if (is_integer()) return int_value_;
  if (is_float() && std::isfinite(float_value_) && std::trunc(float_value_) == float_value_ &&
      std::fabs(float_value_) < 9.2e18) {
    return static_cast<int64_t>(float_value_);
  }
  return std::nullopt;
}

std::optional<double> Value::to_float() const
{
  if (is_float()) return float_value_;
  if (is_integer()) return static_cast<double>(int_value_);
  return std::nullopt;
}

bool Value::operator==(const Value & other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ValueKind::Null:
      return true;
    case ValueKind::Optional:
      if (!inner_ || !other.inner_) {
        return !inner_ && !other.inner_;
      }
      return *inner_ == *other.inner_;
    case ValueKind::Bool:
      return bool_value_ == other.bool_value_;
    case ValueKind::Integer:
      return int_value_ == other.int_value_;
    case ValueKind::Float:
      return float_value_ == other.float_value_;
    case ValueKind::String:
      return text_ == other.text_;
    case ValueKind::Enum:
      return text_ == other.text_ && int_value_ == other.int_value_;
    case ValueKind::Struct: {
      const auto lhs = as_struct();
      const auto rhs = other.as_struct();
      if (lhs.size() != rhs.size()) {
        return false;
      }
      for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i].name != rhs[i].name || lhs[i].value != rhs[i].value) {
          return false;
        }
      }
      return true;
    }
    case ValueKind::Object:
      return object_ == other.object_ && text_ == other.text_;
  }
  return false;
}

namespace
{

std::string format_float(double value)
{
  if (std::trunc(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<int64_t>(value));
  }
  // Shortest representation that round-trips
  char buffer[32];
  for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) {
      break;
    }
  }
  return buffer;
}

}  // namespace

std::string Value::debug_string() const
{
  switch (kind_) {
    case ValueKind::Null:
      return "nil";
    case ValueKind::Optional:
      return inner_ ? "Optional(" + inner_->debug_string() + ")" : "Optional(nil)";
    case ValueKind::Bool:
      return bool_value_ ? "true" : "false";
    case ValueKind::Integer:
      return std::to_string(int_value_);
    case ValueKind::Float:
      return format_float(float_value_);
    case ValueKind::String:
      return "\"" + text_ + "\"";
    case ValueKind::Enum:
      return "Enum(" + text_ + ", " + std::to_string(int_value_) + ")";
    case ValueKind::Struct: {
      std::string out = "{";
      bool first = true;
      for (const auto & f : as_struct()) {
        if (!first) out += ", ";
        out += f.name + ": " + f.value.debug_string();
        first = false;
      }
      return out + "}";
    }
    case ValueKind::Object:
      return "Object(" + (text_.empty() ? std::string("?") : text_) + ")";
  }
  return "?";
}

// ============================================================================
// Helper Functions
// ============================================================================

ResolveResult<std::string> stringify(const Value & value)
{
  auto unwrapped = unwrap_or_fail(value);
  if (!unwrapped) {
    return std::move(unwrapped).error();
  }
  const Value & v = *unwrapped;
  switch (v.kind()) {
    case ValueKind::Bool:
      return std::string(v.as_bool() ? "true" : "false");
    case ValueKind::Integer:
      return std::to_string(v.as_integer());
    case ValueKind::Float:
      return format_float(v.as_float());
    case ValueKind::String:
      return v.as_string();
    case ValueKind::Enum:
      return std::to_string(v.as_integer());
    default:
      break;
  }
  return ResolveError::type_mismatch(
    "cannot convert " + std::string(to_string(v.kind())) + " value to text");
}

ValueMap merge_constants(const std::vector<ValueMap> & layers)
{
  ValueMap result;
  for (const auto & layer : layers) {
    for (const auto & [key, value] : layer) {
      result[key] = value;
    }
  }
  return result;
}

}  // namespace stencil
