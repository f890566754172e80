// stencil/types/type_descriptor.cpp - Property type descriptor implementation
//
#include "stencil/types/type_descriptor.hpp"

#include <algorithm>
#include <utility>

#include "stencil/types/optional.hpp"

namespace stencil
{

namespace
{

const char * kind_name(DescriptorKind kind)
{
  switch (kind) {
    case DescriptorKind::Bool:
      return "bool";
    case DescriptorKind::Integer:
      return "int";
    case DescriptorKind::Float:
      return "float";
    case DescriptorKind::Text:
      return "text";
    case DescriptorKind::Struct:
      return "struct";
    case DescriptorKind::Enum:
      return "enum";
    case DescriptorKind::Object:
      return "object";
  }
  return "unknown";
}

ResolveError mismatch(const TypeDescriptor & expected, const Value & found)
{
  return ResolveError::type_mismatch(
    "expected " + expected.describe() + ", found " + std::string(to_string(found.kind())) + " " +
    found.debug_string());
}

EnumAdaptor default_adaptor(std::string enum_name)
{
  return [enum_name = std::move(enum_name)](const Value & raw) -> std::optional<Value> {
    if (raw.is_enum()) {
      if (raw.enum_name() == enum_name) {
        return raw;
      }
      return std::nullopt;
    }
    if (auto i = raw.to_integer()) {
      return Value::make_enum(enum_name, *i);
    }
    return std::nullopt;
  };
}

}  // namespace

// ============================================================================
// Factory Methods
// ============================================================================

TypeDescriptorPtr TypeDescriptor::make_bool()
{
  return TypeDescriptorPtr(new TypeDescriptor(DescriptorKind::Bool));
}

TypeDescriptorPtr TypeDescriptor::make_integer()
{
  return TypeDescriptorPtr(new TypeDescriptor(DescriptorKind::Integer));
}

TypeDescriptorPtr TypeDescriptor::make_float()
{
  return TypeDescriptorPtr(new TypeDescriptor(DescriptorKind::Float));
}

TypeDescriptorPtr TypeDescriptor::make_text()
{
  return TypeDescriptorPtr(new TypeDescriptor(DescriptorKind::Text));
}

TypeDescriptorPtr TypeDescriptor::make_object(std::string tag)
{
  auto * d = new TypeDescriptor(DescriptorKind::Object);
  d->name_ = std::move(tag);
  return TypeDescriptorPtr(d);
}

ResolveResult<TypeDescriptorPtr> TypeDescriptor::make_enum(
  std::string name, std::vector<EnumCase> cases, EnumAdaptor adaptor)
{
  std::unique_ptr<TypeDescriptor> d(new TypeDescriptor(DescriptorKind::Enum));
  d->name_ = std::move(name);
  d->case_index_.reserve(cases.size());
  for (size_t i = 0; i < cases.size(); ++i) {
    auto [it, inserted] = d->case_index_.emplace(cases[i].name, i);
    if (!inserted) {
      ResolveError err = ResolveError::duplicate_symbol(cases[i].name);
      err.message = "duplicate case '" + cases[i].name + "' in enum " + d->name_;
      return err;
    }
  }
  d->cases_ = std::move(cases);
  d->adaptor_ = adaptor ? std::move(adaptor) : default_adaptor(d->name_);
  return TypeDescriptorPtr(std::move(d));
}

ResolveResult<TypeDescriptorPtr> TypeDescriptor::make_int_enum(
  std::string name, const std::vector<std::pair<std::string, int64_t>> & cases)
{
  std::vector<EnumCase> enum_cases;
  enum_cases.reserve(cases.size());
  for (const auto & [case_name, raw] : cases) {
    enum_cases.push_back(EnumCase{case_name, Value::make_enum(name, raw)});
  }
  return make_enum(std::move(name), std::move(enum_cases));
}

TypeDescriptorPtr TypeDescriptor::make_struct(std::string name, std::vector<FieldDescriptor> fields)
{
  auto * d = new TypeDescriptor(DescriptorKind::Struct);
  d->name_ = std::move(name);
  d->fields_ = std::move(fields);
  return TypeDescriptorPtr(d);
}

TypeDescriptorPtr TypeDescriptor::make_optional(const TypeDescriptorPtr & base)
{
  if (base->optional_) {
    return base;
  }
  auto * d = new TypeDescriptor(*base);
  d->optional_ = true;
  return TypeDescriptorPtr(d);
}

// ============================================================================
// Queries
// ============================================================================

const Value * TypeDescriptor::find_case(std::string_view name) const
{
  auto it = case_index_.find(std::string(name));
  return it != case_index_.end() ? &cases_[it->second].value : nullptr;
}

std::string TypeDescriptor::describe() const
{
  std::string out;
  switch (kind_) {
    case DescriptorKind::Enum:
      out = "enum " + name_;
      break;
    case DescriptorKind::Struct:
      out = name_.empty() ? std::string("struct") : name_;
      break;
    case DescriptorKind::Object:
      out = name_.empty() ? std::string("object") : "object " + name_;
      break;
    default:
      out = kind_name(kind_);
      break;
  }
  if (optional_) {
    out += "?";
  }
  return out;
}

// ============================================================================
// Resolution
// ============================================================================

ResolveResult<Value> TypeDescriptor::resolve(const Value & raw) const
{
  const std::optional<Value> unwrapped = unwrap_or_absent(raw);
  if (!unwrapped) {
    if (optional_) {
      return Value::make_null();
    }
    return ResolveError::unexpected_absent_value();
  }
  const Value & v = *unwrapped;

  switch (kind_) {
    case DescriptorKind::Bool:
      if (v.is_bool()) {
        return v;
      }
      return mismatch(*this, v);

    case DescriptorKind::Integer:
      if (auto i = v.to_integer()) {
        return Value::make_integer(*i);
      }
      return mismatch(*this, v);

    case DescriptorKind::Float:
      if (auto f = v.to_float()) {
        return Value::make_float(*f);
      }
      return mismatch(*this, v);

    case DescriptorKind::Text:
      if (v.is_string()) {
        return v;
      }
      if (v.is_bool() || v.is_numeric() || v.is_enum()) {
        auto text = stringify(v);
        if (!text) {
          return std::move(text).error();
        }
        return Value::make_string(std::move(text).value());
      }
      return mismatch(*this, v);

    case DescriptorKind::Enum:
      if (v.is_string()) {
        if (const Value * c = find_case(v.as_string())) {
          return *c;
        }
        return ResolveError::unknown_enum_case(v.as_string());
      }
      return adapt(v);

    case DescriptorKind::Struct:
      return resolve_struct(v);

    case DescriptorKind::Object:
      if (v.is_object() && (name_.empty() || v.object_tag() == name_)) {
        return v;
      }
      return mismatch(*this, v);
  }
  return mismatch(*this, v);
}

ResolveResult<Value> TypeDescriptor::adapt(const Value & raw) const
{
  if (kind_ != DescriptorKind::Enum || !adaptor_) {
    return mismatch(*this, raw);
  }
  std::optional<Value> adapted = adaptor_(raw);
  if (!adapted) {
    return mismatch(*this, raw);
  }
  return std::move(*adapted);
}

ResolveResult<Value> TypeDescriptor::resolve_struct(const Value & raw) const
{
  if (!raw.is_struct()) {
    return mismatch(*this, raw);
  }

  for (const auto & f : raw.as_struct()) {
    const bool declared = std::any_of(fields_.begin(), fields_.end(), [&](const FieldDescriptor & d) {
      return d.name == f.name;
    });
    if (!declared) {
      return ResolveError::type_mismatch(describe() + " has no field '" + f.name + "'");
    }
  }

  std::vector<StructField> resolved;
  resolved.reserve(fields_.size());
  for (const auto & field : fields_) {
    const Value * fv = raw.field(field.name);
    if (fv == nullptr || is_absent(*fv)) {
      if (field.type->is_optional()) {
        resolved.push_back(StructField{field.name, Value::make_null()});
        continue;
      }
      ResolveError err = ResolveError::missing_required_value(field.name);
      err.message = "missing value for required field '" + field.name + "' of " + describe();
      return err;
    }

    auto r = field.type->resolve(*fv);
    if (!r) {
      ResolveError err = std::move(r).error();
      err.message = "field '" + field.name + "': " + err.message;
      return err;
    }
    resolved.push_back(StructField{field.name, std::move(r).value()});
  }
  return Value::make_struct(std::move(resolved));
}

}  // namespace stencil
