// stencil/types/type_descriptor.hpp - Property type descriptors
//
// Describes the accepted shape of a property value and coerces
// dynamically typed values into that shape.
//
#pragma once

#include <cstdint>
#include <functional>
#include <gsl/span>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "stencil/basic/result.hpp"
#include "stencil/types/value.hpp"

namespace stencil
{

class TypeDescriptor;

using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

// ============================================================================
// Descriptor Kind
// ============================================================================

/**
 * Kind of type descriptor.
 */
enum class DescriptorKind {
  // Primitive kinds
  Bool,
  Integer,
  Float,
  Text,

  // Composite kinds
  Struct,  ///< Structured value, one descriptor per field
  Enum,    ///< Named cases + adaptor for raw values

  // Opaque
  Object,  ///< Opaque object reference, matched by type tag
};

/**
 * A named case of an enum descriptor.
 */
struct EnumCase
{
  std::string name;
  Value value;
};

/**
 * A named field of a structured descriptor.
 */
struct FieldDescriptor
{
  std::string name;
  TypeDescriptorPtr type;
};

/**
 * Converts an already-resolved raw value (integer, enum instance, ...) into
 * the canonical enum value. Returns std::nullopt when the raw value is not
 * acceptable.
 */
using EnumAdaptor = std::function<std::optional<Value>(const Value & raw)>;

// ============================================================================
// Type Descriptor
// ============================================================================

/**
 * Immutable description of the values accepted by a property.
 *
 * Descriptors are only handed out as shared pointers to const and are
 * shared by every node whose target type declares the same property.
 */
class TypeDescriptor
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static TypeDescriptorPtr make_bool();
  static TypeDescriptorPtr make_integer();
  static TypeDescriptorPtr make_float();
  static TypeDescriptorPtr make_text();

  /// Opaque object reference; an empty tag accepts any object
  static TypeDescriptorPtr make_object(std::string tag = {});

  /**
   * Create an enum descriptor.
   *
   * When no adaptor is supplied, integers are wrapped as enum instances of
   * this enum and enum instances of this enum pass through unchanged.
   *
   * @return DuplicateSymbol if a case name appears twice
   */
  static ResolveResult<TypeDescriptorPtr> make_enum(
    std::string name, std::vector<EnumCase> cases, EnumAdaptor adaptor = {});

  /// Convenience: enum cases mapping to integer raw values
  static ResolveResult<TypeDescriptorPtr> make_int_enum(
    std::string name, const std::vector<std::pair<std::string, int64_t>> & cases);

  static TypeDescriptorPtr make_struct(std::string name, std::vector<FieldDescriptor> fields);

  /// Copy of `base` that also accepts absence
  static TypeDescriptorPtr make_optional(const TypeDescriptorPtr & base);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] DescriptorKind kind() const noexcept { return kind_; }

  /// Enum/struct name, or the object tag
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  [[nodiscard]] bool is_optional() const noexcept { return optional_; }

  [[nodiscard]] bool is_primitive() const noexcept
  {
    return kind_ == DescriptorKind::Bool || kind_ == DescriptorKind::Integer ||
           kind_ == DescriptorKind::Float || kind_ == DescriptorKind::Text;
  }

  [[nodiscard]] bool is_enum() const noexcept { return kind_ == DescriptorKind::Enum; }

  [[nodiscard]] bool is_struct() const noexcept { return kind_ == DescriptorKind::Struct; }

  [[nodiscard]] gsl::span<const EnumCase> cases() const noexcept
  {
    return gsl::span<const EnumCase>(cases_.data(), cases_.size());
  }

  [[nodiscard]] gsl::span<const FieldDescriptor> fields() const noexcept
  {
    return gsl::span<const FieldDescriptor>(fields_.data(), fields_.size());
  }

  /// Look up an enum case by exact (case-sensitive) name
  [[nodiscard]] const Value * find_case(std::string_view name) const;

  /// Descriptor spelling, e.g. "float", "enum ContentMode", "Insets?"
  [[nodiscard]] std::string describe() const;

  // ===========================================================================
  // Resolution
  // ===========================================================================

  /**
   * Coerce a raw value into this descriptor's shape.
   *
   * Optional layers are stripped first. Absence yields the Null marker for
   * optional descriptors and UnexpectedAbsentValue otherwise.
   */
  [[nodiscard]] ResolveResult<Value> resolve(const Value & raw) const;

  /**
   * Run the enum adaptor on a raw value (enum descriptors only).
   */
  [[nodiscard]] ResolveResult<Value> adapt(const Value & raw) const;

private:
  explicit TypeDescriptor(DescriptorKind kind) : kind_(kind) {}

  ResolveResult<Value> resolve_struct(const Value & raw) const;

  DescriptorKind kind_;
  std::string name_;
  bool optional_ = false;
  std::vector<EnumCase> cases_;
  std::unordered_map<std::string, size_t> case_index_;
  EnumAdaptor adaptor_;
  std::vector<FieldDescriptor> fields_;
};

}  // namespace stencil
