// stencil/types/value.hpp - Dynamically typed runtime value
//
// Represents constants, state values and the results of expression
// evaluation before and after coercion.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "stencil/basic/result.hpp"

namespace stencil
{

struct StructField;

// ============================================================================
// Value Kind
// ============================================================================

/**
 * Kind of runtime value.
 */
enum class ValueKind {
  Null,      ///< Explicit absence marker
  Optional,  ///< Optional wrapper (present or empty)
  Bool,      ///< Boolean
  Integer,   ///< 64-bit signed integer
  Float,     ///< 64-bit floating point
  String,    ///< Text
  Enum,      ///< Enum instance (enum name + raw storage value)
  Struct,    ///< Structured value (ordered named fields)
  Object,    ///< Opaque object reference (type tag + shared pointer)
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

// ============================================================================
// Value
// ============================================================================

/**
 * Runtime value.
 *
 * Values are immutable once built; nested payloads (optional inner value,
 * struct fields) are shared so copies are cheap.
 *
 * The default constructed value is the Null absence marker.
 */
class Value
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  /// Create the absence marker
  static Value make_null() { return Value{}; }

  /// Wrap a value in an optional layer
  static Value make_optional(Value inner);

  /// Create an empty optional layer
  static Value make_empty_optional();

  static Value make_bool(bool value);

  static Value make_integer(int64_t value);

  static Value make_float(double value);

  static Value make_string(std::string value);

  /// Create an enum instance of the named enum
  static Value make_enum(std::string enum_name, int64_t raw_value);

  /// Create a structured value (field order is preserved)
  static Value make_struct(std::vector<StructField> fields);

  /// Create an opaque object reference
  static Value make_object(std::shared_ptr<void> object, std::string type_tag);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }

  [[nodiscard]] bool is_optional() const noexcept { return kind_ == ValueKind::Optional; }

  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }

  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }

  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }

  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }

  [[nodiscard]] bool is_enum() const noexcept { return kind_ == ValueKind::Enum; }

  [[nodiscard]] bool is_struct() const noexcept { return kind_ == ValueKind::Struct; }

  [[nodiscard]] bool is_object() const noexcept { return kind_ == ValueKind::Object; }

  [[nodiscard]] bool is_numeric() const noexcept { return is_integer() || is_float(); }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Inner value of an optional layer, nullptr when empty or not optional
  [[nodiscard]] const Value * optional_value() const noexcept { return inner_.get(); }

  [[nodiscard]] bool as_bool() const noexcept { return bool_value_; }

  /// Integer value; raw storage value for enums
  [[nodiscard]] int64_t as_integer() const noexcept { return int_value_; }

  [[nodiscard]] double as_float() const noexcept { return float_value_; }

  /// Text for strings; enum name for enums; type tag for objects
  [[nodiscard]] const std::string & as_string() const noexcept { return text_; }

  [[nodiscard]] const std::string & enum_name() const noexcept { return text_; }

  [[nodiscard]] const std::string & object_tag() const noexcept { return text_; }

  [[nodiscard]] const std::shared_ptr<void> & as_object() const noexcept { return object_; }

  /// Struct fields (only valid if is_struct())
  [[nodiscard]] gsl::span<const StructField> as_struct() const noexcept;

  /// Look up a struct field by name
  [[nodiscard]] const Value * field(std::string_view name) const noexcept;

  // ===========================================================================
  // Numeric Conversion
  // ===========================================================================

  /// Integer if integer, or a float with no fractional part
  [[nodiscard]] std::optional<int64_t> to_integer() const;

  /// Float if numeric
  [[nodiscard]] std::optional<double> to_float() const;

  // ===========================================================================
  // Comparison / Debugging
  // ===========================================================================

  /// Deep equality; objects compare by identity
  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

  /// Debug representation, e.g. `Optional(Enum(ContentMode, 4))`
  [[nodiscard]] std::string debug_string() const;

  /// Default constructor creates the Null absence marker
  Value() = default;

private:
  ValueKind kind_ = ValueKind::Null;
  bool bool_value_ = false;
  int64_t int_value_ = 0;
  double float_value_ = 0.0;
  std::string text_;
  std::shared_ptr<const Value> inner_;
  std::shared_ptr<const std::vector<StructField>> fields_;
  std::shared_ptr<void> object_;
};

/**
 * A named field of a structured value.
 */
struct StructField
{
  std::string name;
  Value value;
};

/// Named values (constants or state)
using ValueMap = std::unordered_map<std::string, Value>;

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Convert a value to text.
 *
 * Unwraps optionals first (absence is an UnexpectedAbsentValue error).
 * Booleans become "true"/"false"; integral floats drop the fraction;
 * enums become their raw value; structs are not convertible.
 */
[[nodiscard]] ResolveResult<std::string> stringify(const Value & value);

/**
 * Flatten layered value maps; later maps win on key collision.
 */
[[nodiscard]] ValueMap merge_constants(const std::vector<ValueMap> & layers);

}  // namespace stencil
