// stencil/basic/error.hpp - Resolution error representation
//
// Errors produced while resolving, coercing and composing layout nodes.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace stencil
{

struct Diagnostic;
class DiagnosticBag;

// ============================================================================
// Error Kind
// ============================================================================

/**
 * Kind of resolution error.
 */
enum class ErrorKind : uint8_t {
  TypeMismatch,           ///< Value cannot satisfy the descriptor's kind
  UnknownEnumCase,        ///< Text is not a case name of the enum
  UndefinedSymbol,        ///< Name not found in the symbol chain
  DuplicateSymbol,        ///< Name already defined in this table
  MissingRequiredValue,   ///< Absent value for a non-optional property
  UnexpectedAbsentValue,  ///< Unwrapping produced the absence marker
  MergeFailure,           ///< Deferred subtree could not be merged (wraps a cause)
  UnknownProperty,        ///< Property not declared for the target type
  InvalidExpression,      ///< Malformed literal, evaluator failure or circular reference
  ResourceError,          ///< Template resource could not be loaded
};

/// Stable diagnostic code for an error kind (e.g. "E1003")
[[nodiscard]] std::string_view error_code(ErrorKind kind) noexcept;

/// Human readable name of an error kind
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// ============================================================================
// Resolve Error
// ============================================================================

/**
 * A resolution failure.
 *
 * `subject` names the offending symbol, enum case or field. `property` and
 * `target_type` are filled in as the error travels outward so the final error
 * always identifies where it originated. `cause` is set for MergeFailure.
 */
struct ResolveError
{
  ErrorKind kind = ErrorKind::TypeMismatch;
  std::string message;
  std::string subject;
  std::string property;
  std::string target_type;
  std::string template_path;
  std::shared_ptr<const ResolveError> cause;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static ResolveError type_mismatch(std::string message);
  static ResolveError unknown_enum_case(std::string_view name);
  static ResolveError undefined_symbol(std::string_view name);
  static ResolveError duplicate_symbol(std::string_view name);
  static ResolveError missing_required_value(std::string_view name);
  static ResolveError unexpected_absent_value();
  static ResolveError unknown_property(std::string_view name, std::string_view target_type);
  static ResolveError invalid_expression(std::string_view expression, std::string message);
  static ResolveError resource_error(std::string_view path, std::string message);

  /// Wrap an error produced on the deferred path
  static ResolveError merge_failure(ResolveError cause);

  // ===========================================================================
  // Context
  // ===========================================================================

  /// Attach property/target context if not already present
  ResolveError & in_property(std::string_view target, std::string_view name);

  /// Attach the template path if not already present
  ResolveError & in_template(std::string_view path);

  /// Innermost cause (this error itself when not wrapped)
  [[nodiscard]] const ResolveError & root_cause() const noexcept;

  [[nodiscard]] std::string_view code() const noexcept { return error_code(kind); }

  /// Message including property context, e.g. "Label.text: undefined symbol 'x'"
  [[nodiscard]] std::string describe() const;

  /// Report as an error into `bag`. A wrapped error also points at its root cause.
  void report(DiagnosticBag & bag) const;

  /// Convert to a Diagnostic (severity Error)
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

}  // namespace stencil
