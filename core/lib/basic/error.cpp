// stencil/basic/error.cpp - Resolution error implementation
//
#include "stencil/basic/error.hpp"

#include <utility>

#include "stencil/basic/diagnostic.hpp"

namespace stencil
{

std::string_view error_code(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::TypeMismatch:
      return "E1001";
    case ErrorKind::UnknownEnumCase:
      return "E1002";
    case ErrorKind::UndefinedSymbol:
      return "E1003";
    case ErrorKind::DuplicateSymbol:
      return "E1004";
    case ErrorKind::MissingRequiredValue:
      return "E1005";
    case ErrorKind::UnexpectedAbsentValue:
      return "E1006";
    case ErrorKind::MergeFailure:
      return "E1007";
    case ErrorKind::UnknownProperty:
      return "E1008";
    case ErrorKind::InvalidExpression:
      return "E1009";
    case ErrorKind::ResourceError:
      return "E1010";
  }
  return "E1000";
}

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::TypeMismatch:
      return "TypeMismatch";
    case ErrorKind::UnknownEnumCase:
      return "UnknownEnumCase";
    case ErrorKind::UndefinedSymbol:
      return "UndefinedSymbol";
    case ErrorKind::DuplicateSymbol:
      return "DuplicateSymbol";
    case ErrorKind::MissingRequiredValue:
      return "MissingRequiredValue";
    case ErrorKind::UnexpectedAbsentValue:
      return "UnexpectedAbsentValue";
    case ErrorKind::MergeFailure:
      return "MergeFailure";
    case ErrorKind::UnknownProperty:
      return "UnknownProperty";
    case ErrorKind::InvalidExpression:
      return "InvalidExpression";
    case ErrorKind::ResourceError:
      return "ResourceError";
  }
  return "Unknown";
}

// ============================================================================
// Factory Methods
// ============================================================================

namespace
{

ResolveError make(ErrorKind kind, std::string message, std::string_view subject = {})
{
  ResolveError e;
  e.kind = kind;
  e.message = std::move(message);
  e.subject = std::string(subject);
  return e;
}

}  // namespace

ResolveError ResolveError::type_mismatch(std::string message)
{
  return make(ErrorKind::TypeMismatch, std::move(message));
}

ResolveError ResolveError::unknown_enum_case(std::string_view name)
{
  return make(ErrorKind::UnknownEnumCase, "unknown enum case '" + std::string(name) + "'", name);
}

ResolveError ResolveError::undefined_symbol(std::string_view name)
{
  return make(ErrorKind::UndefinedSymbol, "undefined symbol '" + std::string(name) + "'", name);
}

ResolveError ResolveError::duplicate_symbol(std::string_view name)
{
  return make(
    ErrorKind::DuplicateSymbol, "symbol '" + std::string(name) + "' is already defined", name);
}

ResolveError ResolveError::missing_required_value(std::string_view name)
{
  return make(
    ErrorKind::MissingRequiredValue, "missing value for required '" + std::string(name) + "'",
    name);
}

ResolveError ResolveError::unexpected_absent_value()
{
  return make(ErrorKind::UnexpectedAbsentValue, "unexpected nil value");
}

ResolveError ResolveError::unknown_property(std::string_view name, std::string_view target_type)
{
  auto e = make(
    ErrorKind::UnknownProperty,
    "'" + std::string(target_type) + "' has no property named '" + std::string(name) + "'", name);
  e.target_type = std::string(target_type);
  e.property = std::string(name);
  return e;
}

ResolveError ResolveError::invalid_expression(std::string_view expression, std::string message)
{
  return make(ErrorKind::InvalidExpression, std::move(message), expression);
}

ResolveError ResolveError::resource_error(std::string_view path, std::string message)
{
  auto e = make(ErrorKind::ResourceError, std::move(message), path);
  e.template_path = std::string(path);
  return e;
}

ResolveError ResolveError::merge_failure(ResolveError cause)
{
  ResolveError e;
  e.kind = ErrorKind::MergeFailure;
  e.message = "failed to merge deferred template: " + cause.describe();
  e.template_path = cause.template_path;
  e.cause = std::make_shared<const ResolveError>(std::move(cause));
  return e;
}

// ============================================================================
// Context
// ============================================================================

ResolveError & ResolveError::in_property(std::string_view target, std::string_view name)
{
  if (property.empty()) {
    property = std::string(name);
    target_type = std::string(target);
  } else if (target_type.empty()) {
    target_type = std::string(target);
  }
  return *this;
}

ResolveError & ResolveError::in_template(std::string_view path)
{
  if (template_path.empty()) {
    template_path = std::string(path);
  }
  return *this;
}

const ResolveError & ResolveError::root_cause() const noexcept
{
  const ResolveError * e = this;
  while (e->cause) {
    e = e->cause.get();
  }
  return *e;
}

std::string ResolveError::describe() const
{
  Location loc;
  loc.target_type = target_type;
  loc.property = property;
  const std::string where = loc.qualified_property();
  return where.empty() ? message : where + ": " + message;
}

void ResolveError::report(DiagnosticBag & bag) const
{
  auto builder = bag.report_error(
    Location{template_path, target_type, property}, message, std::string(to_string(kind)));
  builder.with_code(std::string(code()));
  if (!cause) {
    return;
  }
  const ResolveError & root = root_cause();
  const Location root_location{root.template_path, root.target_type, root.property};
  if (root_location.is_valid()) {
    builder.with_secondary_label(root_location, std::string(to_string(root.kind)));
  }
  builder.with_note("caused by [" + std::string(root.code()) + "] " + root.describe());
}

Diagnostic ResolveError::to_diagnostic() const
{
  DiagnosticBag bag;
  report(bag);
  return bag.all().front();
}

}  // namespace stencil
