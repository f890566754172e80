// stencil/resolution/expression_resolver.cpp - Property source evaluation
//
#include "stencil/resolution/expression_resolver.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include "stencil/types/optional.hpp"

namespace stencil
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

bool is_ident_start(char c)
{
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// `name` or `a.b.c`, each segment starting with a letter or underscore
bool is_identifier(std::string_view s)
{
  if (s.empty()) {
    return false;
  }
  bool segment_start = true;
  for (char c : s) {
    if (segment_start) {
      if (!is_ident_start(c)) return false;
      segment_start = false;
    } else if (c == '.') {
      segment_start = true;
    } else if (!is_ident_char(c)) {
      return false;
    }
  }
  return !segment_start;
}

std::optional<Value> parse_number(std::string_view s)
{
  size_t i = 0;
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;

  size_t digits = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
    ++i;
    ++digits;
  }
  bool is_float = false;
  if (i < s.size() && s[i] == '.') {
    is_float = true;
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) {
    return std::nullopt;
  }
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    is_float = true;
    ++i;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    size_t exp_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) {
      return std::nullopt;
    }
  }
  if (i != s.size()) {
    return std::nullopt;
  }

  if (!is_float) {
    std::string_view digits_view = s;
    if (!digits_view.empty() && digits_view.front() == '+') digits_view.remove_prefix(1);
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(digits_view.data(), digits_view.data() + digits_view.size(), out);
    if (ec == std::errc() && ptr == digits_view.data() + digits_view.size()) {
      return Value::make_integer(out);
    }
    // Out of int64 range: fall through to floating point
  }
  const std::string text(s);
  return Value::make_float(std::strtod(text.c_str(), nullptr));
}

/// Literal forms understood without a symbol table
std::optional<Value> parse_literal(std::string_view s)
{
  if (s == "nil" || s == "null") {
    return Value::make_null();
  }
  if (s == "true") {
    return Value::make_bool(true);
  }
  if (s == "false") {
    return Value::make_bool(false);
  }
  if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') && s.back() == s.front() &&
      s.substr(1, s.size() - 2).find(s.front()) == std::string_view::npos) {
    return Value::make_string(std::string(s.substr(1, s.size() - 2)));
  }
  return parse_number(s);
}

}  // namespace

ExpressionResolver::ExpressionResolver(std::shared_ptr<const ExpressionEvaluator> evaluator)
: evaluator_(std::move(evaluator)), text_descriptor_(TypeDescriptor::make_text())
{
}

// ============================================================================
// Public API
// ============================================================================

ResolveResult<Value> ExpressionResolver::evaluate(
  std::string_view target_type, std::string_view property, std::string_view source,
  const TypeDescriptor & descriptor, const SymbolLookup & symbols) const
{
  auto raw = descriptor.kind() == DescriptorKind::Text
               ? evaluate_template(source, symbols)
               : evaluate_source(source, descriptor, symbols);
  if (!raw) {
    ResolveError err = std::move(raw).error();
    err.in_property(target_type, property);
    return err;
  }
  return coerce(target_type, property, raw.value(), descriptor);
}

ResolveResult<Value> ExpressionResolver::resolve_property(
  std::string_view name, std::string_view source, const PropertyTypes & descriptors,
  const SymbolLookup & symbols, std::string_view target_type) const
{
  auto it = descriptors.find(name);
  if (it == descriptors.end()) {
    return ResolveError::unknown_property(name, target_type);
  }
  return evaluate(target_type, name, source, *it->second, symbols);
}

ResolveResult<Value> ExpressionResolver::coerce(
  std::string_view target_type, std::string_view property, const Value & value,
  const TypeDescriptor & descriptor) const
{
  auto result = finish(value, descriptor, property);
  if (!result) {
    ResolveError err = std::move(result).error();
    err.in_property(target_type, property);
    return err;
  }
  return result;
}

// ============================================================================
// Source Forms
// ============================================================================

ResolveResult<Value> ExpressionResolver::evaluate_source(
  std::string_view source, const TypeDescriptor & descriptor, const SymbolLookup & symbols) const
{
  const std::string_view s = trim(source);
  if (s.empty()) {
    return ResolveError::invalid_expression(source, "empty expression");
  }

  if (auto literal = parse_literal(s)) {
    return std::move(*literal);
  }

  if (s.front() == '$') {
    const std::string_view name = s.substr(1);
    if (!is_identifier(name)) {
      return ResolveError::invalid_expression(
        s, "invalid symbol reference '" + std::string(s) + "'");
    }
    return resolve_symbol(name, symbols);
  }

  if (is_identifier(s)) {
    // Case names win over symbols of the same spelling
    if (descriptor.is_enum()) {
      if (const Value * c = descriptor.find_case(s)) {
        return *c;
      }
    }
    return resolve_symbol(s, symbols);
  }

  return delegate(s, descriptor, symbols);
}

ResolveResult<Value> ExpressionResolver::evaluate_template(
  std::string_view source, const SymbolLookup & symbols) const
{
  const std::string_view t = trim(source);
  if (t.size() > 1 && t.front() == '$' && is_identifier(t.substr(1))) {
    return resolve_symbol(t.substr(1), symbols);
  }

  // A template that is exactly one `{expr}` keeps the expression's value,
  // so an absent value stays absent
  if (t.size() >= 2 && t.front() == '{' && t.find('}') == t.size() - 1 &&
      t.find('{', 1) == std::string_view::npos) {
    const std::string_view inner = trim(t.substr(1, t.size() - 2));
    if (inner.empty()) {
      return ResolveError::invalid_expression(source, "empty '{}' in text template");
    }
    return evaluate_source(inner, *text_descriptor_, symbols);
  }

  std::string out;
  size_t pos = 0;
  while (pos < source.size()) {
    const size_t open = source.find('{', pos);
    const size_t stray = source.find('}', pos);
    if (stray < open) {
      return ResolveError::invalid_expression(source, "unmatched '}' in text template");
    }
    if (open == std::string_view::npos) {
      out.append(source.substr(pos));
      break;
    }
    out.append(source.substr(pos, open - pos));

    const size_t close = source.find('}', open + 1);
    if (close == std::string_view::npos) {
      return ResolveError::invalid_expression(source, "unterminated '{' in text template");
    }
    const std::string_view segment = trim(source.substr(open + 1, close - open - 1));
    if (segment.empty() || segment.find('{') != std::string_view::npos) {
      return ResolveError::invalid_expression(source, "malformed '{...}' in text template");
    }

    auto value = evaluate_source(segment, *text_descriptor_, symbols);
    if (!value) {
      return std::move(value).error();
    }
    auto text = stringify(value.value());
    if (!text) {
      return std::move(text).error();
    }
    out += text.value();
    pos = close + 1;
  }
  return Value::make_string(std::move(out));
}

ResolveResult<Value> ExpressionResolver::resolve_symbol(
  std::string_view name, const SymbolLookup & symbols) const
{
  auto direct = symbols.resolve(name);
  if (direct || direct.error().kind != ErrorKind::UndefinedSymbol) {
    return direct;
  }

  // `a.b.c`: resolve `a`, then walk struct fields
  const size_t dot = name.find('.');
  if (dot == std::string_view::npos) {
    return direct;
  }
  auto head = symbols.resolve(name.substr(0, dot));
  if (!head) {
    return direct;
  }

  Value current = std::move(head).value();
  std::string_view rest = name.substr(dot + 1);
  while (!rest.empty()) {
    const size_t next = rest.find('.');
    const std::string_view field_name = rest.substr(0, next);
    auto unwrapped = unwrap_or_absent(current);
    if (!unwrapped || !unwrapped->is_struct()) {
      return direct;
    }
    const Value * field = unwrapped->field(field_name);
    if (field == nullptr) {
      return direct;
    }
    current = *field;
    rest = next == std::string_view::npos ? std::string_view() : rest.substr(next + 1);
  }
  return current;
}

ResolveResult<Value> ExpressionResolver::delegate(
  std::string_view source, const TypeDescriptor & descriptor, const SymbolLookup & symbols) const
{
  if (!evaluator_) {
    return ResolveError::invalid_expression(
      source, "'" + std::string(source) + "' is not a literal or symbol reference");
  }
  return evaluator_->evaluate(source, descriptor, symbols);
}

ResolveResult<Value> ExpressionResolver::finish(
  const Value & raw, const TypeDescriptor & descriptor, std::string_view property)
{
  if (is_absent(raw)) {
    if (descriptor.is_optional()) {
      return Value::make_null();
    }
    return ResolveError::missing_required_value(property);
  }
  return descriptor.resolve(raw);
}

}  // namespace stencil
