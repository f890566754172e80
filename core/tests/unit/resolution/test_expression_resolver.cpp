// tests/unit/resolution/test_expression_resolver.cpp - Unit tests for property source evaluation
//
// Covers literals, symbol references, dotted paths, text templates,
// optional handling and delegation to an external evaluator.
//

#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>

#include "stencil/resolution/expression_resolver.hpp"
#include "stencil/resolution/symbol_table.hpp"
#include "stencil/types/type_descriptor.hpp"

using namespace stencil;

// ============================================================================
// Test Helper
// ============================================================================

namespace
{

/// Evaluates `a + b` over integer literals and symbols; counts calls
class SumEvaluator : public ExpressionEvaluator
{
public:
  ResolveResult<Value> evaluate(
    std::string_view expression, const TypeDescriptor & expected,
    const SymbolLookup & symbols) const override
  {
    (void)expected;
    ++calls;
    const size_t plus = expression.find('+');
    if (plus == std::string_view::npos) {
      return ResolveError::invalid_expression(expression, "unsupported expression");
    }
    auto operand = [&symbols](std::string_view s) -> ResolveResult<Value> {
      while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
      while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
      if (!s.empty() && std::isdigit(static_cast<unsigned char>(s.front()))) {
        return Value::make_integer(std::stoll(std::string(s)));
      }
      return symbols.resolve(s);
    };
    auto lhs = operand(expression.substr(0, plus));
    if (!lhs) return lhs;
    auto rhs = operand(expression.substr(plus + 1));
    if (!rhs) return rhs;
    return Value::make_integer(lhs.value().as_integer() + rhs.value().as_integer());
  }

  mutable std::atomic<int> calls{0};
};

struct Fixture
{
  SymbolTable symbols;
  ExpressionResolver resolver;

  Fixture()
  {
    (void)symbols.define("count", Value::make_integer(3), true);
    (void)symbols.define("name", Value::make_string("World"), true);
    (void)symbols.define("missing", Value::make_empty_optional(), true);
    (void)symbols.define(
      "layer", Value::make_struct({{"cornerRadius", Value::make_float(6)}}), true);
  }

  ResolveResult<Value> eval(std::string_view source, const TypeDescriptorPtr & descriptor)
  {
    return resolver.evaluate("View", "prop", source, *descriptor, symbols);
  }
};

}  // namespace

// ============================================================================
// Literals
// ============================================================================

TEST(ResolutionExpressionResolver, Literals)
{
  Fixture f;
  EXPECT_EQ(f.eval("true", TypeDescriptor::make_bool()).value(), Value::make_bool(true));
  EXPECT_EQ(f.eval(" 42 ", TypeDescriptor::make_integer()).value(), Value::make_integer(42));
  EXPECT_EQ(f.eval("-1.5", TypeDescriptor::make_float()).value(), Value::make_float(-1.5));
  EXPECT_EQ(f.eval("1e2", TypeDescriptor::make_float()).value(), Value::make_float(100.0));
  EXPECT_EQ(f.eval("0.5", TypeDescriptor::make_float()).value(), Value::make_float(0.5));
}

TEST(ResolutionExpressionResolver, IntegerOverflowBecomesFloat)
{
  Fixture f;
  auto r = f.eval("99999999999999999999", TypeDescriptor::make_float());
  ASSERT_TRUE(r);
  EXPECT_TRUE(r.value().is_float());

  auto as_int = f.eval("99999999999999999999", TypeDescriptor::make_integer());
  ASSERT_FALSE(as_int);
  EXPECT_EQ(as_int.error().kind, ErrorKind::TypeMismatch);
}

TEST(ResolutionExpressionResolver, NilLiteral)
{
  Fixture f;
  auto opt = f.eval("nil", TypeDescriptor::make_optional(TypeDescriptor::make_integer()));
  ASSERT_TRUE(opt);
  EXPECT_TRUE(opt.value().is_null());

  auto required = f.eval("null", TypeDescriptor::make_integer());
  ASSERT_FALSE(required);
  EXPECT_EQ(required.error().kind, ErrorKind::MissingRequiredValue);
  EXPECT_EQ(required.error().subject, "prop");
  EXPECT_EQ(required.error().property, "prop");
  EXPECT_EQ(required.error().target_type, "View");
}

// ============================================================================
// Symbols
// ============================================================================

TEST(ResolutionExpressionResolver, SymbolReference)
{
  Fixture f;
  EXPECT_EQ(f.eval("count", TypeDescriptor::make_integer()).value(), Value::make_integer(3));
  EXPECT_EQ(f.eval("$count", TypeDescriptor::make_float()).value(), Value::make_float(3.0));
  EXPECT_EQ(f.eval("layer.cornerRadius", TypeDescriptor::make_float()).value(), Value::make_float(6.0));

  auto undefined = f.eval("layer.borderWidth", TypeDescriptor::make_float());
  ASSERT_FALSE(undefined);
  EXPECT_EQ(undefined.error().kind, ErrorKind::UndefinedSymbol);
  EXPECT_EQ(undefined.error().subject, "layer.borderWidth");
}

TEST(ResolutionExpressionResolver, DottedNameDefinedDirectly)
{
  Fixture f;
  ASSERT_FALSE(f.symbols.define("layer.borderWidth", Value::make_float(1), true));
  EXPECT_EQ(f.eval("layer.borderWidth", TypeDescriptor::make_float()).value(), Value::make_float(1.0));
}

TEST(ResolutionExpressionResolver, AbsentSymbol)
{
  Fixture f;
  auto opt = f.eval("missing", TypeDescriptor::make_optional(TypeDescriptor::make_integer()));
  ASSERT_TRUE(opt);
  EXPECT_TRUE(opt.value().is_null());

  auto required = f.eval("missing", TypeDescriptor::make_integer());
  ASSERT_FALSE(required);
  EXPECT_EQ(required.error().kind, ErrorKind::MissingRequiredValue);
}

TEST(ResolutionExpressionResolver, InvalidForms)
{
  Fixture f;
  auto empty = f.eval("  ", TypeDescriptor::make_integer());
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().kind, ErrorKind::InvalidExpression);

  auto bad_ref = f.eval("$1x", TypeDescriptor::make_integer());
  ASSERT_FALSE(bad_ref);
  EXPECT_EQ(bad_ref.error().kind, ErrorKind::InvalidExpression);

  // Without an evaluator, composed expressions are rejected
  auto composed = f.eval("count + 1", TypeDescriptor::make_integer());
  ASSERT_FALSE(composed);
  EXPECT_EQ(composed.error().kind, ErrorKind::InvalidExpression);
  EXPECT_FALSE(f.resolver.has_evaluator());
}

// ============================================================================
// Text Templates
// ============================================================================

TEST(ResolutionExpressionResolver, TextIsLiteralByDefault)
{
  Fixture f;
  EXPECT_EQ(f.eval("count", TypeDescriptor::make_text()).value(), Value::make_string("count"));
  EXPECT_EQ(f.eval("$name", TypeDescriptor::make_text()).value(), Value::make_string("World"));
}

TEST(ResolutionExpressionResolver, TextInterpolation)
{
  Fixture f;
  EXPECT_EQ(
    f.eval("Hello {name}, {count} items", TypeDescriptor::make_text()).value(),
    Value::make_string("Hello World, 3 items"));
  EXPECT_EQ(
    f.eval("r={layer.cornerRadius}", TypeDescriptor::make_text()).value(),
    Value::make_string("r=6"));
  EXPECT_EQ(f.eval("{count}", TypeDescriptor::make_text()).value(), Value::make_string("3"));
}

TEST(ResolutionExpressionResolver, EnumSymbolInTextAgreesAcrossForms)
{
  Fixture f;
  ASSERT_FALSE(f.symbols.define("mode", Value::make_enum("ContentMode", 4), true));

  auto whole = f.eval("{mode}", TypeDescriptor::make_text());
  ASSERT_TRUE(whole) << whole.error().describe();
  EXPECT_EQ(whole.value(), Value::make_string("4"));
  EXPECT_EQ(f.eval("m={mode}", TypeDescriptor::make_text()).value(), Value::make_string("m=4"));
  EXPECT_EQ(f.eval("$mode", TypeDescriptor::make_text()).value(), Value::make_string("4"));
}

TEST(ResolutionExpressionResolver, SingleSegmentKeepsAbsence)
{
  Fixture f;
  auto opt = f.eval("{missing}", TypeDescriptor::make_optional(TypeDescriptor::make_text()));
  ASSERT_TRUE(opt);
  EXPECT_TRUE(opt.value().is_null());

  // Interpolating an absent value into surrounding text fails
  auto embedded = f.eval("x{missing}", TypeDescriptor::make_text());
  ASSERT_FALSE(embedded);
  EXPECT_EQ(embedded.error().kind, ErrorKind::UnexpectedAbsentValue);
}

TEST(ResolutionExpressionResolver, MalformedTemplates)
{
  Fixture f;
  for (const char * source : {"a } b", "open {name", "empty {}", "{ }"}) {
    auto r = f.eval(source, TypeDescriptor::make_text());
    ASSERT_FALSE(r) << source;
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidExpression) << source;
  }
}

// ============================================================================
// Property Lookup / Coercion
// ============================================================================

TEST(ResolutionExpressionResolver, ResolvePropertyUnknown)
{
  Fixture f;
  PropertyTypes props;
  props["alpha"] = TypeDescriptor::make_float();

  EXPECT_EQ(
    f.resolver.resolve_property("alpha", "0.5", props, f.symbols, "View").value(),
    Value::make_float(0.5));

  auto unknown = f.resolver.resolve_property("beta", "1", props, f.symbols, "View");
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().kind, ErrorKind::UnknownProperty);
  EXPECT_EQ(unknown.error().target_type, "View");
}

TEST(ResolutionExpressionResolver, CoerceTagsErrors)
{
  const ExpressionResolver resolver;
  auto r = resolver.coerce("Label", "numberOfLines", Value::make_string("x"), *TypeDescriptor::make_integer());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::TypeMismatch);
  EXPECT_EQ(r.error().describe().rfind("Label.numberOfLines: ", 0), 0U);
}

TEST(ResolutionExpressionResolver, Idempotent)
{
  Fixture f;
  auto descriptor = TypeDescriptor::make_text();
  auto first = f.eval("Hello {name}", descriptor);
  auto second = f.eval("Hello {name}", descriptor);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first.value(), second.value());
}

// ============================================================================
// Delegation
// ============================================================================

TEST(ResolutionExpressionResolver, DelegatesComposedExpressions)
{
  auto evaluator = std::make_shared<SumEvaluator>();
  SymbolTable symbols;
  ASSERT_FALSE(symbols.define("count", Value::make_integer(3), true));
  const ExpressionResolver resolver(evaluator);
  ASSERT_TRUE(resolver.has_evaluator());

  auto sum = resolver.evaluate("View", "tag", "count + 4", *TypeDescriptor::make_integer(), symbols);
  ASSERT_TRUE(sum);
  EXPECT_EQ(sum.value(), Value::make_integer(7));
  EXPECT_EQ(evaluator->calls.load(), 1);

  // Literals and symbols never reach the evaluator
  EXPECT_TRUE(resolver.evaluate("View", "tag", "count", *TypeDescriptor::make_integer(), symbols));
  EXPECT_TRUE(resolver.evaluate("View", "tag", "5", *TypeDescriptor::make_integer(), symbols));
  EXPECT_EQ(evaluator->calls.load(), 1);

  // The evaluator's result is coerced afterwards
  auto as_float = resolver.evaluate("View", "alpha", "1 + 1", *TypeDescriptor::make_float(), symbols);
  ASSERT_TRUE(as_float);
  EXPECT_EQ(as_float.value(), Value::make_float(2.0));

  auto failed = resolver.evaluate("View", "tag", "count * 2", *TypeDescriptor::make_integer(), symbols);
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().kind, ErrorKind::InvalidExpression);
  EXPECT_EQ(failed.error().property, "tag");
}
