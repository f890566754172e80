// tests/unit/types/test_type_descriptor.cpp - Unit tests for type descriptors
//
// Covers primitive coercion, enum cases and adaptors, structured values
// and optional descriptors.
//

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "stencil/types/type_descriptor.hpp"
#include "unit/test_catalog.hpp"

using namespace stencil;
using stencil::test_support::content_mode_descriptor;
using stencil::test_support::insets_descriptor;

// ============================================================================
// Primitives
// ============================================================================

TEST(TypesDescriptor, PrimitiveCoercion)
{
  auto b = TypeDescriptor::make_bool();
  auto i = TypeDescriptor::make_integer();
  auto f = TypeDescriptor::make_float();
  auto t = TypeDescriptor::make_text();

  EXPECT_EQ(b->resolve(Value::make_bool(false)).value(), Value::make_bool(false));
  EXPECT_EQ(i->resolve(Value::make_float(3.0)).value(), Value::make_integer(3));
  EXPECT_EQ(f->resolve(Value::make_integer(2)).value(), Value::make_float(2.0));
  EXPECT_EQ(t->resolve(Value::make_integer(42)).value(), Value::make_string("42"));
  EXPECT_EQ(t->resolve(Value::make_bool(true)).value(), Value::make_string("true"));
  EXPECT_EQ(t->resolve(Value::make_enum("ContentMode", 4)).value(), Value::make_string("4"));
}

TEST(TypesDescriptor, PrimitiveMismatch)
{
  auto r = TypeDescriptor::make_integer()->resolve(Value::make_float(2.5));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::TypeMismatch);

  r = TypeDescriptor::make_bool()->resolve(Value::make_string("true"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::TypeMismatch);

  r = TypeDescriptor::make_text()->resolve(Value::make_struct({}));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::TypeMismatch);
}

TEST(TypesDescriptor, Describe)
{
  EXPECT_EQ(TypeDescriptor::make_float()->describe(), "float");
  EXPECT_EQ(content_mode_descriptor()->describe(), "enum ContentMode");
  EXPECT_EQ(TypeDescriptor::make_optional(insets_descriptor())->describe(), "Insets?");
  EXPECT_EQ(TypeDescriptor::make_object("Image")->describe(), "object Image");
}

// ============================================================================
// Optional
// ============================================================================

TEST(TypesDescriptor, OptionalAcceptsAbsence)
{
  auto opt = TypeDescriptor::make_optional(TypeDescriptor::make_integer());
  EXPECT_TRUE(opt->is_optional());
  EXPECT_EQ(opt->kind(), DescriptorKind::Integer);

  EXPECT_TRUE(opt->resolve(Value::make_null()).value().is_null());
  EXPECT_TRUE(opt->resolve(Value::make_empty_optional()).value().is_null());
  EXPECT_EQ(
    opt->resolve(Value::make_optional(Value::make_optional(Value::make_integer(3)))).value(),
    Value::make_integer(3));

  // Making an optional descriptor optional again is a no-op
  EXPECT_EQ(TypeDescriptor::make_optional(opt), opt);
}

TEST(TypesDescriptor, RequiredRejectsAbsence)
{
  auto r = TypeDescriptor::make_integer()->resolve(Value::make_empty_optional());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::UnexpectedAbsentValue);
}

// ============================================================================
// Enums
// ============================================================================

TEST(TypesDescriptor, EnumCaseName)
{
  auto mode = content_mode_descriptor();
  ASSERT_EQ(mode->cases().size(), 3U);
  ASSERT_NE(mode->find_case("center"), nullptr);
  EXPECT_EQ(*mode->find_case("center"), Value::make_enum("ContentMode", 4));
  EXPECT_EQ(mode->find_case("Center"), nullptr);

  EXPECT_EQ(mode->resolve(Value::make_string("center")).value(), Value::make_enum("ContentMode", 4));

  auto unknown = mode->resolve(Value::make_string("middle"));
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().kind, ErrorKind::UnknownEnumCase);
  EXPECT_EQ(unknown.error().subject, "middle");
}

TEST(TypesDescriptor, EnumDefaultAdaptor)
{
  auto mode = content_mode_descriptor();

  // Raw values need not be one of the named cases
  EXPECT_EQ(mode->resolve(Value::make_integer(2)).value(), Value::make_enum("ContentMode", 2));
  EXPECT_EQ(
    mode->resolve(Value::make_enum("ContentMode", 7)).value(), Value::make_enum("ContentMode", 7));

  auto foreign = mode->resolve(Value::make_enum("TextAlignment", 1));
  ASSERT_FALSE(foreign);
  EXPECT_EQ(foreign.error().kind, ErrorKind::TypeMismatch);

  auto text_adapt = mode->adapt(Value::make_bool(true));
  ASSERT_FALSE(text_adapt);
  EXPECT_EQ(text_adapt.error().kind, ErrorKind::TypeMismatch);
}

TEST(TypesDescriptor, EnumCustomAdaptor)
{
  auto alignment = TypeDescriptor::make_enum(
    "Alignment",
    {
      EnumCase{"leading", Value::make_string("leading")},
      EnumCase{"trailing", Value::make_string("trailing")},
    },
    [](const Value & raw) -> std::optional<Value> {
      if (raw.is_integer() && raw.as_integer() == 0) {
        return Value::make_string("leading");
      }
      return std::nullopt;
    });
  ASSERT_TRUE(alignment);

  EXPECT_EQ(alignment.value()->resolve(Value::make_integer(0)).value(), Value::make_string("leading"));
  EXPECT_EQ(
    alignment.value()->resolve(Value::make_string("trailing")).value(),
    Value::make_string("trailing"));
  EXPECT_FALSE(alignment.value()->resolve(Value::make_integer(1)));
}

TEST(TypesDescriptor, EnumDuplicateCase)
{
  auto dup = TypeDescriptor::make_int_enum("Dup", {{"a", 0}, {"a", 1}});
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error().kind, ErrorKind::DuplicateSymbol);
  EXPECT_EQ(dup.error().subject, "a");
}

// ============================================================================
// Structs
// ============================================================================

TEST(TypesDescriptor, StructCoercesFields)
{
  auto insets = insets_descriptor();
  auto r = insets->resolve(
    Value::make_struct({{"left", Value::make_integer(8)}, {"top", Value::make_integer(4)}}));
  ASSERT_TRUE(r) << r.error().message;

  // Declaration order, fields coerced, optional field filled with nil
  const auto fields = r.value().as_struct();
  ASSERT_EQ(fields.size(), 3U);
  EXPECT_EQ(fields[0].name, "top");
  EXPECT_EQ(fields[0].value, Value::make_float(4.0));
  EXPECT_EQ(fields[1].value, Value::make_float(8.0));
  EXPECT_TRUE(fields[2].value.is_null());
}

TEST(TypesDescriptor, StructErrors)
{
  auto insets = insets_descriptor();

  auto missing = insets->resolve(Value::make_struct({{"top", Value::make_float(1)}}));
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().kind, ErrorKind::MissingRequiredValue);
  EXPECT_EQ(missing.error().subject, "left");

  auto extra = insets->resolve(Value::make_struct({
    {"top", Value::make_float(1)},
    {"left", Value::make_float(1)},
    {"right", Value::make_float(1)},
  }));
  ASSERT_FALSE(extra);
  EXPECT_EQ(extra.error().kind, ErrorKind::TypeMismatch);

  auto bad_field = insets->resolve(Value::make_struct({
    {"top", Value::make_string("x")},
    {"left", Value::make_float(1)},
  }));
  ASSERT_FALSE(bad_field);
  EXPECT_EQ(bad_field.error().kind, ErrorKind::TypeMismatch);
  EXPECT_EQ(bad_field.error().message.rfind("field 'top': ", 0), 0U);

  EXPECT_FALSE(insets->resolve(Value::make_integer(1)));
}

// ============================================================================
// Objects
// ============================================================================

TEST(TypesDescriptor, ObjectMatchedByTag)
{
  auto image = TypeDescriptor::make_object("Image");
  auto any = TypeDescriptor::make_object();
  const Value img = Value::make_object(std::make_shared<int>(1), "Image");
  const Value color = Value::make_object(std::make_shared<int>(2), "Color");

  EXPECT_EQ(image->resolve(img).value(), img);
  EXPECT_FALSE(image->resolve(color));
  EXPECT_EQ(any->resolve(color).value(), color);
  EXPECT_FALSE(any->resolve(Value::make_string("Image")));
}
