// tests/unit/types/test_value.cpp - Unit tests for runtime values
//

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "stencil/types/value.hpp"

using namespace stencil;

TEST(TypesValue, DefaultIsNull)
{
  const Value v;
  EXPECT_TRUE(v.is_null());
  EXPECT_EQ(v, Value::make_null());
  EXPECT_EQ(v.debug_string(), "nil");
}

TEST(TypesValue, NumericConversion)
{
  EXPECT_EQ(Value::make_integer(3).to_float(), 3.0);
  EXPECT_EQ(Value::make_float(4.0).to_integer(), 4);
  EXPECT_FALSE(Value::make_float(4.5).to_integer().has_value());
  EXPECT_FALSE(Value::make_string("4").to_integer().has_value());
  EXPECT_TRUE(Value::make_float(1.5).is_numeric());
}

TEST(TypesValue, Equality)
{
  EXPECT_EQ(Value::make_enum("ContentMode", 4), Value::make_enum("ContentMode", 4));
  EXPECT_NE(Value::make_enum("ContentMode", 4), Value::make_enum("TextAlignment", 4));
  EXPECT_NE(Value::make_integer(1), Value::make_float(1.0));
  EXPECT_EQ(
    Value::make_optional(Value::make_integer(1)), Value::make_optional(Value::make_integer(1)));
  EXPECT_NE(Value::make_optional(Value::make_integer(1)), Value::make_empty_optional());

  auto object = std::make_shared<int>(7);
  EXPECT_EQ(Value::make_object(object, "Image"), Value::make_object(object, "Image"));
  EXPECT_NE(Value::make_object(object, "Image"), Value::make_object(std::make_shared<int>(7), "Image"));
}

TEST(TypesValue, StructFields)
{
  const Value insets = Value::make_struct({{"top", Value::make_float(4)}, {"left", Value::make_float(8)}});
  ASSERT_EQ(insets.as_struct().size(), 2U);
  ASSERT_NE(insets.field("left"), nullptr);
  EXPECT_EQ(insets.field("left")->as_float(), 8.0);
  EXPECT_EQ(insets.field("right"), nullptr);
  EXPECT_EQ(insets.debug_string(), "{top: 4, left: 8}");
}

TEST(TypesValue, DebugString)
{
  EXPECT_EQ(
    Value::make_optional(Value::make_enum("ContentMode", 4)).debug_string(),
    "Optional(Enum(ContentMode, 4))");
  EXPECT_EQ(Value::make_empty_optional().debug_string(), "Optional(nil)");
  EXPECT_EQ(Value::make_string("hi").debug_string(), "\"hi\"");
  EXPECT_EQ(Value::make_float(0.5).debug_string(), "0.5");
}

TEST(TypesValue, Stringify)
{
  EXPECT_EQ(stringify(Value::make_bool(true)).value(), "true");
  EXPECT_EQ(stringify(Value::make_integer(-12)).value(), "-12");
  EXPECT_EQ(stringify(Value::make_float(2.0)).value(), "2");
  EXPECT_EQ(stringify(Value::make_float(0.25)).value(), "0.25");
  EXPECT_EQ(stringify(Value::make_enum("ContentMode", 4)).value(), "4");
  EXPECT_EQ(stringify(Value::make_optional(Value::make_string("x"))).value(), "x");

  auto absent = stringify(Value::make_empty_optional());
  ASSERT_FALSE(absent);
  EXPECT_EQ(absent.error().kind, ErrorKind::UnexpectedAbsentValue);

  auto structured = stringify(Value::make_struct({}));
  ASSERT_FALSE(structured);
  EXPECT_EQ(structured.error().kind, ErrorKind::TypeMismatch);
}

TEST(TypesValue, MergeConstantsLaterLayerWins)
{
  const ValueMap merged = merge_constants({
    {{"a", Value::make_integer(1)}, {"b", Value::make_integer(2)}},
    {{"b", Value::make_integer(3)}},
  });
  ASSERT_EQ(merged.size(), 2U);
  EXPECT_EQ(merged.at("a"), Value::make_integer(1));
  EXPECT_EQ(merged.at("b"), Value::make_integer(3));
}
