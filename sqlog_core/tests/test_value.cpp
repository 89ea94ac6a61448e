#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "sqlog/value.hpp"

using sqlog::Fields;
using sqlog::Value;
using sqlog::ValueType;

TEST(Value, DefaultIsNull)
{
  Value v;
  EXPECT_TRUE(v.IsNull());
  EXPECT_TRUE(v.IsScalar());
  EXPECT_EQ(Value(nullptr), v);
}

TEST(Value, ScalarConstructorsPickType)
{
  EXPECT_EQ(Value(true).Type(), ValueType::Bool);
  EXPECT_EQ(Value(42).Type(), ValueType::Int);
  EXPECT_EQ(Value(42u).Type(), ValueType::Int);
  EXPECT_EQ(Value(int64_t{-7}).Type(), ValueType::Int);
  EXPECT_EQ(Value(1.5).Type(), ValueType::Double);
  EXPECT_EQ(Value(1.5f).Type(), ValueType::Double);
  EXPECT_EQ(Value("text").Type(), ValueType::String);
  EXPECT_EQ(Value(std::string("text")).Type(), ValueType::String);
}

TEST(Value, UnsignedAboveInt64MaxKeepsItsDigits)
{
  const uint64_t big = 18446744073709551615ull;
  Value v(big);
  ASSERT_EQ(v.Type(), ValueType::String);
  EXPECT_EQ(v.AsString(), "18446744073709551615");

  const uint64_t fits = 9223372036854775807ull;
  EXPECT_EQ(Value(fits).Type(), ValueType::Int);
  EXPECT_EQ(Value(fits).AsInt(), 9223372036854775807ll);
}

TEST(Value, Accessors)
{
  EXPECT_TRUE(Value(true).AsBool());
  EXPECT_EQ(Value(42).AsInt(), 42);
  EXPECT_DOUBLE_EQ(Value(2.25).AsDouble(), 2.25);
  EXPECT_DOUBLE_EQ(Value(3).AsDouble(), 3.0);
  EXPECT_EQ(Value("abc").AsString(), "abc");
}

TEST(Value, WrongAccessorThrowsLogicError)
{
  EXPECT_THROW(Value("abc").AsInt(), std::logic_error);
  EXPECT_THROW(Value(1).AsString(), std::logic_error);
  EXPECT_THROW(Value().AsBool(), std::logic_error);
  EXPECT_THROW(Value(1.0).AsArray(), std::logic_error);
}

TEST(Value, NestedContainers)
{
  Value v = Value::MakeObject({
      {"user", Value::MakeObject({{"id", 7}, {"name", "ann"}})},
      {"tags", Value::MakeArray({"a", "b"})},
  });
  ASSERT_EQ(v.Type(), ValueType::Object);
  EXPECT_FALSE(v.IsScalar());
  const auto& obj = v.AsObject();
  ASSERT_EQ(obj.size(), 2u);
  EXPECT_EQ(obj.at("user").AsObject().at("id").AsInt(), 7);
  EXPECT_EQ(obj.at("tags").AsArray().size(), 2u);
  EXPECT_EQ(obj.at("tags").AsArray()[1].AsString(), "b");
}

TEST(Value, CopiesShareContainerAndCompareEqual)
{
  Value a = Value::MakeArray({1, 2, 3});
  Value b = a;
  EXPECT_EQ(a, b);
  EXPECT_EQ(&a.AsArray(), &b.AsArray());

  Value c = Value::MakeArray({1, 2, 3});
  EXPECT_EQ(a, c);
  EXPECT_NE(a, Value::MakeArray({1, 2}));
}

TEST(Value, EqualityIsTypeSensitive)
{
  EXPECT_NE(Value(1), Value(1.0));
  EXPECT_NE(Value(true), Value(1));
  EXPECT_NE(Value("1"), Value(1));
}

TEST(Value, FieldsAreKeyOrdered)
{
  Fields f{{"zeta", 1}, {"alpha", 2}, {"mid", 3}};
  auto it = f.begin();
  EXPECT_EQ(it->first, "alpha");
  ++it;
  EXPECT_EQ(it->first, "mid");
  ++it;
  EXPECT_EQ(it->first, "zeta");
}
