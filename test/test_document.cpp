#include "document.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <type_traits>

using namespace jsonmodel;

TEST(DocumentTest, DefaultIsNull) {
  Document doc;
  ASSERT_EQ(doc.type(), Type::Null);
  ASSERT_TRUE(doc.is<Null>());
}

TEST(DocumentTest, TagsFollowPayload) {
  ASSERT_EQ(Document(Boolean(true)).type(), Type::Boolean);
  ASSERT_EQ(Document(Number(1)).type(), Type::Number);
  ASSERT_EQ(Document(String("a")).type(), Type::String);
  ASSERT_EQ(Document(Array()).type(), Type::Array);
  ASSERT_EQ(Document(Object()).type(), Type::Object);
}

TEST(DocumentTest, TypeNames) {
  ASSERT_EQ(to_string(Type::Null), "Null");
  ASSERT_EQ(to_string(Type::Number), "Number");
  ASSERT_EQ(to_string(Type::Object), "Object");
}

TEST(DocumentTest, AsReturnsPayload) {
  Document doc = String("Catarina");
  ASSERT_EQ(doc.as<String>().value(), "Catarina");
  ASSERT_EQ(doc.get_if<Number>(), nullptr);
}

TEST(DocumentTest, AsWrongTypeThrows) {
  Document doc = Number(37);
  ASSERT_THROW(doc.as<String>(), type_error);
  try {
    (void)doc.as<Array>();
    FAIL() << "Expected type_error";
  } catch (const jsonmodel::exception &e) {
    ASSERT_STREQ(e.what(), "Unexpected document type: Number");
  }
}

TEST(DocumentTest, NumberKeepsRepresentation) {
  Number integral(37);
  Number fractional(0.2);
  ASSERT_TRUE(integral.is_integral());
  ASSERT_FALSE(fractional.is_integral());
  ASSERT_EQ(integral.as_int(), 37);
  ASSERT_DOUBLE_EQ(fractional.as_double(), 0.2);
  ASSERT_DOUBLE_EQ(integral.as_double(), 37.0);
  ASSERT_FALSE(Number(2) == Number(2.0));
}

TEST(DocumentTest, NumberText) {
  ASSERT_EQ(Number(37).to_string(), "37");
  ASSERT_EQ(Number(-15).to_string(), "-15");
  ASSERT_EQ(Number(0.2).to_string(), "0.2");
  ASSERT_EQ(Number(9.18).to_string(), "9.18");
  ASSERT_EQ(Number(37.0).to_string(), "37.0");
  ASSERT_EQ(Number(std::numeric_limits<uint64_t>::max()).to_string(),
            "18446744073709551615");
  ASSERT_EQ(Number(std::numeric_limits<int64_t>::min()).to_string(),
            "-9223372036854775808");
}

TEST(DocumentTest, NumberKeepsLargeUnsigned) {
  constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
  Number large(max);
  ASSERT_TRUE(large.is_integral());
  ASSERT_TRUE(large.is_unsigned());
  ASSERT_EQ(large.as_uint(), max);
  ASSERT_DOUBLE_EQ(large.as_double(), 18446744073709551615.0);

  ASSERT_FALSE(Number(7u).is_unsigned());
  ASSERT_EQ(Number(7u), Number(7));
  ASSERT_EQ(Number(uint64_t{9223372036854775807u}),
            Number(std::numeric_limits<int64_t>::max()));
  ASSERT_NE(Number(uint64_t{9223372036854775808u}),
            Number(std::numeric_limits<int64_t>::min()));
}

TEST(DocumentTest, NumberRejectsCharacters) {
  static_assert(!std::is_constructible_v<Number, char>);
  static_assert(!std::is_constructible_v<Number, wchar_t>);
  static_assert(!std::is_constructible_v<Number, char8_t>);
  static_assert(!std::is_constructible_v<Number, char16_t>);
  static_assert(!std::is_constructible_v<Number, char32_t>);
  static_assert(!std::is_constructible_v<Number, bool>);
  static_assert(std::is_constructible_v<Number, signed char>);
  ASSERT_EQ(Number(static_cast<signed char>(-5)).to_string(), "-5");
}

TEST(DocumentTest, ArrayAccessorsAreReadOnly) {
  Array array{Number(1), Number(2), Number(3)};
  static_assert(std::is_const_v<
                std::remove_reference_t<decltype(array.values()[0])>>);
  ASSERT_EQ(array.size(), 3u);
  ASSERT_EQ(array.values()[1], Document(Number(2)));

  Array copy = array;
  ASSERT_EQ(copy, array);
  ASSERT_EQ(copy.values().data(), array.values().data());
}

TEST(DocumentTest, ObjectLookup) {
  Object object{{"name", String("Catarina")}, {"age", Number(37)}};
  ASSERT_EQ(object.size(), 2u);
  ASSERT_TRUE(object.contains("age"));
  ASSERT_FALSE(object.contains("scores"));
  ASSERT_EQ(*object.find("age"), Document(Number(37)));
  ASSERT_EQ(object.find("scores"), nullptr);
  ASSERT_EQ(object.entries()[0].first, "name");
}

TEST(DocumentTest, ObjectKeepsDuplicateKeys) {
  Object object{{"a", Number(1)}, {"a", Number(2)}};
  ASSERT_EQ(object.size(), 2u);
  ASSERT_EQ(*object.find("a"), Document(Number(1)));
}

TEST(DocumentTest, StructuralEquality) {
  Document lhs = Object{{"scores", Array{Number(17), Number(15)}},
                        {"isStudent", Boolean(true)}};
  Document rhs = Object{{"scores", Array{Number(17), Number(15)}},
                        {"isStudent", Boolean(true)}};
  ASSERT_EQ(lhs, rhs);
  ASSERT_NE(lhs, Document(Object{{"scores", Array{Number(15), Number(17)}},
                                 {"isStudent", Boolean(true)}}));
  ASSERT_NE(Document(Null()), Document(Boolean(false)));
}

TEST(DocumentTest, ObjectEqualityIgnoresOrder) {
  Object lhs{{"a", Number(1)}, {"b", Number(2)}};
  Object rhs{{"b", Number(2)}, {"a", Number(1)}};
  ASSERT_EQ(lhs, rhs);
  ASSERT_NE(lhs, (Object{{"a", Number(1)}}));
}

TEST(DocumentTest, ObjectEqualityCountsDuplicateKeys) {
  Object twice{{"a", Number(1)}, {"a", Number(1)}};
  Object distinct{{"a", Number(1)}, {"b", Number(2)}};
  ASSERT_FALSE(twice == distinct);
  ASSERT_FALSE(distinct == twice);

  Object mixed{{"a", Number(1)}, {"a", Number(2)}};
  ASSERT_FALSE(mixed == twice);
  ASSERT_FALSE(twice == mixed);

  Object reordered{{"a", Number(2)}, {"a", Number(1)}};
  ASSERT_EQ(mixed, reordered);
  ASSERT_EQ(reordered, mixed);
  ASSERT_EQ(twice, (Object{{"a", Number(1)}, {"a", Number(1)}}));
}
