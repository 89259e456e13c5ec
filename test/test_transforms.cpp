#include "serializer.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace jsonmodel;

namespace {
Array one_two_three() { return Array{Number(1), Number(2), Number(3)}; }
} // namespace

TEST(TransformsTest, ArrayMap) {
  Array mapped = one_two_three().map([](const Document &value) -> Document {
    if (const Number *number = value.get_if<Number>()) {
      return Number(number->as_int() * 2);
    }
    return value;
  });
  ASSERT_EQ(stringify(mapped), "[2,4,6]");
}

TEST(TransformsTest, ArrayMapIdentity) {
  Array array = one_two_three();
  ASSERT_EQ(array.map([](const Document &value) { return value; }), array);
}

TEST(TransformsTest, ArrayMapLeavesSourceUntouched) {
  Array array = one_two_three();
  Array mapped = array.map([](const Document &) -> Document { return Null(); });
  ASSERT_EQ(stringify(array), "[1,2,3]");
  ASSERT_EQ(stringify(mapped), "[null,null,null]");
  ASSERT_NE(mapped.values().data(), array.values().data());
}

TEST(TransformsTest, ArrayFilter) {
  Array filtered = one_two_three().filter([](const Document &value) {
    const Number *number = value.get_if<Number>();
    return number && number->as_int() > 1;
  });
  ASSERT_EQ(stringify(filtered), "[2,3]");
}

TEST(TransformsTest, ArrayFilterExtremes) {
  Array array = one_two_three();
  ASSERT_EQ(array.filter([](const Document &) { return true; }), array);
  ASSERT_TRUE(array.filter([](const Document &) { return false; }).empty());
}

TEST(TransformsTest, ObjectFilterRemovesOneKey) {
  Object object{{"name", String("Catarina")},
                {"age", Number(37)},
                {"isStudent", Boolean(true)}};
  Object expected{{"name", String("Catarina")}, {"isStudent", Boolean(true)}};

  Object filtered =
      object.filter([](std::string_view key, const Document &) { return key != "age"; });
  ASSERT_EQ(filtered, expected);
  ASSERT_EQ(stringify(filtered), R"({"name":"Catarina","isStudent":true})");
  ASSERT_EQ(object.size(), 3u);
}

TEST(TransformsTest, ObjectFilterKeepsAllOrNone) {
  Object object{{"a", Number(1)}, {"b", Number(2)}};
  ASSERT_EQ(stringify(object.filter([](std::string_view, const Document &) {
              return true;
            })),
            R"({"a":1,"b":2})");
  ASSERT_EQ(stringify(object.filter([](std::string_view, const Document &) {
              return false;
            })),
            "{}");
}

TEST(TransformsTest, ObjectFilterOnFirstKey) {
  Object object{{"a", Number(1)}, {"b", Number(2)}};
  Object filtered =
      object.filter([](std::string_view key, const Document &) { return key != "a"; });
  ASSERT_EQ(stringify(filtered), R"({"b":2})");
}

TEST(TransformsTest, ObjectFilterSeesValues) {
  Object object{{"a", Number(1)}, {"b", String("x")}, {"c", Number(3)}};
  Object numbers = object.filter(
      [](std::string_view, const Document &value) { return value.is<Number>(); });
  ASSERT_EQ(stringify(numbers), R"({"a":1,"c":3})");
}

TEST(TransformsTest, CallbackExceptionsPropagate) {
  Array array = one_two_three();
  ASSERT_THROW(array.map([](const Document &) -> Document {
                 throw std::runtime_error("transform failed");
               }),
               std::runtime_error);
  ASSERT_THROW(array.filter([](const Document &) -> bool {
                 throw std::logic_error("predicate failed");
               }),
               std::logic_error);
}
