#ifndef JSONMODEL_CONVERTER_HPP
#define JSONMODEL_CONVERTER_HPP

#include "document.hpp"

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmodel {

// Names one data member of a record. Records list their members, in
// declaration order, from a static json_fields():
//
//   struct Point {
//     int x, y;
//     static constexpr auto json_fields() {
//       return std::make_tuple(jsonmodel::field("x", &Point::x),
//                              jsonmodel::field("y", &Point::y));
//     }
//   };
//
// Members not listed there are not emitted.
template <typename Class, typename Member> struct Field {
  std::string_view name;
  Member Class::*pointer;
};

template <typename Class, typename Member>
constexpr Field<Class, Member> field(std::string_view name,
                                     Member Class::*pointer) {
  return {name, pointer};
}

// Lifts a native value into a Document. Supported shapes:
//   Document and its payload types     -> themselves
//   nullptr, std::monostate            -> Null
//   optional / shared_ptr / unique_ptr -> Null when empty, else the pointee
//   bool                               -> Boolean
//   other arithmetic (not char types)  -> Number
//   strings                            -> String
//   enums with an ADL enum_name(E)     -> String holding the member name
//   std::variant                       -> the active alternative
//   std::pair                          -> {"first":..,"second":..}
//   records with json_fields()         -> Object in declared order
//   maps                               -> Object in iteration order
//   other ranges                       -> Array
// Anything else fails to compile. Throws invalid_argument("Map keys must be
// Strings") when a map entry has a non-text key.
template <typename T> Document convert(const T &value);

namespace detail {

template <typename T> inline constexpr bool always_false = false;

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_smart_pointer : std::false_type {};
template <typename T>
struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};
template <typename T, typename D>
struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T>
concept document_part =
    std::same_as<T, Document> || std::same_as<T, Null> ||
    std::same_as<T, Boolean> || std::same_as<T, Number> ||
    std::same_as<T, String> || std::same_as<T, Array> ||
    std::same_as<T, Object>;

template <typename T>
concept number = std::is_arithmetic_v<T> && !std::same_as<T, bool> &&
                 !character<T>;

template <typename T>
concept c_string = std::same_as<T, const char *> || std::same_as<T, char *>;

template <typename T>
concept text = !std::same_as<T, std::nullptr_t> &&
               std::is_convertible_v<const T &, std::string_view>;

template <typename E>
concept named_enum = std::is_enum_v<E> && requires(E e) {
  { enum_name(e) } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept record = requires { T::json_fields(); };

template <typename T>
concept mapping = std::ranges::range<T> && requires {
  typename T::key_type;
  typename T::mapped_type;
};

[[noreturn]] void throw_non_text_key();

// Text form of a map key, or nullopt when the key does not hold text.
template <typename K> std::optional<std::string> key_text(const K &key) {
  if constexpr (c_string<K>) {
    if (!key) {
      return std::nullopt;
    }
    return std::string(key);
  } else if constexpr (text<K>) {
    return std::string(std::string_view(key));
  } else if constexpr (is_variant<K>::value) {
    return std::visit(
        [](const auto &alternative) { return key_text(alternative); }, key);
  } else {
    return std::nullopt;
  }
}

template <typename T> Object convert_record(const T &record) {
  std::vector<Object::Entry> entries;
  std::apply(
      [&](const auto &...fields) {
        (entries.emplace_back(std::string(fields.name),
                              convert(record.*(fields.pointer))),
         ...);
      },
      T::json_fields());
  return Object(std::move(entries));
}

template <typename T> Object convert_mapping(const T &map) {
  std::vector<Object::Entry> entries;
  for (const auto &[key, value] : map) {
    std::optional<std::string> name = key_text(key);
    if (!name) {
      throw_non_text_key();
    }
    entries.emplace_back(std::move(*name), convert(value));
  }
  return Object(std::move(entries));
}

template <typename T> Array convert_range(const T &range) {
  using element_type = std::ranges::range_value_t<T>;
  std::vector<Document> elements;
  for (const auto &element : range) {
    elements.push_back(convert(static_cast<const element_type &>(element)));
  }
  return Array(std::move(elements));
}

} // namespace detail

template <typename T> Document convert(const T &value) {
  if constexpr (detail::document_part<T>) {
    return Document(value);
  } else if constexpr (std::same_as<T, std::nullptr_t> ||
                       std::same_as<T, std::monostate>) {
    return Null{};
  } else if constexpr (detail::is_optional<T>::value ||
                       detail::is_smart_pointer<T>::value) {
    return value ? convert(*value) : Document(Null{});
  } else if constexpr (std::same_as<T, bool>) {
    return Boolean(value);
  } else if constexpr (detail::number<T>) {
    return Number(value);
  } else if constexpr (detail::c_string<T>) {
    return value ? Document(String(value)) : Document(Null{});
  } else if constexpr (detail::text<T>) {
    return String(std::string(std::string_view(value)));
  } else if constexpr (std::is_enum_v<T>) {
    static_assert(detail::named_enum<T>,
                  "enum needs an enum_name(E) overload to be converted");
    return String(std::string(std::string_view(enum_name(value))));
  } else if constexpr (detail::is_variant<T>::value) {
    return std::visit(
        [](const auto &alternative) { return convert(alternative); }, value);
  } else if constexpr (detail::is_pair<T>::value) {
    return Object{{"first", convert(value.first)},
                  {"second", convert(value.second)}};
  } else if constexpr (detail::record<T>) {
    return detail::convert_record(value);
  } else if constexpr (detail::mapping<T>) {
    return detail::convert_mapping(value);
  } else if constexpr (std::ranges::range<T>) {
    return detail::convert_range(value);
  } else {
    static_assert(detail::always_false<T>, "unsupported value shape");
  }
}

} // namespace jsonmodel

#endif // JSONMODEL_CONVERTER_HPP
