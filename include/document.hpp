#ifndef JSONMODEL_DOCUMENT_HPP
#define JSONMODEL_DOCUMENT_HPP

#include "array.hpp"
#include "exception.hpp"
#include "object.hpp"
#include "value.hpp"

#include <string>
#include <utility>
#include <variant>

namespace jsonmodel {

class Document {
public:
  using variant_type = std::variant<Null, Boolean, Number, String, Array, Object>;

  Document() = default;
  Document(Null value) : m_value(std::in_place_type<Null>, value) {}
  Document(Boolean value) : m_value(std::in_place_type<Boolean>, value) {}
  Document(Number value) : m_value(std::in_place_type<Number>, value) {}
  Document(String value)
      : m_value(std::in_place_type<String>, std::move(value)) {}
  Document(Array value) : m_value(std::in_place_type<Array>, std::move(value)) {}
  Document(Object value)
      : m_value(std::in_place_type<Object>, std::move(value)) {}

  Type type() const noexcept { return static_cast<Type>(m_value.index()); }

  template <typename T> bool is() const noexcept {
    return std::holds_alternative<T>(m_value);
  }

  template <typename T> const T *get_if() const noexcept {
    return std::get_if<T>(&m_value);
  }

  template <typename T> const T &as() const {
    if (const T *value = get_if<T>()) {
      return *value;
    }
    throw type_error("Unexpected document type: " +
                     std::string(to_string(type())));
  }

  // Exhaustive match: 'visitor' must accept every alternative.
  template <typename Visitor> decltype(auto) visit(Visitor &&visitor) const {
    return std::visit(std::forward<Visitor>(visitor), m_value);
  }

  friend bool operator==(const Document &lhs, const Document &rhs);

private:
  variant_type m_value;
};

static_assert(std::variant_size_v<Document::variant_type> == 6);

} // namespace jsonmodel

#endif // JSONMODEL_DOCUMENT_HPP
