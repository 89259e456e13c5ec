#include "array.hpp"
#include "document.hpp"
#include <utility>

namespace jsonmodel {

Array::Array() : m_values(std::make_shared<const std::vector<Document>>()) {}

Array::Array(std::vector<Document> values)
    : m_values(std::make_shared<const std::vector<Document>>(std::move(values))) {}

Array::Array(std::initializer_list<Document> values)
    : m_values(std::make_shared<const std::vector<Document>>(values)) {}

std::span<const Document> Array::values() const { return *m_values; }

size_t Array::size() const { return m_values->size(); }

bool Array::empty() const { return m_values->empty(); }

Array Array::map(
    const std::function<Document(const Document &)> &transform) const {
  std::vector<Document> mapped;
  mapped.reserve(m_values->size());
  for (const auto &value : *m_values) {
    mapped.push_back(transform(value));
  }
  return Array(std::move(mapped));
}

Array Array::filter(
    const std::function<bool(const Document &)> &predicate) const {
  std::vector<Document> kept;
  for (const auto &value : *m_values) {
    if (predicate(value)) {
      kept.push_back(value);
    }
  }
  return Array(std::move(kept));
}

bool operator==(const Array &lhs, const Array &rhs) {
  return *lhs.m_values == *rhs.m_values;
}

} // namespace jsonmodel
