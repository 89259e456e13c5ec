#ifndef JSONMODEL_ARRAY_HPP
#define JSONMODEL_ARRAY_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <vector>

namespace jsonmodel {

class Document;

class Array {
public:
  Array();
  explicit Array(std::vector<Document> values);
  Array(std::initializer_list<Document> values);

  // Read-only view of the elements. The storage is immutable and may be
  // shared between copies of this Array.
  std::span<const Document> values() const;
  size_t size() const;
  bool empty() const;

  // Returns a new Array with 'transform' applied to every element, in order.
  Array map(const std::function<Document(const Document &)> &transform) const;

  // Returns a new Array holding the elements for which 'predicate' holds.
  Array filter(const std::function<bool(const Document &)> &predicate) const;

  friend bool operator==(const Array &lhs, const Array &rhs);

private:
  std::shared_ptr<const std::vector<Document>> m_values;
};

} // namespace jsonmodel

#endif // JSONMODEL_ARRAY_HPP
