#ifndef JSONMODEL_OBJECT_HPP
#define JSONMODEL_OBJECT_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonmodel {

class Document;

// Insertion-ordered members. Duplicate keys are accepted here and only
// reported by validate().
class Object {
public:
  using Entry = std::pair<std::string, Document>;

  Object();
  explicit Object(std::vector<Entry> entries);
  Object(std::initializer_list<Entry> entries);

  std::span<const Entry> entries() const;
  size_t size() const;
  bool empty() const;

  // First member named 'key', or nullptr.
  const Document *find(std::string_view key) const;
  bool contains(std::string_view key) const;

  Object filter(
      const std::function<bool(std::string_view, const Document &)> &predicate)
      const;

  // Member order is not significant for equality.
  friend bool operator==(const Object &lhs, const Object &rhs);

private:
  std::shared_ptr<const std::vector<Entry>> m_entries;
};

} // namespace jsonmodel

#endif // JSONMODEL_OBJECT_HPP
