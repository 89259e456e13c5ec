#include "object.hpp"
#include "document.hpp"
#include <algorithm>

namespace jsonmodel {

Object::Object() : m_entries(std::make_shared<const std::vector<Entry>>()) {}

Object::Object(std::vector<Entry> entries)
    : m_entries(std::make_shared<const std::vector<Entry>>(std::move(entries))) {}

Object::Object(std::initializer_list<Entry> entries)
    : m_entries(std::make_shared<const std::vector<Entry>>(entries)) {}

std::span<const Object::Entry> Object::entries() const { return *m_entries; }

size_t Object::size() const { return m_entries->size(); }

bool Object::empty() const { return m_entries->empty(); }

const Document *Object::find(std::string_view key) const {
  auto it = std::find_if(m_entries->begin(), m_entries->end(),
                         [key](const Entry &entry) { return entry.first == key; });
  return it == m_entries->end() ? nullptr : &it->second;
}

bool Object::contains(std::string_view key) const {
  return find(key) != nullptr;
}

Object Object::filter(
    const std::function<bool(std::string_view, const Document &)> &predicate)
    const {
  std::vector<Entry> kept;
  for (const auto &entry : *m_entries) {
    if (predicate(entry.first, entry.second)) {
      kept.push_back(entry);
    }
  }
  return Object(std::move(kept));
}

// Members are matched as a multiset: each lhs entry claims a distinct rhs
// entry with the same key and an equal value.
bool operator==(const Object &lhs, const Object &rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  std::vector<bool> used(rhs.size(), false);
  for (const auto &entry : *lhs.m_entries) {
    bool matched = false;
    for (size_t i = 0; i < rhs.m_entries->size(); ++i) {
      const auto &other = (*rhs.m_entries)[i];
      if (!used[i] && other.first == entry.first &&
          other.second == entry.second) {
        used[i] = true;
        matched = true;
        break;
      }
    }
    if (!matched) {
      return false;
    }
  }
  return true;
}

} // namespace jsonmodel
