#ifndef JSONMODEL_TRAVERSAL_HPP
#define JSONMODEL_TRAVERSAL_HPP

#include "document.hpp"
#include <functional>

namespace jsonmodel {

using Visitor = std::function<void(const Document &)>;

// Pre-order walk: 'visitor' sees a node before any of its children, and
// children in element / insertion order. Each call starts a fresh walk.
void accept(const Document &document, const Visitor &visitor);

} // namespace jsonmodel

#endif // JSONMODEL_TRAVERSAL_HPP
