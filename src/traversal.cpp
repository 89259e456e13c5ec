#include "traversal.hpp"
#include "utils/overloaded.hpp"

namespace jsonmodel {

void accept(const Document &document, const Visitor &visitor) {
  visitor(document);
  document.visit(utils::overloaded{
      [](const Null &) {},
      [](const Boolean &) {},
      [](const Number &) {},
      [](const String &) {},
      [&visitor](const Array &array) {
        for (const auto &element : array.values()) {
          accept(element, visitor);
        }
      },
      [&visitor](const Object &object) {
        for (const auto &entry : object.entries()) {
          accept(entry.second, visitor);
        }
      },
  });
}

} // namespace jsonmodel
