#include "document.hpp"

namespace jsonmodel {

bool operator==(const Document &lhs, const Document &rhs) {
  return lhs.m_value == rhs.m_value;
}

} // namespace jsonmodel
