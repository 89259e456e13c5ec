#ifndef JSONMODEL_SERIALIZER_HPP
#define JSONMODEL_SERIALIZER_HPP

#include "document.hpp"
#include "sink.hpp"
#include <string>

namespace jsonmodel {

// Compact JSON text for 'document': no whitespace, only '"' escaped in
// strings. Documents failing validate() are serialized all the same.
std::string stringify(const Document &document);

// Writes 'document' into 'sink' and returns sink.snapshot().
std::string stringify(const Document &document, ISink &sink);

// Writes exactly one fragment for 'document' into 'sink'.
void write(const Document &document, ISink &sink);

} // namespace jsonmodel

#endif // JSONMODEL_SERIALIZER_HPP
