#ifndef JSONMODEL_VALIDATOR_HPP
#define JSONMODEL_VALIDATOR_HPP

#include "document.hpp"

namespace jsonmodel {

// True iff every Object node has unique keys and every Array node is empty
// or holds elements of a single Type. Never throws.
bool validate(const Document &document);

// Key uniqueness, checked independently per Object node at every depth.
bool validate_objects(const Document &document);

// Homogeneity, checked independently per Array node at every depth.
// Null is a tag of its own: [null, 1] is rejected.
bool validate_arrays(const Document &document);

} // namespace jsonmodel

#endif // JSONMODEL_VALIDATOR_HPP
