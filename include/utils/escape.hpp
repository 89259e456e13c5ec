#ifndef JSONMODEL_UTILS_ESCAPE_HPP
#define JSONMODEL_UTILS_ESCAPE_HPP

#include <string>
#include <string_view>

namespace jsonmodel::utils {

    // Replaces every '"' with '\"'. Backslashes and control characters are
    // passed through untouched, so the result is not always valid JSON text.
    std::string escape_quotes(std::string_view text);

} // namespace jsonmodel::utils

#endif // JSONMODEL_UTILS_ESCAPE_HPP
