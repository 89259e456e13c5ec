#include "utils/escape.hpp"
#include "config.hpp"

namespace jsonmodel::utils {

    std::string escape_quotes(std::string_view text) {
        std::string escaped;
        escaped.reserve(text.size());
        for (char c : text) {
            if (c == config::quote.front()) {
                escaped += config::escaped_quote;
            } else {
                escaped += c;
            }
        }
        return escaped;
    }

} // namespace jsonmodel::utils
