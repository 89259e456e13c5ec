#ifndef JSONMODEL_CONFIG_HPP
#define JSONMODEL_CONFIG_HPP

#include <string_view>

namespace jsonmodel::config {
    constexpr std::string_view null_literal = "null";
    constexpr std::string_view true_literal = "true";
    constexpr std::string_view false_literal = "false";

    constexpr std::string_view quote = "\"";
    constexpr std::string_view escaped_quote = "\\\"";
    constexpr std::string_view member_separator = ",";
    constexpr std::string_view name_separator = ":";
    constexpr std::string_view newline = "\n";

    constexpr std::string_view object_open = "{";
    constexpr std::string_view object_close = "}";
    constexpr std::string_view array_open = "[";
    constexpr std::string_view array_close = "]";
}

#endif // JSONMODEL_CONFIG_HPP
