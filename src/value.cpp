#include "value.hpp"
#include "exception.hpp"
#include "yyjson.h"
#include <cstdlib>

namespace jsonmodel {

    std::string_view to_string(Type type) {
        switch (type) {
            case Type::Null:
                return "Null";
            case Type::Boolean:
                return "Boolean";
            case Type::Number:
                return "Number";
            case Type::String:
                return "String";
            case Type::Array:
                return "Array";
            case Type::Object:
                return "Object";
        }
        return "Unknown";
    }

    // Values above INT64_MAX wrap; use as_uint() when is_unsigned().
    int64_t Number::as_int() const {
        if (const auto* value = std::get_if<int64_t>(&m_value)) {
            return *value;
        }
        if (const auto* value = std::get_if<uint64_t>(&m_value)) {
            return static_cast<int64_t>(*value);
        }
        return static_cast<int64_t>(std::get<double>(m_value));
    }

    uint64_t Number::as_uint() const {
        if (const auto* value = std::get_if<uint64_t>(&m_value)) {
            return *value;
        }
        if (const auto* value = std::get_if<int64_t>(&m_value)) {
            return static_cast<uint64_t>(*value);
        }
        return static_cast<uint64_t>(std::get<double>(m_value));
    }

    double Number::as_double() const {
        if (const auto* value = std::get_if<double>(&m_value)) {
            return *value;
        }
        if (const auto* value = std::get_if<uint64_t>(&m_value)) {
            return static_cast<double>(*value);
        }
        return static_cast<double>(std::get<int64_t>(m_value));
    }

    std::string Number::to_string() const {
        yyjson_mut_doc *doc = yyjson_mut_doc_new(nullptr);
        if (!doc) {
            throw jsonmodel::exception("Failed to allocate number writer");
        }
        yyjson_mut_val *val = nullptr;
        if (const auto* value = std::get_if<int64_t>(&m_value)) {
            val = yyjson_mut_sint(doc, *value);
        } else if (const auto* value = std::get_if<uint64_t>(&m_value)) {
            val = yyjson_mut_uint(doc, *value);
        } else {
            val = yyjson_mut_real(doc, std::get<double>(m_value));
        }

        size_t len = 0;
        char *text = yyjson_mut_val_write(val, YYJSON_WRITE_ALLOW_INF_AND_NAN, &len);
        if (!text) {
            yyjson_mut_doc_free(doc);
            throw jsonmodel::exception("Failed to write number");
        }
        std::string result(text, len);
        free(text);
        yyjson_mut_doc_free(doc);
        return result;
    }

} // namespace jsonmodel
