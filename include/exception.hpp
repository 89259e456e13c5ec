#ifndef JSONMODEL_EXCEPTION_HPP
#define JSONMODEL_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace jsonmodel {

    class exception : public std::runtime_error {
    public:
        explicit exception(const std::string& what) : std::runtime_error(what) {}
    };

    // Raised by convert() for values it cannot represent, e.g. a map with non-text keys.
    class invalid_argument : public exception {
    public:
        explicit invalid_argument(const std::string& what) : exception(what) {}
    };

    // Raised by Document::as<T>() when the document holds another tag.
    class type_error : public exception {
    public:
        explicit type_error(const std::string& what) : exception(what) {}
    };

} // namespace jsonmodel

#endif // JSONMODEL_EXCEPTION_HPP
