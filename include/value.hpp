#ifndef JSONMODEL_VALUE_HPP
#define JSONMODEL_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace jsonmodel {

    // Tag order matches the alternative order of Document::variant_type.
    enum class Type : uint8_t {
        Null,
        Boolean,
        Number,
        String,
        Array,
        Object
    };

    std::string_view to_string(Type type);

    namespace detail {
        template <typename T>
        concept character =
            std::same_as<T, char> || std::same_as<T, wchar_t> ||
            std::same_as<T, char8_t> || std::same_as<T, char16_t> ||
            std::same_as<T, char32_t>;
    } // namespace detail

    struct Null {
        friend bool operator==(const Null&, const Null&) = default;
    };

    class Boolean {
    public:
        explicit Boolean(bool value) : m_value(value) {}

        bool value() const { return m_value; }

        friend bool operator==(const Boolean&, const Boolean&) = default;

    private:
        bool m_value;
    };

    // A single numeric case holding either an integral or a fractional value.
    // The representation is part of the value: Number(2) != Number(2.0).
    // Unsigned values above INT64_MAX keep their own alternative; every other
    // integer is stored as int64_t, so Number(7u) == Number(7).
    class Number {
    public:
        template <typename T>
            requires(std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                     !detail::character<T>)
        explicit Number(T value) : m_value(from_integral(value)) {}

        template <typename T>
            requires std::is_floating_point_v<T>
        explicit Number(T value) : m_value(static_cast<double>(value)) {}

        bool is_integral() const { return !std::holds_alternative<double>(m_value); }
        bool is_unsigned() const { return std::holds_alternative<uint64_t>(m_value); }
        int64_t as_int() const;
        uint64_t as_uint() const;
        double as_double() const;

        // Integers render without a decimal point, doubles in shortest
        // round-trip form with one ("37", "0.2", "37.0").
        std::string to_string() const;

        friend bool operator==(const Number&, const Number&) = default;

    private:
        using storage_type = std::variant<int64_t, uint64_t, double>;

        template <typename T>
        static storage_type from_integral(T value) {
            if constexpr (std::is_unsigned_v<T>) {
                if (static_cast<uint64_t>(value) >
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return storage_type(std::in_place_type<uint64_t>, value);
                }
            }
            return storage_type(std::in_place_type<int64_t>, static_cast<int64_t>(value));
        }

        storage_type m_value;
    };

    class String {
    public:
        explicit String(std::string value) : m_value(std::move(value)) {}

        const std::string& value() const { return m_value; }

        friend bool operator==(const String&, const String&) = default;

    private:
        std::string m_value;
    };

} // namespace jsonmodel

#endif // JSONMODEL_VALUE_HPP
