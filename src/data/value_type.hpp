#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace data {
    class Struct;
    class List;

    using ValueTypeBase = std::variant<
        // types in same order as type consts in ValueTypes below
        std::monostate, // Always first (NONE)
        bool, // BOOL
        int64_t, // INT
        double, // DOUBLE
        std::string, // STRING
        std::shared_ptr<List>, // LIST
        std::shared_ptr<Struct> // STRUCT
        >;

    class ValueType : public ValueTypeBase {
    public:
        ValueType() = default;
        ValueType(const ValueType &) = default;
        ValueType(ValueType &&) = default;
        ValueType &operator=(const ValueType &) = default;
        ValueType &operator=(ValueType &&) = default;
        ~ValueType() = default;

        [[nodiscard]] const ValueTypeBase &base() const {
            return *this;
        }

        template<typename T>
        // NOLINTNEXTLINE(*-explicit-constructor)
        ValueType(T x) : ValueTypeBase(convert(std::move(x))) {
        }

        template<typename T>
        static ValueTypeBase convert(T x) {
            if constexpr(std::is_same_v<bool, T>) {
                return ValueTypeBase(x);
            } else if constexpr(std::is_integral_v<T>) {
                return static_cast<int64_t>(x);
            } else if constexpr(std::is_floating_point_v<T>) {
                return static_cast<double>(x);
            } else if constexpr(std::is_same_v<std::shared_ptr<List>, T>) {
                return ValueTypeBase(std::move(x));
            } else if constexpr(std::is_same_v<std::shared_ptr<Struct>, T>) {
                return ValueTypeBase(std::move(x));
            } else if constexpr(std::is_same_v<std::monostate, T>) {
                return ValueTypeBase{};
            } else {
                static_assert(
                    std::is_constructible_v<std::string, T>, "Must be a ValueType permitted value");
                return std::string(x);
            }
        }
    };

    // enum class ValueTypes would seem to be better, but we need to compare int to
    // int, so this is easier
    struct ValueTypes {
        static constexpr auto NONE{0};
        static constexpr auto BOOL{1};
        static constexpr auto INT{2};
        static constexpr auto DOUBLE{3};
        static constexpr auto STRING{4};
        static constexpr auto LIST{5};
        static constexpr auto STRUCT{6};
    };
} // namespace data
