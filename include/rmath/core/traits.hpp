// include/rmath/core/traits.hpp — Value-representation capability consumed by the arithmetic engines.

#pragma once

#include <type_traits>
#include <utility>

#include <rmath/core/number.hpp>

namespace rmath::core {

    // Specialise for any type the engines should operate on. A specialisation
    // provides `radix`, `decompose(const T&) -> number_parts` and
    // `create(number_parts) -> T`.
    template <typename T> struct number_traits;

    template <int Radix> struct number_traits<basic_number<Radix>> {
        using value_type = basic_number<Radix>;

        static constexpr int radix = Radix;

        static number_parts decompose(const value_type &value) { return value.parts(); }

        static value_type create(number_parts parts) {
            return value_type::from_parts(std::move(parts));
        }
    };

    template <typename T> struct is_radix_numeric : std::false_type {};

    template <int Radix> struct is_radix_numeric<basic_number<Radix>> : std::true_type {};

    template <typename T> inline constexpr bool is_radix_numeric_v = is_radix_numeric<T>::value;

} // namespace rmath::core
