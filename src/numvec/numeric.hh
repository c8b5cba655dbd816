#pragma once

#include <numvec/fwd.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Element type capabilities
// =========================================================================================================
//
// numeric<T>            - primitive arithmetic type usable as vector element for all arithmetic
//                         (i8..i64, u8..u64, f32, f64 and the other standard integer types)
//                         bool and character types are excluded
// integral_numeric<T>   - numeric with a total order, required by max() / min()
// floating_numeric<T>   - numeric floating point, required by linspace()
//
// Operations that need a capability use these concepts in their requires-clauses,
// so an unsupported element type is rejected at compile time:
//   nv::vector<double>{1.0, 2.0}.max();   // error: double is not integral_numeric
//   nv::normal<float>(...);               // error: normal sampling is f64 only
//

namespace nv
{
namespace impl
{
template <class T>
constexpr bool is_character_v = std::is_same_v<std::remove_cv_t<T>, char>         //
                                || std::is_same_v<std::remove_cv_t<T>, wchar_t>     //
                                || std::is_same_v<std::remove_cv_t<T>, char8_t>     //
                                || std::is_same_v<std::remove_cv_t<T>, char16_t>    //
                                || std::is_same_v<std::remove_cv_t<T>, char32_t>;

// unsigned type at least as wide as unsigned int, so integer promotion cannot make it signed again
template <std::integral T>
using wrapping_unsigned_t = std::common_type_t<std::make_unsigned_t<T>, unsigned>;
} // namespace impl

template <class T>
concept numeric = std::is_arithmetic_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool> && !impl::is_character_v<T>;

template <class T>
concept integral_numeric = numeric<T> && std::integral<T>;

template <class T>
concept floating_numeric = numeric<T> && std::floating_point<T>;

// =========================================================================================================
// Wrapping arithmetic
// =========================================================================================================
//
// Integer results wrap modulo 2^bits of T for signed and unsigned types alike:
//   nv::wrapping_add<nv::i32>(INT_MAX, 1)   // INT_MIN, no signed overflow
//   nv::wrapping_mul<nv::u16>(300, 300)     // 24464
// Floating point types use plain IEEE arithmetic.
//

template <numeric T>
[[nodiscard]] constexpr T wrapping_add(T a, T b)
{
    if constexpr (std::integral<T>)
    {
        using U = impl::wrapping_unsigned_t<T>;
        return T(U(a) + U(b));
    }
    else
        return T(a + b);
}

template <numeric T>
[[nodiscard]] constexpr T wrapping_sub(T a, T b)
{
    if constexpr (std::integral<T>)
    {
        using U = impl::wrapping_unsigned_t<T>;
        return T(U(a) - U(b));
    }
    else
        return T(a - b);
}

template <numeric T>
[[nodiscard]] constexpr T wrapping_mul(T a, T b)
{
    if constexpr (std::integral<T>)
    {
        using U = impl::wrapping_unsigned_t<T>;
        return T(U(a) * U(b));
    }
    else
        return T(a * b);
}

/// Raises base to the non-negative integer power exp by repeated squaring.
/// Integer types wrap modulo 2^bits like repeated wrapping_mul.
/// Precondition: exp >= 0.
/// Usage:
///   nv::int_pow(3, 2)     // 9
///   nv::int_pow(2.0, 10)  // 1024.0
///   nv::int_pow(7, 0)     // 1
template <numeric T>
[[nodiscard]] constexpr T int_pow(T base, isize exp)
{
    auto result = T(1);
    while (exp > 0)
    {
        if (exp & 1)
            result = nv::wrapping_mul(result, base);
        exp >>= 1;
        if (exp > 0)
            base = nv::wrapping_mul(base, base);
    }
    return result;
}
} // namespace nv
