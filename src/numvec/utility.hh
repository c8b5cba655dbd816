#pragma once

#include <numvec/fwd.hh>
#include <numvec/macros.hh>

// Small helpers shared by the container, the builders and the operators.
// They replace <utility> and <algorithm> in the headers, which keeps include times down.

namespace nv
{
template <class T>
[[nodiscard]] NV_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] NV_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] NV_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns the previous value of obj.
/// Used to steal storage in move operations:
///   _data = nv::exchange(rhs._data, nullptr);
template <class T, class U = T>
[[nodiscard]] NV_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = nv::forward<U>(new_val);
    return old_val;
}

/// Larger of a and b according to operator<, b on ties.
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Smaller of a and b according to operator<, a on ties.
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

namespace impl
{
template <class T>
struct dont_deduce_t
{
    using type = T;
};
} // namespace impl

/// Excludes a parameter from template argument deduction.
/// The scalar operands of the arithmetic operators and builders use it, so that
///   nv::vector<f64> v = ...;
///   v * 3;                    // T is deduced from v alone, 3 converts to f64
///   nv::range(0.0, 1, 0.25);  // T = f64
/// See https://artificial-mind.net/blog/2020/09/26/dont-deduce
template <class T>
using dont_deduce = typename impl::dont_deduce_t<T>::type;
} // namespace nv
