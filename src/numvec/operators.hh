#pragma once

#include <numvec/assertf.hh>
#include <numvec/fwd.hh>
#include <numvec/numeric.hh>
#include <numvec/utility.hh>
#include <numvec/vector.hh>

// =========================================================================================================
// Elementwise arithmetic
// =========================================================================================================
//
// vector op vector   - per-index operation, both operands must have the same size
// vector op scalar   - the scalar is broadcast to every element
// scalar op vector   - same, with the scalar as left operand (s - v computes s - v[i])
// vector op= ...     - in-place forms of the above, only the left operand is modified
//
// Every result element has type T, so i8 + i8 stays i8. Integer overflow wraps modulo 2^bits
// (see nv::wrapping_add in <numvec/numeric.hh>).
// Vector-vector forms fail with "length mismatch" when the sizes differ.
//
// The scalar operand never takes part in template argument deduction:
//   nv::vector<f64> v = ...;
//   v * 2;      // 2 is converted to f64
//   3 - v;      // 3 is converted to f64
//

namespace nv
{
namespace impl
{
template <class T, class Op>
void elementwise_apply(vector<T>& lhs, vector<T> const& rhs, char const* op_name, Op&& op)
{
    NV_ASSERTF_ALWAYS(lhs.size() == rhs.size(), "length mismatch: vector {} of sizes {} and {}", op_name, lhs.size(), rhs.size());

    auto const n = lhs.size();
    auto const pl = lhs.data();
    auto const pr = rhs.data();
    for (isize i = 0; i < n; ++i)
        pl[i] = T(op(pl[i], pr[i]));
}

template <class T, class Op>
void elementwise_apply(vector<T>& lhs, T const& rhs, Op&& op)
{
    for (auto& x : lhs)
        x = T(op(x, rhs));
}
} // namespace impl

//
// compound assignment
//

template <numeric T>
vector<T>& operator+=(vector<T>& lhs, vector<T> const& rhs)
{
    impl::elementwise_apply(lhs, rhs, "addition", [](T a, T b) { return nv::wrapping_add(a, b); });
    return lhs;
}
template <numeric T>
vector<T>& operator-=(vector<T>& lhs, vector<T> const& rhs)
{
    impl::elementwise_apply(lhs, rhs, "subtraction", [](T a, T b) { return nv::wrapping_sub(a, b); });
    return lhs;
}
template <numeric T>
vector<T>& operator*=(vector<T>& lhs, vector<T> const& rhs)
{
    impl::elementwise_apply(lhs, rhs, "multiplication", [](T a, T b) { return nv::wrapping_mul(a, b); });
    return lhs;
}

template <numeric T>
vector<T>& operator+=(vector<T>& lhs, dont_deduce<T> rhs)
{
    impl::elementwise_apply(lhs, rhs, [](T a, T b) { return nv::wrapping_add(a, b); });
    return lhs;
}
template <numeric T>
vector<T>& operator-=(vector<T>& lhs, dont_deduce<T> rhs)
{
    impl::elementwise_apply(lhs, rhs, [](T a, T b) { return nv::wrapping_sub(a, b); });
    return lhs;
}
template <numeric T>
vector<T>& operator*=(vector<T>& lhs, dont_deduce<T> rhs)
{
    impl::elementwise_apply(lhs, rhs, [](T a, T b) { return nv::wrapping_mul(a, b); });
    return lhs;
}

//
// vector op vector
//
// lhs is taken by value: temporaries are reused, named vectors are copied once
//

template <numeric T>
[[nodiscard]] vector<T> operator+(vector<T> lhs, vector<T> const& rhs)
{
    lhs += rhs;
    return lhs;
}
template <numeric T>
[[nodiscard]] vector<T> operator-(vector<T> lhs, vector<T> const& rhs)
{
    lhs -= rhs;
    return lhs;
}
template <numeric T>
[[nodiscard]] vector<T> operator*(vector<T> lhs, vector<T> const& rhs)
{
    lhs *= rhs;
    return lhs;
}

//
// vector op scalar
//

template <numeric T>
[[nodiscard]] vector<T> operator+(vector<T> lhs, dont_deduce<T> rhs)
{
    lhs += rhs;
    return lhs;
}
template <numeric T>
[[nodiscard]] vector<T> operator-(vector<T> lhs, dont_deduce<T> rhs)
{
    lhs -= rhs;
    return lhs;
}
template <numeric T>
[[nodiscard]] vector<T> operator*(vector<T> lhs, dont_deduce<T> rhs)
{
    lhs *= rhs;
    return lhs;
}

//
// scalar op vector
//

template <numeric T>
[[nodiscard]] vector<T> operator+(dont_deduce<T> lhs, vector<T> rhs)
{
    rhs += lhs;
    return rhs;
}
template <numeric T>
[[nodiscard]] vector<T> operator-(dont_deduce<T> lhs, vector<T> rhs)
{
    // not commutative: every element becomes lhs - element
    for (auto& x : rhs)
        x = nv::wrapping_sub(T(lhs), x);
    return rhs;
}
template <numeric T>
[[nodiscard]] vector<T> operator*(dont_deduce<T> lhs, vector<T> rhs)
{
    rhs *= lhs;
    return rhs;
}
} // namespace nv
