#pragma once

#include <numvec/fwd.hh>
#include <numvec/numeric.hh>
#include <numvec/vector.hh>

// =========================================================================================================
// Fill builders
// =========================================================================================================
//
//   nv::full(4, 2.5)              - [2.5, 2.5, 2.5, 2.5]
//   nv::full_like(v, 7)           - v.size() copies of 7
//   nv::zeros<int>(3)             - [0, 0, 0]
//   nv::ones<f32>(2)              - [1, 1]
//   nv::zeros_like(v)             - v.size() zeros of v's element type
//   nv::ones_like(v)              - v.size() ones of v's element type
//
// len == 0 yields an empty vector, len < 0 fails with "size must be non-negative".
//

namespace nv
{
template <numeric T>
[[nodiscard]] vector<T> full(isize len, T value)
{
    return vector<T>::create_filled(len, value);
}

template <numeric T>
[[nodiscard]] vector<T> full_like(vector<T> const& other, dont_deduce<T> value)
{
    return vector<T>::create_filled(other.size(), value);
}

template <numeric T>
[[nodiscard]] vector<T> zeros(isize len)
{
    return vector<T>::create_filled(len, T(0));
}

template <numeric T>
[[nodiscard]] vector<T> ones(isize len)
{
    return vector<T>::create_filled(len, T(1));
}

template <numeric T>
[[nodiscard]] vector<T> zeros_like(vector<T> const& other)
{
    return nv::zeros<T>(other.size());
}

template <numeric T>
[[nodiscard]] vector<T> ones_like(vector<T> const& other)
{
    return nv::ones<T>(other.size());
}
} // namespace nv
