#pragma once

#include <numvec/assertf.hh>
#include <numvec/builders/fill.hh>
#include <numvec/fwd.hh>
#include <numvec/numeric.hh>
#include <numvec/vector.hh>

#include <cstddef>

// =========================================================================================================
// Nested fill builders
// =========================================================================================================
//
// nested_vector<T, D> is vector<vector<...<T>...>> with D levels:
//   nested_vector<int, 1>  == vector<int>
//   nested_vector<int, 2>  == vector<vector<int>>
//
// The shape is a braced list of D extents, outermost first.
// Every vector on level k has exactly shape[k] elements:
//
//   nv::full_nested({2, 3}, 1.5)      - [[1.5, 1.5, 1.5], [1.5, 1.5, 1.5]]
//   nv::zeros_nested<int>({2, 2, 2})  - 2 x 2 x 2 zeros
//   nv::ones_nested<f32>({4})         - same as nv::ones<f32>(4)
//
// A negative extent fails with "size must be non-negative".
// A zero extent yields empty vectors on that level (and nothing below it).
//

namespace nv
{
namespace impl
{
template <class T, isize D>
struct nested_vector_t
{
    static_assert(D >= 1, "nested vectors need at least one level");
    using type = vector<typename nested_vector_t<T, D - 1>::type>;
};
template <class T>
struct nested_vector_t<T, 1>
{
    using type = vector<T>;
};

template <class T, isize D>
[[nodiscard]] typename nested_vector_t<T, D>::type full_nested_level(isize const* shape, T const& value)
{
    if constexpr (D == 1)
    {
        return nv::full(shape[0], value);
    }
    else
    {
        NV_ASSERTF_ALWAYS(shape[0] >= 0, "size must be non-negative, got {}", shape[0]);
        // every row is built independently so that no two rows share storage
        auto rows = nested_vector_t<T, D>::type::create_with_capacity(shape[0]);
        for (isize i = 0; i < shape[0]; ++i)
            rows.push_back(impl::full_nested_level<T, D - 1>(shape + 1, value));
        return rows;
    }
}
} // namespace impl

template <class T, isize D>
using nested_vector = typename impl::nested_vector_t<T, D>::type;

template <numeric T, std::size_t D>
[[nodiscard]] nested_vector<T, static_cast<isize>(D)> full_nested(isize const (&shape)[D], T value)
{
    return impl::full_nested_level<T, static_cast<isize>(D)>(shape, value);
}

template <numeric T, std::size_t D>
[[nodiscard]] nested_vector<T, static_cast<isize>(D)> zeros_nested(isize const (&shape)[D])
{
    return impl::full_nested_level<T, static_cast<isize>(D)>(shape, T(0));
}

template <numeric T, std::size_t D>
[[nodiscard]] nested_vector<T, static_cast<isize>(D)> ones_nested(isize const (&shape)[D])
{
    return impl::full_nested_level<T, static_cast<isize>(D)>(shape, T(1));
}
} // namespace nv
