#pragma once

#include <numvec/assert.hh>
#include <numvec/assertf.hh>
#include <numvec/fwd.hh>
#include <numvec/numeric.hh>
#include <numvec/utility.hh>
#include <numvec/vector.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Sequence builders
// =========================================================================================================
//
//   nv::range(0, 5, 1)               - [0, 1, 2, 3, 4]
//   nv::range(1.0, 3.0, 0.5)         - [1.0, 1.5, 2.0, 2.5]
//   nv::range(2, 5)                  - [2, 3, 4]
//   nv::range(3)                     - [0, 1, 2]
//   nv::linspace(5, 1.0, 10.0)       - [1.0, 3.25, 5.5, 7.75, 10.0]
//
// Both builders accumulate by repeated addition of the step, never by index * step.
// Floating point drift therefore behaves exactly like a hand-written "x += step" loop:
//   nv::range(0.0, 1.0, 0.1) has 11 elements, the last one being 0.9999999999999999
//
// Both fail with "invalid interval" unless start < stop.
// An empty interval is an error, not an empty vector.
//

namespace nv
{
namespace impl
{
// true if x + step would reach or pass stop, without overflowing T
// precondition: x < stop, step > 0
template <integral_numeric T>
[[nodiscard]] constexpr bool range_step_reaches(T x, T stop, T step)
{
    using U = std::make_unsigned_t<T>;
    auto const distance = U(U(stop) - U(x));
    return distance <= U(step);
}
} // namespace impl

/// Half-open progression [start, start + step, start + 2 * step, ...) that stays strictly below stop.
/// Precondition: start < stop (always checked), step > 0 (only checked with NV_ASSERT).
template <numeric T>
[[nodiscard]] vector<T> range(T start, dont_deduce<T> stop, dont_deduce<T> step)
{
    NV_ASSERTF_ALWAYS(start < stop, "invalid interval: range start {} must be less than stop {}", start, stop);
    NV_ASSERT(step > T(0), "range step must be positive");

    vector<T> result;
    auto x = start;
    while (x < stop)
    {
        result.push_back(x);

        if constexpr (std::integral<T>)
            if (impl::range_step_reaches(x, stop, step))
                break;

        x = T(x + step);
    }
    return result;
}

/// [start, start + 1, ...) below stop
template <numeric T>
[[nodiscard]] vector<T> range(T start, dont_deduce<T> stop)
{
    return nv::range(start, stop, T(1));
}

/// [0, 1, ...) below stop
template <numeric T>
[[nodiscard]] vector<T> range(T stop)
{
    return nv::range(T(0), stop, T(1));
}

/// Exactly len evenly spaced values over the closed interval [start, stop].
/// The first element is exactly start and the last element is exactly stop.
/// The values in between carry the drift of repeated addition of (stop - start) / (len - 1).
/// Precondition: start < stop and len >= 2.
template <floating_numeric T>
[[nodiscard]] vector<T> linspace(isize len, T start, dont_deduce<T> stop)
{
    NV_ASSERTF_ALWAYS(start < stop, "invalid interval: linspace start {} must be less than stop {}", start, stop);
    NV_ASSERTF_ALWAYS(len >= 2, "linspace needs at least 2 samples to hold both endpoints, got {}", len);

    auto const step = T((stop - start) / T(len - 1));

    // the length is fixed by the count, drift only moves the values
    auto result = vector<T>::create_with_capacity(len);
    auto x = start;
    while (result.size() < len - 1)
    {
        result.push_back(x);
        x = T(x + step);
    }
    result.push_back(stop);

    return result;
}
} // namespace nv
