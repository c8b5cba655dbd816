#pragma once

#include <numvec/assertf.hh>
#include <numvec/fwd.hh>
#include <numvec/numeric.hh>
#include <numvec/utility.hh>
#include <numvec/vector.hh>

#include <cmath>
#include <concepts>
#include <random>
#include <type_traits>

// =========================================================================================================
// Random builders
// =========================================================================================================
//
//   nv::uniform(100, 0, 10)          - 100 integers in [0, 10)
//   nv::uniform(100, -1.0, 1.0)      - 100 doubles in [-1.0, 1.0)
//   nv::normal(100, 0.0, 1.0)        - 100 standard normal doubles
//
// Every sample is independent. Without an explicit generator, samples come from a per-thread
// std::mt19937_64 that is seeded once from std::random_device, so results differ between runs.
// Pass a generator for reproducible results:
//
//   auto rng = std::mt19937_64(1234);
//   auto v = nv::uniform(8, 0.0, 1.0, rng);
//
// uniform() fails with "invalid interval" unless low < high and, for floating point types,
// high - low is finite.
// normal() is only available for f64 and fails for a negative std_dev.
//

namespace nv
{
namespace impl
{
/// Per-thread engine used by the builders that take no explicit generator.
[[nodiscard]] std::mt19937_64& thread_engine();

// uniform_int_distribution is only defined for short and wider
template <class T>
using uniform_int_sample_t = std::conditional_t<(sizeof(T) < sizeof(int)), std::conditional_t<std::is_signed_v<T>, int, unsigned>, T>;
} // namespace impl

/// len independent samples from [low, high).
/// Integer types are sampled discretely, every value in [low, high - 1] being equally likely.
/// Floating point types are sampled continuously and never produce high.
template <numeric T, class Rng>
    requires std::uniform_random_bit_generator<std::remove_reference_t<Rng>>
[[nodiscard]] vector<T> uniform(isize len, T low, dont_deduce<T> high, Rng&& rng)
{
    NV_ASSERTF_ALWAYS(low < high, "invalid interval: uniform low {} must be less than high {}", low, high);

    auto result = vector<T>::create_with_capacity(len);

    if constexpr (std::integral<T>)
    {
        using sample_t = impl::uniform_int_sample_t<T>;
        auto dist = std::uniform_int_distribution<sample_t>(sample_t(low), sample_t(high - 1));
        for (isize i = 0; i < len; ++i)
            result.push_back(T(dist(rng)));
    }
    else
    {
        // uniform_real_distribution requires high - low to be representable
        NV_ASSERTF_ALWAYS(std::isfinite(T(high - low)), "invalid interval: uniform width of [{}, {}) overflows", low, high);

        auto dist = std::uniform_real_distribution<T>(low, high);
        for (isize i = 0; i < len; ++i)
        {
            // some standard libraries round up to high for narrow float types
            auto v = dist(rng);
            while (!(v < high))
                v = dist(rng);
            result.push_back(v);
        }
    }

    return result;
}

template <numeric T>
[[nodiscard]] vector<T> uniform(isize len, T low, dont_deduce<T> high)
{
    return nv::uniform(len, low, high, impl::thread_engine());
}

/// len independent samples from the normal distribution N(mean, std_dev^2).
/// std_dev == 0 yields len copies of mean.
template <class T, class Rng>
    requires std::same_as<T, f64> && std::uniform_random_bit_generator<std::remove_reference_t<Rng>>
[[nodiscard]] vector<T> normal(isize len, T mean, dont_deduce<T> std_dev, Rng&& rng)
{
    NV_ASSERTF_ALWAYS(std_dev >= 0, "normal std_dev must be non-negative, got {}", std_dev);

    if (std_dev == 0)
        return vector<T>::create_filled(len, mean);

    auto result = vector<T>::create_with_capacity(len);
    auto dist = std::normal_distribution<T>(mean, std_dev);
    for (isize i = 0; i < len; ++i)
        result.push_back(dist(rng));
    return result;
}

template <class T>
    requires std::same_as<T, f64>
[[nodiscard]] vector<T> normal(isize len, T mean, dont_deduce<T> std_dev)
{
    return nv::normal(len, mean, std_dev, impl::thread_engine());
}
} // namespace nv
