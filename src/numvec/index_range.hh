#pragma once

#include <numvec/assertf.hh>
#include <numvec/fwd.hh>

// =========================================================================================================
// Index ranges for slicing
// =========================================================================================================
//
//   v.slice(b, e)                 - [b, e)
//   v.slice(nv::until(e))         - [0, e)
//   v.slice(nv::from(b))          - [b, size)
//   v.slice(nv::all())            - [0, size)
//   v.slice(nv::inclusive(b, l))  - [b, l]
//   v.slice(nv::through(l))       - [0, l]
//
// A range is resolved against the length of the sliced vector.
// Resolution fails with "out of bounds" unless 0 <= begin <= end <= size.
//

/// Unresolved index range [begin, end), where the end may be left open.
/// With inclusive_end, end names the last index instead and the range is [begin, end].
struct nv::index_range
{
    isize begin = 0;
    isize end = 0;
    bool open_end = true;
    bool inclusive_end = false;

    /// Half-open range resolved against a concrete size.
    struct resolved
    {
        isize begin;
        isize end;

        [[nodiscard]] constexpr isize size() const { return end - begin; }
    };

    [[nodiscard]] constexpr resolved resolve(isize size) const
    {
        auto e = open_end ? size : end;
        if (!open_end && inclusive_end)
        {
            // checked before the +1 so that a last index of isize max cannot overflow
            NV_ASSERTF_ALWAYS(end < size, "out of bounds: slice [{}, {}] does not fit into size {}", begin, end, size);
            e = end + 1;
        }
        NV_ASSERTF_ALWAYS(0 <= begin && begin <= e && e <= size,
                          "out of bounds: slice [{}, {}) does not fit into size {}", begin, e, size);
        return {begin, e};
    }
};

namespace nv
{
/// [begin, end)
[[nodiscard]] constexpr index_range bounded(isize begin, isize end)
{
    return {.begin = begin, .end = end, .open_end = false};
}

/// [0, end)
[[nodiscard]] constexpr index_range until(isize end)
{
    return {.begin = 0, .end = end, .open_end = false};
}

/// [begin, size)
[[nodiscard]] constexpr index_range from(isize begin)
{
    return {.begin = begin, .end = 0, .open_end = true};
}

/// [0, size)
[[nodiscard]] constexpr index_range all()
{
    return {.begin = 0, .end = 0, .open_end = true};
}

/// [begin, last]
[[nodiscard]] constexpr index_range inclusive(isize begin, isize last)
{
    return {.begin = begin, .end = last, .open_end = false, .inclusive_end = true};
}

/// [0, last]
[[nodiscard]] constexpr index_range through(isize last)
{
    return {.begin = 0, .end = last, .open_end = false, .inclusive_end = true};
}
} // namespace nv
