#pragma once

#include <numvec/fwd.hh>
#include <numvec/utility.hh>

#include <cstring>
#include <new>
#include <type_traits>

// Raw storage and object lifetime helpers behind nv::vector<T>.
// All "create" functions construct into uninitialized memory starting at dest_end and advance
// dest_end once per constructed object, so that [start, dest_end) is always the live range,
// even if a constructor throws halfway through.
// Numeric element types are trivially copyable and take the memcpy paths.

namespace nv::impl
{
/// Allocates uninitialized storage for count objects of type T.
/// count == 0 returns nullptr.
template <class T>
[[nodiscard]] T* allocate_storage(isize count)
{
    if (count == 0)
        return nullptr;
    auto const p = ::operator new(static_cast<std::size_t>(count) * sizeof(T), std::align_val_t(alignof(T)));
    return static_cast<T*>(p);
}

/// Releases storage obtained from allocate_storage<T>.
/// nullptr is a no-op. Objects must already be destroyed.
template <class T>
void deallocate_storage(T* p) noexcept
{
    if (p != nullptr)
        ::operator delete(static_cast<void*>(p), std::align_val_t(alignof(T)));
}

/// Calls destructors on [start, end) in reverse order.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Fill-constructs count copies of value at dest_end.
template <class T>
void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        ::new (static_cast<void*>(dest_end)) T(value);
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end) at dest_end.
template <class T>
void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
            std::memcpy(static_cast<void*>(dest_end), src_start, static_cast<std::size_t>(count) * sizeof(T));
        dest_end += count;
    }
    else
    {
        for (auto p = src_start; p != src_end; ++p)
        {
            ::new (static_cast<void*>(dest_end)) T(*p);
            ++dest_end;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) at dest_end.
/// The source objects stay alive in a moved-from state and must still be destroyed.
template <class T>
void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
            std::memcpy(static_cast<void*>(dest_end), src_start, static_cast<std::size_t>(count) * sizeof(T));
        dest_end += count;
    }
    else
    {
        for (auto p = src_start; p != src_end; ++p)
        {
            ::new (static_cast<void*>(dest_end)) T(nv::move(*p));
            ++dest_end;
        }
    }
}
} // namespace nv::impl
