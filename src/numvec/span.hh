#pragma once

#include <numvec/assertf.hh>
#include <numvec/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// (pointer, size) view into memory owned by someone else.
///
/// span<T const> is the entry point for raw literal sequences:
///   auto v = nv::vector<int>::create_copy_of(some_c_array);
///   v.equals({3, 1, 4});
/// and the read-only view through which vector copies, compares, slices and renders itself.
template <class T>
struct nv::span
{
    // construction
public:
    constexpr span() = default;

    // defaulted so that span stays trivially copyable for any T
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Views [ptr, ptr + size).
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        NV_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Views a braced list, only for span<T const>.
    /// The list dies at the end of the full expression, so only use this for function arguments:
    ///   v.equals({1, 2, 3});                         // fine
    ///   nv::span<int const> s = {1, 2, 3};           // dangling
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Views a container with data() and size(), e.g. nv::vector or std::vector.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    // only checked in debug builds, vector<T>::operator[] is the always-checked access
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        NV_ASSERTF(0 <= i && i < _size, "out of bounds: index {} for span of size {}", i, _size);
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // subviews
public:
    /// The part [begin, end) of this view.
    [[nodiscard]] constexpr span subspan(isize begin, isize end) const
    {
        NV_ASSERTF_ALWAYS(0 <= begin && begin <= end && end <= _size,
                          "out of bounds: range [{}, {}) does not fit into size {}", begin, end, _size);
        return span(_data + begin, end - begin);
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
