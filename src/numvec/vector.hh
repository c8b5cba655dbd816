#pragma once

#include <numvec/assertf.hh>
#include <numvec/fwd.hh>
#include <numvec/impl/object_lifetime_util.hh>
#include <numvec/index_range.hh>
#include <numvec/numeric.hh>
#include <numvec/span.hh>
#include <numvec/to_debug_string.hh>
#include <numvec/utility.hh>

#include <initializer_list>
#include <string>
#include <type_traits>


/// Owned, ordered, contiguous sequence of T with deep-copy value semantics.
///
/// The container is generic over any copyable T so that nested vectors (vector<vector<T>>) can
/// be formed. All arithmetic is gated on the capabilities from <numvec/numeric.hh>:
///   - power() and sum() require numeric<T>
///   - max() and min() require integral_numeric<T>
///   - elementwise operators live in <numvec/operators.hh>
///   - builders (full, range, linspace, uniform, ...) live in <numvec/builders.hh>
///
/// The length of a vector never changes behind the owner's back. Builders return vectors of
/// their final length; slicing and arithmetic produce new vectors. Only explicit push_back()
/// and clear() change the length of an existing vector.
///
/// Failure modes (always active, see <numvec/assertf.hh>):
///   - "out of bounds" for indexing, front/back on empty vectors, and slicing
///   - "size must be non-negative" for negative lengths passed to factories
template <class T>
struct nv::vector
{
    static_assert(std::is_copy_constructible_v<T>, "vector<T> requires a copyable element type");

    // factories
public:
    /// Creates a vector of size copies of value.
    /// size == 0 yields an empty vector without allocating.
    [[nodiscard]] static vector create_filled(isize size, T const& value)
    {
        NV_ASSERTF_ALWAYS(size >= 0, "size must be non-negative, got {}", size);
        auto v = vector::create_with_capacity(size);
        if constexpr (std::is_nothrow_copy_constructible_v<T>)
        {
            auto end = v._data;
            impl::fill_create_objects_to(end, size, value);
            v._size = size;
        }
        else
        {
            for (isize i = 0; i < size; ++i)
                v.impl_append_within_capacity(value);
        }
        return v;
    }

    /// Creates a deep copy of the elements viewed by source.
    [[nodiscard]] static vector create_copy_of(span<T const> source)
    {
        auto v = vector::create_with_capacity(source.size());
        if constexpr (std::is_nothrow_copy_constructible_v<T>)
        {
            auto end = v._data;
            impl::copy_create_objects_to(end, source.begin(), source.end());
            v._size = source.size();
        }
        else
        {
            for (auto const& x : source)
                v.impl_append_within_capacity(x);
        }
        return v;
    }

    /// Creates an empty vector that can hold capacity elements before reallocating.
    [[nodiscard]] static vector create_with_capacity(isize capacity)
    {
        NV_ASSERTF_ALWAYS(capacity >= 0, "size must be non-negative, got {}", capacity);
        vector v;
        v._data = impl::allocate_storage<T>(capacity);
        v._capacity = capacity;
        return v;
    }

    // construction
public:
    vector() = default;

    /// Creates a vector from a literal sequence: nv::vector<int>{3, 1, 4, 1, 5}
    vector(std::initializer_list<T> init) : vector(create_copy_of(span<T const>(init.begin(), isize(init.size())))) {}

    vector(vector const& rhs) : vector(create_copy_of(span<T const>(rhs))) {}

    vector(vector&& rhs) noexcept
      : _data(nv::exchange(rhs._data, nullptr)),
        _size(nv::exchange(rhs._size, 0)),
        _capacity(nv::exchange(rhs._capacity, 0))
    {
    }

    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
            *this = vector(rhs);
        return *this;
    }

    vector& operator=(vector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_release();
            _data = nv::exchange(rhs._data, nullptr);
            _size = nv::exchange(rhs._size, 0);
            _capacity = nv::exchange(rhs._capacity, 0);
        }
        return *this;
    }

    ~vector() { impl_release(); }

    /// Explicit deep copy with independent storage.
    /// Same as the copy constructor, but spells out the cost at the call site.
    [[nodiscard]] vector clone() const { return vector(*this); }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size(), no wraparound and no negative indexing.
    [[nodiscard]] T& operator[](isize i)
    {
        NV_ASSERTF_ALWAYS(0 <= i && i < _size, "out of bounds: index {} for size {}", i, _size);
        return _data[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        NV_ASSERTF_ALWAYS(0 <= i && i < _size, "out of bounds: index {} for size {}", i, _size);
        return _data[i];
    }

    [[nodiscard]] T& front()
    {
        NV_ASSERT_ALWAYS(_size > 0, "out of bounds: front() called on empty vector");
        return _data[0];
    }
    [[nodiscard]] T const& front() const
    {
        NV_ASSERT_ALWAYS(_size > 0, "out of bounds: front() called on empty vector");
        return _data[0];
    }

    [[nodiscard]] T& back()
    {
        NV_ASSERT_ALWAYS(_size > 0, "out of bounds: back() called on empty vector");
        return _data[_size - 1];
    }
    [[nodiscard]] T const& back() const
    {
        NV_ASSERT_ALWAYS(_size > 0, "out of bounds: back() called on empty vector");
        return _data[_size - 1];
    }

    /// May be nullptr for empty vectors.
    [[nodiscard]] T* data() { return _data; }
    [[nodiscard]] T const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] T* begin() { return _data; }
    [[nodiscard]] T* end() { return _data + _size; }
    [[nodiscard]] T const* begin() const { return _data; }
    [[nodiscard]] T const* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize capacity() const { return _capacity; }

    // modifiers
public:
    /// Appends a copy of value, doubling the capacity when full.
    /// value may reference an element of this vector.
    /// Amortized O(1).
    T& push_back(T const& value) { return impl_emplace_back(value); }
    T& push_back(T&& value) { return impl_emplace_back(nv::move(value)); }

    /// Destroys all elements, keeps the capacity.
    void clear()
    {
        impl::destroy_objects_in_reverse(_data, _data + _size);
        _size = 0;
    }

    // slicing
public:
    /// Returns an independent copy of the elements addressed by range.
    /// Fails with "out of bounds" unless 0 <= begin <= end <= size().
    /// O(range size).
    [[nodiscard]] vector slice(index_range range) const
    {
        auto const r = range.resolve(_size);
        return create_copy_of(span<T const>(*this).subspan(r.begin, r.end));
    }

    /// Returns an independent copy of [begin, end).
    [[nodiscard]] vector slice(isize begin, isize end) const { return slice(nv::bounded(begin, end)); }

    // elementwise helpers and reductions
public:
    /// Raises every element to the power exp, using exponentiation by squaring.
    /// Precondition: exp >= 0.
    [[nodiscard]] vector power(isize exp) const
        requires numeric<T>
    {
        NV_ASSERTF_ALWAYS(exp >= 0, "power exponent must be non-negative, got {}", exp);
        auto result = vector(*this);
        for (auto& x : result)
            x = nv::int_pow(x, exp);
        return result;
    }

    /// Returns the elements for which pred(element) is true, in their original order.
    template <class Pred>
    [[nodiscard]] vector filter(Pred&& pred) const
    {
        static_assert(std::is_invocable_r_v<bool, Pred&, T const&>, "filter predicate must be callable as bool(T)");

        vector result;
        for (auto const& x : *this)
            if (pred(x))
                result.push_back(x);
        return result;
    }

    /// Left fold of all elements with +, starting at T(0).
    /// The empty vector sums to T(0).
    [[nodiscard]] T sum() const
        requires numeric<T>
    {
        auto acc = T(0);
        for (auto const x : *this)
            acc = nv::wrapping_add(acc, x);
        return acc;
    }

    /// Largest element. Floating point vectors are rejected at compile time (NaN has no order).
    /// Precondition: !empty().
    [[nodiscard]] T max() const
        requires integral_numeric<T>
    {
        NV_ASSERT_ALWAYS(_size > 0, "max() called on empty vector");
        auto result = _data[0];
        for (auto const x : *this)
            result = nv::max(result, x);
        return result;
    }

    /// Smallest element. Floating point vectors are rejected at compile time (NaN has no order).
    /// Precondition: !empty().
    [[nodiscard]] T min() const
        requires integral_numeric<T>
    {
        NV_ASSERT_ALWAYS(_size > 0, "min() called on empty vector");
        auto result = _data[0];
        for (auto const x : *this)
            result = nv::min(result, x);
        return result;
    }

    // comparison
public:
    /// True iff rhs has the same length and pairwise-equal elements in order.
    /// Compares against raw literal sequences as well: v.equals({1, 2, 3})
    [[nodiscard]] bool equals(span<T const> rhs) const
        requires requires(T const& a) { a == a; }
    {
        if (_size != rhs.size())
            return false;

        for (isize i = 0; i < _size; ++i)
            if (!(_data[i] == rhs[i]))
                return false;

        return true;
    }

    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& a) { a == a; }
    {
        return lhs.equals(span<T const>(rhs));
    }

    // debug
public:
    /// Renders the vector as Vector([e0, e1, ...]) with every element.
    [[nodiscard]] std::string to_string() const { return to_string(debug_string_config::unlimited()); }

    /// Same as to_string() but truncates after cfg.max_length characters.
    [[nodiscard]] std::string to_string(debug_string_config const& cfg) const
    {
        auto s = std::string("Vector(");
        s += nv::to_debug_string(span<T const>(*this), cfg);
        s += ")";
        return s;
    }

private:
    // _size only counts an element once its constructor returned, so a throwing copy
    // leaves [0, _size) as exactly the live objects for the destructor
    template <class U>
    void impl_append_within_capacity(U&& value)
    {
        ::new (static_cast<void*>(_data + _size)) T(nv::forward<U>(value));
        ++_size;
    }

    template <class U>
    T& impl_emplace_back(U&& value)
    {
        if (_size == _capacity) [[unlikely]]
        {
            impl_grow_and_append(nv::forward<U>(value));
            ++_size;
        }
        else
            impl_append_within_capacity(nv::forward<U>(value));

        return _data[_size - 1];
    }

    // value may alias an element, so it is copied out before the old storage is released.
    // A throwing copy happens before the allocation and leaves the vector unchanged.
    template <class U>
    NV_COLD_FUNC void impl_grow_and_append(U&& value)
    {
        auto appended = T(nv::forward<U>(value));

        auto const new_capacity = nv::max(_capacity * 2, isize(4));
        auto const new_data = impl::allocate_storage<T>(new_capacity);

        ::new (static_cast<void*>(new_data + _size)) T(nv::move(appended));

        auto moved_end = new_data;
        impl::move_create_objects_to(moved_end, _data, _data + _size);

        impl::destroy_objects_in_reverse(_data, _data + _size);
        impl::deallocate_storage(_data);
        _data = new_data;
        _capacity = new_capacity;
    }

    void impl_release()
    {
        impl::destroy_objects_in_reverse(_data, _data + _size);
        impl::deallocate_storage(_data);
        _data = nullptr;
        _size = 0;
        _capacity = 0;
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
    isize _capacity = 0;
};
