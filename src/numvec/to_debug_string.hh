#pragma once

#include <numvec/fwd.hh>
#include <numvec/to_string.hh>

#include <format>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

// =========================================================================================================
// Debug rendering of arbitrary values
// =========================================================================================================
//
// nv::to_debug_string(v) picks the first rendering that applies to v:
//
//   string-like         "text"                      (quoted)
//   to_string(v)        whatever it returns         (numvec's primitive overloads or found by ADL)
//   v.to_string()       whatever it returns         (nv::vector renders as Vector([...]))
//   iterable            [e0, e1, ...]               (elements rendered recursively)
//   tuple-like          (e0, e1, ...)               (elements rendered recursively)
//   anything else       0x0403020.._BBAA....        (hex dump of the object bytes, grouped by alignment)
//
// Iterables and tuples stop appending elements once the output reaches cfg.max_length
// and close with ", ...".
//
// The output is meant for humans reading logs and test failures, not for parsing.
//

namespace nv
{
struct debug_string_config
{
    // soft limit, the element that crosses it is still printed completely
    isize max_length = 100;

    [[nodiscard]] static constexpr debug_string_config unlimited()
    {
        return {.max_length = std::numeric_limits<isize>::max()};
    }
};

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

namespace impl
{
// appends ", elem" (or just "elem" after the opening bracket)
// returns false once the limit is reached, after closing with ", ..."
template <class T>
bool append_debug_element(std::string& out, T const& elem, debug_string_config const& cfg)
{
    if (isize(out.size()) >= cfg.max_length)
    {
        out += ", ...";
        return false;
    }

    if (out.size() > 1)
        out += ", ";
    out += nv::to_debug_string(elem, cfg);
    return true;
}

template <class T, std::size_t... I>
void append_debug_tuple_elements(std::string& out, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(nv::impl::append_debug_element(out, std::get<I>(v), cfg) && ...);
}

template <class T>
std::string debug_hex_dump(T const& v)
{
    auto out = std::string("0x");
    auto const bytes = reinterpret_cast<unsigned char const*>(&v);
    for (std::size_t i = 0; i < sizeof(T); ++i)
    {
        if (i > 0 && i % alignof(T) == 0)
            out += '_';
        out += std::format("{:02X}", bytes[i]);
    }
    return out;
}
} // namespace impl

template <class T>
std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        return std::format("\"{}\"", std::string_view(v));
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto out = std::string("[");
        for (auto const& e : v)
            if (!nv::impl::append_debug_element(out, e, cfg))
                break;
        out += ']';
        return out;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto out = std::string("(");
        nv::impl::append_debug_tuple_elements(out, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        out += ')';
        return out;
    }
    else
    {
        return nv::impl::debug_hex_dump(v);
    }
}
} // namespace nv
