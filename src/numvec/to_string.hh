#pragma once

#include <string>
#include <string_view>

// Human-readable rendering of the primitive element types.
// Used by to_debug_string and thus by vector<T>::to_string().

namespace nv
{
// in hex
[[nodiscard]] std::string to_string(void const* ptr);

// true/false
[[nodiscard]] std::string to_string(bool b);

// simply the char
[[nodiscard]] std::string to_string(char c);

// integer types
// note: i8/u8 are signed/unsigned char and print as numbers, not as characters
[[nodiscard]] std::string to_string(signed char i);
[[nodiscard]] std::string to_string(unsigned char i);
[[nodiscard]] std::string to_string(signed short i);
[[nodiscard]] std::string to_string(unsigned short i);
[[nodiscard]] std::string to_string(signed int i);
[[nodiscard]] std::string to_string(unsigned int i);
[[nodiscard]] std::string to_string(signed long i);
[[nodiscard]] std::string to_string(unsigned long i);
[[nodiscard]] std::string to_string(signed long long i);
[[nodiscard]] std::string to_string(unsigned long long i);

// float/double, shortest representation that round-trips
[[nodiscard]] std::string to_string(float f);
[[nodiscard]] std::string to_string(double f);

// no-op
[[nodiscard]] std::string to_string(char const* s);
[[nodiscard]] std::string to_string(std::string_view s);

} // namespace nv
