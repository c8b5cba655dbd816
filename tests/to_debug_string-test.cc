#include <numvec/span.hh>
#include <numvec/to_debug_string.hh>
#include <numvec/vector.hh>

#include <nexus/test.hh>

#include <array>
#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// Type with both ADL to_string and iterability
struct HasAdlAndIterable
{
    std::vector<int> data = {10, 20, 30};

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

std::string to_string(HasAdlAndIterable const&)
{
    return "ADL_to_string";
}

// Type with member to_string() and iterability
struct HasMemberAndIterable
{
    std::vector<int> data = {40, 50};

    std::string to_string() const { return "member_to_string"; }
    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

// Opaque struct for memory dump fallback
struct OpaqueType
{
    uint32_t a;
    uint16_t b;
};

TEST("to_debug_string - dispatch priorities")
{
    CHECK(nv::to_debug_string(HasAdlAndIterable{}) == "ADL_to_string");
    CHECK(nv::to_debug_string(HasMemberAndIterable{}) == "member_to_string");
    CHECK(nv::to_debug_string(std::string("abc")) == "\"abc\"");
}

TEST("to_debug_string - primitive element types")
{
    CHECK(nv::to_debug_string(42) == "42");
    CHECK(nv::to_debug_string(-7L) == "-7");
    CHECK(nv::to_debug_string(nv::u64(18446744073709551615ull)) == "18446744073709551615");
    CHECK(nv::to_debug_string(nv::i8(-3)) == "-3");
    CHECK(nv::to_debug_string(nv::u8(200)) == "200");
    CHECK(nv::to_debug_string(0.1) == "0.1");
    CHECK(nv::to_debug_string(2.0) == "2");
    CHECK(nv::to_debug_string(1.5f) == "1.5");
    CHECK(nv::to_debug_string(true) == "true");
}

TEST("to_debug_string - collections")
{
    SECTION("empty")
    {
        CHECK(nv::to_debug_string(std::vector<int>{}) == "[]");
        CHECK(nv::to_debug_string(nv::span<int const>{}) == "[]");
    }

    SECTION("elements are comma separated")
    {
        auto const v = std::vector<double>{1.5, 2.0, -0.25};
        CHECK(nv::to_debug_string(v) == "[1.5, 2, -0.25]");

        auto const a = std::array<int, 3>{7, 8, 9};
        CHECK(nv::to_debug_string(a) == "[7, 8, 9]");
    }

    SECTION("nested collections")
    {
        auto const v = std::vector<std::vector<int>>{{1, 2}, {}, {3}};
        CHECK(nv::to_debug_string(v) == "[[1, 2], [], [3]]");
    }

    SECTION("numvec vectors render through their member to_string")
    {
        auto const v = nv::vector<int>{1, 2};
        CHECK(nv::to_debug_string(v) == "Vector([1, 2])");
    }
}

TEST("to_debug_string - tuples")
{
    CHECK(nv::to_debug_string(std::tuple<>{}) == "()");
    CHECK(nv::to_debug_string(std::pair<int, double>{1, 0.5}) == "(1, 0.5)");
    CHECK(nv::to_debug_string(std::tuple<int, std::string, bool>{3, "x", false}) == "(3, \"x\", false)");
}

TEST("to_debug_string - opaque struct produces hex dump")
{
    auto const o = OpaqueType{.a = 0x01020304, .b = 0xAABB};
    auto const s = nv::to_debug_string(o);
    CHECK(s.starts_with("0x"));
    // 8 bytes, separated into 4-byte groups
    CHECK(s.size() == 2 + 16 + 1);
    CHECK(s[10] == '_');
}

TEST("to_debug_string - truncation")
{
    auto v = std::vector<int>(100, 5);

    SECTION("default config stops around 100 characters")
    {
        auto const s = nv::to_debug_string(v);
        CHECK(s.ends_with(", ...]"));
        CHECK(s.size() < 120);
    }

    SECTION("explicit max_length")
    {
        auto const s = nv::to_debug_string(v, {.max_length = 6});
        CHECK(s == "[5, 5, 5, ...]");
    }

    SECTION("unlimited")
    {
        auto const s = nv::to_debug_string(v, nv::debug_string_config::unlimited());
        CHECK(s.find("...") == std::string::npos);
        CHECK(s.size() == 2 + 100 + 99 * 2);
    }
}
