#include <numvec/numeric.hh>

#include <nexus/test.hh>

#include <limits>

static_assert(nv::numeric<int> && nv::numeric<nv::i8> && nv::numeric<nv::u64> && nv::numeric<double>);
static_assert(!nv::numeric<bool>);
static_assert(!nv::numeric<char> && !nv::numeric<char8_t> && !nv::numeric<wchar_t>);
static_assert(!nv::numeric<int*>);

static_assert(nv::integral_numeric<nv::i16> && !nv::integral_numeric<float>);
static_assert(nv::floating_numeric<float> && !nv::floating_numeric<nv::u32>);

static_assert(nv::int_pow(3, 2) == 9);
static_assert(nv::int_pow(7, 0) == 1);

static_assert(nv::wrapping_add<int>(std::numeric_limits<int>::max(), 1) == std::numeric_limits<int>::min());
static_assert(nv::wrapping_sub<int>(std::numeric_limits<int>::min(), 1) == std::numeric_limits<int>::max());
static_assert(nv::wrapping_mul<nv::u16>(300, 300) == 24464);
static_assert(nv::wrapping_add(0.5, 0.25) == 0.75);

TEST("numeric - int_pow")
{
    SECTION("integers")
    {
        CHECK(nv::int_pow(2, 10) == 1024);
        CHECK(nv::int_pow(-3, 3) == -27);
        CHECK(nv::int_pow(0, 0) == 1);
        CHECK(nv::int_pow(0, 5) == 0);
        CHECK(nv::int_pow(nv::i64(10), 18) == 1000000000000000000);
    }

    SECTION("floating point")
    {
        CHECK(nv::int_pow(2.0, 10) == 1024.0);
        CHECK(nv::int_pow(0.5, 3) == 0.125);
        CHECK(nv::int_pow(1.5f, 2) == 2.25f);
    }

    SECTION("narrow types wrap like repeated multiplication")
    {
        CHECK(nv::int_pow(nv::u8(2), 8) == 0);
        CHECK(nv::int_pow(nv::u8(3), 5) == nv::u8(243));
        CHECK(nv::int_pow(nv::i8(2), 7) == nv::i8(-128));
    }

    SECTION("wide types wrap as well")
    {
        CHECK(nv::int_pow(2, 32) == 0);
        CHECK(nv::int_pow(-2, 31) == std::numeric_limits<int>::min());
        CHECK(nv::int_pow(-2, 32) == 0);
        CHECK(nv::int_pow(nv::u64(2), 64) == 0);
        CHECK(nv::int_pow(nv::u16(255), 2) == nv::u16(65025));
        CHECK(nv::int_pow(nv::u16(256), 2) == 0);
    }
}
