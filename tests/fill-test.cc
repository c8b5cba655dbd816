#include <numvec/builders/fill.hh>

#include <nexus/test.hh>

#include "assert-helper.hh"

#include <type_traits>

TEST("fill - full")
{
    SECTION("copies of value")
    {
        auto const v = nv::full(4, 2.5);
        static_assert(std::is_same_v<decltype(v), nv::vector<double> const>);
        CHECK(v.size() == 4);
        CHECK(v.equals({2.5, 2.5, 2.5, 2.5}));
    }

    SECTION("element type follows the value")
    {
        auto const v = nv::full(3, nv::u8(200));
        static_assert(std::is_same_v<decltype(v), nv::vector<nv::u8> const>);
        for (auto x : v)
            CHECK(x == 200);
    }

    SECTION("zero length")
    {
        CHECK(nv::full(0, 7).empty());
    }

    SECTION("negative length fails")
    {
        CHECK(nv::test::fails_with([] { (void)nv::full(-1, 7); }, "size must be non-negative"));
    }
}

TEST("fill - zeros and ones")
{
    auto const z = nv::zeros<int>(5);
    CHECK(z.size() == 5);
    CHECK(z.equals({0, 0, 0, 0, 0}));

    auto const o = nv::ones<float>(3);
    CHECK(o.equals({1.f, 1.f, 1.f}));

    CHECK(nv::zeros<nv::i64>(0).empty());
    CHECK(nv::ones<double>(0).empty());

    CHECK(nv::test::fails_with([] { (void)nv::zeros<int>(-2); }, "size must be non-negative"));
    CHECK(nv::test::fails_with([] { (void)nv::ones<int>(-2); }, "size must be non-negative"));
}

TEST("fill - shape-copying variants")
{
    auto const v = nv::vector<nv::i16>{3, 1, 4, 1, 5};

    SECTION("full_like")
    {
        auto const f = nv::full_like(v, 9);
        static_assert(std::is_same_v<decltype(f), nv::vector<nv::i16> const>);
        CHECK(f.equals({9, 9, 9, 9, 9}));
    }

    SECTION("zeros_like and ones_like")
    {
        CHECK(nv::zeros_like(v).equals({0, 0, 0, 0, 0}));
        CHECK(nv::ones_like(v).equals({1, 1, 1, 1, 1}));
    }

    SECTION("empty template")
    {
        auto const e = nv::vector<double>{};
        CHECK(nv::zeros_like(e).empty());
        CHECK(nv::ones_like(e).empty());
        CHECK(nv::full_like(e, 3.0).empty());
    }

    SECTION("the template is not modified")
    {
        (void)nv::full_like(v, 0);
        CHECK(v.equals({3, 1, 4, 1, 5}));
    }
}

namespace
{
template <class T>
concept can_fill = requires(T value) {
    nv::full(3, value);
    nv::zeros<T>(3);
    nv::ones<T>(3);
};
} // namespace

static_assert(can_fill<int> && can_fill<nv::f32> && can_fill<nv::u64>);
static_assert(!can_fill<bool>, "bool is not a numeric element type");
static_assert(!can_fill<char>, "char is not a numeric element type");
