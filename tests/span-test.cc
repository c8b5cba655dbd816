#include <numvec/span.hh>
#include <numvec/vector.hh>

#include <nexus/test.hh>

#include "assert-helper.hh"

#include <type_traits>

static_assert(std::is_trivially_copyable_v<nv::span<int>>, "span should be trivially copyable");
static_assert(std::is_trivially_copyable_v<nv::span<nv::vector<int> const>>,
              "span should be trivially copyable even with non-trivial T");

TEST("span - construction")
{
    SECTION("default construction")
    {
        auto const s = nv::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer + size construction")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = nv::span<int>(data, 5);
        CHECK(s.data() == data);
        CHECK(s.size() == 5);
        CHECK(!s.empty());
    }

    SECTION("C array construction")
    {
        double data[] = {0.5, 1.5, 2.5};
        auto const s = nv::span<double>(data);
        CHECK(s.size() == 3);
        CHECK(s[1] == 1.5);
    }

    SECTION("container construction")
    {
        auto v = nv::vector<int>{1, 2, 3, 4};
        auto const s = nv::span<int>(v);
        CHECK(s.data() == v.data());
        CHECK(s.size() == 4);

        s[0] = 10;
        CHECK(v[0] == 10);
    }

    SECTION("const view of a const container")
    {
        auto const v = nv::vector<int>{7, 8};
        auto const s = nv::span<int const>(v);
        CHECK(s.size() == 2);
        CHECK(s[1] == 8);
    }
}

TEST("span - literal sequences as arguments")
{
    auto sum = [](nv::span<int const> s)
    {
        int r = 0;
        for (auto x : s)
            r += x;
        return r;
    };

    CHECK(sum({}) == 0);
    CHECK(sum({1, 2, 3}) == 6);
    CHECK(sum({-4, 4}) == 0);
}

TEST("span - subspan")
{
    int data[] = {0, 1, 2, 3, 4, 5};
    auto const s = nv::span<int>(data);

    SECTION("inner range")
    {
        auto const sub = s.subspan(1, 4);
        CHECK(sub.size() == 3);
        CHECK(sub[0] == 1);
        CHECK(sub[2] == 3);
        CHECK(sub.data() == data + 1);
    }

    SECTION("empty and full ranges")
    {
        CHECK(s.subspan(3, 3).empty());
        CHECK(s.subspan(0, 6).size() == 6);
    }

    SECTION("ranges outside the span fail")
    {
        CHECK(nv::test::fails_with([&] { (void)s.subspan(0, 7); }, "out of bounds"));
        CHECK(nv::test::fails_with([&] { (void)s.subspan(-1, 2); }, "out of bounds"));
        CHECK(nv::test::fails_with([&] { (void)s.subspan(4, 2); }, "out of bounds"));
    }
}

#if NV_ASSERT_ENABLED
TEST("span - indexing is checked in debug builds")
{
    int data[] = {1, 2};
    auto const s = nv::span<int>(data);
    CHECK(nv::test::fails([&] { (void)s[2]; }));
    CHECK(nv::test::fails([&] { (void)s[-1]; }));
}
#endif
