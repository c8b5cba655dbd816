#include <numvec/numvec.hh>

#include <nexus/test.hh>

#include "assert-helper.hh"

#include <random>

TEST("numvec - builders, arithmetic and slicing together")
{
    SECTION("normalizing a sequence")
    {
        auto const x = nv::linspace(5, 0.0, 1.0);
        auto const y = (x * 2.0 - nv::ones_like(x)) * 4.0;
        CHECK(y.equals({-4.0, -2.0, 0.0, 2.0, 4.0}));
        CHECK(y.slice(nv::from(3)).equals({2.0, 4.0}));
    }

    SECTION("integer pipeline")
    {
        auto const r = nv::range(1, 7);
        auto const squares = r.power(2);
        auto const odd = squares.filter([](int v) { return v % 2 == 1; });
        CHECK(odd.equals({1, 9, 25}));
        CHECK(odd.sum() == 35);
        CHECK((squares - r).max() == 30);
        CHECK((10 - r).min() == 4);
    }

    SECTION("grid of random rows")
    {
        auto rng = std::mt19937_64(5);
        auto grid = nv::zeros_nested<double>({3, 4});
        for (auto& row : grid)
            row += nv::uniform(4, 0.0, 1.0, rng);

        for (auto const& row : grid)
        {
            REQUIRE(row.size() == 4);
            for (auto v : row)
                CHECK((v >= 0.0 && v < 1.0));
        }
    }

    SECTION("failures propagate through the whole expression")
    {
        auto const a = nv::range(0, 4);
        auto const b = nv::range(0, 5);
        CHECK(nv::test::fails_with([&] { (void)(a * 2 + b); }, "length mismatch"));
        CHECK(nv::test::fails_with([&] { (void)(a + b.slice(nv::through(4))); }, "length mismatch"));
        CHECK(nv::test::fails_with([&] { (void)(a + b.slice(nv::through(5))); }, "out of bounds"));
    }
}
