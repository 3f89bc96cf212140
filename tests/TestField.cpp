#include "StencilFixture.hpp"
#include "core/Errors.hpp"
#include "field/FieldBuffer.hpp"

#include <catch2/catch.hpp>

using domain::BoundaryKind;
using domain::Coord;
using field::FieldBuffer;

/**
 * Test Suite: Field buffers
 *
 * Verifies value ordering, halo sizing and halo staleness tracking.
 */
TEST_CASE("Values round-trip in domain order", "[field]")
{
    auto dom = fixture::box({2, 3}, BoundaryKind::ZeroClamp);
    std::vector<double> values{0, 1, 2, 3, 4, 5};

    auto buffer = FieldBuffer<double>::fromValues(dom, values);

    REQUIRE(buffer.toValues() == values);
    REQUIRE(buffer.at({0, 2}) == 2.0);
    REQUIRE(buffer.at({1, 0}) == 3.0);
}

TEST_CASE("Value count must match the domain", "[field]")
{
    auto dom = fixture::line(0, 4, BoundaryKind::ZeroClamp);

    REQUIRE_THROWS_AS(FieldBuffer<double>::fromValues(dom, {1.0, 2.0}), core::InvalidField);
    REQUIRE_THROWS_AS(FieldBuffer<double>(dom, Coord{1, 1}), core::InvalidField);
    REQUIRE_THROWS_AS(FieldBuffer<double>(dom, Coord{-1}), core::InvalidField);
}

TEST_CASE("Storage includes the halo", "[field][halo]")
{
    auto dom = fixture::box({4, 5}, BoundaryKind::Periodic);
    FieldBuffer<double> buffer(dom, Coord{1, 2});

    REQUIRE(buffer.storageRegion() == domain::Region({-1, -2}, {4, 6}));
    REQUIRE(buffer.storageSize() == 6 * 9);
    REQUIRE(buffer.toValues().size() == 20);
}

TEST_CASE("Reading a stale halo cell is a defect", "[field][halo]")
{
    auto dom = fixture::line(0, 4, BoundaryKind::ZeroClamp);
    auto buffer = FieldBuffer<double>::fromValues(dom, Coord{1}, {1, 2, 3, 4, 5});

    REQUIRE_FALSE(buffer.isHaloValid());
    REQUIRE(buffer.get({2}) == 3.0);
    REQUIRE_THROWS_AS(buffer.get({-1}), core::StaleHaloRead);
    REQUIRE_THROWS_AS(buffer.get({-2}), std::out_of_range);
}

TEST_CASE("Halo refresh applies each boundary kind", "[field][halo]")
{
    std::vector<double> values{1, 2, 3, 4, 5};

    SECTION("periodic")
    {
        auto buffer = FieldBuffer<double>::fromValues(fixture::line(0, 4, BoundaryKind::Periodic), Coord{2}, values);
        buffer.refreshHalo();
        REQUIRE(buffer.get({-1}) == 5.0);
        REQUIRE(buffer.get({-2}) == 4.0);
        REQUIRE(buffer.get({5}) == 1.0);
    }

    SECTION("zero")
    {
        auto buffer = FieldBuffer<double>::fromValues(fixture::line(0, 4, BoundaryKind::ZeroClamp), Coord{1}, values);
        buffer.refreshHalo();
        REQUIRE(buffer.get({-1}) == 0.0);
        REQUIRE(buffer.get({5}) == 0.0);
    }

    SECTION("edge")
    {
        auto buffer = FieldBuffer<double>::fromValues(fixture::line(0, 4, BoundaryKind::EdgeClamp), Coord{2}, values);
        buffer.refreshHalo();
        REQUIRE(buffer.get({-2}) == 1.0);
        REQUIRE(buffer.get({6}) == 5.0);
    }

    SECTION("constant")
    {
        domain::Domain dom({{0, 4}}, std::vector<domain::Boundary>{{BoundaryKind::Constant, -1.0}});
        auto buffer = FieldBuffer<double>::fromValues(dom, Coord{1}, values);
        buffer.refreshHalo();
        REQUIRE(buffer.get({5}) == -1.0);
    }
}

TEST_CASE("Writing the interior marks the halo stale", "[field][halo]")
{
    auto buffer = FieldBuffer<double>::fromValues(fixture::line(0, 4, BoundaryKind::Periodic), Coord{1},
                                                  {1, 2, 3, 4, 5});
    buffer.refreshHalo();
    REQUIRE(buffer.isHaloValid());

    buffer.set({0}, 9.0);
    REQUIRE_FALSE(buffer.isHaloValid());
    REQUIRE_THROWS_AS(buffer.set({-1}, 1.0), std::out_of_range);

    buffer.refreshHalo();
    REQUIRE(buffer.get({5}) == 9.0);
}

TEST_CASE("Generated values and fill", "[field]")
{
    auto dom = fixture::box({3, 3}, BoundaryKind::EdgeClamp);
    FieldBuffer<int64_t> buffer(dom, Coord{0, 0});

    buffer.setValues([](const Coord& c) { return c[0] * 10 + c[1]; });
    REQUIRE(buffer.toValues() == std::vector<int64_t>{0, 1, 2, 10, 11, 12, 20, 21, 22});

    buffer.fill(7);
    REQUIRE(buffer.toValues() == std::vector<int64_t>(9, 7));

    FieldBuffer<int64_t> other(dom, Coord{0, 0});
    REQUIRE(buffer.sameShape(other));
    REQUIRE_FALSE(buffer.sameShape(FieldBuffer<int64_t>(dom, Coord{1, 1})));
}
