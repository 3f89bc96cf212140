#include "StencilFixture.hpp"
#include "core/Errors.hpp"
#include "domain/Domain.hpp"
#include "domain/Region.hpp"

#include <catch2/catch.hpp>

using domain::BoundaryKind;
using domain::Coord;

/**
 * Test Suite: Domain and Region
 *
 * Verifies bounds validation, index mapping and boundary resolution.
 */
TEST_CASE("Domain rejects malformed bounds", "[domain]")
{
    REQUIRE_THROWS_AS(domain::Domain({{5, 4}}, std::vector<BoundaryKind>{BoundaryKind::Periodic}),
                      core::InvalidDomain);
    REQUIRE_THROWS_AS(domain::Domain({{0, 9}, {3, 2}},
                                     std::vector<BoundaryKind>{BoundaryKind::ZeroClamp, BoundaryKind::ZeroClamp}),
                      core::InvalidDomain);
    REQUIRE_THROWS_AS(domain::Domain({}, std::vector<BoundaryKind>{}), core::InvalidDomain);
    REQUIRE_THROWS_AS(domain::Domain({{0, 9}}, std::vector<BoundaryKind>{}), core::InvalidDomain);
}

TEST_CASE("Single-point domain is legal", "[domain]")
{
    auto dom = fixture::line(3, 3, BoundaryKind::EdgeClamp);

    REQUIRE(dom.rank() == 1);
    REQUIRE(dom.pointCount() == 1);
    REQUIRE(dom.contains({3}));
    REQUIRE_FALSE(dom.contains({4}));
}

TEST_CASE("Domain contains", "[domain]")
{
    auto dom = fixture::box({4, 6}, BoundaryKind::ZeroClamp);

    REQUIRE(dom.pointCount() == 24);
    REQUIRE(dom.contains({0, 0}));
    REQUIRE(dom.contains({3, 5}));
    REQUIRE_FALSE(dom.contains({4, 0}));
    REQUIRE_FALSE(dom.contains({0, -1}));
}

TEST_CASE("Periodic boundary wraps modulo extent", "[domain][boundary]")
{
    auto dom = fixture::line(2, 6, BoundaryKind::Periodic);  // 5 points

    REQUIRE(dom.resolveBoundary(4, 0).index == 4);
    REQUIRE(dom.resolveBoundary(1, 0).index == 6);
    REQUIRE(dom.resolveBoundary(7, 0).index == 2);
    REQUIRE(dom.resolveBoundary(-9, 0).index == 6);
    REQUIRE(dom.resolveBoundary(19, 0).index == 4);
    REQUIRE_FALSE(dom.resolveBoundary(-9, 0).isValue);
}

TEST_CASE("Clamped boundaries", "[domain][boundary]")
{
    auto zero = fixture::line(0, 4, BoundaryKind::ZeroClamp);
    auto r = zero.resolveBoundary(-1, 0);
    REQUIRE(r.isValue);
    REQUIRE(r.value == 0.0);

    auto edge = fixture::line(0, 4, BoundaryKind::EdgeClamp);
    REQUIRE(edge.resolveBoundary(-3, 0).index == 0);
    REQUIRE(edge.resolveBoundary(12, 0).index == 4);
    REQUIRE_FALSE(edge.resolveBoundary(12, 0).isValue);

    domain::Domain constant({{0, 4}}, std::vector<domain::Boundary>{{BoundaryKind::Constant, 2.5}});
    auto c = constant.resolveBoundary(5, 0);
    REQUIRE(c.isValue);
    REQUIRE(c.value == 2.5);
}

TEST_CASE("Full position resolution with mixed boundaries", "[domain][boundary]")
{
    domain::Domain dom({{0, 3}, {0, 3}},
                       std::vector<BoundaryKind>{BoundaryKind::Periodic, BoundaryKind::ZeroClamp});
    Coord resolved;
    double value = -1.0;

    REQUIRE(dom.resolve({-1, 2}, resolved, value));
    REQUIRE(resolved == Coord{3, 2});

    REQUIRE_FALSE(dom.resolve({-1, 4}, resolved, value));
    REQUIRE(value == 0.0);
}

TEST_CASE("Boundary kind names", "[domain][boundary]")
{
    REQUIRE(domain::parseBoundaryKind("periodic") == BoundaryKind::Periodic);
    REQUIRE(domain::parseBoundaryKind("edge") == BoundaryKind::EdgeClamp);
    REQUIRE(std::string(domain::toString(BoundaryKind::ZeroClamp)) == "zero");
    REQUIRE_THROWS_AS(domain::parseBoundaryKind("mirror"), std::invalid_argument);
}

TEST_CASE("Region linear indexing is row-major", "[domain][region]")
{
    domain::Region r({1, 10}, {2, 12});

    REQUIRE(r.volume() == 6);
    REQUIRE(r.linearIndex({1, 10}) == 0);
    REQUIRE(r.linearIndex({1, 12}) == 2);
    REQUIRE(r.linearIndex({2, 10}) == 3);
    REQUIRE(r.coordAt(5) == Coord{2, 12});

    std::vector<Coord> visited;
    r.forEachPoint([&](const Coord& c) { visited.push_back(c); });
    REQUIRE(visited.size() == 6);
    for (size_t i = 0; i < visited.size(); ++i) {
        REQUIRE(r.linearIndex(visited[i]) == i);
    }
}

TEST_CASE("Region set operations", "[domain][region]")
{
    domain::Region a({0, 0}, {9, 9});
    domain::Region b({5, 8}, {12, 20});
    domain::Region c({10, 10}, {11, 11});

    REQUIRE(a.intersects(b));
    REQUIRE_FALSE(a.intersects(c));
    REQUIRE(*a.intersection(b) == domain::Region({5, 8}, {9, 9}));
    REQUIRE_FALSE(a.intersection(c).has_value());
    REQUIRE(a.containsRegion(domain::Region({2, 2}, {3, 3})));
    REQUIRE_FALSE(a.containsRegion(b));
    REQUIRE(a.expanded({1, 2}) == domain::Region({-1, -2}, {10, 11}));
    REQUIRE(a.toString() == "[0:9, 0:9]");
    REQUIRE_THROWS_AS(domain::Region({3}, {2}), std::invalid_argument);
}
