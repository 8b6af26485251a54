/**
 * @file test_equivalent_loads.cpp
 * @brief Tests for member axes and consistent equivalent nodal loads
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "fem2d/equivalent_loads.hpp"
#include "fem2d/geometry.hpp"

#include <cmath>
#include <stdexcept>

using namespace fem2d;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Member axes
// =============================================================================

TEST_CASE("Member axes of an inclined member", "[Geometry][axes]") {
    MemberAxes axes(1.0, 1.0, 4.0, 5.0);

    REQUIRE_THAT(axes.length, WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(axes.c, WithinAbs(0.6, 1e-12));
    REQUIRE_THAT(axes.s, WithinAbs(0.8, 1e-12));
    REQUIRE_THAT(axes.angle, WithinAbs(std::atan2(4.0, 3.0), 1e-12));
}

TEST_CASE("Local end vector of a vertical member rotates to global", "[Geometry][axes]") {
    MemberAxes axes(0.0, 0.0, 0.0, 3.0);

    Vector6 local;
    local << 1.0, 2.0, 3.0, 4.0, 5.0, 6.0;
    Vector6 global = axes.to_global(local);

    REQUIRE_THAT(global(0), WithinAbs(-2.0, 1e-12));
    REQUIRE_THAT(global(1), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(global(2), WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(global(3), WithinAbs(-5.0, 1e-12));
    REQUIRE_THAT(global(4), WithinAbs(4.0, 1e-12));
    REQUIRE_THAT(global(5), WithinAbs(6.0, 1e-12));

    Vector6 back = axes.to_local(global);
    for (int i = 0; i < 6; ++i) {
        REQUIRE_THAT(back(i), WithinAbs(local(i), 1e-12));
    }
}

TEST_CASE("Global gravity load on a column is axial", "[Geometry][axes]") {
    MemberAxes axes(0.0, 0.0, 0.0, 3.0);

    Eigen::Vector2d q = axes.load_to_local(0.0, -1000.0);
    REQUIRE_THAT(q(0), WithinAbs(-1000.0, 1e-9));
    REQUIRE_THAT(q(1), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Coincident end points are rejected", "[Geometry][axes]") {
    REQUIRE_THROWS_AS(MemberAxes(2.0, 3.0, 2.0, 3.0), std::invalid_argument);
}

// =============================================================================
// Equivalent nodal loads
// =============================================================================

TEST_CASE("Full extent reproduces the fixed-end forces of a uniform load", "[EquivalentLoads][full]") {
    const double L = 4.0;
    const double qx = 250.0;
    const double qy = -5000.0;

    Vector6 partial = partial_equivalent_forces(L, LocalLoad(qx, qy, 0.0, 1.0));
    Vector6 full = full_span_equivalent_forces(L, qx, qy);

    for (int i = 0; i < 6; ++i) {
        REQUIRE_THAT(partial(i), WithinAbs(full(i), 1e-9));
    }

    // qL/2 and qL^2/12
    REQUIRE_THAT(full(1), WithinAbs(-10000.0, 1e-9));
    REQUIRE_THAT(full(2), WithinAbs(-5000.0 * 16.0 / 12.0, 1e-9));
    REQUIRE_THAT(full(5), WithinAbs(5000.0 * 16.0 / 12.0, 1e-9));
    REQUIRE_THAT(full(0), WithinAbs(500.0, 1e-12));
}

TEST_CASE("Partial load equivalents are statically equivalent to the load", "[EquivalentLoads][partial]") {
    const double L = 6.0;
    const double qx = -120.0;
    const double qy = -3000.0;
    const double a = 0.25 * L;
    const double b = 0.75 * L;

    Vector6 f = partial_equivalent_forces(L, LocalLoad(qx, qy, 0.25, 0.75));

    // Resultant forces
    REQUIRE_THAT(f(0) + f(3), WithinRel(qx * (b - a), 1e-12));
    REQUIRE_THAT(f(1) + f(4), WithinRel(qy * (b - a), 1e-12));

    // Moment about the start node
    double load_moment = qy * (b * b - a * a) / 2.0;
    REQUIRE_THAT(f(2) + f(5) + f(4) * L, WithinRel(load_moment, 1e-12));

    // Symmetric load on the middle half
    REQUIRE_THAT(f(1), WithinRel(f(4), 1e-12));
    REQUIRE_THAT(f(2), WithinRel(-f(5), 1e-12));
}

TEST_CASE("Load near one end loads that end more", "[EquivalentLoads][partial]") {
    Vector6 f = partial_equivalent_forces(5.0, LocalLoad(0.0, -1000.0, 0.0, 0.2));

    REQUIRE(std::abs(f(1)) > std::abs(f(4)));
    REQUIRE(std::abs(f(2)) > std::abs(f(5)));
    REQUIRE_THAT(f(1) + f(4), WithinRel(-1000.0, 1e-12));
}

TEST_CASE("Zero extent gives zero equivalents", "[EquivalentLoads][partial]") {
    Vector6 f = partial_equivalent_forces(3.0, LocalLoad(100.0, -100.0, 0.4, 0.4));
    for (int i = 0; i < 6; ++i) {
        REQUIRE_THAT(f(i), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Global equivalents of an inclined member", "[EquivalentLoads][global]") {
    MemberAxes axes(0.0, 0.0, 3.0, 4.0);
    LocalLoad load(0.0, -2000.0, 0.0, 1.0);

    Vector6 g = global_equivalent_forces(axes, load);
    Vector6 local = partial_equivalent_forces(5.0, load);

    // Transverse resultant q*L rotated by the member angle
    REQUIRE_THAT(g(0) + g(3), WithinRel(-0.8 * (-2000.0 * 5.0), 1e-12));
    REQUIRE_THAT(g(1) + g(4), WithinRel(0.6 * (-2000.0 * 5.0), 1e-12));
    REQUIRE_THAT(g(2), WithinAbs(local(2), 1e-9));
    REQUIRE_THAT(g(5), WithinAbs(local(5), 1e-9));
}

TEST_CASE("Load classification", "[EquivalentLoads]") {
    REQUIRE(LocalLoad(0.0, -1.0).is_full_span());
    REQUIRE_FALSE(LocalLoad(0.0, -1.0, 0.1, 1.0).is_full_span());
    REQUIRE(LocalLoad(0.0, 0.0, 0.2, 0.5).is_zero());
    REQUIRE_FALSE(LocalLoad(1.0, 0.0).is_zero());
}
