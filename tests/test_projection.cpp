/// @file test_projection.cpp
/// @brief Unit tests for planisphere::astro::AzimuthalProjection.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/azimuthal_projection.hpp"
#include "core/types.hpp"

#include <glm/geometric.hpp>

#include <cmath>

using namespace planisphere;
using namespace planisphere::astro;

static constexpr f64 kPxTol = 1e-6;

static constexpr f64 deg(f64 d) { return d * astro_constants::kDegToRad; }

// =================================================================
// Scale and edge
// =================================================================

TEST_CASE("Scale is radius over polar distance of the limit")
{
    const AzimuthalProjection proj(300.0, deg(-30.0));
    CHECK(proj.celestial_radius_scale()
          == doctest::Approx(300.0 / (astro_constants::kHalfPi + deg(30.0))).epsilon(1e-12));
    CHECK(proj.screen_radius() == 300.0);
    CHECK(proj.declination_limit() == deg(-30.0));
    CHECK(proj.pole() == ProjectionPole::North);
    CHECK(proj.pole_sign() == 1.0);
}

TEST_CASE("Declination limit lands on the disc edge for every RA")
{
    const AzimuthalProjection north(440.0, deg(-70.0));
    const AzimuthalProjection south(440.0, deg(70.0), ProjectionPole::South);

    for (i32 i = 0; i < 8; ++i)
    {
        const f64 ra = static_cast<f64>(i) * astro_constants::kTwoPi / 8.0;
        CHECK(std::abs(glm::length(north.project(ra, deg(-70.0))) - 440.0) < kPxTol);
        CHECK(std::abs(glm::length(south.project(ra, deg(70.0))) - 440.0) < kPxTol);
    }
}

TEST_CASE("Celestial pole projects to the center")
{
    const AzimuthalProjection north(440.0, deg(-70.0));
    const AzimuthalProjection south(440.0, deg(70.0), ProjectionPole::South);

    for (const f64 ra : {0.0, 1.0, 3.0, 5.5})
    {
        CHECK(glm::length(north.project(ra, astro_constants::kHalfPi)) < kPxTol);
        CHECK(glm::length(south.project(ra, -astro_constants::kHalfPi)) < kPxTol);
    }
}

TEST_CASE("Equator with a -30° limit on a 300 px disc")
{
    // 300 · (π/2) / (π/2 + π/6) = 225
    const AzimuthalProjection proj(300.0, deg(-30.0));
    const ScreenPoint p = proj.project(0.0, 0.0);

    CHECK(glm::length(p) == doctest::Approx(225.0).epsilon(1e-9));
    CHECK(p.x > 0.0);
    CHECK(std::abs(p.y) < kPxTol);
}

TEST_CASE("Radius grows linearly with polar distance")
{
    const AzimuthalProjection proj(440.0, deg(-70.0));
    const f64 r30 = glm::length(proj.project(0.0, deg(60.0)));
    const f64 r60 = glm::length(proj.project(0.0, deg(30.0)));

    CHECK(r60 == doctest::Approx(2.0 * r30).epsilon(1e-12));
}

// =================================================================
// Orientation and culling
// =================================================================

TEST_CASE("North disc: RA runs counter-clockwise in (x, y)")
{
    const AzimuthalProjection proj(440.0, deg(-70.0));

    const ScreenPoint at0  = proj.project(0.0, 0.0);
    const ScreenPoint at6h = proj.project(astro_constants::kHalfPi, 0.0);

    CHECK(at0.x > 0.0);
    CHECK(std::abs(at6h.x) < kPxTol);
    CHECK(at6h.y > 0.0);
}

TEST_CASE("South disc mirrors RA")
{
    const AzimuthalProjection north(440.0, deg(-70.0));
    const AzimuthalProjection south(440.0, deg(70.0), ProjectionPole::South);

    const ScreenPoint n = north.project(1.2, deg(20.0));
    const ScreenPoint s = south.project(1.2, deg(-20.0));

    CHECK(s.x == doctest::Approx(n.x).epsilon(1e-12));
    CHECK(s.y == doctest::Approx(-n.y).epsilon(1e-12));
    CHECK(south.pole_sign() == -1.0);
}

TEST_CASE("Points past the limit fall outside the disc")
{
    const AzimuthalProjection proj(440.0, deg(-70.0));

    CHECK(proj.is_within_disc(proj.project(2.0, deg(-69.0))));
    CHECK(proj.is_within_disc(proj.project(2.0, deg(-70.0))));
    CHECK_FALSE(proj.is_within_disc(proj.project(2.0, deg(-71.0))));
    CHECK_FALSE(proj.is_within_disc(proj.project(2.0, -astro_constants::kHalfPi)));
}

// =================================================================
// Disc rotation
// =================================================================

TEST_CASE("Disc rotation brings the meridian to the bottom")
{
    const AzimuthalProjection north(440.0, deg(-70.0));
    const AzimuthalProjection south(440.0, deg(70.0), ProjectionPole::South);

    // Sidereal time of day 0h, 6h, 18h
    CHECK(north.disc_rotation_degrees(2451544.5) == doctest::Approx(90.0).epsilon(1e-9));
    CHECK(north.disc_rotation_degrees(2451544.75) == doctest::Approx(0.0).epsilon(1e-9));
    CHECK(north.disc_rotation_degrees(2451545.25) == doctest::Approx(-180.0).epsilon(1e-9));

    CHECK(south.disc_rotation_degrees(2451544.75) == doctest::Approx(180.0).epsilon(1e-9));

    SUBCASE("Rotated meridian points to +y")
    {
        const f64 lst = 2451544.6;
        const f64 ra = (lst - 2451544.5) * astro_constants::kTwoPi;
        const f64 rot = north.disc_rotation_degrees(lst) * astro_constants::kDegToRad;

        const ScreenPoint p = north.project(ra, 0.0);
        const f64 y = p.x * std::sin(rot) + p.y * std::cos(rot);
        CHECK(y == doctest::Approx(glm::length(p)).epsilon(1e-9));
    }
}
