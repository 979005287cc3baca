/// @file test_observer_frame.cpp
/// @brief Unit tests for planisphere::astro::ObserverFrame validation.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/observer_frame.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <cmath>
#include <limits>

using namespace planisphere;
using namespace planisphere::astro;

// =================================================================
// Custom main: rejected frames log a warning
// =================================================================

int main(int argc, char** argv)
{
    planisphere::core::Logger::init({});  // console only
    const int result = doctest::Context(argc, argv).run();
    planisphere::core::Logger::shutdown();
    return result;
}

static constexpr f64 kDegTol = 1e-9;

// =================================================================
// Accepted sites
// =================================================================

TEST_CASE("Seoul is accepted and stored in radians")
{
    const auto frame = ObserverFrame::create(9.0, 126.98, 37.57);
    REQUIRE(frame.has_value());

    CHECK(frame->utc_offset_hours() == 9.0);
    CHECK(frame->longitude_rad() == doctest::Approx(126.98 * astro_constants::kDegToRad).epsilon(kDegTol));
    CHECK(frame->latitude_rad() == doctest::Approx(37.57 * astro_constants::kDegToRad).epsilon(kDegTol));
    CHECK(frame->longitude_deg() == doctest::Approx(126.98).epsilon(kDegTol));
    CHECK(frame->latitude_deg() == doctest::Approx(37.57).epsilon(kDegTol));
    CHECK_FALSE(frame->is_southern());
}

TEST_CASE("Longitude in hours is east positive")
{
    const auto east = ObserverFrame::create(9.0, 135.0, 35.0);
    const auto west = ObserverFrame::create(-5.0, -75.0, 40.0);
    REQUIRE(east.has_value());
    REQUIRE(west.has_value());

    CHECK(east->longitude_hours() == doctest::Approx(9.0).epsilon(kDegTol));
    CHECK(west->longitude_hours() == doctest::Approx(-5.0).epsilon(kDegTol));
}

TEST_CASE("Longitude is wrapped into [-180, 180)")
{
    SUBCASE("190 → -170")
    {
        const auto frame = ObserverFrame::create(0.0, 190.0, 45.0);
        REQUIRE(frame.has_value());
        CHECK(frame->longitude_deg() == doctest::Approx(-170.0).epsilon(kDegTol));
    }

    SUBCASE("180 → -180")
    {
        const auto frame = ObserverFrame::create(0.0, 180.0, 45.0);
        REQUIRE(frame.has_value());
        CHECK(frame->longitude_deg() == doctest::Approx(-180.0).epsilon(kDegTol));
    }

    SUBCASE("-540 → -180")
    {
        const auto frame = ObserverFrame::create(0.0, -540.0, 45.0);
        REQUIRE(frame.has_value());
        CHECK(frame->longitude_deg() == doctest::Approx(-180.0).epsilon(kDegTol));
    }
}

TEST_CASE("Southern observer")
{
    const auto sydney = ObserverFrame::create(10.0, 151.21, -33.87);
    REQUIRE(sydney.has_value());
    CHECK(sydney->is_southern());
    CHECK(sydney->latitude_deg() == doctest::Approx(-33.87).epsilon(kDegTol));
}

TEST_CASE("Latitude limits are inclusive")
{
    CHECK(ObserverFrame::create(0.0, 0.0, 90.0).has_value());
    CHECK(ObserverFrame::create(0.0, 0.0, -90.0).has_value());
    CHECK(ObserverFrame::create(0.0, 0.0, 10.0).has_value());
    CHECK(ObserverFrame::create(0.0, 0.0, -10.0).has_value());
}

// =================================================================
// Rejected sites
// =================================================================

TEST_CASE("Latitude outside [-90, 90] is rejected")
{
    CHECK_FALSE(ObserverFrame::create(0.0, 0.0, 90.5).has_value());
    CHECK_FALSE(ObserverFrame::create(0.0, 0.0, -91.0).has_value());
}

TEST_CASE("Latitude near the equator is rejected")
{
    CHECK_FALSE(ObserverFrame::create(0.0, 0.0, 0.0).has_value());
    CHECK_FALSE(ObserverFrame::create(7.0, 100.5, 9.99).has_value());
    CHECK_FALSE(ObserverFrame::create(-3.0, -47.9, -5.0).has_value());

    SUBCASE("Threshold is configurable")
    {
        CHECK(ObserverFrame::create(0.0, 0.0, 5.0, 0.0).has_value());
        CHECK_FALSE(ObserverFrame::create(0.0, 0.0, 20.0, 25.0).has_value());
    }
}

TEST_CASE("Non-finite input is rejected")
{
    constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();
    constexpr f64 kInf = std::numeric_limits<f64>::infinity();

    CHECK_FALSE(ObserverFrame::create(kNaN, 0.0, 45.0).has_value());
    CHECK_FALSE(ObserverFrame::create(0.0, kInf, 45.0).has_value());
    CHECK_FALSE(ObserverFrame::create(0.0, 0.0, kNaN).has_value());
}
