/// @file test_observer_clock.cpp
/// @brief Unit tests for planisphere::astro::ObserverClock.
///
/// Verifies LCT/UT/GST/LST round trips, local apparent solar noon,
/// date ring reference hours and hour angles for a Seoul observer.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/observer_clock.hpp"
#include "astro/observer_frame.hpp"
#include "astro/time_system.hpp"
#include "core/angles.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <cmath>
#include <limits>

using namespace planisphere;
using namespace planisphere::astro;

int main(int argc, char** argv)
{
    planisphere::core::Logger::init({});  // console only
    const int result = doctest::Context(argc, argv).run();
    planisphere::core::Logger::shutdown();
    return result;
}

// =================================================================
// Fixtures
// =================================================================

static constexpr f64 kJdTolerance   = 1e-8;   // days
static constexpr f64 kHourTolerance = 1e-9;

static ObserverClock seoul_clock()
{
    const auto frame = ObserverFrame::create(9.0, 126.98, 37.57);
    REQUIRE(frame.has_value());
    return ObserverClock(*frame);
}

// Local civil moments whose UT time of day is well before 23h56m
static const f64 kSampleMoments[] = {
    TimeSystem::julian_day(2023, 3, 10, 21, 0, 0.0),
    TimeSystem::julian_day(2023, 8, 2, 3, 0, 0.0),
    TimeSystem::julian_day(2024, 12, 30, 13, 30, 0.0),
    TimeSystem::julian_day(2023, 6, 1, 0, 15, 0.0),
    TimeSystem::julian_day(2000, 1, 1, 12, 0, 0.0),
};

// =================================================================
// Round trips
// =================================================================

TEST_CASE("LCT ↔ UT shifts by the zone offset")
{
    const ObserverClock clock = seoul_clock();

    for (const f64 lct : kSampleMoments)
    {
        const f64 ut = clock.lct_to_ut(lct);
        CHECK(std::abs((lct - ut) * 24.0 - 9.0) < 1e-6);
        CHECK(std::abs(clock.ut_to_lct(ut) - lct) < kJdTolerance);
    }
}

TEST_CASE("GST ↔ LST shifts by the longitude")
{
    const ObserverClock clock = seoul_clock();

    for (const f64 gst : kSampleMoments)
    {
        const f64 lst = clock.gst_to_lst(gst);
        CHECK(std::abs((lst - gst) * 24.0 - 126.98 / 15.0) < 1e-6);
        CHECK(std::abs(clock.lst_to_gst(lst) - gst) < kJdTolerance);
    }
}

TEST_CASE("Round-trip: LCT → LST → LCT")
{
    const ObserverClock clock = seoul_clock();

    for (const f64 lct : kSampleMoments)
    {
        CHECK(std::abs(clock.lst_to_lct(clock.lct_to_lst(lct)) - lct) < kJdTolerance);
    }
}

TEST_CASE("Chains agree with their single steps")
{
    const ObserverClock clock = seoul_clock();

    for (const f64 lct : kSampleMoments)
    {
        const f64 ut = clock.lct_to_ut(lct);
        CHECK(clock.lct_to_gst(lct) == TimeSystem::ut_to_gst(ut));
        CHECK(clock.lct_to_lst(lct) == clock.gst_to_lst(clock.lct_to_gst(lct)));
        CHECK(clock.ut_to_lst(ut) == clock.lct_to_lst(lct));

        const f64 gst = clock.lct_to_gst(lct);
        CHECK(std::abs(clock.gst_to_lct(gst) - lct) < kJdTolerance);
        CHECK(std::abs(clock.lst_to_ut(clock.ut_to_lst(ut)) - ut) < kJdTolerance);
    }
}

// =================================================================
// Solar reference hours
// =================================================================

TEST_CASE("Apparent solar noon in Seoul falls between 12h and 13h all year")
{
    const ObserverClock clock = seoul_clock();
    const auto counts = TimeSystem::month_day_counts(2023);

    for (i32 month = 1; month <= 12; ++month)
    {
        for (i32 day = 1; day <= counts[static_cast<std::size_t>(month - 1)]; ++day)
        {
            const f64 noon = clock.local_apparent_solar_noon(2023, month, day);
            CHECK(noon > 12.0);
            CHECK(noon < 13.0);
        }
    }
}

TEST_CASE("Apparent solar noon matches the mean-noon offset and equation of time")
{
    const ObserverClock clock = seoul_clock();

    const f64 expected = 12.0 + (9.0 - 126.98 / 15.0)
                       - TimeSystem::equation_of_time_minutes(2023, 11, 3) / 60.0;
    CHECK(clock.local_apparent_solar_noon(2023, 11, 3) == doctest::Approx(expected).epsilon(1e-9));
}

TEST_CASE("Apparent midnight is twelve hours from apparent noon")
{
    const ObserverClock clock = seoul_clock();

    for (i32 month = 1; month <= 12; ++month)
    {
        const f64 noon = clock.local_apparent_solar_noon(2023, month, 15);
        const f64 midnight = clock.local_apparent_midnight(2023, month, 15);
        CHECK(midnight == doctest::Approx(core::normalize_hours(noon - 12.0)).epsilon(kHourTolerance));
    }
}

TEST_CASE("DST shifts the reference hours by one hour")
{
    const ObserverClock clock = seoul_clock();

    const f64 noon = clock.local_apparent_solar_noon(2023, 7, 4);
    const f64 noon_dst = clock.local_apparent_solar_noon(2023, 7, 4, 1.0);
    CHECK(noon_dst - noon == doctest::Approx(1.0).epsilon(kHourTolerance));

    CHECK(clock.hour_for_date_ring(2023, 7, 4, DateRingMode::Local21h, 1.0)
          == doctest::Approx(22.0).epsilon(kHourTolerance));
    CHECK(clock.hour_for_date_ring(2023, 7, 4, DateRingMode::Midnight, 1.0)
          == doctest::Approx(1.0).epsilon(kHourTolerance));
}

TEST_CASE("Date ring reference hour per mode")
{
    const ObserverClock clock = seoul_clock();

    CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::Midnight) == 0.0);
    CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::LocalNoon) == 12.0);
    CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::Local21h) == 21.0);
    CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::ApparentNoon)
          == clock.local_apparent_solar_noon(2023, 9, 1));
    CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::ApparentMidnight)
          == clock.local_apparent_midnight(2023, 9, 1));

    SUBCASE("Default mode is apparent noon")
    {
        CHECK(clock.hour_for_date_ring(2023, 9, 1) == clock.local_apparent_solar_noon(2023, 9, 1));
    }

    SUBCASE("Unrecognized mode behaves like midnight")
    {
        CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::Unrecognized) == 0.0);
        CHECK(clock.hour_for_date_ring(2023, 9, 1, DateRingMode::Unrecognized, 1.0)
              == clock.hour_for_date_ring(2023, 9, 1, DateRingMode::Midnight, 1.0));
    }
}

TEST_CASE("A NaN DST offset gives a NaN reference hour")
{
    const ObserverClock clock = seoul_clock();
    constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();

    CHECK(std::isnan(clock.local_apparent_solar_noon(2023, 9, 1, kNaN)));
    CHECK(std::isnan(clock.local_apparent_midnight(2023, 9, 1, kNaN)));
    for (const auto mode : {DateRingMode::Midnight, DateRingMode::LocalNoon,
                            DateRingMode::ApparentNoon, DateRingMode::ApparentMidnight,
                            DateRingMode::Local21h, DateRingMode::Unrecognized})
    {
        CHECK(std::isnan(clock.hour_for_date_ring(2023, 9, 1, mode, kNaN)));
    }
}

TEST_CASE("days_in_year")
{
    const ObserverClock clock = seoul_clock();
    CHECK(clock.days_in_year(2023) == 365);
    CHECK(clock.days_in_year(2024) == 366);
}

// =================================================================
// Hour angle for altitude
// =================================================================

TEST_CASE("Equatorial star sets six hours after transit")
{
    const ObserverClock clock = seoul_clock();
    const f64 h = clock.hour_angle_for_altitude(0.0, 0.0);
    CHECK(h == doctest::Approx(astro_constants::kHalfPi).epsilon(1e-12));
}

TEST_CASE("Star on the zenith declination is near transit at 89° altitude")
{
    const ObserverClock clock = seoul_clock();
    const f64 lat = clock.frame().latitude_rad();
    const f64 h = clock.hour_angle_for_altitude(89.0 * astro_constants::kDegToRad, lat);

    CHECK(h > 0.0);
    CHECK(h < 2.0 * astro_constants::kDegToRad);
}

TEST_CASE("Circumpolar and never-rising stars give NaN")
{
    const ObserverClock clock = seoul_clock();
    const f64 dec80 = 80.0 * astro_constants::kDegToRad;

    CHECK(std::isnan(clock.hour_angle_for_altitude(0.0, dec80)));
    CHECK(std::isnan(clock.hour_angle_for_altitude(0.0, -dec80)));
}
