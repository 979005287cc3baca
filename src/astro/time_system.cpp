/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/angles.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

namespace planisphere::astro
{

namespace
{
    // Sidereal days per solar day, and its approximate reciprocal
    constexpr f64 kSiderealRate = 1.00273790935;
    constexpr f64 kSolarRate    = 0.9972695663;
}

// -----------------------------------------------------------------
// Calendar helpers
// -----------------------------------------------------------------

bool TimeSystem::is_leap_year(i32 year)
{
    return (year % 400 == 0) || (year % 4 == 0 && year % 100 != 0);
}

std::array<i32, 12> TimeSystem::month_day_counts(i32 year)
{
    return {31, is_leap_year(year) ? 29 : 28, 31, 30, 31, 30,
            31, 31, 30, 31, 30, 31};
}

i32 TimeSystem::month_mid_day(i32 year, i32 month)
{
    if (month < 1 || month > 12)
    {
        return 0;
    }

    const i32 days = month_day_counts(year)[static_cast<std::size_t>(month - 1)];
    return (days + 1) / 2;
}

i32 TimeSystem::days_in_year(i32 year)
{
    return is_leap_year(year) ? 366 : 365;
}

i32 TimeSystem::day_of_year(i32 year, i32 month, i32 day)
{
    const auto counts = month_day_counts(year);

    i32 ordinal = day;
    for (i32 m = 1; m < month && m <= 12; ++m)
    {
        ordinal += counts[static_cast<std::size_t>(m - 1)];
    }
    return ordinal;
}

// -----------------------------------------------------------------
// Julian Day, Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::julian_day(i32 year, i32 month, i32 day,
                           i32 hour, i32 minute, f64 second)
{
    i32 y = year;
    i32 m = month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = static_cast<i32>(std::floor(static_cast<f64>(y) / 100.0));
    const i32 b = 2 - a + static_cast<i32>(std::floor(static_cast<f64>(a) / 4.0));

    const f64 day_fraction = static_cast<f64>(hour) / 24.0
                           + static_cast<f64>(minute) / 1440.0
                           + second / 86400.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(day)
         + static_cast<f64>(b)
         - 1524.5
         + day_fraction;
}

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    return julian_day(dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
}

// -----------------------------------------------------------------
// Julian Day → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

f64 TimeSystem::date_part(f64 jd)
{
    return std::floor(jd - 0.5) + 0.5;
}

f64 TimeSystem::time_of_day(f64 jd)
{
    return (jd - date_part(jd)) * 24.0;
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto since_epoch = now.time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    // Unix epoch (1970-01-01 00:00 UTC) as Julian Date
    constexpr f64 kUnixEpochJd = 2440587.5;

    return kUnixEpochJd + total_seconds / 86400.0;
}

// -----------------------------------------------------------------
// Equation of time
//
// B = 2π (N − 81) / 365
// E = 9.87 sin(2B) − 7.53 cos(B) − 1.5 sin(B)   [minutes]
// -----------------------------------------------------------------

f64 TimeSystem::equation_of_time_minutes(i32 year, i32 month, i32 day)
{
    const f64 n = static_cast<f64>(day_of_year(year, month, day));
    const f64 b = astro_constants::kTwoPi * (n - 81.0) / 365.0;

    return 9.87 * std::sin(2.0 * b) - 7.53 * std::cos(b) - 1.5 * std::sin(b);
}

// -----------------------------------------------------------------
// Sidereal time at 0h UT
//
// T0 = 6.697374558 + 2400.051336 T + 0.000025862 T²   [hours, mod 24]
// -----------------------------------------------------------------

f64 TimeSystem::sidereal_offset_hours(f64 date)
{
    const f64 t = julian_centuries(date);
    return core::normalize_hours(6.697374558 + 2400.051336 * t + 0.000025862 * t * t);
}

// -----------------------------------------------------------------
// UT → GST: advance T0 at the sidereal rate over the elapsed UT hours
// -----------------------------------------------------------------

f64 TimeSystem::ut_to_gst(f64 ut)
{
    const f64 ut_date = date_part(ut);
    const f64 ut_time = (ut - ut_date) * 24.0;

    const f64 gst_time = core::normalize_hours(ut_time * kSiderealRate
                                               + sidereal_offset_hours(ut_date));
    return ut_date + gst_time / 24.0;
}

// -----------------------------------------------------------------
// GST → UT: remove T0, then scale back at the solar rate
// -----------------------------------------------------------------

f64 TimeSystem::gst_to_ut(f64 gst)
{
    const f64 gst_date = date_part(gst);
    const f64 gst_time = (gst - gst_date) * 24.0;

    const f64 ut_time = core::normalize_hours(gst_time - sidereal_offset_hours(gst_date));
    return gst_date + ut_time * kSolarRate / 24.0;
}

} // namespace planisphere::astro
