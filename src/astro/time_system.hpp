#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Day, calendar helpers, sidereal time.

#include "core/types.hpp"

#include <array>

namespace planisphere::astro
{
    /// @brief Civil date/time representation.
    ///
    /// Carries no time zone: the same struct describes local civil time or UT
    /// depending on where it came from.
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// A "moment" is a Julian Day number whose time system (UT, GST, LST or
    /// local civil time) is implied by the function that produced it:
    /// ut_to_gst() takes a UT moment and returns a GST moment. Julian Day
    /// integers change at 12:00, so the start of a civil day is a value
    /// ending in .5 (see date_part()).
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        // -------------------------------------------------------------
        // Calendar
        // -------------------------------------------------------------

        /// @brief Gregorian leap-year rule (400 → leap, 100 → common, 4 → leap).
        [[nodiscard]] static bool is_leap_year(i32 year);

        /// @brief Number of days in each month, January first.
        [[nodiscard]] static std::array<i32, 12> month_day_counts(i32 year);

        /// @brief Middle day of a month: ceil(days / 2). Returns 0 for a month outside [1, 12].
        [[nodiscard]] static i32 month_mid_day(i32 year, i32 month);

        /// @brief 366 for leap years, otherwise 365.
        [[nodiscard]] static i32 days_in_year(i32 year);

        /// @brief 1-based ordinal day within the year (1 January = 1).
        ///
        /// Day and month are not validated; a day past the end of its month
        /// simply counts on into the next one.
        [[nodiscard]] static i32 day_of_year(i32 year, i32 month, i32 day);

        // -------------------------------------------------------------
        // Julian Day
        // -------------------------------------------------------------

        /// @brief Convert a civil date/time to a Julian Day (Meeus, Astronomical Algorithms Ch. 7).
        /// @return 2451545.0 for 2000-01-01 12:00:00.
        [[nodiscard]] static f64 julian_day(i32 year, i32 month, i32 day,
                                            i32 hour, i32 minute, f64 second);

        /// @brief DateTime overload of julian_day().
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert a Julian Day back to civil date/time.
        /// @param jd Julian Day (must be positive).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Start (0h) of the day containing jd: floor(jd − 0.5) + 0.5.
        [[nodiscard]] static f64 date_part(f64 jd);

        /// @brief Hours elapsed since date_part(jd), in [0, 24).
        [[nodiscard]] static f64 time_of_day(f64 jd);

        /// @brief Julian centuries elapsed since J2000.0.
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Get current system time as a UT Julian Day.
        [[nodiscard]] static f64 now_as_jd();

        // -------------------------------------------------------------
        // Solar and sidereal time
        // -------------------------------------------------------------

        /// @brief Equation of time (apparent − mean solar time) in minutes.
        ///
        /// Two-harmonic approximation, good to a couple of minutes; stays
        /// within roughly [−17, +18] minutes over any year.
        [[nodiscard]] static f64 equation_of_time_minutes(i32 year, i32 month, i32 day);

        /// @brief Universal Time → Greenwich Sidereal Time.
        [[nodiscard]] static f64 ut_to_gst(f64 ut);

        /// @brief Greenwich Sidereal Time → Universal Time.
        ///
        /// Approximate inverse of ut_to_gst(), exact to ~1e-9 day except in
        /// two windows where the result is off by one sidereal day (~0.9973 day):
        /// - UT time of day at or after 24 / 1.00273790935 h (23h 56m 04s): the
        ///   sidereal time has already wrapped and the result lands early.
        /// - UT exactly 0h: the recovered GST time of day can round just below
        ///   T0, wrap to ~24 h and land late. About half of all midnights do.
        [[nodiscard]] static f64 gst_to_ut(f64 gst);

    private:
        /// @brief Sidereal time at 0h of `date` (a date_part() value), in hours [0, 24).
        [[nodiscard]] static f64 sidereal_offset_hours(f64 date);
    };

} // namespace planisphere::astro
