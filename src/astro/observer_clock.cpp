/// @file observer_clock.cpp
/// @brief Implementation of observer-bound time conversions.

#include "astro/observer_clock.hpp"

#include "astro/time_system.hpp"
#include "core/angles.hpp"

#include <cmath>
#include <limits>

namespace planisphere::astro
{

ObserverClock::ObserverClock(const ObserverFrame& frame)
    : m_frame(frame)
{
}

// -----------------------------------------------------------------
// UT ↔ LCT: shift by the zone offset
// -----------------------------------------------------------------

f64 ObserverClock::ut_to_lct(f64 ut) const
{
    return ut + m_frame.utc_offset_hours() / 24.0;
}

f64 ObserverClock::lct_to_ut(f64 lct) const
{
    return lct - m_frame.utc_offset_hours() / 24.0;
}

// -----------------------------------------------------------------
// GST ↔ LST: shift by the longitude expressed in days
// -----------------------------------------------------------------

f64 ObserverClock::gst_to_lst(f64 gst) const
{
    return gst + m_frame.longitude_hours() / 24.0;
}

f64 ObserverClock::lst_to_gst(f64 lst) const
{
    return lst - m_frame.longitude_hours() / 24.0;
}

// -----------------------------------------------------------------
// Chains
// -----------------------------------------------------------------

f64 ObserverClock::lct_to_gst(f64 lct) const
{
    return TimeSystem::ut_to_gst(lct_to_ut(lct));
}

f64 ObserverClock::lct_to_lst(f64 lct) const
{
    return ut_to_lst(lct_to_ut(lct));
}

f64 ObserverClock::ut_to_lst(f64 ut) const
{
    return gst_to_lst(TimeSystem::ut_to_gst(ut));
}

f64 ObserverClock::lst_to_ut(f64 lst) const
{
    return TimeSystem::gst_to_ut(lst_to_gst(lst));
}

f64 ObserverClock::lst_to_lct(f64 lst) const
{
    return ut_to_lct(lst_to_ut(lst));
}

f64 ObserverClock::gst_to_lct(f64 gst) const
{
    return ut_to_lct(TimeSystem::gst_to_ut(gst));
}

// -----------------------------------------------------------------
// Local apparent solar noon / midnight
//
// The mean Sun transits at 12h local mean time; the zone meridian differs
// from the observer's by (offset − lon_h) hours, and the true Sun runs
// ahead of the mean Sun by the equation of time.
// -----------------------------------------------------------------

f64 ObserverClock::local_apparent_solar_noon(i32 year, i32 month, i32 day, f64 dst_hours) const
{
    const f64 mean_noon_offset = m_frame.utc_offset_hours() - m_frame.longitude_hours();
    const f64 eot_hours = TimeSystem::equation_of_time_minutes(year, month, day) / 60.0;

    return core::normalize_hours(12.0 + mean_noon_offset - eot_hours + dst_hours);
}

f64 ObserverClock::local_apparent_midnight(i32 year, i32 month, i32 day, f64 dst_hours) const
{
    return core::normalize_hours(local_apparent_solar_noon(year, month, day, dst_hours) - 12.0);
}

f64 ObserverClock::hour_for_date_ring(i32 year, i32 month, i32 day,
                                      DateRingMode mode, f64 dst_hours) const
{
    switch (mode)
    {
        case DateRingMode::Midnight:
            return core::normalize_hours(0.0 + dst_hours);
        case DateRingMode::LocalNoon:
            return core::normalize_hours(12.0 + dst_hours);
        case DateRingMode::ApparentNoon:
            return local_apparent_solar_noon(year, month, day, dst_hours);
        case DateRingMode::ApparentMidnight:
            return local_apparent_midnight(year, month, day, dst_hours);
        case DateRingMode::Local21h:
            return core::normalize_hours(21.0 + dst_hours);
        case DateRingMode::Unrecognized:
            break;
    }
    return core::normalize_hours(0.0 + dst_hours);
}

i32 ObserverClock::days_in_year(i32 year) const
{
    return TimeSystem::days_in_year(year);
}

// -----------------------------------------------------------------
// cos(H) = (sin(alt) − sin(lat) sin(dec)) / (cos(lat) cos(dec))
// -----------------------------------------------------------------

f64 ObserverClock::hour_angle_for_altitude(f64 altitude_rad, f64 declination_rad) const
{
    const f64 lat = m_frame.latitude_rad();
    const f64 cos_h = (std::sin(altitude_rad) - std::sin(lat) * std::sin(declination_rad))
                    / (std::cos(lat) * std::cos(declination_rad));

    if (!(cos_h >= -1.0 && cos_h <= 1.0))
    {
        return std::numeric_limits<f64>::quiet_NaN();
    }
    return std::acos(cos_h);
}

} // namespace planisphere::astro
