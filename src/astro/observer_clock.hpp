#pragma once

/// @file observer_clock.hpp
/// @brief Time-system conversions bound to one observer (LCT, UT, GST, LST).

#include "astro/date_ring_mode.hpp"
#include "astro/observer_frame.hpp"
#include "core/types.hpp"

namespace planisphere::astro
{
    /// @brief Converts Julian Day moments between civil, universal and sidereal time
    /// for a fixed observer.
    ///
    /// Abbreviations: LCT local civil time, UT universal time, GST Greenwich
    /// sidereal time, LST local sidereal time. Every argument and result is a
    /// Julian Day moment in the named system. Conversions that pass through
    /// GST ↔ UT inherit the approximation documented on TimeSystem::gst_to_ut().
    class ObserverClock
    {
    public:
        explicit ObserverClock(const ObserverFrame& frame);

        [[nodiscard]] const ObserverFrame& frame() const { return m_frame; }

        // -------------------------------------------------------------
        // Single steps
        // -------------------------------------------------------------

        [[nodiscard]] f64 ut_to_lct(f64 ut) const;
        [[nodiscard]] f64 lct_to_ut(f64 lct) const;
        [[nodiscard]] f64 gst_to_lst(f64 gst) const;
        [[nodiscard]] f64 lst_to_gst(f64 lst) const;

        // -------------------------------------------------------------
        // Chains
        // -------------------------------------------------------------

        [[nodiscard]] f64 lct_to_gst(f64 lct) const;
        [[nodiscard]] f64 lct_to_lst(f64 lct) const;
        [[nodiscard]] f64 ut_to_lst(f64 ut) const;
        [[nodiscard]] f64 lst_to_ut(f64 lst) const;
        [[nodiscard]] f64 lst_to_lct(f64 lst) const;
        [[nodiscard]] f64 gst_to_lct(f64 gst) const;

        // -------------------------------------------------------------
        // Solar reference hours (local civil hours in [0, 24))
        // -------------------------------------------------------------

        /// @brief Civil hour at which the true Sun crosses the local meridian.
        ///
        /// 12 + (UTC offset − longitude in hours) − equation of time + DST.
        [[nodiscard]] f64 local_apparent_solar_noon(i32 year, i32 month, i32 day,
                                                    f64 dst_hours = 0.0) const;

        /// @brief Twelve hours away from local_apparent_solar_noon().
        [[nodiscard]] f64 local_apparent_midnight(i32 year, i32 month, i32 day,
                                                  f64 dst_hours = 0.0) const;

        /// @brief Civil hour used to place a calendar day on the date ring.
        ///
        /// DateRingMode::Unrecognized falls back to the Midnight result.
        [[nodiscard]] f64 hour_for_date_ring(i32 year, i32 month, i32 day,
                                             DateRingMode mode = DateRingMode::ApparentNoon,
                                             f64 dst_hours = 0.0) const;

        [[nodiscard]] i32 days_in_year(i32 year) const;

        /// @brief Hour angle (radians, [0, π]) at which an object of the given
        /// declination reaches the given altitude.
        /// @return NaN when the object never reaches that altitude from this latitude.
        [[nodiscard]] f64 hour_angle_for_altitude(f64 altitude_rad, f64 declination_rad) const;

    private:
        ObserverFrame m_frame;
    };

} // namespace planisphere::astro
