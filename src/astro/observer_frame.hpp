#pragma once

/// @file observer_frame.hpp
/// @brief Immutable observer location and time zone.

#include "core/types.hpp"

#include <optional>

namespace planisphere::astro
{
    /// @brief Where (and in which time zone) the planisphere is used.
    ///
    /// Built once per location change through create(), which rejects
    /// latitudes the disc cannot represent. Angles are stored in radians.
    class ObserverFrame
    {
    public:
        /// Default stability threshold: the sidereal rotation of the disc
        /// degenerates within ±10° of the equator.
        static constexpr f64 kDefaultMinAbsLatitudeDeg = 10.0;

        /// @brief Validate and build an observer frame.
        /// @param utc_offset_hours Civil time zone offset (e.g. +9 for KST).
        /// @param longitude_deg Longitude in degrees, east positive; wrapped into [−180, 180).
        /// @param latitude_deg Latitude in degrees; must lie in [−90, 90].
        /// @param min_abs_latitude_deg Smallest accepted |latitude|.
        /// @return The frame, or std::nullopt (with a warning logged) if the latitude is rejected.
        [[nodiscard]] static std::optional<ObserverFrame> create(
            f64 utc_offset_hours,
            f64 longitude_deg,
            f64 latitude_deg,
            f64 min_abs_latitude_deg = kDefaultMinAbsLatitudeDeg
        );

        [[nodiscard]] f64 utc_offset_hours() const { return m_utc_offset_hours; }
        [[nodiscard]] f64 longitude_rad() const { return m_longitude_rad; }
        [[nodiscard]] f64 latitude_rad() const { return m_latitude_rad; }

        [[nodiscard]] f64 longitude_deg() const;
        [[nodiscard]] f64 latitude_deg() const;

        /// @brief Longitude expressed as a time offset from Greenwich (hours, east positive).
        [[nodiscard]] f64 longitude_hours() const;

        /// @brief True south of the equator; the disc is then centered on the south celestial pole.
        [[nodiscard]] bool is_southern() const { return m_latitude_rad < 0.0; }

    private:
        ObserverFrame(f64 utc_offset_hours, f64 longitude_rad, f64 latitude_rad)
            : m_utc_offset_hours(utc_offset_hours)
            , m_longitude_rad(longitude_rad)
            , m_latitude_rad(latitude_rad)
        {
        }

        f64 m_utc_offset_hours;
        f64 m_longitude_rad;
        f64 m_latitude_rad;
    };

} // namespace planisphere::astro
