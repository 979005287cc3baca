#pragma once

/// @file disc_layout.hpp
/// @brief Screen-space geometry of one planisphere disc: date ring, horizon
/// window, time ring, grid and projected catalog entries.

#include "astro/azimuthal_projection.hpp"
#include "astro/date_ring_mode.hpp"
#include "astro/matrix3.hpp"
#include "astro/observer_clock.hpp"
#include "catalog/star_entry.hpp"
#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace planisphere::astro
{
    struct DiscLayoutOptions
    {
        DateRingMode date_ring_mode = DateRingMode::ApparentNoon;
        f64 dst_hours = 0.0;
        f64 horizon_step_rad = 0.01;  ///< Azimuth sampling of the horizon outline
    };

    /// @brief Tick length class on the date ring.
    enum class DateTickKind
    {
        MonthStart,  ///< Day 1: long tick
        Tenth,       ///< Days 10, 20, 30: labeled
        Fifth,       ///< Days 5, 15, 25
        Plain,
    };

    struct DateTick
    {
        i32 month;
        i32 day;
        f64 angle_rad;   ///< Planar angle on the unrotated sky disc, [0, 2π)
        DateTickKind kind;
    };

    struct MonthLabel
    {
        i32 month;
        f64 angle_rad;
    };

    /// @brief Compass label on the horizon window.
    struct CardinalPoint
    {
        std::string_view label;   ///< "N", "NE", ... "NW"
        ScreenPoint anchor;       ///< Just below the horizon (altitude −4°)
        ScreenPoint zenith;
        f64 label_rotation_deg;   ///< Text rotation, baseline facing the zenith
    };

    struct TimeTick
    {
        i32 hour;        ///< 1..24
        i32 minute;      ///< 0, 5, ... 55
        f64 angle_rad;   ///< [0, 2π)
    };

    struct DecCircle
    {
        f64 dec_deg;
        f64 radius;
    };

    struct ProjectedStar
    {
        std::size_t index;   ///< Position in the input span
        ScreenPoint position;
    };

    struct ProjectedSegment
    {
        ScreenPoint from;
        ScreenPoint to;
    };

    struct ProjectedLabel
    {
        std::size_t index;
        ScreenPoint position;
        f64 rotation_deg;    ///< Text rotation, baseline tangent to the disc
    };

    /// @brief Computes everything the renderer draws for one observer,
    /// projection and date-ring setting.
    ///
    /// The sky disc (stars, grid, date ring) is laid out unrotated; the
    /// renderer turns it by sky_rotation_degrees(). The horizon window and
    /// time ring are laid out for the given civil moment and drawn on top.
    class DiscLayout
    {
    public:
        DiscLayout(const ObserverClock& clock,
                   const AzimuthalProjection& projection,
                   DiscLayoutOptions options = {});

        [[nodiscard]] const ObserverClock& clock() const { return m_clock; }
        [[nodiscard]] const AzimuthalProjection& projection() const { return m_projection; }

        /// @brief Sky disc rotation (degrees) for a local civil moment.
        [[nodiscard]] f64 sky_rotation_degrees(f64 lct) const;

        // -------------------------------------------------------------
        // Date ring
        // -------------------------------------------------------------

        /// @brief One tick per calendar day of the year.
        [[nodiscard]] std::vector<DateTick> date_ring(i32 year) const;

        /// @brief Month name positions (the day after each month's middle day).
        [[nodiscard]] std::vector<MonthLabel> month_labels(i32 year) const;

        /// @brief Planar angle of a calendar day on the date ring.
        [[nodiscard]] f64 date_angle(i32 year, i32 month, i32 day) const;

        // -------------------------------------------------------------
        // Horizon window and time ring
        // -------------------------------------------------------------

        /// @brief Horizon polyline, azimuth 0 through 2π.
        [[nodiscard]] std::vector<ScreenPoint> horizon_outline(f64 lct) const;

        [[nodiscard]] std::array<CardinalPoint, 8> cardinal_points(f64 lct) const;

        /// @brief Hour ticks 1..24 and five-minute sub-ticks of the civil time ring.
        [[nodiscard]] std::vector<TimeTick> time_ring(f64 lct) const;

        // -------------------------------------------------------------
        // Grid
        // -------------------------------------------------------------

        /// @brief Outer end point of each RA spoke (spokes start at the center).
        [[nodiscard]] std::vector<ScreenPoint> ra_grid(f64 interval_hours) const;

        /// @brief Declination circles that fit inside the disc, from −90° upward.
        [[nodiscard]] std::vector<DecCircle> dec_circles(f64 interval_deg) const;

        // -------------------------------------------------------------
        // Catalog
        // -------------------------------------------------------------

        /// @brief Stars that land on the disc.
        [[nodiscard]] std::vector<ProjectedStar> project_stars(
            std::span<const catalog::StarEntry> stars) const;

        /// @brief Segments whose both ends land on the disc.
        [[nodiscard]] std::vector<ProjectedSegment> project_constellation_lines(
            std::span<const catalog::ConstellationSegment> segments) const;

        /// @brief Labels at least `inset_px` inside the disc edge.
        [[nodiscard]] std::vector<ProjectedLabel> project_constellation_labels(
            std::span<const catalog::ConstellationLabel> labels,
            f64 inset_px) const;

    private:
        /// @brief Sky → screen for a horizontal direction under a prepared matrix.
        [[nodiscard]] ScreenPoint project_horizontal(const Matrix3& hor_to_equ,
                                                     f64 azimuth_rad,
                                                     f64 altitude_rad) const;

        ObserverClock m_clock;
        AzimuthalProjection m_projection;
        DiscLayoutOptions m_options;
    };

} // namespace planisphere::astro
