/// @file disc_layout.cpp
/// @brief Implementation of the planisphere disc geometry.

#include "astro/disc_layout.hpp"

#include "astro/time_system.hpp"
#include "astro/vector3.hpp"
#include "core/angles.hpp"

#include <glm/geometric.hpp>

#include <cmath>

namespace planisphere::astro
{

namespace
{
    constexpr std::array<std::string_view, 8> kCardinalLabels = {
        "N", "NE", "E", "SE", "S", "SW", "W", "NW"
    };

    // Cardinal labels hang just below the horizon line
    constexpr f64 kCardinalAltitudeDeg = -4.0;

    constexpr i32 kMinutesPerTimeTick = 5;

    [[nodiscard]] DateTickKind tick_kind_for_day(i32 day)
    {
        if (day == 1)       return DateTickKind::MonthStart;
        if (day % 10 == 0)  return DateTickKind::Tenth;
        if (day % 5 == 0)   return DateTickKind::Fifth;
        return DateTickKind::Plain;
    }

    /// Angle that turns text so its baseline is tangent to a circle around the origin.
    [[nodiscard]] f64 tangent_rotation_degrees(f64 dx, f64 dy)
    {
        return (std::atan2(dy, dx) - astro_constants::kHalfPi) * astro_constants::kRadToDeg;
    }
}

DiscLayout::DiscLayout(const ObserverClock& clock,
                       const AzimuthalProjection& projection,
                       DiscLayoutOptions options)
    : m_clock(clock)
    , m_projection(projection)
    , m_options(options)
{
}

f64 DiscLayout::sky_rotation_degrees(f64 lct) const
{
    return m_projection.disc_rotation_degrees(m_clock.lct_to_lst(lct));
}

// -----------------------------------------------------------------
// Date ring
//
// For each day, the reference civil hour (per DateRingMode) is turned
// into a local sidereal moment. Its time of day is the RA that sits on
// the meridian at that hour; the tick is drawn half a day-step past it
// so that the tick marks the middle of the day's slot.
// -----------------------------------------------------------------

f64 DiscLayout::date_angle(i32 year, i32 month, i32 day) const
{
    const f64 hour = m_clock.hour_for_date_ring(year, month, day,
                                                m_options.date_ring_mode,
                                                m_options.dst_hours);
    const f64 lct = TimeSystem::julian_day(year, month, day, 0, 0, 0.0) + hour / 24.0;
    const f64 lst = m_clock.lct_to_lst(lct);

    const f64 ra = TimeSystem::time_of_day(lst) * astro_constants::kHourToRad;
    const f64 daily_step = astro_constants::kTwoPi
                         / static_cast<f64>(TimeSystem::days_in_year(year));

    const ScreenPoint p = m_projection.project(ra + daily_step * 0.5,
                                               m_projection.declination_limit());
    return core::normalize_radians(std::atan2(p.y, p.x));
}

std::vector<DateTick> DiscLayout::date_ring(i32 year) const
{
    const auto counts = TimeSystem::month_day_counts(year);

    std::vector<DateTick> ticks;
    ticks.reserve(static_cast<std::size_t>(TimeSystem::days_in_year(year)));

    for (i32 month = 1; month <= 12; ++month)
    {
        const i32 days = counts[static_cast<std::size_t>(month - 1)];
        for (i32 day = 1; day <= days; ++day)
        {
            ticks.push_back(DateTick{
                .month     = month,
                .day       = day,
                .angle_rad = date_angle(year, month, day),
                .kind      = tick_kind_for_day(day),
            });
        }
    }

    return ticks;
}

std::vector<MonthLabel> DiscLayout::month_labels(i32 year) const
{
    std::vector<MonthLabel> labels;
    labels.reserve(12);

    for (i32 month = 1; month <= 12; ++month)
    {
        const i32 day = TimeSystem::month_mid_day(year, month) + 1;
        labels.push_back(MonthLabel{
            .month     = month,
            .angle_rad = date_angle(year, month, day),
        });
    }

    return labels;
}

// -----------------------------------------------------------------
// Horizon window
// -----------------------------------------------------------------

ScreenPoint DiscLayout::project_horizontal(const Matrix3& hor_to_equ,
                                           f64 azimuth_rad,
                                           f64 altitude_rad) const
{
    const Vector3 equ = hor_to_equ * Vector3::from_spherical(azimuth_rad, altitude_rad);
    return m_projection.project(equ.lon(), equ.lat());
}

std::vector<ScreenPoint> DiscLayout::horizon_outline(f64 lct) const
{
    std::vector<ScreenPoint> outline;

    const f64 step = m_options.horizon_step_rad;
    if (!(step > 0.0))
    {
        return outline;
    }

    const Matrix3 hor_to_equ = Matrix3::horizontal_to_equatorial(
        m_clock.lct_to_lst(lct), m_clock.frame().latitude_rad());

    // Integer sample count avoids drift from repeated addition
    const auto samples = static_cast<std::size_t>(std::floor(astro_constants::kTwoPi / step));
    outline.reserve(samples + 1);

    for (std::size_t i = 0; i <= samples; ++i)
    {
        outline.push_back(project_horizontal(hor_to_equ, static_cast<f64>(i) * step, 0.0));
    }

    return outline;
}

std::array<CardinalPoint, 8> DiscLayout::cardinal_points(f64 lct) const
{
    const Matrix3 hor_to_equ = Matrix3::horizontal_to_equatorial(
        m_clock.lct_to_lst(lct), m_clock.frame().latitude_rad());

    const f64 anchor_alt = kCardinalAltitudeDeg * astro_constants::kDegToRad;
    const ScreenPoint zenith = project_horizontal(hor_to_equ, 0.0, astro_constants::kHalfPi);

    std::array<CardinalPoint, 8> points{};
    for (std::size_t i = 0; i < kCardinalLabels.size(); ++i)
    {
        const f64 azimuth = static_cast<f64>(i) * 45.0 * astro_constants::kDegToRad;
        const ScreenPoint anchor = project_horizontal(hor_to_equ, azimuth, anchor_alt);

        points[i] = CardinalPoint{
            .label              = kCardinalLabels[i],
            .anchor             = anchor,
            .zenith             = zenith,
            .label_rotation_deg = tangent_rotation_degrees(anchor.x - zenith.x,
                                                           anchor.y - zenith.y),
        };
    }

    return points;
}

// -----------------------------------------------------------------
// Time ring
//
// L   = RA where the meridian meets the horizon on the equator side
//       (south point for northern observers, north point for southern)
// Δc  = UTC offset (rad) − longitude (rad)
// t   = s · (L + Δc − hour(rad) − π)
//
// With both discs turned by the same rotation, the current civil hour
// lines up with today's date tick (up to the equation of time).
// -----------------------------------------------------------------

std::vector<TimeTick> DiscLayout::time_ring(f64 lct) const
{
    const ObserverFrame& frame = m_clock.frame();

    const Matrix3 hor_to_equ = Matrix3::horizontal_to_equatorial(
        m_clock.lct_to_lst(lct), frame.latitude_rad());
    const f64 meridian_azimuth = frame.is_southern() ? 0.0 : astro_constants::kPi;
    const f64 meridian_ra = (hor_to_equ * Vector3::from_spherical(meridian_azimuth, 0.0)).lon();

    const f64 delta_culmination = frame.utc_offset_hours() * astro_constants::kHourToRad
                                - frame.longitude_rad();
    const f64 s = m_projection.pole_sign();

    std::vector<TimeTick> ticks;
    ticks.reserve(24 * (60 / kMinutesPerTimeTick));

    for (i32 hour = 1; hour <= 24; ++hour)
    {
        for (i32 minute = 0; minute < 60; minute += kMinutesPerTimeTick)
        {
            const f64 h = static_cast<f64>(hour) + static_cast<f64>(minute) / 60.0;
            const f64 t = s * (meridian_ra + delta_culmination
                               - h * astro_constants::kHourToRad - astro_constants::kPi);

            ticks.push_back(TimeTick{
                .hour      = hour,
                .minute    = minute,
                .angle_rad = core::normalize_radians(t),
            });
        }
    }

    return ticks;
}

// -----------------------------------------------------------------
// Grid
// -----------------------------------------------------------------

std::vector<ScreenPoint> DiscLayout::ra_grid(f64 interval_hours) const
{
    std::vector<ScreenPoint> spokes;
    if (!(interval_hours > 0.0))
    {
        return spokes;
    }

    const auto count = static_cast<std::size_t>(std::ceil(24.0 / interval_hours));
    spokes.reserve(count);

    for (std::size_t i = 0; i < count; ++i)
    {
        const f64 ra_hours = static_cast<f64>(i) * interval_hours;
        if (ra_hours >= 24.0)
        {
            break;
        }
        spokes.push_back(m_projection.project(ra_hours * astro_constants::kHourToRad,
                                              m_projection.declination_limit()));
    }

    return spokes;
}

std::vector<DecCircle> DiscLayout::dec_circles(f64 interval_deg) const
{
    std::vector<DecCircle> circles;
    if (!(interval_deg > 0.0))
    {
        return circles;
    }

    const auto count = static_cast<std::size_t>(std::ceil(180.0 / interval_deg));
    for (std::size_t i = 0; i < count; ++i)
    {
        const f64 dec_deg = -90.0 + static_cast<f64>(i) * interval_deg;
        if (dec_deg >= 90.0)
        {
            break;
        }

        const f64 radius = glm::length(m_projection.project(0.0, dec_deg * astro_constants::kDegToRad));
        if (radius < m_projection.screen_radius())
        {
            circles.push_back(DecCircle{.dec_deg = dec_deg, .radius = radius});
        }
    }

    return circles;
}

// -----------------------------------------------------------------
// Catalog
// -----------------------------------------------------------------

std::vector<ProjectedStar> DiscLayout::project_stars(
    std::span<const catalog::StarEntry> stars) const
{
    std::vector<ProjectedStar> projected;
    projected.reserve(stars.size());

    for (std::size_t i = 0; i < stars.size(); ++i)
    {
        const ScreenPoint p = m_projection.project(stars[i].ra, stars[i].dec);
        if (m_projection.is_within_disc(p))
        {
            projected.push_back(ProjectedStar{.index = i, .position = p});
        }
    }

    return projected;
}

std::vector<ProjectedSegment> DiscLayout::project_constellation_lines(
    std::span<const catalog::ConstellationSegment> segments) const
{
    std::vector<ProjectedSegment> projected;
    projected.reserve(segments.size());

    for (const auto& segment : segments)
    {
        const ScreenPoint from = m_projection.project(segment.ra1, segment.dec1);
        const ScreenPoint to   = m_projection.project(segment.ra2, segment.dec2);

        if (m_projection.is_within_disc(from) && m_projection.is_within_disc(to))
        {
            projected.push_back(ProjectedSegment{.from = from, .to = to});
        }
    }

    return projected;
}

std::vector<ProjectedLabel> DiscLayout::project_constellation_labels(
    std::span<const catalog::ConstellationLabel> labels,
    f64 inset_px) const
{
    std::vector<ProjectedLabel> projected;

    const f64 max_radius = m_projection.screen_radius() - inset_px;

    for (std::size_t i = 0; i < labels.size(); ++i)
    {
        const ScreenPoint p = m_projection.project(labels[i].ra, labels[i].dec);
        if (glm::length(p) < max_radius)
        {
            projected.push_back(ProjectedLabel{
                .index        = i,
                .position     = p,
                .rotation_deg = tangent_rotation_degrees(p.x, p.y),
            });
        }
    }

    return projected;
}

} // namespace planisphere::astro
