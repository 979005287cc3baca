/// @file azimuthal_projection.cpp
/// @brief Implementation of the equidistant azimuthal projection.

#include "astro/azimuthal_projection.hpp"

#include "astro/time_system.hpp"

#include <cmath>

namespace planisphere::astro
{

AzimuthalProjection::AzimuthalProjection(f64 screen_radius,
                                         f64 declination_limit_rad,
                                         ProjectionPole pole)
    : m_screen_radius(screen_radius)
    , m_declination_limit(declination_limit_rad)
    , m_pole(pole)
    , m_celestial_radius_scale(0.0)
{
    const f64 s = pole_sign();
    m_celestial_radius_scale = screen_radius
                             / std::abs(astro_constants::kHalfPi - s * declination_limit_rad);
}

f64 AzimuthalProjection::pole_sign() const
{
    return (m_pole == ProjectionPole::North) ? 1.0 : -1.0;
}

ScreenPoint AzimuthalProjection::project(f64 ra_rad, f64 dec_rad) const
{
    const f64 s = pole_sign();
    const f64 r = (astro_constants::kHalfPi - s * dec_rad) * m_celestial_radius_scale;
    const f64 theta = s * ra_rad;

    return ScreenPoint{r * std::cos(theta), r * std::sin(theta)};
}

bool AzimuthalProjection::is_within_disc(const ScreenPoint& point) const
{
    return glm::length(point) <= m_screen_radius;
}

f64 AzimuthalProjection::disc_rotation_degrees(f64 lst) const
{
    const f64 lst_deg = TimeSystem::time_of_day(lst) * astro_constants::kHourToRad
                      * astro_constants::kRadToDeg;
    return 90.0 - pole_sign() * lst_deg;
}

} // namespace planisphere::astro
