/// @file observer_frame.cpp
/// @brief Observer frame validation.

#include "astro/observer_frame.hpp"

#include "core/angles.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace planisphere::astro
{

std::optional<ObserverFrame> ObserverFrame::create(
    f64 utc_offset_hours,
    f64 longitude_deg,
    f64 latitude_deg,
    f64 min_abs_latitude_deg)
{
    if (!std::isfinite(utc_offset_hours) || !std::isfinite(longitude_deg) ||
        !std::isfinite(latitude_deg))
    {
        PLN_CORE_WARN("ObserverFrame: Non-finite input (offset={}, lon={}, lat={})",
                      utc_offset_hours, longitude_deg, latitude_deg);
        return std::nullopt;
    }

    if (latitude_deg < -90.0 || latitude_deg > 90.0)
    {
        PLN_CORE_WARN("ObserverFrame: Latitude {} outside [-90, 90]", latitude_deg);
        return std::nullopt;
    }

    if (std::abs(latitude_deg) < min_abs_latitude_deg)
    {
        PLN_CORE_WARN("ObserverFrame: Latitude {} within {} deg of the equator is not supported",
                      latitude_deg, min_abs_latitude_deg);
        return std::nullopt;
    }

    const f64 wrapped_lon = core::normalize(longitude_deg, -180.0, 180.0);

    return ObserverFrame(utc_offset_hours,
                         wrapped_lon * astro_constants::kDegToRad,
                         latitude_deg * astro_constants::kDegToRad);
}

f64 ObserverFrame::longitude_deg() const
{
    return m_longitude_rad * astro_constants::kRadToDeg;
}

f64 ObserverFrame::latitude_deg() const
{
    return m_latitude_rad * astro_constants::kRadToDeg;
}

f64 ObserverFrame::longitude_hours() const
{
    return m_longitude_rad * astro_constants::kRadToHour;
}

} // namespace planisphere::astro
