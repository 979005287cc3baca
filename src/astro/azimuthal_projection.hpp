#pragma once

/// @file azimuthal_projection.hpp
/// @brief Equidistant azimuthal projection of the celestial sphere onto the disc.

#include "core/types.hpp"

namespace planisphere::astro
{
    /// @brief Celestial pole placed at the disc center.
    enum class ProjectionPole
    {
        North,  ///< Northern-hemisphere disc; RA increases counter-clockwise in (x, y)
        South,  ///< Southern-hemisphere disc; mirrored so RA runs the other way
    };

    /// @brief Maps (RA, Dec) to planar pixel offsets from the disc center.
    ///
    /// Distance from the center is linear in angular distance from the pole:
    ///
    ///   r = (π/2 − s·dec) · scale,   scale = R / |π/2 − s·limit|
    ///   x = r cos(s·ra),  y = r sin(s·ra)
    ///
    /// with s = +1 for the north pole and −1 for the south pole. A point at
    /// the declination limit lands exactly on the disc edge (radius R); points
    /// beyond the limit land outside and are left for the caller to cull.
    ///
    /// The limit may lie in the far hemisphere (e.g. −70° for a northern disc).
    /// Instances are immutable; build a new one when the radius or limit changes.
    class AzimuthalProjection
    {
    public:
        /// @param screen_radius Disc radius in pixels.
        /// @param declination_limit_rad Declination mapped onto the disc edge.
        /// @param pole Celestial pole at the disc center.
        AzimuthalProjection(f64 screen_radius,
                            f64 declination_limit_rad,
                            ProjectionPole pole = ProjectionPole::North);

        /// @brief Project an equatorial position (radians) to screen offsets.
        [[nodiscard]] ScreenPoint project(f64 ra_rad, f64 dec_rad) const;

        /// @brief True if the point lies on the disc (distance ≤ screen radius).
        [[nodiscard]] bool is_within_disc(const ScreenPoint& point) const;

        /// @brief Rotation (degrees) that brings the meridian of a local sidereal
        /// moment to the bottom of the disc (+y, screen coordinates pointing down).
        ///
        /// 90 − s · LST(deg); applied by the renderer to the whole sky group.
        [[nodiscard]] f64 disc_rotation_degrees(f64 lst) const;

        [[nodiscard]] f64 screen_radius() const { return m_screen_radius; }
        [[nodiscard]] f64 declination_limit() const { return m_declination_limit; }
        [[nodiscard]] f64 celestial_radius_scale() const { return m_celestial_radius_scale; }
        [[nodiscard]] ProjectionPole pole() const { return m_pole; }

        /// @brief +1 for a north-centered disc, −1 for a south-centered one.
        [[nodiscard]] f64 pole_sign() const;

    private:
        f64 m_screen_radius;
        f64 m_declination_limit;
        ProjectionPole m_pole;
        f64 m_celestial_radius_scale;  ///< Pixels per radian of polar distance
    };

} // namespace planisphere::astro
