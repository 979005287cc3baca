#pragma once

/// @file vector3.hpp
/// @brief Point on the celestial sphere and single-shot frame transforms.

#include "core/types.hpp"

namespace planisphere::astro
{
    /// @brief Cartesian direction on (or near) the unit sphere.
    ///
    /// Spherical longitude is measured from +x toward +y, latitude from the
    /// xy-plane toward +z. In the equatorial frame these are right ascension
    /// and declination; in the horizontal frame, azimuth (from north through
    /// east) and altitude.
    ///
    /// Transforms return a new vector and never alias their argument.
    class Vector3
    {
    public:
        Vector3() = default;
        Vector3(f64 x, f64 y, f64 z) : m_v(x, y, z) {}
        explicit Vector3(const Vec3d& v) : m_v(v) {}

        /// @brief Unit vector from spherical coordinates (radians).
        [[nodiscard]] static Vector3 from_spherical(f64 lon_rad, f64 lat_rad);

        [[nodiscard]] f64 x() const { return m_v.x; }
        [[nodiscard]] f64 y() const { return m_v.y; }
        [[nodiscard]] f64 z() const { return m_v.z; }
        [[nodiscard]] const Vec3d& xyz() const { return m_v; }

        /// @brief Spherical longitude in [0, 2π). Returns 0 on the z-axis (x = y = 0).
        [[nodiscard]] f64 lon() const;

        /// @brief Spherical latitude, asin(z / |v|). Works for non-unit vectors;
        /// NaN for the zero vector.
        [[nodiscard]] f64 lat() const;

        [[nodiscard]] f64 length() const;

        /// @brief Unit vector in the same direction (zero vector stays zero).
        [[nodiscard]] Vector3 normalized() const;

        // -------------------------------------------------------------
        // Single-shot frame transforms
        //
        // `lst` is a local sidereal moment (Julian Day), `jd` the epoch for
        // the obliquity of the ecliptic. For many points under the same
        // parameters, build the Matrix3 once instead.
        // -------------------------------------------------------------

        [[nodiscard]] static Vector3 equatorial_to_horizontal(const Vector3& equ, f64 lst, f64 latitude_rad);
        [[nodiscard]] static Vector3 horizontal_to_equatorial(const Vector3& hor, f64 lst, f64 latitude_rad);

        [[nodiscard]] static Vector3 equatorial_to_ecliptic(const Vector3& equ, f64 jd);
        [[nodiscard]] static Vector3 ecliptic_to_equatorial(const Vector3& ecl, f64 jd);

        [[nodiscard]] static Vector3 equatorial_to_galactic(const Vector3& equ);
        [[nodiscard]] static Vector3 galactic_to_equatorial(const Vector3& gal);

        /// @brief Ecliptic → horizontal. The obliquity epoch is taken from `lst`
        /// itself; it differs from UT by less than a day, far below the
        /// resolution of the obliquity formula.
        [[nodiscard]] static Vector3 ecliptic_to_horizontal(const Vector3& ecl, f64 lst, f64 latitude_rad);

    private:
        Vec3d m_v{0.0, 0.0, 0.0};
    };

} // namespace planisphere::astro
