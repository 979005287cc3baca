/// @file vector3.cpp
/// @brief Implementation of Vector3 spherical accessors and transforms.

#include "astro/vector3.hpp"

#include "astro/matrix3.hpp"
#include "core/angles.hpp"

#include <algorithm>
#include <cmath>

namespace planisphere::astro
{

Vector3 Vector3::from_spherical(f64 lon_rad, f64 lat_rad)
{
    const f64 cos_lat = std::cos(lat_rad);
    return Vector3(cos_lat * std::cos(lon_rad),
                   cos_lat * std::sin(lon_rad),
                   std::sin(lat_rad));
}

f64 Vector3::lon() const
{
    // atan2(0, 0) == 0 at the poles
    return core::normalize_radians(std::atan2(m_v.y, m_v.x));
}

f64 Vector3::lat() const
{
    // Rounding can push |z / length| a hair past 1 near the poles
    return std::asin(std::clamp(m_v.z / length(), -1.0, 1.0));
}

f64 Vector3::length() const
{
    return glm::length(m_v);
}

Vector3 Vector3::normalized() const
{
    const f64 len = length();
    return (len > 0.0) ? Vector3(m_v / len) : Vector3{};
}

// -----------------------------------------------------------------
// Frame transforms: thin wrappers over the Matrix3 builders
// -----------------------------------------------------------------

Vector3 Vector3::equatorial_to_horizontal(const Vector3& equ, f64 lst, f64 latitude_rad)
{
    return Matrix3::equatorial_to_horizontal(lst, latitude_rad) * equ;
}

Vector3 Vector3::horizontal_to_equatorial(const Vector3& hor, f64 lst, f64 latitude_rad)
{
    return Matrix3::horizontal_to_equatorial(lst, latitude_rad) * hor;
}

// Rotation about the x-axis by the obliquity ε:
//   y' =  y cos ε + z sin ε
//   z' = −y sin ε + z cos ε
Vector3 Vector3::equatorial_to_ecliptic(const Vector3& equ, f64 jd)
{
    const f64 e = Matrix3::obliquity_of_ecliptic(jd);
    const f64 cos_e = std::cos(e);
    const f64 sin_e = std::sin(e);

    return Vector3(equ.x(),
                   equ.y() * cos_e + equ.z() * sin_e,
                   -equ.y() * sin_e + equ.z() * cos_e);
}

Vector3 Vector3::ecliptic_to_equatorial(const Vector3& ecl, f64 jd)
{
    const f64 e = Matrix3::obliquity_of_ecliptic(jd);
    const f64 cos_e = std::cos(e);
    const f64 sin_e = std::sin(e);

    return Vector3(ecl.x(),
                   ecl.y() * cos_e - ecl.z() * sin_e,
                   ecl.y() * sin_e + ecl.z() * cos_e);
}

Vector3 Vector3::equatorial_to_galactic(const Vector3& equ)
{
    return Matrix3::equatorial_to_galactic() * equ;
}

Vector3 Vector3::galactic_to_equatorial(const Vector3& gal)
{
    return Matrix3::galactic_to_equatorial() * gal;
}

Vector3 Vector3::ecliptic_to_horizontal(const Vector3& ecl, f64 lst, f64 latitude_rad)
{
    return equatorial_to_horizontal(ecliptic_to_equatorial(ecl, lst), lst, latitude_rad);
}

} // namespace planisphere::astro
