/// @file matrix3.cpp
/// @brief Implementation of frame rotation matrices.

#include "astro/matrix3.hpp"

#include "astro/time_system.hpp"

#include <cmath>

namespace planisphere::astro
{

namespace
{
    /// Sidereal angle (radians) of a local sidereal moment.
    f64 sidereal_angle(f64 lst)
    {
        return TimeSystem::time_of_day(lst) * astro_constants::kHourToRad;
    }
}

Matrix3 Matrix3::from_rows(f64 x11, f64 x12, f64 x13,
                           f64 x21, f64 x22, f64 x23,
                           f64 x31, f64 x32, f64 x33)
{
    // glm takes columns; feeding rows and transposing gives row-major reading order
    return Matrix3(glm::transpose(Mat3d(x11, x12, x13,
                                        x21, x22, x23,
                                        x31, x32, x33)));
}

Matrix3 Matrix3::transposed() const
{
    return Matrix3(glm::transpose(m_m));
}

Matrix3 Matrix3::operator*(const Matrix3& rhs) const
{
    return Matrix3(m_m * rhs.m_m);
}

Vector3 Matrix3::operator*(const Vector3& v) const
{
    return Vector3(m_m * v.xyz());
}

// -----------------------------------------------------------------
// Equatorial ↔ horizontal
//
// With θ the local sidereal angle and φ the latitude:
//
//         | −sinφ cosθ   −sinφ sinθ   cosφ |
//   E→H = |   −sinθ         cosθ       0   |
//         |  cosφ cosθ    cosφ sinθ   sinφ |
// -----------------------------------------------------------------

Matrix3 Matrix3::equatorial_to_horizontal(f64 lst, f64 latitude_rad)
{
    const f64 theta   = sidereal_angle(lst);
    const f64 cos_lst = std::cos(theta);
    const f64 sin_lst = std::sin(theta);
    const f64 cos_lat = std::cos(latitude_rad);
    const f64 sin_lat = std::sin(latitude_rad);

    return from_rows(-sin_lat * cos_lst, -sin_lat * sin_lst, cos_lat,
                     -sin_lst,            cos_lst,           0.0,
                      cos_lat * cos_lst,  cos_lat * sin_lst, sin_lat);
}

Matrix3 Matrix3::horizontal_to_equatorial(f64 lst, f64 latitude_rad)
{
    const f64 theta   = sidereal_angle(lst);
    const f64 cos_lst = std::cos(theta);
    const f64 sin_lst = std::sin(theta);
    const f64 cos_lat = std::cos(latitude_rad);
    const f64 sin_lat = std::sin(latitude_rad);

    return from_rows(-cos_lst * sin_lat, -sin_lst, cos_lst * cos_lat,
                     -sin_lst * sin_lat,  cos_lst, sin_lst * cos_lat,
                      cos_lat,            0.0,     sin_lat);
}

// -----------------------------------------------------------------
// Equatorial ↔ ecliptic: rotation about x by the obliquity
// -----------------------------------------------------------------

f64 Matrix3::obliquity_of_ecliptic(f64 jd)
{
    const f64 d = jd - 2451543.5;
    return (23.4393 - 3.563e-7 * d) * astro_constants::kDegToRad;
}

Matrix3 Matrix3::equatorial_to_ecliptic(f64 jd)
{
    const f64 e = obliquity_of_ecliptic(jd);
    const f64 cos_e = std::cos(e);
    const f64 sin_e = std::sin(e);

    return from_rows(1.0,  0.0,   0.0,
                     0.0,  cos_e, sin_e,
                     0.0, -sin_e, cos_e);
}

Matrix3 Matrix3::ecliptic_to_equatorial(f64 jd)
{
    const f64 e = obliquity_of_ecliptic(jd);
    const f64 cos_e = std::cos(e);
    const f64 sin_e = std::sin(e);

    return from_rows(1.0, 0.0,    0.0,
                     0.0, cos_e, -sin_e,
                     0.0, sin_e,  cos_e);
}

// -----------------------------------------------------------------
// Equatorial ↔ galactic
// -----------------------------------------------------------------

Matrix3 Matrix3::galactic_to_equatorial()
{
    return from_rows(-0.0669887,  0.4927285, -0.8676008,
                     -0.8727558, -0.4503470, -0.1883746,
                     -0.4835389,  0.7445846,  0.4601998);
}

Matrix3 Matrix3::equatorial_to_galactic()
{
    return galactic_to_equatorial().transposed();
}

// -----------------------------------------------------------------
// Composites
// -----------------------------------------------------------------

Matrix3 Matrix3::galactic_to_horizontal(f64 lst, f64 latitude_rad)
{
    return equatorial_to_horizontal(lst, latitude_rad) * galactic_to_equatorial();
}

Matrix3 Matrix3::ecliptic_to_horizontal(f64 lst, f64 latitude_rad)
{
    return equatorial_to_horizontal(lst, latitude_rad) * ecliptic_to_equatorial(lst);
}

} // namespace planisphere::astro
