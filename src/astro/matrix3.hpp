#pragma once

/// @file matrix3.hpp
/// @brief 3×3 rotation matrices between equatorial, horizontal, ecliptic and galactic frames.

#include "astro/vector3.hpp"
#include "core/types.hpp"

namespace planisphere::astro
{
    /// @brief Rotation between two celestial frames, applied as result = M · v.
    ///
    /// Elements are addressed by (row, col). Storage is a glm::dmat3, which
    /// is column-major internally; from_rows() and get() hide that.
    ///
    /// Build one matrix per parameter set (sidereal moment, latitude, epoch)
    /// and reuse it across all points of a render pass.
    class Matrix3
    {
    public:
        /// @brief Identity.
        Matrix3() = default;
        explicit Matrix3(const Mat3d& m) : m_m(m) {}

        /// @brief Build from nine elements in row-major reading order.
        [[nodiscard]] static Matrix3 from_rows(f64 x11, f64 x12, f64 x13,
                                               f64 x21, f64 x22, f64 x23,
                                               f64 x31, f64 x32, f64 x33);

        [[nodiscard]] static Matrix3 identity() { return Matrix3{}; }

        [[nodiscard]] f64 get(i32 row, i32 col) const { return m_m[col][row]; }
        [[nodiscard]] const Mat3d& mat() const { return m_m; }

        [[nodiscard]] Matrix3 transposed() const;

        [[nodiscard]] Matrix3 operator*(const Matrix3& rhs) const;
        [[nodiscard]] Vector3 operator*(const Vector3& v) const;

        // -------------------------------------------------------------
        // Frame builders
        //
        // `lst` is a local sidereal moment (Julian Day); its time of day
        // gives the sidereal angle. `jd` selects the obliquity epoch.
        // -------------------------------------------------------------

        /// @brief Equatorial → horizontal (azimuth from north through east).
        [[nodiscard]] static Matrix3 equatorial_to_horizontal(f64 lst, f64 latitude_rad);

        /// @brief Horizontal → equatorial; the transpose of equatorial_to_horizontal().
        [[nodiscard]] static Matrix3 horizontal_to_equatorial(f64 lst, f64 latitude_rad);

        [[nodiscard]] static Matrix3 equatorial_to_ecliptic(f64 jd);
        [[nodiscard]] static Matrix3 ecliptic_to_equatorial(f64 jd);

        /// @brief Galactic → equatorial (fixed, J2000 galactic pole).
        [[nodiscard]] static Matrix3 galactic_to_equatorial();
        [[nodiscard]] static Matrix3 equatorial_to_galactic();

        [[nodiscard]] static Matrix3 galactic_to_horizontal(f64 lst, f64 latitude_rad);
        [[nodiscard]] static Matrix3 ecliptic_to_horizontal(f64 lst, f64 latitude_rad);

        /// @brief Mean obliquity of the ecliptic (radians):
        /// 23.4393° − 3.563e-7° × (jd − 2451543.5).
        [[nodiscard]] static f64 obliquity_of_ecliptic(f64 jd);

    private:
        Mat3d m_m{1.0};
    };

} // namespace planisphere::astro
