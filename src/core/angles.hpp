#pragma once

/// @file angles.hpp
/// @brief Range reduction for angles and time-of-day values.

#include "core/types.hpp"

#include <cmath>
#include <limits>

namespace planisphere::core
{
    /// @brief Floor-based remainder: result lies in [0, divisor) for a positive divisor.
    ///
    /// Unlike std::fmod, a negative dividend wraps to the positive side
    /// (mod(-30, 360) == 330).
    [[nodiscard]] inline f64 mod(f64 dividend, f64 divisor)
    {
        return dividend - std::floor(dividend / divisor) * divisor;
    }

    /// @brief Wrap x into the half-open interval [from, to).
    /// @return Quiet NaN when the interval is empty or reversed (to <= from),
    ///         or when x is NaN or infinite.
    [[nodiscard]] inline f64 normalize(f64 x, f64 from, f64 to)
    {
        const f64 width = to - from;
        if (!(width > 0.0))
        {
            return std::numeric_limits<f64>::quiet_NaN();
        }
        const f64 wrapped = x - std::floor((x - from) / width) * width;

        // A tiny negative offset can round up to exactly `to`; NaN falls through
        return (wrapped >= to) ? from : wrapped;
    }

    /// @brief Normalize an angle to [0, 2π).
    [[nodiscard]] inline f64 normalize_radians(f64 angle)
    {
        return normalize(angle, 0.0, astro_constants::kTwoPi);
    }

    /// @brief Normalize an hour value to [0, 24).
    [[nodiscard]] inline f64 normalize_hours(f64 hours)
    {
        return normalize(hours, 0.0, 24.0);
    }

} // namespace planisphere::core
