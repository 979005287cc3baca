#pragma once

/// @file date_ring_mode.hpp
/// @brief Reference hour used to place each day on the date ring.

#include <string_view>

namespace planisphere::astro
{
    /// @brief Which civil hour of each day lines up with the time ring.
    enum class DateRingMode
    {
        Midnight,          ///< "MIDNIGHT": 00:00 standard time
        LocalNoon,         ///< "LOCAL_NOON": 12:00 standard time
        ApparentNoon,      ///< "LASN": local apparent solar noon (default)
        ApparentMidnight,  ///< "LAMN": local apparent midnight
        Local21h,          ///< "LOCAL_21H": 21:00, start of an evening session
        Unrecognized,      ///< Any other tag; behaves like Midnight
    };

    /// @brief Map a mode tag to its enumerator. Unknown tags give Unrecognized.
    [[nodiscard]] constexpr DateRingMode date_ring_mode_from_string(std::string_view tag)
    {
        if (tag == "MIDNIGHT")   return DateRingMode::Midnight;
        if (tag == "LOCAL_NOON") return DateRingMode::LocalNoon;
        if (tag == "LASN")       return DateRingMode::ApparentNoon;
        if (tag == "LAMN")       return DateRingMode::ApparentMidnight;
        if (tag == "LOCAL_21H")  return DateRingMode::Local21h;
        return DateRingMode::Unrecognized;
    }

    /// @brief Canonical tag of a mode ("UNRECOGNIZED" for the fallback).
    [[nodiscard]] constexpr std::string_view to_string(DateRingMode mode)
    {
        switch (mode)
        {
            case DateRingMode::Midnight:         return "MIDNIGHT";
            case DateRingMode::LocalNoon:        return "LOCAL_NOON";
            case DateRingMode::ApparentNoon:     return "LASN";
            case DateRingMode::ApparentMidnight: return "LAMN";
            case DateRingMode::Local21h:         return "LOCAL_21H";
            case DateRingMode::Unrecognized:     break;
        }
        return "UNRECOGNIZED";
    }

} // namespace planisphere::astro
