#pragma once

/// @file star_entry.hpp
/// @brief Runtime data structures for static catalog entries.

#include "core/types.hpp"

#include <string>

namespace planisphere::catalog
{
    /// @brief One star from the catalog.
    ///
    /// Coordinates are stored in radians (J2000 epoch), converted at load time
    /// from the catalog's hours and degrees.
    struct StarEntry
    {
        f64 ra;              ///< Right ascension (radians, 0..2π)
        f64 dec;             ///< Declination (radians, -π/2..+π/2)
        f32 mag_v;           ///< Visual magnitude (V-band)
        char spectral_class; ///< Spectral type letter (O B A F G K M), '?' if unknown
        u32 catalog_id;      ///< Source catalog ID
        std::string name;    ///< Proper name, may be empty
    };

    /// @brief One stick-figure segment of a constellation (radians).
    struct ConstellationSegment
    {
        f64 ra1;
        f64 dec1;
        f64 ra2;
        f64 dec2;
    };

    /// @brief Anchor position of a constellation name (radians).
    struct ConstellationLabel
    {
        f64 ra;
        f64 dec;
        std::string name;
    };

} // namespace planisphere::catalog
