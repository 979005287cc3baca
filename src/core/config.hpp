#pragma once

/// @file config.hpp
/// @brief Default planisphere configuration (observer site, canvas, grid, date ring).

#include "astro/date_ring_mode.hpp"
#include "core/types.hpp"

#include <filesystem>

namespace planisphere::core
{
    /// @brief Observer site used when nothing else is configured.
    struct SiteConfig
    {
        f64 utc_offset_hours = 9.0;     ///< Korea Standard Time
        f64 longitude_deg    = 126.98;  ///< Seoul City Hall, east positive
        f64 latitude_deg     = 37.57;   ///< Seoul City Hall, north positive
    };

    /// @brief Everything a planisphere front end needs to build one disc.
    ///
    /// All values are in-code defaults; a front end copies this struct and
    /// overrides the fields it exposes.
    struct PlanisphereConfig
    {
        SiteConfig site{};

        // Canvas (pixels). The disc sits centered with two margins on each side.
        f64 canvas_width  = 1000.0;
        f64 canvas_height = 1000.0;
        f64 canvas_margin = 30.0;

        /// Southernmost declination drawn (northern-hemisphere disc).
        f64 declination_limit_deg = -70.0;

        f64 ra_grid_interval_hours = 2.0;
        f64 dec_grid_interval_deg  = 30.0;

        astro::DateRingMode date_ring_mode = astro::DateRingMode::ApparentNoon;
        f64 dst_hours = 0.0;

        /// Azimuth step when sampling the horizon outline (radians, about 0.57°).
        f64 horizon_step_rad = 0.01;

        /// Constellation names are only placed this far inside the disc edge.
        f64 label_inset_px = 30.0;

        /// Below this |latitude| the sidereal rotation of the disc degenerates.
        f64 min_abs_latitude_deg = 10.0;

        /// Rotating log file; empty keeps logging on the console.
        std::filesystem::path log_file = "planisphere.log";

        /// @brief Disc radius in pixels derived from the canvas.
        [[nodiscard]] f64 screen_radius() const
        {
            return canvas_width * 0.5 - canvas_margin * 2.0;
        }
    };

} // namespace planisphere::core
