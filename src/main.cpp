/// @file main.cpp
/// @brief Planisphere demo: lays out one disc for the current moment and logs the result.

#include "astro/azimuthal_projection.hpp"
#include "astro/disc_layout.hpp"
#include "astro/observer_clock.hpp"
#include "astro/observer_frame.hpp"
#include "astro/time_system.hpp"
#include "catalog/catalog_loader.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <filesystem>

using namespace planisphere;

int main(int argc, char** argv)
{
    const core::PlanisphereConfig config{};

    core::Logger::init(config.log_file);
    PLN_INFO("Planisphere starting");

    const auto frame = astro::ObserverFrame::create(config.site.utc_offset_hours,
                                                    config.site.longitude_deg,
                                                    config.site.latitude_deg,
                                                    config.min_abs_latitude_deg);
    if (!frame)
    {
        PLN_CRITICAL("Configured site cannot be shown on a planisphere");
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    // A southern observer gets a disc centered on the south celestial pole
    const auto pole = frame->is_southern() ? astro::ProjectionPole::South
                                           : astro::ProjectionPole::North;
    const f64 limit_deg = frame->is_southern() ? -config.declination_limit_deg
                                               : config.declination_limit_deg;

    const astro::ObserverClock clock(*frame);
    const astro::AzimuthalProjection projection(config.screen_radius(),
                                                limit_deg * astro_constants::kDegToRad,
                                                pole);
    const astro::DiscLayout layout(clock, projection,
                                   astro::DiscLayoutOptions{
                                       .date_ring_mode   = config.date_ring_mode,
                                       .dst_hours        = config.dst_hours,
                                       .horizon_step_rad = config.horizon_step_rad,
                                   });

    // -----------------------------------------------------------------
    // Current moment
    // -----------------------------------------------------------------
    const f64 lct = clock.ut_to_lct(astro::TimeSystem::now_as_jd());
    const f64 lst = clock.lct_to_lst(lct);
    const astro::DateTime now = astro::TimeSystem::from_julian_date(lct);

    PLN_INFO("Site: lon {:.2f}°, lat {:.2f}°, UTC{:+.1f}",
             frame->longitude_deg(), frame->latitude_deg(), frame->utc_offset_hours());
    PLN_INFO("Local civil time: {:04}-{:02}-{:02} {:02}:{:02}:{:06.3f}",
             now.year, now.month, now.day, now.hour, now.minute, now.second);
    PLN_INFO("Local sidereal time: {:.4f} h", astro::TimeSystem::time_of_day(lst));
    PLN_INFO("Sky rotation: {:.2f}°", layout.sky_rotation_degrees(lct));
    PLN_INFO("Apparent solar noon: {:.4f} h",
             clock.local_apparent_solar_noon(now.year, now.month, now.day, config.dst_hours));
    PLN_INFO("Date ring mode {}: {} ticks",
             astro::to_string(config.date_ring_mode), layout.date_ring(now.year).size());
    PLN_INFO("Horizon outline: {} samples", layout.horizon_outline(lct).size());
    PLN_INFO("Grid: {} RA spokes, {} declination circles",
             layout.ra_grid(config.ra_grid_interval_hours).size(),
             layout.dec_circles(config.dec_grid_interval_deg).size());

    // -----------------------------------------------------------------
    // Optional catalogs: stars, then constellation names
    // -----------------------------------------------------------------
    if (argc > 1)
    {
        const std::filesystem::path star_path{argv[1]};
        const auto stars = catalog::CatalogLoader::load_star_csv(star_path);
        if (stars)
        {
            const auto visible = layout.project_stars(*stars);
            PLN_INFO("{} of {} stars fall on the disc", visible.size(), stars->size());
        }
        else
        {
            PLN_WARN("No stars drawn; could not load {}", star_path.string());
        }
    }

    if (argc > 2)
    {
        const std::filesystem::path names_path{argv[2]};
        const auto names = catalog::CatalogLoader::load_constellation_names_csv(names_path);
        if (names)
        {
            const auto placed = layout.project_constellation_labels(*names, config.label_inset_px);
            PLN_INFO("{} of {} constellation names placed at least {:.0f} px inside the rim",
                     placed.size(), names->size(), config.label_inset_px);
        }
        else
        {
            PLN_WARN("No constellation names drawn; could not load {}", names_path.string());
        }
    }

    PLN_INFO("Planisphere done");
    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
