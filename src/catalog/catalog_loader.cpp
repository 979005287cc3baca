/// @file catalog_loader.cpp
/// @brief Implementation of CSV catalog loaders.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>
#include <fstream>
#include <string>
#include <utility>

namespace planisphere::catalog
{

namespace
{
    // -----------------------------------------------------------------
    // Shared reader: open, skip header, parse each non-blank line
    // -----------------------------------------------------------------

    template <typename Entry, typename ParseLine>
    std::optional<std::vector<Entry>> read_catalog(const std::filesystem::path& path,
                                                   std::string_view what,
                                                   ParseLine parse_line)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            PLN_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
            return std::nullopt;
        }

        std::string line;

        // Skip header line
        if (!std::getline(file, line))
        {
            PLN_CORE_ERROR("CatalogLoader: File is empty: {}", path.string());
            return std::nullopt;
        }

        std::vector<Entry> entries;
        u32 line_number = 1;
        u32 skipped = 0;

        while (std::getline(file, line))
        {
            ++line_number;

            if (line.find_first_not_of(" \t\r") == std::string::npos)
            {
                continue;
            }

            std::optional<Entry> entry = parse_line(line);
            if (!entry)
            {
                PLN_CORE_WARN("CatalogLoader: Malformed line {}: {}", line_number, line);
                ++skipped;
                continue;
            }

            entries.push_back(std::move(*entry));
        }

        if (entries.empty())
        {
            PLN_CORE_ERROR("CatalogLoader: No valid {} found in: {}", what, path.string());
            return std::nullopt;
        }

        if (skipped > 0)
        {
            PLN_CORE_WARN("CatalogLoader: Skipped {} malformed lines", skipped);
        }

        PLN_CORE_INFO("CatalogLoader: Loaded {} {} from {}", entries.size(), what, path.string());

        return entries;
    }
}

// -----------------------------------------------------------------
// Stars: Id,Name,RA_h,Dec_deg,Vmag,SpType
// -----------------------------------------------------------------

std::optional<std::vector<StarEntry>>
CatalogLoader::load_star_csv(const std::filesystem::path& path)
{
    return read_catalog<StarEntry>(path, "stars", [](std::string_view line) -> std::optional<StarEntry>
    {
        std::vector<std::string_view> fields;
        if (!split_fields(line, fields, 6))
        {
            return std::nullopt;
        }

        const auto id      = parse_u32(fields[0]);
        const auto ra_h    = parse_f64(fields[2]);
        const auto dec_deg = parse_f64(fields[3]);
        const auto mag_v   = parse_f64(fields[4]);

        if (!id || !ra_h || !dec_deg || !mag_v)
        {
            return std::nullopt;
        }

        return StarEntry{
            .ra             = *ra_h * astro_constants::kHourToRad,
            .dec            = *dec_deg * astro_constants::kDegToRad,
            .mag_v          = static_cast<f32>(*mag_v),
            .spectral_class = fields[5].empty() ? '?' : fields[5].front(),
            .catalog_id     = *id,
            .name           = std::string(fields[1]),
        };
    });
}

// -----------------------------------------------------------------
// Constellation lines: RA1_h,Dec1_deg,RA2_h,Dec2_deg
// -----------------------------------------------------------------

std::optional<std::vector<ConstellationSegment>>
CatalogLoader::load_constellation_lines_csv(const std::filesystem::path& path)
{
    return read_catalog<ConstellationSegment>(path, "constellation segments",
        [](std::string_view line) -> std::optional<ConstellationSegment>
    {
        std::vector<std::string_view> fields;
        if (!split_fields(line, fields, 4))
        {
            return std::nullopt;
        }

        const auto ra1  = parse_f64(fields[0]);
        const auto dec1 = parse_f64(fields[1]);
        const auto ra2  = parse_f64(fields[2]);
        const auto dec2 = parse_f64(fields[3]);

        if (!ra1 || !dec1 || !ra2 || !dec2)
        {
            return std::nullopt;
        }

        return ConstellationSegment{
            .ra1  = *ra1 * astro_constants::kHourToRad,
            .dec1 = *dec1 * astro_constants::kDegToRad,
            .ra2  = *ra2 * astro_constants::kHourToRad,
            .dec2 = *dec2 * astro_constants::kDegToRad,
        };
    });
}

// -----------------------------------------------------------------
// Constellation names: RA_h,Dec_deg,Name
// -----------------------------------------------------------------

std::optional<std::vector<ConstellationLabel>>
CatalogLoader::load_constellation_names_csv(const std::filesystem::path& path)
{
    return read_catalog<ConstellationLabel>(path, "constellation names",
        [](std::string_view line) -> std::optional<ConstellationLabel>
    {
        std::vector<std::string_view> fields;
        if (!split_fields(line, fields, 3))
        {
            return std::nullopt;
        }

        const auto ra_h    = parse_f64(fields[0]);
        const auto dec_deg = parse_f64(fields[1]);

        if (!ra_h || !dec_deg || fields[2].empty())
        {
            return std::nullopt;
        }

        return ConstellationLabel{
            .ra   = *ra_h * astro_constants::kHourToRad,
            .dec  = *dec_deg * astro_constants::kDegToRad,
            .name = std::string(fields[2]),
        };
    });
}

// -----------------------------------------------------------------
// Utility: split on commas
// -----------------------------------------------------------------

bool CatalogLoader::split_fields(std::string_view line,
                                 std::vector<std::string_view>& fields,
                                 std::size_t count)
{
    fields.clear();

    while (true)
    {
        const auto comma = line.find(',');
        fields.push_back(trim(line.substr(0, comma)));
        if (comma == std::string_view::npos)
        {
            break;
        }
        line.remove_prefix(comma + 1);
    }

    return fields.size() == count;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> CatalogLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // std::from_chars for double requires C++17 and MSVC/GCC 11+/Clang 16+
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

// -----------------------------------------------------------------
// Utility: parse u32 from string_view
// -----------------------------------------------------------------

std::optional<u32> CatalogLoader::parse_u32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    u32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace planisphere::catalog
