#pragma once

/// @file catalog_loader.hpp
/// @brief Loads star and constellation catalogs from CSV files into memory.

#include "catalog/star_entry.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace planisphere::catalog
{
    /// @brief Static utility class for loading catalog files.
    ///
    /// Every format has a header row, which is skipped. Right ascension is
    /// given in hours and declination in degrees; both are converted to
    /// radians. Malformed lines are skipped with a warning; a file that
    /// cannot be read, or yields no valid entry, gives std::nullopt.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Load stars.
        ///
        /// Expected CSV columns:
        ///   Id, Name, RA_h, Dec_deg, Vmag, SpType
        ///
        /// Name may be empty. Only the first letter of SpType is kept.
        [[nodiscard]] static std::optional<std::vector<StarEntry>>
            load_star_csv(const std::filesystem::path& path);

        /// @brief Load constellation stick-figure segments.
        ///
        /// Expected CSV columns:
        ///   RA1_h, Dec1_deg, RA2_h, Dec2_deg
        [[nodiscard]] static std::optional<std::vector<ConstellationSegment>>
            load_constellation_lines_csv(const std::filesystem::path& path);

        /// @brief Load constellation name anchors.
        ///
        /// Expected CSV columns:
        ///   RA_h, Dec_deg, Name
        [[nodiscard]] static std::optional<std::vector<ConstellationLabel>>
            load_constellation_names_csv(const std::filesystem::path& path);

    private:
        /// @brief Split a line on commas into exactly `count` trimmed fields.
        /// @return false if the field count differs.
        [[nodiscard]] static bool split_fields(std::string_view line,
                                               std::vector<std::string_view>& fields,
                                               std::size_t count);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single u32 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<u32> parse_u32(std::string_view sv);
    };

} // namespace planisphere::catalog
