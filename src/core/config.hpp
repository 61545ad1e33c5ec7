#pragma once

/// @file config.hpp
/// @brief Application configuration snapshot loaded from YAML.

#include "astro/geo_location.hpp"
#include "astro/time_system.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace vedika::core
{
    struct EphemerisConfig
    {
        std::string provider{"analytic"};   ///< "analytic" or "swisseph"
        std::string ayanamsa{"lahiri"};     ///< "lahiri" or "tropical"
        std::string ephe_path;              ///< Swiss Ephemeris data directory
    };

    struct CorpusConfig
    {
        std::filesystem::path path{"data/verses.yaml"};
        std::string default_verse_id;
        std::string matcher{"keyword"};     ///< "keyword" or "vector"
    };

    struct JanamPatriConfig
    {
        bool enabled{false};
        std::string name;
        astro::DateTime birth_time{1990, 1, 1, 10, 30, 0.0};   ///< Local wall-clock time
        astro::GeoLocation birth_place{astro::make_new_jersey_site()};
        std::optional<i32> janma_nakshatra;  ///< Override, 1..27
        std::optional<i32> rashi;            ///< Override, 1..12
    };

    struct OutputConfig
    {
        std::filesystem::path records_path;  ///< Empty: records go to the log only
    };

    /// @brief Immutable configuration. Every field has a usable default.
    struct AppConfig
    {
        astro::GeoLocation location{astro::make_new_jersey_site()};
        EphemerisConfig ephemeris;
        CorpusConfig corpus;
        JanamPatriConfig janam_patri;
        OutputConfig output;
        std::string log_level{"info"};
    };

    /// @brief Static utility class for reading AppConfig files.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load a YAML configuration file.
        ///
        /// Missing keys keep their defaults. Relative corpus and record paths
        /// are resolved against the file's directory.
        ///
        /// @return The configuration, or std::nullopt if the file is missing,
        ///         unparsable or holds an invalid value (logged with its key path).
        [[nodiscard]] static std::optional<AppConfig> load(const std::filesystem::path& path);

        /// @brief Parse configuration from YAML text (paths are kept as written).
        [[nodiscard]] static std::optional<AppConfig> parse(const std::string& yaml_text);
    };

} // namespace vedika::core
