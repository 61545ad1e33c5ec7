/// @file config.cpp
/// @brief YAML configuration loader.

#include "core/config.hpp"

#include "core/logger.hpp"
#include "panchang/calendar_indices.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <charconv>
#include <string_view>

namespace vedika::core
{

namespace
{
    using astro::TimeSystem;

    /// Read `parent[key]` into `out` when present. False on a conversion error.
    template <typename T>
    [[nodiscard]] bool read(const YAML::Node& parent, const char* key, const std::string& path, T& out)
    {
        const YAML::Node node = parent[key];
        if (!node || node.IsNull())
        {
            return true;
        }
        try
        {
            out = node.as<T>();
            return true;
        }
        catch (const YAML::Exception& e)
        {
            VDK_CORE_ERROR("Config: Invalid value for {}.{}: {}", path, key, e.what());
            return false;
        }
    }

    template <std::size_t N>
    [[nodiscard]] bool one_of(const std::string& value, const std::array<std::string_view, N>& allowed,
                              const char* key)
    {
        for (const auto a : allowed)
        {
            if (value == a) return true;
        }
        VDK_CORE_ERROR("Config: Unsupported {} '{}'", key, value);
        return false;
    }

    [[nodiscard]] bool read_location(const YAML::Node& node, const std::string& path,
                                     const char* name_key, astro::GeoLocation& location)
    {
        if (!node) return true;
        if (!node.IsMap())
        {
            VDK_CORE_ERROR("Config: {} must be a map", path);
            return false;
        }

        bool ok = read(node, name_key, path, location.name);
        ok = read(node, "latitude", path, location.latitude) && ok;
        ok = read(node, "longitude", path, location.longitude) && ok;
        ok = read(node, "tz_offset", path, location.utc_offset_hours) && ok;

        if (location.latitude < -90.0 || location.latitude > 90.0)
        {
            VDK_CORE_ERROR("Config: {}.latitude {} is outside [-90, 90]", path, location.latitude);
            ok = false;
        }
        if (location.longitude < -180.0 || location.longitude > 180.0)
        {
            VDK_CORE_ERROR("Config: {}.longitude {} is outside [-180, 180]", path, location.longitude);
            ok = false;
        }
        if (location.utc_offset_hours < -14.0 || location.utc_offset_hours > 14.0)
        {
            VDK_CORE_ERROR("Config: {}.tz_offset {} is outside [-14, 14]", path, location.utc_offset_hours);
            ok = false;
        }
        return ok;
    }

    /// Name ("Punarvasu") or 1-based number ("7").
    template <typename Lookup>
    [[nodiscard]] bool read_index(const YAML::Node& parent, const char* key, i32 max,
                                  Lookup by_name, std::optional<i32>& out)
    {
        std::string text;
        if (!read(parent, key, "janam_patri", text)) return false;
        if (text.empty()) return true;

        i32 number = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
        if (ec == std::errc{} && ptr == text.data() + text.size())
        {
            if (number < 1 || number > max)
            {
                VDK_CORE_ERROR("Config: janam_patri.{} {} is outside 1..{}", key, number, max);
                return false;
            }
            out = number;
            return true;
        }

        out = by_name(text);
        if (!out)
        {
            VDK_CORE_ERROR("Config: Unknown janam_patri.{} '{}'", key, text);
            return false;
        }
        return true;
    }

    [[nodiscard]] bool read_janam_patri(const YAML::Node& node, JanamPatriConfig& jp)
    {
        if (!node) return true;
        if (!node.IsMap())
        {
            VDK_CORE_ERROR("Config: janam_patri must be a map");
            return false;
        }

        bool ok = read(node, "enabled", "janam_patri", jp.enabled);
        ok = read(node, "name", "janam_patri", jp.name) && ok;

        std::string date_text = TimeSystem::format_date({jp.birth_time.year, jp.birth_time.month, jp.birth_time.day});
        std::string time_text = "10:30";
        ok = read(node, "birth_date", "janam_patri", date_text) && ok;
        ok = read(node, "birth_time", "janam_patri", time_text) && ok;

        const auto date = TimeSystem::parse_date(date_text);
        const auto time = date ? TimeSystem::parse_time(*date, time_text) : std::nullopt;
        if (!date)
        {
            VDK_CORE_ERROR("Config: janam_patri.birth_date '{}' is not YYYY-MM-DD", date_text);
            ok = false;
        }
        else if (!time)
        {
            VDK_CORE_ERROR("Config: janam_patri.birth_time '{}' is not HH:MM", time_text);
            ok = false;
        }
        else
        {
            jp.birth_time = *time;
        }

        ok = read_location(node["birth_place"], "janam_patri.birth_place", "city", jp.birth_place) && ok;

        ok = read_index(node, "janma_nakshatra", calendar_constants::kNakshatraCount,
                        panchang::nakshatra_from_name, jp.janma_nakshatra) && ok;
        ok = read_index(node, "rashi", calendar_constants::kRashiCount,
                        panchang::rashi_from_name, jp.rashi) && ok;
        return ok;
    }

    [[nodiscard]] std::optional<AppConfig> from_node(const YAML::Node& root)
    {
        AppConfig config;
        if (!root || root.IsNull())
        {
            return config;
        }
        if (!root.IsMap())
        {
            VDK_CORE_ERROR("Config: Top level must be a map");
            return std::nullopt;
        }

        bool ok = read_location(root["location"], "location", "name", config.location);

        if (const YAML::Node eph = root["ephemeris"])
        {
            ok = read(eph, "provider", "ephemeris", config.ephemeris.provider) && ok;
            ok = read(eph, "ayanamsa", "ephemeris", config.ephemeris.ayanamsa) && ok;
            ok = read(eph, "ephe_path", "ephemeris", config.ephemeris.ephe_path) && ok;
        }
        ok = one_of(config.ephemeris.provider, std::array<std::string_view, 2>{"analytic", "swisseph"},
                    "ephemeris.provider") && ok;
        ok = one_of(config.ephemeris.ayanamsa, std::array<std::string_view, 3>{"lahiri", "sidereal", "tropical"},
                    "ephemeris.ayanamsa") && ok;

        if (const YAML::Node corpus = root["corpus"])
        {
            std::string path = config.corpus.path.string();
            ok = read(corpus, "path", "corpus", path) && ok;
            config.corpus.path = path;
            ok = read(corpus, "default_verse_id", "corpus", config.corpus.default_verse_id) && ok;
            ok = read(corpus, "matcher", "corpus", config.corpus.matcher) && ok;
        }
        ok = one_of(config.corpus.matcher, std::array<std::string_view, 2>{"keyword", "vector"},
                    "corpus.matcher") && ok;

        ok = read_janam_patri(root["janam_patri"], config.janam_patri) && ok;

        if (const YAML::Node output = root["output"])
        {
            std::string records;
            ok = read(output, "records_path", "output", records) && ok;
            config.output.records_path = records;
        }

        if (const YAML::Node logging = root["logging"])
        {
            ok = read(logging, "level", "logging", config.log_level) && ok;
        }
        ok = one_of(config.log_level,
                    std::array<std::string_view, 7>{"trace", "debug", "info", "warn", "error", "critical", "off"},
                    "logging.level") && ok;

        if (!ok)
        {
            return std::nullopt;
        }
        return config;
    }
}

std::optional<AppConfig> ConfigLoader::parse(const std::string& yaml_text)
{
    try
    {
        return from_node(YAML::Load(yaml_text));
    }
    catch (const YAML::Exception& e)
    {
        VDK_CORE_ERROR("Config: Failed to parse YAML: {}", e.what());
        return std::nullopt;
    }
}

std::optional<AppConfig> ConfigLoader::load(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
    {
        VDK_CORE_ERROR("Config: File not found: {}", path.string());
        return std::nullopt;
    }

    std::optional<AppConfig> config;
    try
    {
        config = from_node(YAML::LoadFile(path.string()));
    }
    catch (const YAML::Exception& e)
    {
        VDK_CORE_ERROR("Config: Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    if (!config)
    {
        VDK_CORE_ERROR("Config: Rejected {}", path.string());
        return std::nullopt;
    }

    const auto base = path.parent_path();
    if (config->corpus.path.is_relative())
    {
        config->corpus.path = base / config->corpus.path;
    }
    if (!config->output.records_path.empty() && config->output.records_path.is_relative())
    {
        config->output.records_path = base / config->output.records_path;
    }

    VDK_CORE_INFO("Config: Loaded {} (location {}, provider {}, matcher {})", path.string(),
                  config->location.name, config->ephemeris.provider, config->corpus.matcher);
    return config;
}

} // namespace vedika::core
