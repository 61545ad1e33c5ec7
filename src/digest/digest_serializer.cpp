/// @file digest_serializer.cpp
/// @brief yaml-cpp node builders and emitters.

#include "digest/digest_serializer.hpp"

#include "panchang/calendar_indices.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <system_error>

namespace vedika::digest
{

namespace
{
    using astro::TimeSystem;

    [[nodiscard]] YAML::Node string_list(const std::vector<std::string>& values)
    {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (const auto& v : values)
        {
            seq.push_back(v);
        }
        return seq;
    }

    /// Numbers and booleans stay bare so a JSON reader sees their type.
    [[nodiscard]] bool is_bare_scalar(const std::string& text)
    {
        if (text == "true" || text == "false") return true;
        if (text.empty()) return false;

        // Leading zeros ("007") are not JSON numbers
        const std::size_t lead = text[0] == '-' ? 1 : 0;
        if (text.size() > lead + 1 && text[lead] == '0' && text[lead + 1] != '.'
            && text[lead + 1] != 'e' && text[lead + 1] != 'E')
        {
            return false;
        }

        f64 value = 0.0;
        const char* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, value);
        return ec == std::errc{} && ptr == end && std::isfinite(value);
    }

    void emit_flow_node(YAML::Emitter& out, const YAML::Node& node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
            out << YAML::Flow << YAML::BeginMap;
            for (const auto& kv : node)
            {
                out << YAML::Key << YAML::DoubleQuoted << kv.first.Scalar() << YAML::Value;
                emit_flow_node(out, kv.second);
            }
            out << YAML::EndMap;
            break;
        case YAML::NodeType::Sequence:
            out << YAML::Flow << YAML::BeginSeq;
            for (const auto& item : node)
            {
                emit_flow_node(out, item);
            }
            out << YAML::EndSeq;
            break;
        case YAML::NodeType::Scalar:
            if (is_bare_scalar(node.Scalar()))
            {
                out << node.Scalar();
            }
            else
            {
                out << YAML::DoubleQuoted << node.Scalar();
            }
            break;
        default:
            out << YAML::Null;
            break;
        }
    }
}

YAML::Node to_yaml(const astro::GeoLocation& location)
{
    YAML::Node node;
    node["name"] = location.name;
    node["latitude"] = location.latitude;
    node["longitude"] = location.longitude;
    node["tz_offset"] = location.utc_offset_hours;
    return node;
}

YAML::Node to_yaml(const ephemeris::EphemerisSource& source)
{
    YAML::Node node;
    node["provider"] = source.provider;
    node["zodiac"] = source.zodiac;
    return node;
}

YAML::Node to_yaml(const verse::VerseRecord& verse)
{
    YAML::Node node;
    node["id"] = verse.id;
    node["devanagari"] = verse.devanagari;
    node["transliteration"] = verse.transliteration;
    node["meaning"] = verse.meaning;
    node["deity"] = verse.deity;
    node["source"] = verse.source;
    node["tags"] = string_list(verse.tags);
    return node;
}

YAML::Node to_yaml(const verse::RecommendationResult& result)
{
    YAML::Node node = to_yaml(result.verse);
    node["score"] = result.score;
    node["rank"] = result.rank;
    node["fallback"] = result.fallback;
    node["query_tags"] = string_list(result.query_tags);
    return node;
}

YAML::Node to_yaml(const panchang::Observance& observance)
{
    YAML::Node node;
    node["name"] = observance.name;
    node["deity"] = observance.deity;
    node["description"] = observance.description;
    node["tags"] = string_list(observance.tags);
    node["from_skipped_tithi"] = observance.from_skipped_tithi;
    return node;
}

YAML::Node to_yaml(const panchang::PanchangDay& day)
{
    using namespace panchang;

    YAML::Node node;
    node["date"] = TimeSystem::format_date(day.date);
    node["weekday"] = std::string(astro::weekday_name(day.weekday));
    node["vaara"] = std::string(vaara_name(static_cast<i32>(day.weekday)));
    node["tithi"] = std::string(tithi_name(day.tithi));
    node["tithi_index"] = day.tithi;
    node["paksha"] = std::string(paksha_name(day.paksha));
    node["nakshatra"] = std::string(nakshatra_name(day.nakshatra));
    node["nakshatra_index"] = day.nakshatra;
    node["yoga"] = std::string(yoga_name(day.yoga));
    node["yoga_index"] = day.yoga;
    node["karana"] = std::string(karana_name(day.karana));
    node["karana_index"] = day.karana;
    node["rashi"] = std::string(rashi_name(day.rashi));
    node["sunrise"] = TimeSystem::format_time(day.sunrise);
    node["sunset"] = TimeSystem::format_time(day.sunset);
    node["sunrise_jd"] = day.sunrise.jd_ut;
    if (day.skipped_tithi)
    {
        node["skipped_tithi"] = std::string(tithi_name(*day.skipped_tithi));
        node["skipped_tithi_index"] = *day.skipped_tithi;
    }
    node["sun_longitude"] = day.positions.sun_longitude;
    node["moon_longitude"] = day.positions.moon_longitude;
    node["ayanamsa"] = day.positions.ayanamsa;
    return node;
}

YAML::Node to_yaml(const WeeklyDigest& digest)
{
    YAML::Node node;
    node["week_start"] = TimeSystem::format_date(digest.week_start);
    node["week_end"] = TimeSystem::format_date(digest.week_end);
    node["location"] = to_yaml(digest.location);
    node["ephemeris"] = to_yaml(digest.ephemeris);

    YAML::Node days(YAML::NodeType::Sequence);
    for (const auto& d : digest.days)
    {
        YAML::Node day = to_yaml(d.panchang);
        YAML::Node observances(YAML::NodeType::Sequence);
        for (const auto& obs : d.observances.observances)
        {
            observances.push_back(to_yaml(obs));
        }
        day["observances"] = observances;
        day["verse"] = to_yaml(d.verse);
        days.push_back(day);
    }
    node["days"] = days;
    node["verse_of_week"] = to_yaml(digest.verse_of_week);
    node["lifestyle_recommendations"] = string_list(digest.lifestyle);
    return node;
}

YAML::Node to_yaml(const panchang::JanamPatri& chart)
{
    const auto& t = chart.birth.local_time;

    YAML::Node node;
    node["name"] = chart.birth.name;
    node["birth_date"] = TimeSystem::format_date({t.year, t.month, t.day});
    node["birth_time"] = fmt::format("{:02}:{:02}", t.hour, t.minute);
    node["birth_place"] = to_yaml(chart.birth.place);
    node["birth_moment_utc"] = TimeSystem::format_datetime(astro::Moment{.jd_ut = chart.birth_moment.jd_ut, .utc_offset_hours = 0.0});
    node["janma_nakshatra"] = std::string(panchang::nakshatra_name(chart.nakshatra));
    node["nakshatra_index"] = chart.nakshatra;
    node["rashi"] = std::string(panchang::rashi_name(chart.rashi));
    node["rashi_index"] = chart.rashi;
    node["overridden"] = chart.overridden;
    node["ephemeris"] = to_yaml(chart.ephemeris);
    node["theme"] = chart.theme;
    node["lifestyle_recommendations"] = string_list(chart.lifestyle);

    YAML::Node verses(YAML::NodeType::Sequence);
    for (const auto& v : chart.verses)
    {
        verses.push_back(to_yaml(v));
    }
    node["verses"] = verses;
    return node;
}

// -----------------------------------------------------------------
// Emitters
// -----------------------------------------------------------------

std::string emit_block(const YAML::Node& node)
{
    YAML::Emitter out;
    out.SetIndent(2);
    out << node;
    return out.c_str();
}

std::string emit_flow(const YAML::Node& node)
{
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    emit_flow_node(out, node);
    return out.c_str();
}

} // namespace vedika::digest
