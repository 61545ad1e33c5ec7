/// @file record_sink.cpp
/// @brief Record builders, log sink and append-only file sink.

#include "digest/record_sink.hpp"

#include "core/logger.hpp"
#include "digest/digest_serializer.hpp"
#include "panchang/calendar_indices.hpp"

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <stdexcept>

namespace vedika::digest
{

namespace
{
    using astro::TimeSystem;

    [[nodiscard]] YAML::Node verse_summary(const verse::RecommendationResult& result)
    {
        YAML::Node node;
        node["id"] = result.verse.id;
        node["source"] = result.verse.source;
        node["score"] = result.score;
        node["fallback"] = result.fallback;
        YAML::Node tags(YAML::NodeType::Sequence);
        for (const auto& t : result.query_tags)
        {
            tags.push_back(t);
        }
        node["query_tags"] = tags;
        return node;
    }
}

YAML::Node make_digest_record(const WeeklyDigest& digest)
{
    YAML::Node record;
    record["kind"] = "weekly_digest";
    record["schema_version"] = kRecordSchemaVersion;

    YAML::Node generated_for;
    generated_for["week_start"] = TimeSystem::format_date(digest.week_start);
    generated_for["week_end"] = TimeSystem::format_date(digest.week_end);
    generated_for["location"] = to_yaml(digest.location);
    record["generated_for"] = generated_for;
    record["ephemeris"] = to_yaml(digest.ephemeris);

    YAML::Node observances(YAML::NodeType::Sequence);
    YAML::Node daily(YAML::NodeType::Sequence);
    for (const auto& day : digest.days)
    {
        const std::string date = TimeSystem::format_date(day.panchang.date);
        for (const auto& obs : day.observances.observances)
        {
            YAML::Node o;
            o["date"] = date;
            o["name"] = obs.name;
            observances.push_back(o);
        }

        YAML::Node v = verse_summary(day.verse);
        v["date"] = date;
        v["tithi"] = std::string(panchang::tithi_name(day.panchang.tithi));
        v["tithi_index"] = day.panchang.tithi;
        v["nakshatra_index"] = day.panchang.nakshatra;
        v["rashi_index"] = day.panchang.rashi;
        daily.push_back(v);
    }
    record["observances"] = observances;
    record["daily_verses"] = daily;
    record["verse_of_week"] = verse_summary(digest.verse_of_week);
    return record;
}

YAML::Node make_janam_patri_record(const panchang::JanamPatri& chart)
{
    const auto& t = chart.birth.local_time;

    YAML::Node record;
    record["kind"] = "janam_patri";
    record["schema_version"] = kRecordSchemaVersion;

    YAML::Node generated_for;
    generated_for["name"] = chart.birth.name;
    generated_for["birth_date"] = TimeSystem::format_date({t.year, t.month, t.day});
    generated_for["birth_time"] = fmt::format("{:02}:{:02}:{:02}", t.hour, t.minute, static_cast<i32>(t.second));
    generated_for["birth_place"] = to_yaml(chart.birth.place);
    record["generated_for"] = generated_for;
    record["ephemeris"] = to_yaml(chart.ephemeris);

    record["janma_nakshatra"] = std::string(panchang::nakshatra_name(chart.nakshatra));
    record["nakshatra_index"] = chart.nakshatra;
    record["rashi"] = std::string(panchang::rashi_name(chart.rashi));
    record["rashi_index"] = chart.rashi;
    record["overridden"] = chart.overridden;

    YAML::Node verses(YAML::NodeType::Sequence);
    for (const auto& v : chart.verses)
    {
        verses.push_back(verse_summary(v));
    }
    record["verses"] = verses;
    return record;
}

RecordSink log_sink()
{
    return [](const YAML::Node& record) {
        VDK_INFO("record: {}", emit_flow(record));
    };
}

RecordSink file_sink(const std::filesystem::path& path)
{
    return [path](const YAML::Node& record) {
        std::ofstream file(path, std::ios::app);
        if (!file.is_open())
        {
            VDK_ERROR("file_sink: Failed to open {}", path.string());
            throw std::runtime_error("cannot open record file " + path.string());
        }
        file << emit_flow(record) << '\n';
        if (!file)
        {
            VDK_ERROR("file_sink: Write failed for {}", path.string());
            throw std::runtime_error("cannot write record file " + path.string());
        }
        VDK_DEBUG("file_sink: appended {} record to {}", record["kind"].as<std::string>(), path.string());
    };
}

} // namespace vedika::digest
