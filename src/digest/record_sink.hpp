#pragma once

/// @file record_sink.hpp
/// @brief Self-describing result records and the sinks that receive them.

#include "digest/weekly_digest.hpp"
#include "panchang/janam_patri.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <functional>

namespace vedika::digest
{
    /// @brief Receives one record per generated digest or birth chart.
    using RecordSink = std::function<void(const YAML::Node& record)>;

    constexpr i32 kRecordSchemaVersion = 1;

    /// @brief Summary record: observances, matched verse ids, scores and query tags.
    ///
    /// generated_for carries the full location and the ephemeris block names the
    /// provider and zodiac, so the week can be recomputed from the record alone.
    [[nodiscard]] YAML::Node make_digest_record(const WeeklyDigest& digest);

    [[nodiscard]] YAML::Node make_janam_patri_record(const panchang::JanamPatri& chart);

    /// @brief Writes each record as one info line on the application logger.
    [[nodiscard]] RecordSink log_sink();

    /// @brief Appends each record as one flow-style line to a file.
    /// @throws std::runtime_error if the file cannot be written.
    [[nodiscard]] RecordSink file_sink(const std::filesystem::path& path);

} // namespace vedika::digest
