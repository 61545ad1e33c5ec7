#pragma once

/// @file digest_serializer.hpp
/// @brief Lossless YAML trees for panchang days, digests and birth charts.

#include "digest/weekly_digest.hpp"
#include "panchang/janam_patri.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace vedika::digest
{
    [[nodiscard]] YAML::Node to_yaml(const astro::GeoLocation& location);
    [[nodiscard]] YAML::Node to_yaml(const ephemeris::EphemerisSource& source);
    [[nodiscard]] YAML::Node to_yaml(const verse::VerseRecord& verse);
    [[nodiscard]] YAML::Node to_yaml(const verse::RecommendationResult& result);
    [[nodiscard]] YAML::Node to_yaml(const panchang::Observance& observance);
    [[nodiscard]] YAML::Node to_yaml(const panchang::PanchangDay& day);
    [[nodiscard]] YAML::Node to_yaml(const WeeklyDigest& digest);
    [[nodiscard]] YAML::Node to_yaml(const panchang::JanamPatri& chart);

    /// @brief Multi-line block-style document.
    [[nodiscard]] std::string emit_block(const YAML::Node& node);

    /// @brief Single-line flow-style document (JSON-compatible for these trees).
    ///
    /// Keys and text are double-quoted; numbers and booleans are written bare.
    [[nodiscard]] std::string emit_flow(const YAML::Node& node);

} // namespace vedika::digest
