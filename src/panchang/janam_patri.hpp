#pragma once

/// @file janam_patri.hpp
/// @brief Birth chart: janma nakshatra and rashi from the sidereal Moon at birth.

#include "astro/geo_location.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/ephemeris_adapter.hpp"
#include "verse/verse_recommender.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vedika::panchang
{
    /// @brief Birth moment and place as entered by the user.
    struct BirthDetails
    {
        std::string name;
        astro::DateTime local_time;     ///< Wall-clock time at the birth place
        astro::GeoLocation place;       ///< utc_offset_hours converts local_time to UT
    };

    /// @brief Known nakshatra/rashi supplied by the caller.
    ///
    /// With both values present no ephemeris query is made. A single value
    /// replaces the computed one.
    struct JanamPatriOverride
    {
        std::optional<i32> nakshatra;   ///< 1..27
        std::optional<i32> rashi;       ///< 1..12
    };

    struct JanamPatri
    {
        BirthDetails birth;
        astro::Moment birth_moment;

        i32 nakshatra;                  ///< Janma nakshatra, 1..27
        i32 rashi;                      ///< Moon sign, 1..12
        bool overridden{false};
        ephemeris::EphemerisSource ephemeris;

        std::string theme;                              ///< Verse search theme for the nakshatra
        std::vector<std::string> lifestyle;             ///< Practical recommendations
        std::vector<verse::RecommendationResult> verses;
    };

    class JanamPatriCalculator
    {
    public:
        explicit JanamPatriCalculator(ephemeris::EphemerisAdapter& adapter);

        /// @brief Compute the chart, theme and lifestyle lines (no verses).
        /// @throws std::invalid_argument for an out-of-range override.
        /// @throws core::ComputationError from the adapter.
        [[nodiscard]] JanamPatri compute(const BirthDetails& birth,
                                         const std::optional<JanamPatriOverride>& override_values = std::nullopt);

        /// @brief Verses matching the chart's theme.
        [[nodiscard]] static std::vector<verse::RecommendationResult> recommend(
            const JanamPatri& chart,
            const verse::VerseRecommender& recommender,
            const verse::Corpus& corpus,
            i32 top_k = 5);

        /// @brief Deity/theme words associated with a nakshatra.
        [[nodiscard]] static std::string theme_for(i32 nakshatra);

        /// @brief Lifestyle recommendations for a janma nakshatra.
        [[nodiscard]] static std::vector<std::string> lifestyle_for(i32 nakshatra);

    private:
        ephemeris::EphemerisAdapter& m_adapter;
    };

} // namespace vedika::panchang
