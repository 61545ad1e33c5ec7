#pragma once

/// @file weekly_digest.hpp
/// @brief Seven days of panchang, observances and matched verses.

#include "panchang/observance_classifier.hpp"
#include "panchang/panchang_calculator.hpp"
#include "verse/verse_recommender.hpp"

#include <string>
#include <vector>

namespace vedika::digest
{
    /// @brief One day of the digest.
    struct DigestDay
    {
        panchang::PanchangDay panchang;
        panchang::ObservanceSet observances;
        std::vector<std::string> query_tags;
        verse::RecommendationResult verse;
    };

    struct WeeklyDigest
    {
        astro::CivilDate week_start;
        astro::CivilDate week_end;
        astro::GeoLocation location;
        ephemeris::EphemerisSource ephemeris;

        std::vector<DigestDay> days;                ///< Calendar order, always 7
        verse::RecommendationResult verse_of_week;
        std::vector<std::string> week_query_tags;   ///< Union of the week's observance tags
        std::vector<std::string> lifestyle;         ///< At most 5, last is the daily anchor
    };

    /// @brief Builds a WeeklyDigest from the calculator, classifier and recommender.
    ///
    /// Assembly is all-or-nothing: the first ComputationError aborts it and
    /// propagates to the caller.
    class WeeklyDigestAssembler
    {
    public:
        WeeklyDigestAssembler(panchang::PanchangCalculator& calculator,
                              const verse::VerseRecommender& recommender);

        [[nodiscard]] WeeklyDigest assemble(const astro::CivilDate& week_start,
                                            const astro::GeoLocation& location,
                                            const verse::Corpus& corpus);

        /// @brief Verse query for a day: observance tags, else the tithi theme.
        [[nodiscard]] static std::vector<std::string> day_query_tags(const panchang::PanchangDay& day,
                                                                     const panchang::ObservanceSet& observances);

        /// @brief Practical suggestions for the week.
        [[nodiscard]] static std::vector<std::string> lifestyle_recommendations(
            const std::vector<panchang::PanchangDay>& days,
            const std::vector<panchang::ObservanceSet>& observances);

    private:
        panchang::PanchangCalculator& m_calculator;
        const verse::VerseRecommender& m_recommender;
    };

} // namespace vedika::digest
