#pragma once

/// @file observance_classifier.hpp
/// @brief Named religious observances derived from a day's tithi and weekday.

#include "panchang/panchang_calculator.hpp"

#include <string>
#include <vector>

namespace vedika::panchang
{
    /// @brief One observance that applies to a day.
    struct Observance
    {
        std::string name;
        std::string deity;
        std::string description;
        std::vector<std::string> tags;          ///< Query tags for verse matching
        bool from_skipped_tithi{false};         ///< Matched the day's kshaya tithi, not the sunrise tithi
    };

    /// @brief All observances of one day, in rule-table order. Empty is a valid result.
    struct ObservanceSet
    {
        astro::CivilDate date;
        std::vector<Observance> observances;

        [[nodiscard]] bool empty() const { return observances.empty(); }
    };

    /// @brief Stateless rule table evaluation.
    ///
    /// | Observance          | Tithi     | Weekday          |
    /// |---------------------|-----------|------------------|
    /// | Ekadashi            | 11, 26    | any              |
    /// | Pradosham           | 13        | Monday, Tuesday  |
    /// | Amavasya            | 30        | any              |
    /// | Purnima             | 15        | any              |
    /// | Sankashti Chaturthi | 19        | any              |
    ///
    /// Every matching rule fires. A rule also fires, flagged, for the day's
    /// skipped tithi.
    class ObservanceClassifier
    {
    public:
        ObservanceClassifier() = delete;

        /// @brief Observances of each day, index-aligned with the input.
        [[nodiscard]] static std::vector<ObservanceSet> classify(const std::vector<PanchangDay>& week);

        /// @brief Observances of a single day.
        /// @throws core::ComputationError (InvalidDate) for a tithi outside 1..30.
        [[nodiscard]] static ObservanceSet classify_day(const PanchangDay& day);

        /// @brief Observances for a bare tithi/weekday pair (sunrise tithi only).
        [[nodiscard]] static std::vector<Observance> match(i32 tithi, astro::Weekday weekday);
    };

} // namespace vedika::panchang
