#pragma once

/// @file calendar_indices.hpp
/// @brief Mapping from Sun/Moon longitudes to panchang indices, and the name tables.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace vedika::panchang
{
    /// @brief Lunar fortnight.
    enum class Paksha
    {
        Shukla,     ///< Waxing, tithi 1-15
        Krishna,    ///< Waning, tithi 16-30
    };

    /// @brief All 1-based calendar indices derived from one pair of longitudes.
    struct CalendarIndices
    {
        i32 tithi;          ///< 1..30 (15 = Purnima, 30 = Amavasya)
        Paksha paksha;
        i32 nakshatra;      ///< 1..27
        i32 yoga;           ///< 1..27
        i32 karana;         ///< 1..11 (Bava .. Kimstughna)
        i32 rashi;          ///< 1..12
    };

    /// @brief Derive tithi, nakshatra, yoga, karana and rashi from longitudes.
    ///
    /// Inputs are in degrees and need not be normalized. The Moon's longitude
    /// is expected in the zodiac the nakshatra is reckoned in (sidereal).
    ///
    ///   tithi     = floor(((moon - sun) mod 360) / 12) + 1
    ///   nakshatra = floor(moon / (360/27)) + 1
    ///   yoga      = floor(((sun + moon) mod 360) / (360/27)) + 1
    ///   rashi     = floor(moon / 30) + 1
    [[nodiscard]] CalendarIndices zodiacal_positions_to_calendar_indices(f64 sun_longitude,
                                                                         f64 moon_longitude);

    /// @brief Tithi index (1..30) for a Moon-Sun elongation.
    [[nodiscard]] i32 tithi_from_elongation(f64 elongation_deg);

    /// @brief Karana index (1..11) for a Moon-Sun elongation.
    ///
    /// Half-tithi k = floor(elongation / 6) in 0..59: k = 0 is Kimstughna (11),
    /// 57..59 are Shakuni (8), Chatushpada (9), Nagava (10); the rest cycle
    /// through the seven movable karanas Bava..Vishti.
    [[nodiscard]] i32 karana_from_elongation(f64 elongation_deg);

    [[nodiscard]] Paksha paksha_of(i32 tithi);

    // -----------------------------------------------------------------
    // Names (1-based index; out-of-range returns "?")
    // -----------------------------------------------------------------

    [[nodiscard]] std::string_view tithi_name(i32 tithi);
    [[nodiscard]] std::string_view nakshatra_name(i32 nakshatra);
    [[nodiscard]] std::string_view yoga_name(i32 yoga);
    [[nodiscard]] std::string_view karana_name(i32 karana);
    [[nodiscard]] std::string_view rashi_name(i32 rashi);
    [[nodiscard]] std::string_view paksha_name(Paksha paksha);

    /// @brief Sanskrit weekday name, 0 = Ravivara (Sunday).
    [[nodiscard]] std::string_view vaara_name(i32 weekday);

    /// @brief Case-insensitive lookup of a nakshatra by name.
    [[nodiscard]] std::optional<i32> nakshatra_from_name(std::string_view name);

    /// @brief Case-insensitive lookup of a rashi by name.
    [[nodiscard]] std::optional<i32> rashi_from_name(std::string_view name);

} // namespace vedika::panchang
