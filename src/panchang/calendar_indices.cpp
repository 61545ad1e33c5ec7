/// @file calendar_indices.cpp
/// @brief Calendar index arithmetic and the panchang name tables.

#include "panchang/calendar_indices.hpp"

#include "astro/coordinates.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace vedika::panchang
{

namespace
{
    using astro::Coordinates;
    using namespace calendar_constants;

    constexpr std::array<std::string_view, kTithiCount> kTithiNames{
        "Pratipada", "Dwitiya", "Tritiya", "Chaturthi", "Panchami",
        "Shashthi", "Saptami", "Ashtami", "Navami", "Dashami",
        "Ekadashi", "Dwadashi", "Trayodashi", "Chaturdashi", "Purnima",
        "Pratipada", "Dwitiya", "Tritiya", "Chaturthi", "Panchami",
        "Shashthi", "Saptami", "Ashtami", "Navami", "Dashami",
        "Ekadashi", "Dwadashi", "Trayodashi", "Chaturdashi", "Amavasya",
    };

    constexpr std::array<std::string_view, kNakshatraCount> kNakshatraNames{
        "Ashwini", "Bharani", "Krittika", "Rohini", "Mrigashira",
        "Ardra", "Punarvasu", "Pushya", "Ashlesha", "Magha",
        "Purva Phalguni", "Uttara Phalguni", "Hasta", "Chitra", "Swati",
        "Vishakha", "Anuradha", "Jyeshtha", "Mula", "Purva Ashadha",
        "Uttara Ashadha", "Shravana", "Dhanishta", "Shatabhisha",
        "Purva Bhadrapada", "Uttara Bhadrapada", "Revati",
    };

    constexpr std::array<std::string_view, kYogaCount> kYogaNames{
        "Vishkambha", "Priti", "Ayushman", "Saubhagya", "Shobhana",
        "Atiganda", "Sukarma", "Dhriti", "Shula", "Ganda",
        "Vriddhi", "Dhruva", "Vyaghata", "Harshana", "Vajra",
        "Siddhi", "Vyatipata", "Variyan", "Parigha", "Shiva",
        "Siddha", "Sadhya", "Shubha", "Shukla", "Brahma",
        "Indra", "Vaidhriti",
    };

    constexpr std::array<std::string_view, kKaranaCount> kKaranaNames{
        "Bava", "Balava", "Kaulava", "Taitila", "Garaja",
        "Vanija", "Vishti", "Shakuni", "Chatushpada", "Nagava", "Kimstughna",
    };

    constexpr std::array<std::string_view, kRashiCount> kRashiNames{
        "Mesha", "Vrishabha", "Mithuna", "Karka", "Simha", "Kanya",
        "Tula", "Vrishchika", "Dhanu", "Makara", "Kumbha", "Meena",
    };

    constexpr std::array<std::string_view, kDaysPerWeek> kVaaraNames{
        "Ravivara", "Somavara", "Mangalavara", "Budhavara",
        "Guruvara", "Shukravara", "Shanivara",
    };

    constexpr i32 kHalfTithiCount = 60;
    constexpr i32 kMovableKaranas = 7;

    /// 1-based bucket of an already normalized angle, clamped to [1, count].
    [[nodiscard]] i32 bucket(f64 angle_deg, f64 span_deg, i32 count)
    {
        const i32 index = static_cast<i32>(std::floor(angle_deg / span_deg)) + 1;
        return std::clamp(index, 1, count);
    }

    template <std::size_t N>
    [[nodiscard]] std::string_view lookup(const std::array<std::string_view, N>& table, i32 index)
    {
        if (index < 1 || index > static_cast<i32>(N)) return "?";
        return table[static_cast<std::size_t>(index - 1)];
    }

    [[nodiscard]] bool iequals(std::string_view a, std::string_view b)
    {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x))
                       == std::tolower(static_cast<unsigned char>(y));
               });
    }

    template <std::size_t N>
    [[nodiscard]] std::optional<i32> find_name(const std::array<std::string_view, N>& table,
                                               std::string_view name)
    {
        for (std::size_t i = 0; i < N; ++i)
        {
            if (iequals(table[i], name)) return static_cast<i32>(i) + 1;
        }
        return std::nullopt;
    }
}

// -----------------------------------------------------------------
// Index arithmetic
// -----------------------------------------------------------------

i32 tithi_from_elongation(f64 elongation_deg)
{
    return bucket(Coordinates::normalize_degrees(elongation_deg), kTithiSpanDeg, kTithiCount);
}

i32 karana_from_elongation(f64 elongation_deg)
{
    const i32 k = bucket(Coordinates::normalize_degrees(elongation_deg), kKaranaSpanDeg, kHalfTithiCount) - 1;

    switch (k)
    {
    case 0:  return 11;     // Kimstughna
    case 57: return 8;      // Shakuni
    case 58: return 9;      // Chatushpada
    case 59: return 10;     // Nagava
    default: return ((k - 1) % kMovableKaranas) + 1;
    }
}

Paksha paksha_of(i32 tithi)
{
    return tithi <= kTithiCount / 2 ? Paksha::Shukla : Paksha::Krishna;
}

CalendarIndices zodiacal_positions_to_calendar_indices(f64 sun_longitude, f64 moon_longitude)
{
    const f64 sun = Coordinates::normalize_degrees(sun_longitude);
    const f64 moon = Coordinates::normalize_degrees(moon_longitude);
    const f64 elongation = Coordinates::normalize_degrees(moon - sun);
    const f64 sum = Coordinates::normalize_degrees(sun + moon);

    const i32 tithi = tithi_from_elongation(elongation);
    return CalendarIndices{
        .tithi     = tithi,
        .paksha    = paksha_of(tithi),
        .nakshatra = bucket(moon, kNakshatraSpanDeg, kNakshatraCount),
        .yoga      = bucket(sum, kYogaSpanDeg, kYogaCount),
        .karana    = karana_from_elongation(elongation),
        .rashi     = bucket(moon, kRashiSpanDeg, kRashiCount),
    };
}

// -----------------------------------------------------------------
// Names
// -----------------------------------------------------------------

std::string_view tithi_name(i32 tithi)          { return lookup(kTithiNames, tithi); }
std::string_view nakshatra_name(i32 nakshatra)  { return lookup(kNakshatraNames, nakshatra); }
std::string_view yoga_name(i32 yoga)            { return lookup(kYogaNames, yoga); }
std::string_view karana_name(i32 karana)        { return lookup(kKaranaNames, karana); }
std::string_view rashi_name(i32 rashi)          { return lookup(kRashiNames, rashi); }
std::string_view vaara_name(i32 weekday)        { return lookup(kVaaraNames, weekday + 1); }

std::string_view paksha_name(Paksha paksha)
{
    return paksha == Paksha::Shukla ? "Shukla" : "Krishna";
}

std::optional<i32> nakshatra_from_name(std::string_view name)
{
    return find_name(kNakshatraNames, name);
}

std::optional<i32> rashi_from_name(std::string_view name)
{
    return find_name(kRashiNames, name);
}

} // namespace vedika::panchang
