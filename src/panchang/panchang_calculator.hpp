#pragma once

/// @file panchang_calculator.hpp
/// @brief Daily panchang (tithi, nakshatra, yoga, karana) reckoned at local sunrise.

#include "astro/geo_location.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/ephemeris_adapter.hpp"
#include "panchang/calendar_indices.hpp"

#include <optional>
#include <vector>

namespace vedika::panchang
{
    /// @brief Calendar facts for one civil date at one location.
    struct PanchangDay
    {
        astro::CivilDate date;
        astro::Weekday weekday;
        astro::GeoLocation location;

        astro::Moment sunrise;
        astro::Moment sunset;

        i32 tithi;              ///< 1..30, current at sunrise
        Paksha paksha;
        i32 nakshatra;          ///< 1..27
        i32 yoga;               ///< 1..27
        i32 karana;             ///< 1..11
        i32 rashi;              ///< 1..12, Moon sign at sunrise

        /// Tithi that starts after this sunrise and ends before the next one.
        std::optional<i32> skipped_tithi;

        ephemeris::CelestialPosition positions;     ///< Positions at sunrise
    };

    /// @brief Computes PanchangDay records through an EphemerisAdapter.
    ///
    /// Every ComputationError raised by the adapter propagates unchanged.
    class PanchangCalculator
    {
    public:
        explicit PanchangCalculator(ephemeris::EphemerisAdapter& adapter);

        /// @brief Panchang for one local civil date.
        [[nodiscard]] PanchangDay compute(const astro::CivilDate& date,
                                          const astro::GeoLocation& location);

        /// @brief Panchang for `days` consecutive dates starting at `start`, in calendar order.
        [[nodiscard]] std::vector<PanchangDay> compute_range(const astro::CivilDate& start,
                                                             i32 days,
                                                             const astro::GeoLocation& location);

        [[nodiscard]] const ephemeris::EphemerisAdapter& adapter() const { return m_adapter; }

    private:
        struct SunriseSample
        {
            astro::CivilDate date;
            ephemeris::SunriseSunset times;
            ephemeris::CelestialPosition positions;
            CalendarIndices indices;
        };

        [[nodiscard]] SunriseSample sample(const astro::CivilDate& date,
                                           const astro::GeoLocation& location);

        [[nodiscard]] static PanchangDay make_day(const SunriseSample& today,
                                                  const SunriseSample& tomorrow,
                                                  const astro::GeoLocation& location);

        ephemeris::EphemerisAdapter& m_adapter;
    };

} // namespace vedika::panchang
