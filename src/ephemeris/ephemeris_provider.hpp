#pragma once

/// @file ephemeris_provider.hpp
/// @brief Interface to an external source of Sun/Moon positions and sunrise times.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>
#include <string_view>

namespace vedika::ephemeris
{
    /// @brief Geocentric apparent ecliptic state at one instant (degrees, of date).
    struct EclipticState
    {
        f64 sun_longitude;      ///< Tropical longitude of the Sun
        f64 moon_longitude;     ///< Tropical longitude of the Moon
        f64 moon_latitude;      ///< Ecliptic latitude of the Moon
        f64 obliquity;          ///< True obliquity of the ecliptic
    };

    /// @brief Outcome of a sunrise/sunset search.
    enum class RiseSetStatus
    {
        Ok,
        NeverRises,     ///< Polar night: the Sun stays below the horizon
        NeverSets,      ///< Midnight sun: the Sun stays above the horizon
    };

    /// @brief Apparent altitude of the Sun's upper limb at rise and set, refraction included.
    constexpr f64 kSunriseAltitudeDeg = -0.8333;

    /// @brief Polar night or midnight sun, from the Sun's altitude at local noon.
    ///
    /// Only meaningful once a search has found no sunrise or sunset on the date.
    [[nodiscard]] inline RiseSetStatus polar_status(f64 latitude_deg, f64 sun_declination_deg)
    {
        const f64 noon_altitude = 90.0 - std::abs(latitude_deg - sun_declination_deg);
        return noon_altitude > kSunriseAltitudeDeg ? RiseSetStatus::NeverSets : RiseSetStatus::NeverRises;
    }

    /// @brief Sunrise and sunset instants (Julian Date, UT).
    struct RiseSet
    {
        RiseSetStatus status{RiseSetStatus::Ok};
        f64 sunrise_jd{0.0};
        f64 sunset_jd{0.0};
    };

    /// @brief Source of raw positions consumed by the EphemerisAdapter.
    ///
    /// Implementations may throw any std::exception when the underlying
    /// library or data files cannot answer; the adapter turns that into a
    /// ComputationError. Values need not be normalized.
    class EphemerisProvider
    {
    public:
        virtual ~EphemerisProvider() = default;

        /// @brief Short identifier recorded in logs and output records.
        [[nodiscard]] virtual std::string_view name() const = 0;

        /// @brief Apparent geocentric Sun/Moon ecliptic state.
        /// @param jd_ut Julian Date (UT).
        [[nodiscard]] virtual EclipticState ecliptic_state(f64 jd_ut) = 0;

        /// @brief Sunrise and following sunset on a local civil date.
        /// @param date Local civil date.
        /// @param latitude_deg Observer latitude (north positive).
        /// @param longitude_deg Observer longitude (east positive).
        /// @param utc_offset_hours Offset of the local civil date from UT.
        [[nodiscard]] virtual RiseSet rise_set(const astro::CivilDate& date,
                                               f64 latitude_deg,
                                               f64 longitude_deg,
                                               f64 utc_offset_hours) = 0;

        /// @brief Lahiri ayanamsa (degrees) at an instant.
        [[nodiscard]] virtual f64 ayanamsa(f64 jd_ut) = 0;
    };

} // namespace vedika::ephemeris
