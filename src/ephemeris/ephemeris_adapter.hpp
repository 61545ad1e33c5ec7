#pragma once

/// @file ephemeris_adapter.hpp
/// @brief Validating front end between an EphemerisProvider and the calendar core.

#include "astro/geo_location.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vedika::ephemeris
{
    /// @brief Zodiac in which longitudes are reported.
    enum class Zodiac
    {
        Sidereal,   ///< Lahiri ayanamsa subtracted
        Tropical,   ///< Provider longitudes as-is
    };

    /// @brief Parse "lahiri"/"sidereal" or "tropical".
    [[nodiscard]] std::optional<Zodiac> parse_zodiac(std::string_view text);

    /// @brief "lahiri" or "tropical", accepted back by parse_zodiac.
    [[nodiscard]] std::string_view zodiac_name(Zodiac zodiac);

    /// @brief Which provider and zodiac produced a result.
    struct EphemerisSource
    {
        std::string provider;
        std::string zodiac;
    };

    /// @brief Sun and Moon positions at one moment, degrees.
    ///
    /// Longitudes are normalized to [0, 360) and already corrected for the
    /// ayanamsa when the adapter is sidereal.
    struct CelestialPosition
    {
        f64 sun_longitude;
        f64 moon_longitude;
        f64 moon_latitude;
        f64 obliquity;
        f64 ayanamsa;       ///< Amount subtracted from the tropical longitudes (0 for tropical)
    };

    struct SunriseSunset
    {
        astro::Moment sunrise;
        astro::Moment sunset;
    };

    /// @brief Wraps a provider and guarantees that everything it hands out is valid.
    ///
    /// Any provider exception and any non-finite or implausible value becomes
    /// a ComputationError of kind EphemerisUnavailable. A Sun that never rises
    /// or never sets on the requested date becomes InvalidDate. No defaults are
    /// substituted.
    class EphemerisAdapter
    {
    public:
        explicit EphemerisAdapter(EphemerisProvider& provider, Zodiac zodiac = Zodiac::Sidereal);

        /// @brief Geocentric Sun/Moon longitudes at a moment.
        /// @param location Observer site (recorded in the log only; positions are geocentric).
        [[nodiscard]] CelestialPosition positions(const astro::Moment& moment,
                                                  const astro::GeoLocation& location);

        /// @brief Sunrise and sunset on a local civil date at a site.
        [[nodiscard]] SunriseSunset sunrise_sunset(const astro::CivilDate& date,
                                                   const astro::GeoLocation& location);

        [[nodiscard]] Zodiac zodiac() const { return m_zodiac; }
        [[nodiscard]] std::string_view provider_name() const { return m_provider.name(); }
        [[nodiscard]] EphemerisSource source() const;

    private:
        EphemerisProvider& m_provider;
        Zodiac m_zodiac;
    };

} // namespace vedika::ephemeris
