#pragma once

/// @file analytic_provider.hpp
/// @brief Low-precision analytic Sun/Moon theory with no data files.

#include "ephemeris/ephemeris_provider.hpp"

#include <utility>

namespace vedika::ephemeris
{
    /// @brief Self-contained ephemeris provider.
    ///
    /// Sun: NOAA / Meeus low-precision solar coordinates (Astronomical
    /// Algorithms Ch. 25), about 0.01° in longitude.
    /// Moon: principal periodic terms of the ELP-2000/82 series as abridged
    /// by Meeus (Ch. 47), about 0.02° in longitude.
    /// Sunrise/sunset: hour-angle iteration for a −0.8333° apparent altitude
    /// (refraction plus solar semidiameter).
    /// Ayanamsa: Lahiri, as a quadratic in Julian centuries from J2000.
    class AnalyticProvider final : public EphemerisProvider
    {
    public:
        [[nodiscard]] std::string_view name() const override { return "analytic"; }

        [[nodiscard]] EclipticState ecliptic_state(f64 jd_ut) override;

        [[nodiscard]] RiseSet rise_set(const astro::CivilDate& date,
                                       f64 latitude_deg,
                                       f64 longitude_deg,
                                       f64 utc_offset_hours) override;

        [[nodiscard]] f64 ayanamsa(f64 jd_ut) override;

        /// @brief Apparent solar longitude (degrees) at a TT instant.
        [[nodiscard]] static f64 sun_longitude(f64 jd_tt);

        /// @brief Apparent lunar longitude and latitude (degrees) at a TT instant.
        [[nodiscard]] static std::pair<f64, f64> moon_position(f64 jd_tt);

        /// @brief True obliquity of the ecliptic (degrees) at a TT instant.
        [[nodiscard]] static f64 obliquity(f64 jd_tt);

    private:
        /// @brief Solve for the instant the Sun's hour angle equals ±H0.
        /// @param direction -1 for rising, +1 for setting.
        [[nodiscard]] static RiseSetStatus solve_event(f64 jd_guess,
                                                       f64 latitude_deg,
                                                       f64 longitude_deg,
                                                       f64 direction,
                                                       f64& jd_event);
    };

} // namespace vedika::ephemeris
