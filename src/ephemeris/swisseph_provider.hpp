#pragma once

/// @file swisseph_provider.hpp
/// @brief Ephemeris provider backed by the Swiss Ephemeris C library (libswe).

#include "ephemeris/ephemeris_provider.hpp"

#include <filesystem>

namespace vedika::ephemeris
{
    /// @brief Swiss Ephemeris provider (Lahiri sidereal mode).
    ///
    /// Owns the library's global state: only one instance should exist at a
    /// time. Throws std::runtime_error with the library's message when a
    /// computation fails.
    class SwissEphemerisProvider final : public EphemerisProvider
    {
    public:
        /// @param ephe_path Directory holding the .se1 data files; empty uses
        ///                  the built-in Moshier theory.
        explicit SwissEphemerisProvider(const std::filesystem::path& ephe_path);
        ~SwissEphemerisProvider() override;

        SwissEphemerisProvider(const SwissEphemerisProvider&) = delete;
        SwissEphemerisProvider& operator=(const SwissEphemerisProvider&) = delete;

        [[nodiscard]] std::string_view name() const override { return "swisseph"; }

        [[nodiscard]] EclipticState ecliptic_state(f64 jd_ut) override;

        [[nodiscard]] RiseSet rise_set(const astro::CivilDate& date,
                                       f64 latitude_deg,
                                       f64 longitude_deg,
                                       f64 utc_offset_hours) override;

        [[nodiscard]] f64 ayanamsa(f64 jd_ut) override;

    private:
        i32 m_ephe_flag;
    };

} // namespace vedika::ephemeris
