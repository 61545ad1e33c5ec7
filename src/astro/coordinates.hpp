#pragma once

/// @file coordinates.hpp
/// @brief Angle normalization and the ecliptic to equatorial transform.

#include "core/types.hpp"

namespace vedika::astro
{
    /// @brief Ecliptic coordinate of date.
    struct EclipticCoord
    {
        f64 lon;    ///< Ecliptic longitude (radians, 0..2π)
        f64 lat;    ///< Ecliptic latitude (radians, -π/2..+π/2)
    };

    /// @brief Equatorial coordinate of date.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// Angular inputs and outputs of the transforms are in radians; the
    /// degree helpers are used by the calendar arithmetic.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Normalize an angle in degrees to [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle_deg);

        /// @brief Wrap an angle in degrees to (-180, 180].
        [[nodiscard]] static f64 signed_degrees(f64 angle_deg);

        /// @brief Ecliptic (λ, β) → Equatorial (α, δ) by rotation about the x axis.
        /// @param ec Ecliptic coordinates.
        /// @param obliquity_rad Obliquity of the ecliptic (radians).
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(
            const EclipticCoord& ec,
            f64 obliquity_rad
        );

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace vedika::astro
