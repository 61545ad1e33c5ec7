/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace vedika::astro
{

f64 Coordinates::normalize_degrees(f64 angle_deg)
{
    angle_deg = std::fmod(angle_deg, astro_constants::kFullCircle);
    if (angle_deg < 0.0)
    {
        angle_deg += astro_constants::kFullCircle;
    }
    // fmod of a tiny negative value can round up to exactly 360
    if (angle_deg >= astro_constants::kFullCircle)
    {
        angle_deg = 0.0;
    }
    return angle_deg;
}

f64 Coordinates::signed_degrees(f64 angle_deg)
{
    const f64 wrapped = normalize_degrees(angle_deg);
    return wrapped > 180.0 ? wrapped - astro_constants::kFullCircle : wrapped;
}

// -----------------------------------------------------------------
// Ecliptic (λ, β) → Equatorial (α, δ)
//
// The equatorial unit vector is the ecliptic unit vector rotated by
// +ε about the vernal-equinox (x) axis:
//
//   x' = x
//   y' = y cos ε − z sin ε
//   z' = y sin ε + z cos ε
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(
    const EclipticCoord& ec,
    f64 obliquity_rad)
{
    const Vec3d ecliptic{
        std::cos(ec.lat) * std::cos(ec.lon),
        std::cos(ec.lat) * std::sin(ec.lon),
        std::sin(ec.lat),
    };

    const f64 cos_eps = std::cos(obliquity_rad);
    const f64 sin_eps = std::sin(obliquity_rad);

    // glm matrices are column-major: each Vec3d below is one column
    const Mat3d rotation{
        Vec3d{1.0, 0.0,     0.0},
        Vec3d{0.0, cos_eps, sin_eps},
        Vec3d{0.0, -sin_eps, cos_eps},
    };

    const Vec3d equatorial = rotation * ecliptic;

    return EquatorialCoord{
        .ra  = normalize_radians(std::atan2(equatorial.y, equatorial.x)),
        .dec = std::asin(std::clamp(equatorial.z, -1.0, 1.0)),
    };
}

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace vedika::astro
