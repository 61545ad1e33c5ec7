/// @file test_coordinates.cpp
/// @brief Unit tests for vedika::astro::Coordinates.
///
/// Verifies degree normalization used by the calendar arithmetic and the
/// ecliptic-to-equatorial rotation used by the sunrise solver.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace vedika;
using namespace vedika::astro;

static constexpr f64 kDeg = astro_constants::kDegToRad;
static constexpr f64 kArcSecRad = kDeg / 3600.0;

// =================================================================
// Degree normalization
// =================================================================

TEST_CASE("normalize_degrees maps into [0, 360)")
{
    CHECK(Coordinates::normalize_degrees(0.0) == 0.0);
    CHECK(Coordinates::normalize_degrees(360.0) == 0.0);
    CHECK(Coordinates::normalize_degrees(370.5) == doctest::Approx(10.5));
    CHECK(Coordinates::normalize_degrees(-10.0) == doctest::Approx(350.0));
    CHECK(Coordinates::normalize_degrees(-720.0) == 0.0);
    CHECK(Coordinates::normalize_degrees(719.0) == doctest::Approx(359.0));
}

TEST_CASE("normalize_degrees never returns 360 for tiny negatives")
{
    const f64 wrapped = Coordinates::normalize_degrees(-1e-15);
    CHECK(wrapped >= 0.0);
    CHECK(wrapped < 360.0);
}

TEST_CASE("signed_degrees wraps into (-180, 180]")
{
    CHECK(Coordinates::signed_degrees(190.0) == doctest::Approx(-170.0));
    CHECK(Coordinates::signed_degrees(-190.0) == doctest::Approx(170.0));
    CHECK(Coordinates::signed_degrees(180.0) == doctest::Approx(180.0));
    CHECK(Coordinates::signed_degrees(359.0) == doctest::Approx(-1.0));
}

// =================================================================
// Ecliptic -> Equatorial
// =================================================================

TEST_CASE("Vernal equinox point is RA 0, Dec 0")
{
    const auto eq = Coordinates::ecliptic_to_equatorial(EclipticCoord{.lon = 0.0, .lat = 0.0}, 23.44 * kDeg);
    CHECK(std::abs(eq.ra) < kArcSecRad);
    CHECK(std::abs(eq.dec) < kArcSecRad);
}

TEST_CASE("Summer solstice point has declination equal to the obliquity")
{
    const f64 eps = 23.44 * kDeg;
    const auto eq = Coordinates::ecliptic_to_equatorial(EclipticCoord{.lon = 90.0 * kDeg, .lat = 0.0}, eps);

    CHECK(eq.ra == doctest::Approx(90.0 * kDeg).epsilon(1e-9));
    CHECK(eq.dec == doctest::Approx(eps).epsilon(1e-9));
}

TEST_CASE("Winter solstice point has negative declination and RA 270")
{
    const f64 eps = 23.44 * kDeg;
    const auto eq = Coordinates::ecliptic_to_equatorial(EclipticCoord{.lon = 270.0 * kDeg, .lat = 0.0}, eps);

    CHECK(eq.ra == doctest::Approx(270.0 * kDeg).epsilon(1e-9));
    CHECK(eq.dec == doctest::Approx(-eps).epsilon(1e-9));
}

TEST_CASE("Ecliptic pole maps to RA 270, Dec 90 - obliquity")
{
    const f64 eps = 23.44 * kDeg;
    const auto eq = Coordinates::ecliptic_to_equatorial(EclipticCoord{.lon = 0.0, .lat = 90.0 * kDeg}, eps);

    CHECK(eq.dec == doctest::Approx(90.0 * kDeg - eps).epsilon(1e-9));
    CHECK(eq.ra == doctest::Approx(270.0 * kDeg).epsilon(1e-6));
}

TEST_CASE("Meeus example 13.a: Pollux")
{
    // λ = 113.215630°, β = 6.684170°, ε = 23.4392911° -> α = 116.328942°, δ = 28.026183°
    const auto eq = Coordinates::ecliptic_to_equatorial(
        EclipticCoord{.lon = 113.215630 * kDeg, .lat = 6.684170 * kDeg}, 23.4392911 * kDeg);

    CHECK(std::abs(eq.ra - 116.328942 * kDeg) < 2.0 * kArcSecRad);
    CHECK(std::abs(eq.dec - 28.026183 * kDeg) < 2.0 * kArcSecRad);
}

TEST_CASE("RA is always in [0, 2pi)")
{
    for (f64 lon = -350.0; lon < 720.0; lon += 37.0)
    {
        const auto eq = Coordinates::ecliptic_to_equatorial(EclipticCoord{.lon = lon * kDeg, .lat = 0.1}, 23.44 * kDeg);
        CHECK(eq.ra >= 0.0);
        CHECK(eq.ra < astro_constants::kTwoPi);
    }
}
