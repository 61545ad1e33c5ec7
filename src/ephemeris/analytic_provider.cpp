/// @file analytic_provider.cpp
/// @brief Implementation of the analytic Sun/Moon provider.

#include "ephemeris/analytic_provider.hpp"

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <array>
#include <cmath>

namespace vedika::ephemeris
{

namespace
{
    using astro::Coordinates;
    using astro::TimeSystem;

    constexpr f64 kDeg = astro_constants::kDegToRad;

    /// Apparent altitude of the Sun's upper limb at rise/set (refraction + semidiameter).

    /// Hour angle of the Sun advances 360° per mean solar day.
    constexpr f64 kHourAngleDegPerDay = 360.0;

    constexpr i32 kMaxRiseSetIterations = 8;
    constexpr f64 kRiseSetToleranceDeg = 1e-4;

    // Argument multipliers (D, M, M', F) and coefficient in 1e-6 degrees.
    struct LunarTerm
    {
        i32 d;
        i32 m;
        i32 mp;
        i32 f;
        f64 coeff;
    };

    // Meeus Table 47.A (longitude), terms with |coeff| >= 0.0003°
    constexpr std::array<LunarTerm, 59> kLongitudeTerms{{
        {0, 0, 1, 0, 6288774},   {2, 0, -1, 0, 1274027},  {2, 0, 0, 0, 658314},
        {0, 0, 2, 0, 213618},    {0, 1, 0, 0, -185116},   {0, 0, 0, 2, -114332},
        {2, 0, -2, 0, 58793},    {2, -1, -1, 0, 57066},   {2, 0, 1, 0, 53322},
        {2, -1, 0, 0, 45758},    {0, 1, -1, 0, -40923},   {1, 0, 0, 0, -34720},
        {0, 1, 1, 0, -30383},    {2, 0, 0, -2, 15327},    {0, 0, 1, 2, -12528},
        {0, 0, 1, -2, 10980},    {4, 0, -1, 0, 10675},    {0, 0, 3, 0, 10034},
        {4, 0, -2, 0, 8548},     {2, 1, -1, 0, -7888},    {2, 1, 0, 0, -6766},
        {1, 0, -1, 0, -5163},    {1, 1, 0, 0, 4987},      {2, -1, 1, 0, 4036},
        {2, 0, 2, 0, 3994},      {4, 0, 0, 0, 3861},      {2, 0, -3, 0, 3665},
        {0, 1, -2, 0, -2689},    {2, 0, -1, 2, -2602},    {2, -1, -2, 0, 2390},
        {1, 0, 1, 0, -2348},     {2, -2, 0, 0, 2236},     {0, 1, 2, 0, -2120},
        {0, 2, 0, 0, -2069},     {2, -2, -1, 0, 2048},    {2, 0, 1, -2, -1773},
        {2, 0, 0, 2, -1595},     {4, -1, -1, 0, 1215},    {0, 0, 2, 2, -1110},
        {3, 0, -1, 0, -892},     {2, 1, 1, 0, -810},      {4, -1, -2, 0, 759},
        {0, 2, -1, 0, -713},     {2, 2, -1, 0, -700},     {2, 1, -2, 0, 691},
        {2, -1, 0, -2, 596},     {4, 0, 1, 0, 549},       {0, 0, 4, 0, 537},
        {4, -1, 0, 0, 520},      {1, 0, -2, 0, -487},     {2, 1, 0, -2, -399},
        {0, 0, 2, -2, -381},     {1, 1, 1, 0, 351},       {3, 0, -2, 0, -340},
        {4, 0, -3, 0, 330},      {2, -1, 2, 0, 327},      {0, 2, 1, 0, -323},
        {1, 1, -1, 0, 299},      {2, 0, 3, 0, 294},
    }};

    // Meeus Table 47.B (latitude), leading terms
    constexpr std::array<LunarTerm, 30> kLatitudeTerms{{
        {0, 0, 0, 1, 5128122},   {0, 0, 1, 1, 280602},    {0, 0, 1, -1, 277693},
        {2, 0, 0, -1, 173237},   {2, 0, -1, 1, 55413},    {2, 0, -1, -1, 46271},
        {2, 0, 0, 1, 32573},     {0, 0, 2, 1, 17198},     {2, 0, 1, -1, 9266},
        {0, 0, 2, -1, 8822},     {2, -1, 0, -1, 8216},    {2, 0, -2, -1, 4324},
        {2, 0, 1, 1, 4200},      {2, 1, 0, -1, -3359},    {2, -1, -1, 1, 2463},
        {2, -1, 0, 1, 2211},     {2, -1, -1, -1, 2065},   {0, 1, -1, -1, -1870},
        {4, 0, -1, -1, 1828},    {0, 1, 0, 1, -1794},     {0, 0, 0, 3, -1749},
        {0, 1, -1, 1, -1565},    {1, 0, 0, 1, -1491},     {0, 1, 1, 1, -1475},
        {0, 1, 1, -1, -1410},    {0, 1, 0, -1, -1344},    {1, 0, 0, -1, -1335},
        {0, 0, 3, 1, 1107},      {4, 0, 0, -1, 1021},     {4, 0, -1, 1, 833},
    }};

    /// Longitude of the Moon's ascending node (degrees).
    [[nodiscard]] f64 node_longitude(f64 t)
    {
        return 125.04452 - 1934.136261 * t;
    }

    /// Nutation in longitude, leading term only (degrees).
    [[nodiscard]] f64 nutation_longitude(f64 t)
    {
        return -0.00478 * std::sin(node_longitude(t) * kDeg);
    }

    template <std::size_t N>
    [[nodiscard]] f64 sum_series(const std::array<LunarTerm, N>& terms,
                                 f64 d, f64 m, f64 mp, f64 f, f64 e)
    {
        f64 sum = 0.0;
        for (const auto& term : terms)
        {
            const f64 arg = (term.d * d + term.m * m + term.mp * mp + term.f * f) * kDeg;
            f64 coeff = term.coeff;
            // Terms containing the solar anomaly shrink with Earth's eccentricity
            if (term.m == 1 || term.m == -1)
            {
                coeff *= e;
            }
            else if (term.m == 2 || term.m == -2)
            {
                coeff *= e * e;
            }
            sum += coeff * std::sin(arg);
        }
        return sum;
    }
}

// -----------------------------------------------------------------
// Sun: low-precision solar coordinates
//
// L0 = 280.46646 + 36000.76983 T + 0.0003032 T²   (mean longitude)
// M  = 357.52911 + 35999.05029 T − 0.0001537 T²   (mean anomaly)
// C  = equation of the centre
// λ  = L0 + C − 0.00569 − 0.00478 sin Ω          (apparent longitude)
// -----------------------------------------------------------------

f64 AnalyticProvider::sun_longitude(f64 jd_tt)
{
    const f64 t = TimeSystem::julian_centuries(jd_tt);

    const f64 l0 = 280.46646 + t * (36000.76983 + t * 0.0003032);
    const f64 m  = (357.52911 + t * (35999.05029 - t * 0.0001537)) * kDeg;

    const f64 c = std::sin(m) * (1.914602 - t * (0.004817 + 0.000014 * t))
                + std::sin(2.0 * m) * (0.019993 - 0.000101 * t)
                + std::sin(3.0 * m) * 0.000289;

    const f64 apparent = l0 + c - 0.00569 - 0.00478 * std::sin(node_longitude(t) * kDeg);
    return Coordinates::normalize_degrees(apparent);
}

f64 AnalyticProvider::obliquity(f64 jd_tt)
{
    const f64 t = TimeSystem::julian_centuries(jd_tt);
    const f64 mean = 23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0;
    return mean + 0.00256 * std::cos(node_longitude(t) * kDeg);
}

// -----------------------------------------------------------------
// Moon: Meeus Ch. 47
// -----------------------------------------------------------------

std::pair<f64, f64> AnalyticProvider::moon_position(f64 jd_tt)
{
    const f64 t  = TimeSystem::julian_centuries(jd_tt);
    const f64 t2 = t * t;

    const f64 lp = 218.3164477 + 481267.88123421 * t - 0.0015786 * t2;   // mean longitude
    const f64 d  = 297.8501921 + 445267.1114034 * t - 0.0018819 * t2;    // mean elongation
    const f64 m  = 357.5291092 + 35999.0502909 * t - 0.0001536 * t2;     // Sun's mean anomaly
    const f64 mp = 134.9633964 + 477198.8675055 * t + 0.0087414 * t2;    // Moon's mean anomaly
    const f64 f  = 93.2720950 + 483202.0175233 * t - 0.0036539 * t2;     // argument of latitude
    const f64 e  = 1.0 - 0.002516 * t - 0.0000074 * t2;

    const f64 a1 = 119.75 + 131.849 * t;
    const f64 a2 = 53.09 + 479264.290 * t;
    const f64 a3 = 313.45 + 481266.484 * t;

    f64 sigma_l = sum_series(kLongitudeTerms, d, m, mp, f, e);
    sigma_l += 3958.0 * std::sin(a1 * kDeg)
             + 1962.0 * std::sin((lp - f) * kDeg)
             + 318.0 * std::sin(a2 * kDeg);

    f64 sigma_b = sum_series(kLatitudeTerms, d, m, mp, f, e);
    sigma_b += -2235.0 * std::sin(lp * kDeg)
             + 382.0 * std::sin(a3 * kDeg)
             + 175.0 * std::sin((a1 - f) * kDeg)
             + 175.0 * std::sin((a1 + f) * kDeg)
             + 127.0 * std::sin((lp - mp) * kDeg)
             - 115.0 * std::sin((lp + mp) * kDeg);

    const f64 longitude = lp + sigma_l / 1.0e6 + nutation_longitude(t);
    const f64 latitude = sigma_b / 1.0e6;

    return {Coordinates::normalize_degrees(longitude), latitude};
}

EclipticState AnalyticProvider::ecliptic_state(f64 jd_ut)
{
    const f64 jd_tt = TimeSystem::ut_to_tt(jd_ut);
    const auto [moon_lon, moon_lat] = moon_position(jd_tt);

    return EclipticState{
        .sun_longitude  = sun_longitude(jd_tt),
        .moon_longitude = moon_lon,
        .moon_latitude  = moon_lat,
        .obliquity      = obliquity(jd_tt),
    };
}

// -----------------------------------------------------------------
// Lahiri ayanamsa: 23°51'11" at J2000 plus general precession
// -----------------------------------------------------------------

f64 AnalyticProvider::ayanamsa(f64 jd_ut)
{
    const f64 t = TimeSystem::julian_centuries(TimeSystem::ut_to_tt(jd_ut));
    return 23.85306 + 1.396971 * t + 0.000308 * t * t;
}

// -----------------------------------------------------------------
// Sunrise / sunset
//
// Starting from local apparent noon, repeatedly move the instant by the
// difference between the Sun's current hour angle and the target
// ±H0, where
//
//   cos H0 = (sin h0 − sin φ sin δ) / (cos φ cos δ),  h0 = −0.8333°
// -----------------------------------------------------------------

RiseSet AnalyticProvider::rise_set(const astro::CivilDate& date,
                                   f64 latitude_deg,
                                   f64 longitude_deg,
                                   f64 /*utc_offset_hours*/)
{
    // Local mean noon of the civil date, expressed in UT
    const f64 noon_guess = TimeSystem::to_julian_date(date) + 0.5
                         - longitude_deg / kHourAngleDegPerDay;

    RiseSet result;
    result.status = solve_event(noon_guess, latitude_deg, longitude_deg, -1.0, result.sunrise_jd);
    if (result.status != RiseSetStatus::Ok)
    {
        return result;
    }
    result.status = solve_event(noon_guess, latitude_deg, longitude_deg, 1.0, result.sunset_jd);
    return result;
}

RiseSetStatus AnalyticProvider::solve_event(f64 jd_guess,
                                            f64 latitude_deg,
                                            f64 longitude_deg,
                                            f64 direction,
                                            f64& jd_event)
{
    const f64 sin_h0  = std::sin(kSunriseAltitudeDeg * kDeg);
    const f64 sin_lat = std::sin(latitude_deg * kDeg);
    const f64 cos_lat = std::cos(latitude_deg * kDeg);

    f64 jd = jd_guess;
    for (i32 i = 0; i < kMaxRiseSetIterations; ++i)
    {
        const f64 jd_tt = TimeSystem::ut_to_tt(jd);
        const astro::EclipticCoord sun{
            .lon = sun_longitude(jd_tt) * kDeg,
            .lat = 0.0,
        };
        const auto eq = Coordinates::ecliptic_to_equatorial(sun, obliquity(jd_tt) * kDeg);

        const f64 cos_h0 = (sin_h0 - sin_lat * std::sin(eq.dec)) / (cos_lat * std::cos(eq.dec));
        if (cos_h0 > 1.0)
        {
            return RiseSetStatus::NeverRises;
        }
        if (cos_h0 < -1.0)
        {
            return RiseSetStatus::NeverSets;
        }

        const f64 h0_deg = std::acos(cos_h0) / kDeg;
        const f64 lst_deg = TimeSystem::lmst(jd, longitude_deg * kDeg) / kDeg;
        const f64 hour_angle = Coordinates::signed_degrees(lst_deg - eq.ra / kDeg);

        const f64 correction = Coordinates::signed_degrees(direction * h0_deg - hour_angle);
        jd += correction / kHourAngleDegPerDay;

        if (std::abs(correction) < kRiseSetToleranceDeg)
        {
            break;
        }
    }

    jd_event = jd;
    return RiseSetStatus::Ok;
}

} // namespace vedika::ephemeris
