/// @file swisseph_provider.cpp
/// @brief Swiss Ephemeris wrapper: swe_calc_ut, swe_rise_trans, swe_get_ayanamsa_ut.

#include "ephemeris/swisseph_provider.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

extern "C" {
#include <swephexp.h>
}

#include <array>
#include <stdexcept>
#include <string>

namespace vedika::ephemeris
{

namespace
{
    [[nodiscard]] f64 calc_longitude(f64 jd_ut, i32 body, i32 flags, f64* latitude = nullptr)
    {
        std::array<f64, 6> xx{};
        std::array<char, AS_MAXCH> serr{};
        if (swe_calc_ut(jd_ut, body, flags, xx.data(), serr.data()) < 0)
        {
            throw std::runtime_error(std::string("swe_calc_ut: ") + serr.data());
        }
        if (latitude != nullptr)
        {
            *latitude = xx[1];
        }
        return xx[0];
    }

    [[nodiscard]] f64 sun_declination(f64 jd_ut, i32 flags)
    {
        f64 declination = 0.0;
        (void)calc_longitude(jd_ut, SE_SUN, flags | SEFLG_EQUATORIAL, &declination);
        return declination;
    }

    [[nodiscard]] bool rise_trans(f64 jd_start, i32 flags, i32 event,
                                  f64 latitude_deg, f64 longitude_deg, f64& jd_event)
    {
        std::array<f64, 3> geopos{longitude_deg, latitude_deg, 0.0};
        std::array<char, AS_MAXCH> serr{};
        const i32 rc = swe_rise_trans(jd_start, SE_SUN, nullptr, flags, event,
                                      geopos.data(), 0.0, 0.0, &jd_event, serr.data());
        if (rc == ERR)
        {
            throw std::runtime_error(std::string("swe_rise_trans: ") + serr.data());
        }
        // -2: no rise or set found at all
        return rc != -2;
    }
}

SwissEphemerisProvider::SwissEphemerisProvider(const std::filesystem::path& ephe_path)
    : m_ephe_flag(ephe_path.empty() ? SEFLG_MOSEPH : SEFLG_SWIEPH)
{
    if (!ephe_path.empty())
    {
        swe_set_ephe_path(ephe_path.string().c_str());
    }
    swe_set_sid_mode(SE_SIDM_LAHIRI, 0.0, 0.0);
    VDK_CORE_INFO("SwissEphemerisProvider: initialized ({})",
                  ephe_path.empty() ? std::string("Moshier") : ephe_path.string());
}

SwissEphemerisProvider::~SwissEphemerisProvider()
{
    swe_close();
}

EclipticState SwissEphemerisProvider::ecliptic_state(f64 jd_ut)
{
    f64 moon_latitude = 0.0;
    const f64 sun = calc_longitude(jd_ut, SE_SUN, m_ephe_flag);
    const f64 moon = calc_longitude(jd_ut, SE_MOON, m_ephe_flag, &moon_latitude);

    // SE_ECL_NUT: xx[0] = true obliquity
    const f64 obliquity = calc_longitude(jd_ut, SE_ECL_NUT, 0);

    return EclipticState{
        .sun_longitude  = sun,
        .moon_longitude = moon,
        .moon_latitude  = moon_latitude,
        .obliquity      = obliquity,
    };
}

RiseSet SwissEphemerisProvider::rise_set(const astro::CivilDate& date,
                                         f64 latitude_deg,
                                         f64 longitude_deg,
                                         f64 utc_offset_hours)
{
    // Search forward from local midnight of the civil date
    const f64 local_midnight_ut = astro::TimeSystem::to_julian_date(date) - utc_offset_hours / 24.0;

    const f64 next_midnight_ut = local_midnight_ut + 1.0;

    // A rise that lands on a later date means none on this one; which way
    // the date fails depends on where the Sun stands at noon
    const auto classify = [&]() {
        const f64 dec = sun_declination(local_midnight_ut + 0.5, m_ephe_flag);
        return polar_status(latitude_deg, dec);
    };

    RiseSet result;
    if (!rise_trans(local_midnight_ut, m_ephe_flag, SE_CALC_RISE,
                    latitude_deg, longitude_deg, result.sunrise_jd)
        || result.sunrise_jd >= next_midnight_ut)
    {
        result.status = classify();
        return result;
    }
    if (!rise_trans(result.sunrise_jd, m_ephe_flag, SE_CALC_SET,
                    latitude_deg, longitude_deg, result.sunset_jd)
        || result.sunset_jd >= result.sunrise_jd + 1.0)
    {
        result.status = classify();
    }
    return result;
}

f64 SwissEphemerisProvider::ayanamsa(f64 jd_ut)
{
    return swe_get_ayanamsa_ut(jd_ut);
}

} // namespace vedika::ephemeris
