/// @file ephemeris_adapter.cpp
/// @brief Provider output validation, normalization and ayanamsa correction.

#include "ephemeris/ephemeris_adapter.hpp"

#include "astro/coordinates.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <exception>
#include <string>

namespace vedika::ephemeris
{

namespace
{
    using astro::Coordinates;
    using astro::TimeSystem;
    using core::ErrorKind;

    constexpr f64 kMaxAbsLongitudeDeg = 720.0;
    constexpr f64 kMinObliquityDeg = 20.0;
    constexpr f64 kMaxObliquityDeg = 30.0;
    constexpr f64 kMaxAbsAyanamsaDeg = 60.0;

    void require_longitude(f64 value, std::string_view what, f64 jd_ut)
    {
        if (!std::isfinite(value) || std::abs(value) > kMaxAbsLongitudeDeg)
        {
            core::fail(ErrorKind::EphemerisUnavailable,
                       fmt::format("provider returned invalid {} {} at JD {:.5f}", what, value, jd_ut));
        }
    }
}

std::optional<Zodiac> parse_zodiac(std::string_view text)
{
    if (text == "lahiri" || text == "sidereal") return Zodiac::Sidereal;
    if (text == "tropical") return Zodiac::Tropical;
    return std::nullopt;
}

std::string_view zodiac_name(Zodiac zodiac)
{
    return zodiac == Zodiac::Tropical ? "tropical" : "lahiri";
}

EphemerisAdapter::EphemerisAdapter(EphemerisProvider& provider, Zodiac zodiac)
    : m_provider(provider)
    , m_zodiac(zodiac)
{
}

EphemerisSource EphemerisAdapter::source() const
{
    return EphemerisSource{
        .provider = std::string(m_provider.name()),
        .zodiac   = std::string(zodiac_name(m_zodiac)),
    };
}

// -----------------------------------------------------------------
// positions
// -----------------------------------------------------------------

CelestialPosition EphemerisAdapter::positions(const astro::Moment& moment,
                                              const astro::GeoLocation& location)
{
    if (!std::isfinite(moment.jd_ut))
    {
        core::fail(ErrorKind::InvalidDate, "query moment is not a finite Julian Date");
    }

    EclipticState state{};
    f64 ayanamsa = 0.0;
    try
    {
        state = m_provider.ecliptic_state(moment.jd_ut);
        if (m_zodiac == Zodiac::Sidereal)
        {
            ayanamsa = m_provider.ayanamsa(moment.jd_ut);
        }
    }
    catch (const std::exception& e)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("{} provider failed at JD {:.5f}: {}", m_provider.name(), moment.jd_ut, e.what()));
    }

    require_longitude(state.sun_longitude, "sun longitude", moment.jd_ut);
    require_longitude(state.moon_longitude, "moon longitude", moment.jd_ut);

    if (!std::isfinite(state.moon_latitude) || std::abs(state.moon_latitude) > 90.0)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("provider returned invalid moon latitude {}", state.moon_latitude));
    }
    if (!std::isfinite(state.obliquity)
        || state.obliquity < kMinObliquityDeg || state.obliquity > kMaxObliquityDeg)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("provider returned invalid obliquity {}", state.obliquity));
    }
    if (!std::isfinite(ayanamsa) || std::abs(ayanamsa) > kMaxAbsAyanamsaDeg)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("provider returned invalid ayanamsa {}", ayanamsa));
    }

    CelestialPosition pos{
        .sun_longitude  = Coordinates::normalize_degrees(state.sun_longitude - ayanamsa),
        .moon_longitude = Coordinates::normalize_degrees(state.moon_longitude - ayanamsa),
        .moon_latitude  = state.moon_latitude,
        .obliquity      = state.obliquity,
        .ayanamsa       = ayanamsa,
    };

    VDK_CORE_TRACE("positions @ JD {:.5f} ({}): sun {:.4f} moon {:.4f} ayanamsa {:.4f}",
                   moment.jd_ut, location.name, pos.sun_longitude, pos.moon_longitude, pos.ayanamsa);
    return pos;
}

// -----------------------------------------------------------------
// sunrise_sunset
// -----------------------------------------------------------------

SunriseSunset EphemerisAdapter::sunrise_sunset(const astro::CivilDate& date,
                                               const astro::GeoLocation& location)
{
    if (date.month < 1 || date.month > 12 || date.day < 1
        || date.day > TimeSystem::days_in_month(date.year, date.month))
    {
        core::fail(ErrorKind::InvalidDate,
                   fmt::format("{:04}-{:02}-{:02} is not a calendar date", date.year, date.month, date.day));
    }

    RiseSet rs{};
    try
    {
        rs = m_provider.rise_set(date, location.latitude, location.longitude, location.utc_offset_hours);
    }
    catch (const std::exception& e)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("{} provider failed for sunrise on {}: {}",
                               m_provider.name(), TimeSystem::format_date(date), e.what()));
    }

    const std::string date_text = TimeSystem::format_date(date);
    switch (rs.status)
    {
    case RiseSetStatus::NeverRises:
        core::fail(ErrorKind::InvalidDate,
                   fmt::format("the Sun does not rise on {} at {} (lat {:.4f})", date_text, location.name, location.latitude));
    case RiseSetStatus::NeverSets:
        core::fail(ErrorKind::InvalidDate,
                   fmt::format("the Sun does not set on {} at {} (lat {:.4f})", date_text, location.name, location.latitude));
    case RiseSetStatus::Ok:
        break;
    }

    if (!std::isfinite(rs.sunrise_jd) || !std::isfinite(rs.sunset_jd) || rs.sunrise_jd >= rs.sunset_jd)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("provider returned inconsistent sunrise/sunset for {}", date_text));
    }

    SunriseSunset result{
        .sunrise = astro::Moment{.jd_ut = rs.sunrise_jd, .utc_offset_hours = location.utc_offset_hours},
        .sunset  = astro::Moment{.jd_ut = rs.sunset_jd, .utc_offset_hours = location.utc_offset_hours},
    };

    if (TimeSystem::local_date(result.sunrise) != date)
    {
        core::fail(ErrorKind::EphemerisUnavailable,
                   fmt::format("provider sunrise for {} falls on {}", date_text,
                               TimeSystem::format_date(TimeSystem::local_date(result.sunrise))));
    }

    VDK_CORE_TRACE("sunrise {} at {}: {} / sunset {}", date_text, location.name,
                   TimeSystem::format_time(result.sunrise), TimeSystem::format_time(result.sunset));
    return result;
}

} // namespace vedika::ephemeris
