/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <cmath>

namespace vedika::astro
{

namespace
{
    [[nodiscard]] std::optional<i32> parse_i32(std::string_view sv)
    {
        if (sv.empty())
        {
            return std::nullopt;
        }

        i32 value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }

        return value;
    }
}

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    // Day fraction from hours, minutes, seconds
    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

f64 TimeSystem::to_julian_date(const CivilDate& date)
{
    return to_julian_date(DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    });
}

// -----------------------------------------------------------------
// Julian Date → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day (with fractional part)
    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Time from day fraction
    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

// -----------------------------------------------------------------
// ΔT: polynomial expressions by Espenak & Meeus (NASA eclipse site)
// -----------------------------------------------------------------

f64 TimeSystem::delta_t_seconds(f64 jd_ut)
{
    const f64 y = 2000.0 + (jd_ut - astro_constants::kJ2000) / 365.25;

    if (y >= 2005.0 && y < 2050.0)
    {
        const f64 t = y - 2000.0;
        return 62.92 + 0.32217 * t + 0.005589 * t * t;
    }
    if (y >= 1986.0 && y < 2005.0)
    {
        const f64 t = y - 2000.0;
        return 63.86 + 0.3345 * t - 0.060374 * t * t + 0.0017275 * t * t * t
             + 0.000651814 * t * t * t * t + 0.00002373599 * t * t * t * t * t;
    }
    if (y >= 1961.0 && y < 1986.0)
    {
        const f64 t = y - 1975.0;
        return 45.45 + 1.067 * t - t * t / 260.0 - t * t * t / 718.0;
    }
    if (y >= 1941.0 && y < 1961.0)
    {
        const f64 t = y - 1950.0;
        return 29.07 + 0.407 * t - t * t / 233.0 + t * t * t / 2547.0;
    }

    const f64 u = (y - 1820.0) / 100.0;
    if (y >= 2050.0 && y < 2150.0)
    {
        return -20.0 + 32.0 * u * u - 0.5628 * (2150.0 - y);
    }
    return -20.0 + 32.0 * u * u;
}

f64 TimeSystem::ut_to_tt(f64 jd_ut)
{
    return jd_ut + delta_t_seconds(jd_ut) / 86400.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    f64 gmst_deg = 280.46061837
                 + 360.98564736629 * d
                 + 0.000387933 * t * t
                 - (t * t * t) / 38710000.0;

    gmst_deg = std::fmod(gmst_deg, 360.0);
    if (gmst_deg < 0.0)
    {
        gmst_deg += 360.0;
    }

    return gmst_deg * astro_constants::kDegToRad;
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

f64 TimeSystem::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

// -----------------------------------------------------------------
// Local wall clock ↔ UT
// -----------------------------------------------------------------

Moment TimeSystem::from_local(const DateTime& local, f64 utc_offset_hours)
{
    return Moment{
        .jd_ut            = to_julian_date(local) - utc_offset_hours / 24.0,
        .utc_offset_hours = utc_offset_hours,
    };
}

DateTime TimeSystem::to_local(const Moment& moment)
{
    return from_julian_date(moment.jd_ut + moment.utc_offset_hours / 24.0);
}

CivilDate TimeSystem::local_date(const Moment& moment)
{
    // Snap to the preceding local midnight before converting
    const f64 jd_local = moment.jd_ut + moment.utc_offset_hours / 24.0;
    const f64 midnight = std::floor(jd_local + 0.5) - 0.5;
    const DateTime dt = from_julian_date(midnight);
    return CivilDate{.year = dt.year, .month = dt.month, .day = dt.day};
}

CivilDate TimeSystem::add_days(const CivilDate& date, i32 days)
{
    const DateTime dt = from_julian_date(to_julian_date(date) + static_cast<f64>(days));
    return CivilDate{.year = dt.year, .month = dt.month, .day = dt.day};
}

Weekday TimeSystem::weekday(const CivilDate& date)
{
    const auto n = static_cast<i64>(std::floor(to_julian_date(date) + 1.5));
    return static_cast<Weekday>(((n % 7) + 7) % 7);
}

// -----------------------------------------------------------------
// Current system time → Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto since_epoch = now.time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    // Unix epoch (1970-01-01 00:00 UTC) as Julian Date
    constexpr f64 kUnixEpochJd = 2440587.5;

    return kUnixEpochJd + total_seconds / 86400.0;
}

// -----------------------------------------------------------------
// Text forms
// -----------------------------------------------------------------

std::optional<CivilDate> TimeSystem::parse_date(std::string_view text)
{
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }

    const auto year  = parse_i32(text.substr(0, 4));
    const auto month = parse_i32(text.substr(5, 2));
    const auto day   = parse_i32(text.substr(8, 2));

    if (!year || !month || !day || *month < 1 || *month > 12)
    {
        return std::nullopt;
    }
    if (*day < 1 || *day > days_in_month(*year, *month))
    {
        return std::nullopt;
    }

    return CivilDate{.year = *year, .month = *month, .day = *day};
}

std::optional<DateTime> TimeSystem::parse_time(const CivilDate& date, std::string_view text)
{
    if (text.size() != 5 && text.size() != 8)
    {
        return std::nullopt;
    }
    if (text[2] != ':' || (text.size() == 8 && text[5] != ':'))
    {
        return std::nullopt;
    }

    const auto hour   = parse_i32(text.substr(0, 2));
    const auto minute = parse_i32(text.substr(3, 2));
    const auto second = text.size() == 8 ? parse_i32(text.substr(6, 2)) : std::optional<i32>{0};

    if (!hour || !minute || !second || *hour > 23 || *minute > 59 || *second > 59)
    {
        return std::nullopt;
    }

    return DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = *hour,
        .minute = *minute,
        .second = static_cast<f64>(*second),
    };
}

std::string TimeSystem::format_date(const CivilDate& date)
{
    return fmt::format("{:04}-{:02}-{:02}", date.year, date.month, date.day);
}

std::string TimeSystem::format_time(const Moment& moment)
{
    // Round to the nearest minute of the local day
    const f64 jd_local = moment.jd_ut + moment.utc_offset_hours / 24.0 + 0.5;
    const f64 day_frac = jd_local - std::floor(jd_local);
    const auto minutes = static_cast<i32>(std::lround(day_frac * 1440.0)) % 1440;
    return fmt::format("{:02}:{:02}", minutes / 60, minutes % 60);
}

std::string TimeSystem::format_datetime(const Moment& moment)
{
    // Minutes since the JD epoch midnight, so 23:59:45 rolls into the next date
    const f64 jd_local = moment.jd_ut + moment.utc_offset_hours / 24.0 + 0.5;
    const i64 total = std::llround(jd_local * 1440.0);
    const i64 day = total >= 0 ? total / 1440 : -((-total + 1439) / 1440);
    const auto minutes = static_cast<i32>(total - day * 1440);

    const DateTime noon = from_julian_date(static_cast<f64>(day));
    return fmt::format("{}T{:02}:{:02}", format_date({noon.year, noon.month, noon.day}),
                       minutes / 60, minutes % 60);
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    static constexpr i32 kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2)
    {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

std::string_view weekday_name(Weekday day)
{
    static constexpr std::string_view kNames[7] = {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
    };
    return kNames[static_cast<i32>(day)];
}

} // namespace vedika::astro
