/// @file test_time_system.cpp
/// @brief Unit tests for vedika::astro::TimeSystem.
///
/// Verifies Julian Date conversion (Meeus algorithm), local-time moments,
/// civil date arithmetic and the text forms used in configs and output.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace vedika;
using namespace vedika::astro;

static constexpr f64 kJdTolerance     = 1e-6;
static constexpr f64 kSecondTolerance = 1.0;

// =================================================================
// Julian Date conversion
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {.year = 2000, .month = 1, .day = 1, .hour = 12, .minute = 0, .second = 0.0};
    CHECK(TimeSystem::to_julian_date(j2000) == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Civil date overload is 0h UT")
{
    // Meeus example 7.a uses 1957-10-04.81; midnight of that date is JD 2436115.5
    CHECK(TimeSystem::to_julian_date(CivilDate{1957, 10, 4}) == doctest::Approx(2436115.5).epsilon(kJdTolerance));
    CHECK(TimeSystem::to_julian_date(CivilDate{2023, 3, 21}) == doctest::Approx(2460024.5).epsilon(kJdTolerance));
}

TEST_CASE("Round-trip: DateTime -> JD -> DateTime in a leap February")
{
    const DateTime original = {.year = 2024, .month = 2, .day = 29, .hour = 5, .minute = 47, .second = 12.0};

    const DateTime result = TimeSystem::from_julian_date(TimeSystem::to_julian_date(original));

    CHECK(result.year   == 2024);
    CHECK(result.month  == 2);
    CHECK(result.day    == 29);
    CHECK(result.hour   == 5);
    CHECK(result.minute == 47);
    CHECK(result.second == doctest::Approx(12.0).epsilon(kSecondTolerance));
}

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000) == doctest::Approx(0.0));
}

TEST_CASE("Delta T is about a minute in the 2020s")
{
    const f64 dt = TimeSystem::delta_t_seconds(TimeSystem::to_julian_date(CivilDate{2023, 1, 1}));
    CHECK(dt > 60.0);
    CHECK(dt < 80.0);
    CHECK(TimeSystem::ut_to_tt(2460000.0) > 2460000.0);
}

TEST_CASE("GMST at J2000.0 is 280.46 degrees")
{
    const f64 gmst_deg = TimeSystem::gmst(astro_constants::kJ2000) * astro_constants::kRadToDeg;
    CHECK(gmst_deg == doctest::Approx(280.46).epsilon(0.01));
}

// =================================================================
// Local moments
// =================================================================

TEST_CASE("from_local subtracts the UTC offset")
{
    // 10:30 IST is 05:00 UT
    const DateTime local = {.year = 1990, .month = 1, .day = 1, .hour = 10, .minute = 30, .second = 0.0};
    const Moment m = TimeSystem::from_local(local, 5.5);

    CHECK(m.jd_ut == doctest::Approx(TimeSystem::to_julian_date(DateTime{1990, 1, 1, 5, 0, 0.0})).epsilon(kJdTolerance));
    CHECK(m.utc_offset_hours == 5.5);
    CHECK(TimeSystem::format_time(Moment{.jd_ut = m.jd_ut, .utc_offset_hours = 0.0}) == "05:00");

    // Presented back in the original offset
    CHECK(TimeSystem::format_time(m) == "10:30");
    CHECK(TimeSystem::to_local(m).day == 1);
}

TEST_CASE("local_date crosses midnight with the offset")
{
    // 2023-03-21 03:00 UT is still the 20th in New Jersey (EST)
    const f64 jd = TimeSystem::to_julian_date(DateTime{2023, 3, 21, 3, 0, 0.0});

    CHECK(TimeSystem::local_date(Moment{.jd_ut = jd, .utc_offset_hours = -5.0}) == CivilDate{2023, 3, 20});
    CHECK(TimeSystem::local_date(Moment{.jd_ut = jd, .utc_offset_hours = 5.5}) == CivilDate{2023, 3, 21});
}

TEST_CASE("format_time rounds to the local minute")
{
    const f64 jd = TimeSystem::to_julian_date(DateTime{2023, 3, 21, 10, 58, 40.0});
    CHECK(TimeSystem::format_time(Moment{.jd_ut = jd, .utc_offset_hours = -5.0}) == "05:59");
    CHECK(TimeSystem::format_time(Moment{.jd_ut = jd, .utc_offset_hours = 0.0}) == "10:59");
}

TEST_CASE("format_datetime rolls the date with the rounded minute")
{
    const f64 late = TimeSystem::to_julian_date(DateTime{1990, 1, 1, 23, 59, 45.0});
    CHECK(TimeSystem::format_datetime(Moment{.jd_ut = late, .utc_offset_hours = 0.0}) == "1990-01-02T00:00");
    CHECK(TimeSystem::format_datetime(Moment{.jd_ut = late, .utc_offset_hours = -5.0}) == "1990-01-01T19:00");

    // Year end
    const f64 new_year = TimeSystem::to_julian_date(DateTime{1999, 12, 31, 23, 59, 50.0});
    CHECK(TimeSystem::format_datetime(Moment{.jd_ut = new_year, .utc_offset_hours = 0.0}) == "2000-01-01T00:00");

    const f64 morning = TimeSystem::to_julian_date(DateTime{2023, 3, 21, 10, 58, 40.0});
    CHECK(TimeSystem::format_datetime(Moment{.jd_ut = morning, .utc_offset_hours = 5.5}) == "2023-03-21T16:29");
}

// =================================================================
// Civil dates
// =================================================================

TEST_CASE("add_days crosses month, year and leap-day boundaries")
{
    CHECK(TimeSystem::add_days(CivilDate{2023, 3, 19}, 6) == CivilDate{2023, 3, 25});
    CHECK(TimeSystem::add_days(CivilDate{2023, 12, 29}, 7) == CivilDate{2024, 1, 5});
    CHECK(TimeSystem::add_days(CivilDate{2024, 2, 28}, 1) == CivilDate{2024, 2, 29});
    CHECK(TimeSystem::add_days(CivilDate{2023, 2, 28}, 1) == CivilDate{2023, 3, 1});
    CHECK(TimeSystem::add_days(CivilDate{2023, 3, 1}, -1) == CivilDate{2023, 2, 28});
}

TEST_CASE("weekday of known dates")
{
    CHECK(TimeSystem::weekday(CivilDate{2000, 1, 1}) == Weekday::Saturday);
    CHECK(TimeSystem::weekday(CivilDate{2023, 3, 19}) == Weekday::Sunday);
    CHECK(TimeSystem::weekday(CivilDate{2023, 3, 21}) == Weekday::Tuesday);
    CHECK(TimeSystem::weekday(CivilDate{2024, 2, 29}) == Weekday::Thursday);
    CHECK(weekday_name(Weekday::Monday) == "Monday");
}

TEST_CASE("days_in_month follows the Gregorian leap rule")
{
    CHECK(TimeSystem::days_in_month(2023, 2) == 28);
    CHECK(TimeSystem::days_in_month(2024, 2) == 29);
    CHECK(TimeSystem::days_in_month(1900, 2) == 28);
    CHECK(TimeSystem::days_in_month(2000, 2) == 29);
    CHECK(TimeSystem::days_in_month(2023, 4) == 30);
    CHECK(TimeSystem::days_in_month(2023, 12) == 31);
}

// =================================================================
// Text forms
// =================================================================

TEST_CASE("parse_date accepts real dates only")
{
    const auto d = TimeSystem::parse_date("2023-03-19");
    REQUIRE(d.has_value());
    CHECK(*d == CivilDate{2023, 3, 19});
    CHECK(TimeSystem::format_date(*d) == "2023-03-19");

    CHECK(TimeSystem::parse_date("2024-02-29").has_value());
    CHECK_FALSE(TimeSystem::parse_date("2023-02-29").has_value());
    CHECK_FALSE(TimeSystem::parse_date("2023-13-01").has_value());
    CHECK_FALSE(TimeSystem::parse_date("2023-3-19").has_value());
    CHECK_FALSE(TimeSystem::parse_date("19/03/2023").has_value());
    CHECK_FALSE(TimeSystem::parse_date("").has_value());
}

TEST_CASE("parse_time accepts HH:MM and HH:MM:SS")
{
    const CivilDate date{1990, 1, 1};

    const auto t = TimeSystem::parse_time(date, "10:30");
    REQUIRE(t.has_value());
    CHECK(t->hour == 10);
    CHECK(t->minute == 30);
    CHECK(t->second == 0.0);
    CHECK(t->year == 1990);

    const auto s = TimeSystem::parse_time(date, "23:59:58");
    REQUIRE(s.has_value());
    CHECK(s->second == 58.0);

    CHECK_FALSE(TimeSystem::parse_time(date, "24:00").has_value());
    CHECK_FALSE(TimeSystem::parse_time(date, "10:60").has_value());
    CHECK_FALSE(TimeSystem::parse_time(date, "1030").has_value());
}

TEST_CASE("now_as_jd returns a reasonable Julian Date")
{
    const f64 jd = TimeSystem::now_as_jd();
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
