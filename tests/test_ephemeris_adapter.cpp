/// @file test_ephemeris_adapter.cpp
/// @brief Validation and error mapping of vedika::ephemeris::EphemerisAdapter.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/ephemeris_adapter.hpp"
#ifdef VEDIKA_WITH_SWISSEPH
#include "ephemeris/swisseph_provider.hpp"
#endif
#include "test_support.hpp"

#include <cmath>
#include <filesystem>
#include <limits>

using namespace vedika;
using namespace vedika::ephemeris;
using vedika::core::ComputationError;
using vedika::core::ErrorKind;
using vedika::testing::ScriptedProvider;

int main(int argc, char** argv)
{
    vedika::core::Logger::init_silent();
    const int result = doctest::Context(argc, argv).run();
    vedika::core::Logger::shutdown();
    return result;
}

namespace
{
    const astro::CivilDate kDate{2023, 3, 21};

    /// Kind of the ComputationError thrown by `fn`; fails the test if none is thrown.
    template <typename Fn>
    ErrorKind error_kind_of(Fn&& fn)
    {
        try
        {
            fn();
        }
        catch (const ComputationError& e)
        {
            return e.kind();
        }
        FAIL("expected a ComputationError");
        return ErrorKind::CorpusEmpty;
    }

    astro::Moment sunrise_moment(const astro::GeoLocation& site)
    {
        return astro::Moment{.jd_ut = ScriptedProvider::sunrise_jd(kDate, site.utc_offset_hours),
                             .utc_offset_hours = site.utc_offset_hours};
    }
}

// =================================================================
// positions
// =================================================================

TEST_CASE("Sidereal positions subtract the ayanamsa and normalize")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 354.0, site.utc_offset_hours);
    provider.sun_at_anchor = 10.0;
    provider.ayanamsa_deg = 24.0;

    EphemerisAdapter adapter(provider);
    const auto pos = adapter.positions(sunrise_moment(site), site);

    CHECK(pos.sun_longitude == doctest::Approx(346.0));     // 10 - 24
    CHECK(pos.moon_longitude == doctest::Approx(340.0));    // 364 - 24
    CHECK(pos.ayanamsa == doctest::Approx(24.0));
    CHECK(pos.obliquity == doctest::Approx(23.44));
    CHECK(provider.ayanamsa_calls == 1);
}

TEST_CASE("Tropical positions skip the ayanamsa")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 100.0, site.utc_offset_hours);
    provider.sun_at_anchor = 370.0;
    provider.ayanamsa_deg = 24.0;

    EphemerisAdapter adapter(provider, Zodiac::Tropical);
    const auto pos = adapter.positions(sunrise_moment(site), site);

    CHECK(pos.sun_longitude == doctest::Approx(10.0));
    CHECK(pos.moon_longitude == doctest::Approx(110.0));
    CHECK(pos.ayanamsa == 0.0);
    CHECK(provider.ayanamsa_calls == 0);
}

TEST_CASE("Non-finite query moment is an InvalidDate")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
    EphemerisAdapter adapter(provider);

    const astro::Moment bad{.jd_ut = std::numeric_limits<f64>::quiet_NaN(), .utc_offset_hours = 0.0};
    CHECK(error_kind_of([&] { (void)adapter.positions(bad, site); }) == ErrorKind::InvalidDate);
    CHECK(provider.ecliptic_calls == 0);
}

TEST_CASE("Provider exception becomes EphemerisUnavailable")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
    provider.fail_positions = true;
    EphemerisAdapter adapter(provider);

    CHECK(error_kind_of([&] { (void)adapter.positions(sunrise_moment(site), site); })
          == ErrorKind::EphemerisUnavailable);
}

TEST_CASE("NaN longitude is rejected, not defaulted")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
    provider.return_nan = true;
    EphemerisAdapter adapter(provider);

    CHECK(error_kind_of([&] { (void)adapter.positions(sunrise_moment(site), site); })
          == ErrorKind::EphemerisUnavailable);
}

TEST_CASE("Implausible obliquity, latitude or ayanamsa is rejected")
{
    const auto site = astro::make_new_jersey_site();

    SUBCASE("obliquity")
    {
        ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
        provider.obliquity = 0.0;
        EphemerisAdapter adapter(provider);
        CHECK(error_kind_of([&] { (void)adapter.positions(sunrise_moment(site), site); })
              == ErrorKind::EphemerisUnavailable);
    }
    SUBCASE("moon latitude")
    {
        ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
        provider.moon_latitude = 95.0;
        EphemerisAdapter adapter(provider);
        CHECK(error_kind_of([&] { (void)adapter.positions(sunrise_moment(site), site); })
              == ErrorKind::EphemerisUnavailable);
    }
    SUBCASE("ayanamsa")
    {
        ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
        provider.ayanamsa_deg = std::numeric_limits<f64>::infinity();
        EphemerisAdapter adapter(provider);
        CHECK(error_kind_of([&] { (void)adapter.positions(sunrise_moment(site), site); })
              == ErrorKind::EphemerisUnavailable);
    }
}

// =================================================================
// sunrise_sunset
// =================================================================

TEST_CASE("Sunrise and sunset carry the site offset")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
    EphemerisAdapter adapter(provider);

    const auto times = adapter.sunrise_sunset(kDate, site);

    CHECK(times.sunrise.utc_offset_hours == -5.0);
    CHECK(astro::TimeSystem::format_time(times.sunrise) == "06:00");
    CHECK(astro::TimeSystem::format_time(times.sunset) == "18:00");
    CHECK(astro::TimeSystem::local_date(times.sunrise) == kDate);
}

TEST_CASE("Impossible calendar date is an InvalidDate")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
    EphemerisAdapter adapter(provider);

    CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(astro::CivilDate{2023, 2, 30}, site); })
          == ErrorKind::InvalidDate);
    CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(astro::CivilDate{2023, 13, 1}, site); })
          == ErrorKind::InvalidDate);
    CHECK(provider.rise_set_calls == 0);
}

TEST_CASE("Polar day or night is an InvalidDate")
{
    astro::GeoLocation tromso;
    tromso.name = "Tromso";
    tromso.latitude = 69.65;
    tromso.longitude = 18.96;
    tromso.utc_offset_hours = 1.0;

    ScriptedProvider provider(kDate, 0.0, tromso.utc_offset_hours);
    EphemerisAdapter adapter(provider);

    provider.status = RiseSetStatus::NeverRises;
    CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(astro::CivilDate{2023, 12, 21}, tromso); })
          == ErrorKind::InvalidDate);

    provider.status = RiseSetStatus::NeverSets;
    CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(astro::CivilDate{2023, 6, 21}, tromso); })
          == ErrorKind::InvalidDate);
}

#ifdef VEDIKA_WITH_SWISSEPH
TEST_CASE("Swiss Ephemeris polar dates are InvalidDate")
{
    astro::GeoLocation tromso;
    tromso.name = "Tromso";
    tromso.latitude = 69.65;
    tromso.longitude = 18.96;
    tromso.utc_offset_hours = 1.0;

    SwissEphemerisProvider provider{std::filesystem::path{}};
    EphemerisAdapter adapter(provider);

    CHECK(provider.rise_set(astro::CivilDate{2023, 12, 21}, tromso.latitude, tromso.longitude,
                            tromso.utc_offset_hours).status == RiseSetStatus::NeverRises);
    CHECK(provider.rise_set(astro::CivilDate{2023, 6, 21}, tromso.latitude, tromso.longitude,
                            tromso.utc_offset_hours).status == RiseSetStatus::NeverSets);

    CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(astro::CivilDate{2023, 12, 21}, tromso); })
          == ErrorKind::InvalidDate);
    CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(astro::CivilDate{2023, 6, 21}, tromso); })
          == ErrorKind::InvalidDate);
}
#endif

TEST_CASE("Sunrise failures from the provider")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(kDate, 0.0, site.utc_offset_hours);
    EphemerisAdapter adapter(provider);

    SUBCASE("exception")
    {
        provider.fail_on_date = kDate;
        CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(kDate, site); })
              == ErrorKind::EphemerisUnavailable);
    }
    SUBCASE("sunset before sunrise")
    {
        provider.day_length_days = -0.1;
        CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(kDate, site); })
              == ErrorKind::EphemerisUnavailable);
    }
    SUBCASE("sunrise on another local date")
    {
        provider.sunrise_shift_days = 1.0;
        CHECK(error_kind_of([&] { (void)adapter.sunrise_sunset(kDate, site); })
              == ErrorKind::EphemerisUnavailable);
    }
}

TEST_CASE("parse_zodiac")
{
    CHECK(parse_zodiac("lahiri") == Zodiac::Sidereal);
    CHECK(parse_zodiac("sidereal") == Zodiac::Sidereal);
    CHECK(parse_zodiac("tropical") == Zodiac::Tropical);
    CHECK_FALSE(parse_zodiac("raman").has_value());
}
