/// @file test_panchang_calculator.cpp
/// @brief Sunrise reckoning, date ranges and skipped tithis in PanchangCalculator.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "panchang/panchang_calculator.hpp"
#include "test_support.hpp"

using namespace vedika;
using namespace vedika::panchang;
using vedika::astro::CivilDate;
using vedika::astro::TimeSystem;
using vedika::astro::Weekday;
using vedika::testing::ScriptedProvider;

int main(int argc, char** argv)
{
    vedika::core::Logger::init_silent();
    const int result = doctest::Context(argc, argv).run();
    vedika::core::Logger::shutdown();
    return result;
}

// =================================================================
// Single day
// =================================================================

TEST_CASE("Amavasya at sunrise")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 3, 21}, 354.0, site.utc_offset_hours);
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    const auto day = calculator.compute(CivilDate{2023, 3, 21}, site);

    CHECK(day.date == CivilDate{2023, 3, 21});
    CHECK(day.weekday == Weekday::Tuesday);
    CHECK(day.tithi == 30);
    CHECK(day.paksha == Paksha::Krishna);
    CHECK(day.nakshatra == 27);         // Moon at 354°
    CHECK(day.rashi == 12);
    CHECK(day.karana == 10);            // k = 59, Nagava
    CHECK_FALSE(day.skipped_tithi.has_value());
    CHECK(day.location.name == "New Jersey");
    CHECK(TimeSystem::format_time(day.sunrise) == "06:00");
    CHECK(day.positions.moon_longitude == doctest::Approx(354.0));

    // Today's and tomorrow's sunrise
    CHECK(provider.rise_set_calls == 2);
    CHECK(provider.ecliptic_calls == 2);
}

TEST_CASE("A tithi that begins and ends between sunrises is recorded as skipped")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 6, 1}, 114.0, site.utc_offset_hours);
    provider.elongation_rate = 20.0;
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    // 114° (Dashami) today, 134° (Dwadashi) tomorrow
    const auto day = calculator.compute(CivilDate{2023, 6, 1}, site);

    CHECK(day.tithi == 10);
    REQUIRE(day.skipped_tithi.has_value());
    CHECK(*day.skipped_tithi == 11);
}

TEST_CASE("Skipped Amavasya across the lunation boundary")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 6, 1}, 342.0, site.utc_offset_hours);
    provider.elongation_rate = 20.0;
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    // 342° (tithi 29) today, 2° (tithi 1) tomorrow
    const auto day = calculator.compute(CivilDate{2023, 6, 1}, site);

    CHECK(day.tithi == 29);
    REQUIRE(day.skipped_tithi.has_value());
    CHECK(*day.skipped_tithi == 30);
}

TEST_CASE("A repeated tithi is not a skip")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 6, 1}, 13.0, site.utc_offset_hours);
    provider.elongation_rate = 10.0;
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    // 13° and 23°: Dwitiya on both sunrises
    const auto today = calculator.compute(CivilDate{2023, 6, 1}, site);
    const auto tomorrow = calculator.compute(CivilDate{2023, 6, 2}, site);

    CHECK(today.tithi == 2);
    CHECK(tomorrow.tithi == 2);
    CHECK_FALSE(today.skipped_tithi.has_value());
}

// =================================================================
// Ranges
// =================================================================

TEST_CASE("Seven-day range in calendar order")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 3, 21}, 354.0, site.utc_offset_hours);
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    const auto week = calculator.compute_range(CivilDate{2023, 3, 19}, 7, site);

    REQUIRE(week.size() == 7);
    const i32 expected_tithi[7] = {28, 29, 30, 1, 2, 3, 4};
    for (std::size_t i = 0; i < week.size(); ++i)
    {
        CAPTURE(i);
        CHECK(week[i].date == TimeSystem::add_days(CivilDate{2023, 3, 19}, static_cast<i32>(i)));
        CHECK(week[i].tithi == expected_tithi[i]);
        CHECK_FALSE(week[i].skipped_tithi.has_value());
    }
    CHECK(week[0].weekday == Weekday::Sunday);
    CHECK(week[6].weekday == Weekday::Saturday);
    CHECK(week[3].paksha == Paksha::Shukla);

    // Neighbouring days share their sunrise samples
    CHECK(provider.rise_set_calls == 8);
    CHECK(provider.ecliptic_calls == 8);
}

TEST_CASE("Range matches day-by-day computation")
{
    const auto site = astro::make_ujjain_site();
    ScriptedProvider provider(CivilDate{2024, 1, 10}, 100.0, site.utc_offset_hours);
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    const auto range = calculator.compute_range(CivilDate{2024, 1, 8}, 4, site);
    for (std::size_t i = 0; i < range.size(); ++i)
    {
        const auto single = calculator.compute(range[i].date, site);
        CHECK(single.tithi == range[i].tithi);
        CHECK(single.nakshatra == range[i].nakshatra);
        CHECK(single.yoga == range[i].yoga);
        CHECK(single.karana == range[i].karana);
    }
}

TEST_CASE("Empty range is rejected")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 3, 21}, 0.0, site.utc_offset_hours);
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    CHECK_THROWS_AS((void)calculator.compute_range(CivilDate{2023, 3, 19}, 0, site), core::ComputationError);
    CHECK(provider.rise_set_calls == 0);
}

TEST_CASE("Provider outage mid-range propagates unchanged")
{
    const auto site = astro::make_new_jersey_site();
    ScriptedProvider provider(CivilDate{2023, 3, 21}, 354.0, site.utc_offset_hours);
    provider.fail_on_date = CivilDate{2023, 3, 22};
    ephemeris::EphemerisAdapter adapter(provider);
    PanchangCalculator calculator(adapter);

    try
    {
        (void)calculator.compute_range(CivilDate{2023, 3, 19}, 7, site);
        FAIL("expected a ComputationError");
    }
    catch (const core::ComputationError& e)
    {
        CHECK(e.kind() == core::ErrorKind::EphemerisUnavailable);
    }
}
