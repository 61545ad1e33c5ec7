/// @file test_janam_patri.cpp
/// @brief Birth chart computation, overrides and verse themes.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "panchang/janam_patri.hpp"
#include "test_support.hpp"
#include "verse/scoring.hpp"

#include <stdexcept>

using namespace vedika;
using namespace vedika::panchang;
using vedika::astro::CivilDate;
using vedika::testing::ScriptedProvider;
using vedika::testing::make_verse;

int main(int argc, char** argv)
{
    vedika::core::Logger::init_silent();
    const int result = doctest::Context(argc, argv).run();
    vedika::core::Logger::shutdown();
    return result;
}

namespace
{
    astro::GeoLocation hyderabad()
    {
        astro::GeoLocation site;
        site.name = "Hyderabad";
        site.latitude = 17.3850;
        site.longitude = 78.4867;
        site.utc_offset_hours = 5.5;
        return site;
    }

    BirthDetails birth()
    {
        return BirthDetails{
            .name       = "Asha",
            .local_time = astro::DateTime{1990, 1, 1, 10, 30, 0.0},
            .place      = hyderabad(),
        };
    }

    /// Moon near 85° at the birth moment: Punarvasu (80..93.33), Mithuna (60..90).
    ScriptedProvider punarvasu_sky()
    {
        ScriptedProvider provider(CivilDate{1990, 1, 1}, 85.0, 5.5);
        provider.elongation_rate = 0.0;
        return provider;
    }
}

// =================================================================
// Computed chart
// =================================================================

TEST_CASE("Chart from the sidereal Moon at birth")
{
    auto provider = punarvasu_sky();
    ephemeris::EphemerisAdapter adapter(provider);
    JanamPatriCalculator calculator(adapter);

    const auto chart = calculator.compute(birth());

    CHECK(chart.nakshatra == 7);
    CHECK(nakshatra_name(chart.nakshatra) == "Punarvasu");
    CHECK(chart.rashi == 3);
    CHECK(rashi_name(chart.rashi) == "Mithuna");
    CHECK_FALSE(chart.overridden);
    CHECK(chart.theme == "Aditi abundance home");
    REQUIRE(chart.lifestyle.size() == 3);
    CHECK(chart.lifestyle[0].rfind("Keep mornings uncluttered", 0) == 0);
    CHECK(chart.verses.empty());
    CHECK(provider.ecliptic_calls == 1);

    // 10:30 IST is 05:00 UT
    CHECK(astro::TimeSystem::format_time(astro::Moment{.jd_ut = chart.birth_moment.jd_ut, .utc_offset_hours = 0.0})
          == "05:00");
}

TEST_CASE("Other nakshatras get the general lifestyle lines")
{
    const auto lines = JanamPatriCalculator::lifestyle_for(1);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].rfind("Maintain a steady wake-sleep cycle", 0) == 0);
    CHECK(JanamPatriCalculator::lifestyle_for(7) != lines);
}

TEST_CASE("Every nakshatra has a theme")
{
    for (i32 n = 1; n <= 27; ++n)
    {
        CHECK_FALSE(JanamPatriCalculator::theme_for(n).empty());
    }
    CHECK(JanamPatriCalculator::theme_for(10) == "pitru ancestors royalty");
}

// =================================================================
// Overrides
// =================================================================

TEST_CASE("Full override makes no ephemeris query")
{
    auto provider = punarvasu_sky();
    provider.fail_positions = true;
    ephemeris::EphemerisAdapter adapter(provider);
    JanamPatriCalculator calculator(adapter);

    const auto chart = calculator.compute(birth(), JanamPatriOverride{.nakshatra = 10, .rashi = 5});

    CHECK(chart.nakshatra == 10);
    CHECK(chart.rashi == 5);
    CHECK(chart.overridden);
    CHECK(chart.theme == "pitru ancestors royalty");
    CHECK(provider.ecliptic_calls == 0);
    CHECK(provider.rise_set_calls == 0);
    CHECK(provider.ayanamsa_calls == 0);
}

TEST_CASE("Partial override replaces only the supplied value")
{
    auto provider = punarvasu_sky();
    ephemeris::EphemerisAdapter adapter(provider);
    JanamPatriCalculator calculator(adapter);

    const auto chart = calculator.compute(birth(), JanamPatriOverride{.nakshatra = 8, .rashi = std::nullopt});

    CHECK(chart.nakshatra == 8);
    CHECK(chart.rashi == 3);
    CHECK(chart.overridden);
    CHECK(provider.ecliptic_calls == 1);
}

TEST_CASE("Out-of-range override is rejected before any query")
{
    auto provider = punarvasu_sky();
    ephemeris::EphemerisAdapter adapter(provider);
    JanamPatriCalculator calculator(adapter);

    CHECK_THROWS_AS((void)calculator.compute(birth(), JanamPatriOverride{.nakshatra = 28, .rashi = 1}),
                    std::invalid_argument);
    CHECK_THROWS_AS((void)calculator.compute(birth(), JanamPatriOverride{.nakshatra = std::nullopt, .rashi = 0}),
                    std::invalid_argument);
    CHECK(provider.ecliptic_calls == 0);
}

TEST_CASE("Ephemeris outage without an override propagates")
{
    auto provider = punarvasu_sky();
    provider.fail_positions = true;
    ephemeris::EphemerisAdapter adapter(provider);
    JanamPatriCalculator calculator(adapter);

    try
    {
        (void)calculator.compute(birth());
        FAIL("expected a ComputationError");
    }
    catch (const core::ComputationError& e)
    {
        CHECK(e.kind() == core::ErrorKind::EphemerisUnavailable);
    }
}

// =================================================================
// Verses
// =================================================================

TEST_CASE("Verses follow the nakshatra theme")
{
    auto provider = punarvasu_sky();
    ephemeris::EphemerisAdapter adapter(provider);
    JanamPatriCalculator calculator(adapter);

    const verse::Corpus corpus{
        make_verse("peace", {"peace", "universal"}),
        make_verse("bg-9.25", {"pitru", "devotion", "vishnu"}),
        make_verse("pitru-svadha", {"pitru", "ancestors", "amavasya", "tarpanam"}),
    };
    const verse::VerseRecommender recommender(verse::keyword_scorer(), "peace");

    auto chart = calculator.compute(birth(), JanamPatriOverride{.nakshatra = 10, .rashi = 5});
    chart.verses = JanamPatriCalculator::recommend(chart, recommender, corpus, 2);

    REQUIRE(chart.verses.size() == 2);
    CHECK(chart.verses[0].verse.id == "pitru-svadha");
    CHECK(chart.verses[0].score == doctest::Approx(2.0));
    CHECK(chart.verses[1].verse.id == "bg-9.25");
    CHECK_FALSE(chart.verses[0].fallback);
}
