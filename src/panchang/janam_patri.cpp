/// @file janam_patri.cpp
/// @brief Janma nakshatra / rashi, nakshatra themes and lifestyle lines.

#include "panchang/janam_patri.hpp"

#include "core/logger.hpp"
#include "panchang/calendar_indices.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <stdexcept>
#include <string_view>

namespace vedika::panchang
{

namespace
{
    using astro::TimeSystem;
    using namespace calendar_constants;

    // Presiding deity and character of each nakshatra, Ashwini first
    constexpr std::array<std::string_view, kNakshatraCount> kNakshatraThemes{
        "healing vitality Ashwini Kumaras",
        "transformation Yama dharma",
        "Agni fire purification",
        "moon devotion beauty",
        "Soma moon seeking",
        "Shiva Rudra storm",
        "Aditi abundance home",
        "Brihaspati wisdom Jupiter",
        "serpent wisdom Naga",
        "pitru ancestors royalty",
        "love devotion Venus",
        "grace Aryaman",
        "skill Savitr sun",
        "Vishwakarma creation",
        "Vayu wind freedom",
        "Indra Agni victory",
        "Mitra friendship devotion",
        "Indra protection elder",
        "Nirriti dissolution",
        "Apah waters",
        "Vishvedeva universal",
        "Vishnu listening",
        "Vasudeva rhythm",
        "Varuna healing",
        "Aja Ekapada",
        "Ahir Budhnya",
        "Pushan nourishment",
    };

    constexpr i32 kPunarvasu = 7;

    void require_range(std::optional<i32> value, i32 max, std::string_view what)
    {
        if (value && (*value < 1 || *value > max))
        {
            throw std::invalid_argument(fmt::format("{} override {} is outside 1..{}", what, *value, max));
        }
    }
}

JanamPatriCalculator::JanamPatriCalculator(ephemeris::EphemerisAdapter& adapter)
    : m_adapter(adapter)
{
}

// -----------------------------------------------------------------
// compute
// -----------------------------------------------------------------

JanamPatri JanamPatriCalculator::compute(const BirthDetails& birth,
                                         const std::optional<JanamPatriOverride>& override_values)
{
    JanamPatri chart;
    chart.birth = birth;
    chart.birth_moment = TimeSystem::from_local(birth.local_time, birth.place.utc_offset_hours);
    chart.ephemeris = m_adapter.source();

    if (override_values)
    {
        require_range(override_values->nakshatra, kNakshatraCount, "nakshatra");
        require_range(override_values->rashi, kRashiCount, "rashi");
    }

    if (override_values && override_values->nakshatra && override_values->rashi)
    {
        chart.nakshatra = *override_values->nakshatra;
        chart.rashi = *override_values->rashi;
        chart.overridden = true;
        VDK_CORE_INFO("JanamPatri: using supplied {} / {}", nakshatra_name(chart.nakshatra), rashi_name(chart.rashi));
    }
    else
    {
        const auto pos = m_adapter.positions(chart.birth_moment, birth.place);
        const auto idx = zodiacal_positions_to_calendar_indices(pos.sun_longitude, pos.moon_longitude);
        chart.nakshatra = idx.nakshatra;
        chart.rashi = idx.rashi;

        if (override_values && override_values->nakshatra)
        {
            chart.nakshatra = *override_values->nakshatra;
            chart.overridden = true;
        }
        if (override_values && override_values->rashi)
        {
            chart.rashi = *override_values->rashi;
            chart.overridden = true;
        }

        VDK_CORE_INFO("JanamPatri: moon {:.4f}° -> {} / {}", pos.moon_longitude,
                      nakshatra_name(chart.nakshatra), rashi_name(chart.rashi));
    }

    chart.theme = theme_for(chart.nakshatra);
    chart.lifestyle = lifestyle_for(chart.nakshatra);
    return chart;
}

std::vector<verse::RecommendationResult> JanamPatriCalculator::recommend(const JanamPatri& chart,
                                                                         const verse::VerseRecommender& recommender,
                                                                         const verse::Corpus& corpus,
                                                                         i32 top_k)
{
    return recommender.recommend(corpus, {chart.theme}, top_k);
}

// -----------------------------------------------------------------
// Themes and lifestyle
// -----------------------------------------------------------------

std::string JanamPatriCalculator::theme_for(i32 nakshatra)
{
    if (nakshatra < 1 || nakshatra > kNakshatraCount)
    {
        return "devotion dharma";
    }
    return std::string(kNakshatraThemes[static_cast<std::size_t>(nakshatra - 1)]);
}

std::vector<std::string> JanamPatriCalculator::lifestyle_for(i32 nakshatra)
{
    if (nakshatra == kPunarvasu)
    {
        return {
            "Keep mornings uncluttered; begin with a short prayer and fresh air.",
            "Nurture home energy: one small act of care in your living space daily.",
            "Prefer steady routines over sudden lifestyle swings this week.",
        };
    }
    return {
        "Maintain a steady wake-sleep cycle and keep one daily reflection practice.",
        "Choose sattvic food and avoid over-stimulation in late evenings.",
        "Do one intentional act of service each week.",
    };
}

} // namespace vedika::panchang
