/// @file weekly_digest.cpp
/// @brief Digest assembly, day query tags and lifestyle lines.

#include "digest/weekly_digest.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <string_view>

namespace vedika::digest
{

namespace
{
    using astro::TimeSystem;
    using astro::Weekday;
    using namespace calendar_constants;

    constexpr std::size_t kMaxLifestyleLines = 5;

    struct TithiTheme
    {
        std::string_view tithi;
        std::string_view words;
    };

    // Query words for days without an observance, by tithi name
    constexpr std::array<TithiTheme, 7> kTithiThemes{{
        {"Pratipada", "ganesha beginning auspicious"},
        {"Chaturthi", "ganesha chaturthi obstacles"},
        {"Ekadashi", "vishnu ekadashi devotion"},
        {"Trayodashi", "shiva pradosham"},
        {"Amavasya", "pitru ancestors amavasya tarpanam"},
        {"Purnima", "full moon devotion"},
        {"Dwadashi", "vishnu devotion"},
    }};

    void append_unique(std::vector<std::string>& out, const std::string& value)
    {
        if (std::find(out.begin(), out.end(), value) == out.end())
        {
            out.push_back(value);
        }
    }

    void append_words(std::vector<std::string>& out, std::string_view words)
    {
        std::istringstream stream{std::string(words)};
        std::string word;
        while (stream >> word)
        {
            append_unique(out, word);
        }
    }

    [[nodiscard]] bool has_observance(const std::vector<panchang::ObservanceSet>& sets, std::string_view name)
    {
        return std::any_of(sets.begin(), sets.end(), [name](const panchang::ObservanceSet& s) {
            return std::any_of(s.observances.begin(), s.observances.end(),
                               [name](const panchang::Observance& o) { return o.name == name; });
        });
    }
}

WeeklyDigestAssembler::WeeklyDigestAssembler(panchang::PanchangCalculator& calculator,
                                             const verse::VerseRecommender& recommender)
    : m_calculator(calculator)
    , m_recommender(recommender)
{
}

// -----------------------------------------------------------------
// Query tags
// -----------------------------------------------------------------

std::vector<std::string> WeeklyDigestAssembler::day_query_tags(const panchang::PanchangDay& day,
                                                               const panchang::ObservanceSet& observances)
{
    std::vector<std::string> tags;
    if (!observances.empty())
    {
        for (const auto& obs : observances.observances)
        {
            for (const auto& tag : obs.tags)
            {
                append_unique(tags, tag);
            }
        }
        return tags;
    }

    const std::string_view tithi = panchang::tithi_name(day.tithi);
    const auto theme = std::find_if(kTithiThemes.begin(), kTithiThemes.end(),
                                    [tithi](const TithiTheme& t) { return t.tithi == tithi; });
    if (theme != kTithiThemes.end())
    {
        append_words(tags, theme->words);
        append_unique(tags, std::string(tithi));
    }
    else
    {
        append_unique(tags, std::string(tithi));
        append_unique(tags, std::string(panchang::nakshatra_name(day.nakshatra)));
        append_unique(tags, "dharma");
    }
    return tags;
}

// -----------------------------------------------------------------
// Lifestyle recommendations
// -----------------------------------------------------------------

std::vector<std::string> WeeklyDigestAssembler::lifestyle_recommendations(
    const std::vector<panchang::PanchangDay>& days,
    const std::vector<panchang::ObservanceSet>& observances)
{
    const auto any_day = [&days](auto predicate) {
        return std::any_of(days.begin(), days.end(), predicate);
    };

    std::vector<std::string> recs;
    if (has_observance(observances, "Amavasya"))
    {
        recs.emplace_back("Amavasya week: spend time in quiet reflection and gratitude for ancestors.");
    }
    if (has_observance(observances, "Ekadashi"))
    {
        recs.emplace_back("Ekadashi: keep meals light and sattvic, with extra hydration and simple japa.");
    }
    if (has_observance(observances, "Sankashti Chaturthi")
        || any_day([](const panchang::PanchangDay& d) { return d.tithi == 4 || d.tithi == 19; }))
    {
        recs.emplace_back("Chaturthi energy: clear one pending task and remove one source of clutter.");
    }
    if (any_day([](const panchang::PanchangDay& d) { return d.weekday == Weekday::Monday; }))
    {
        recs.emplace_back("Somavara: start the week with a short sankalpa and 10 minutes of silence.");
    }
    if (any_day([](const panchang::PanchangDay& d) { return d.weekday == Weekday::Thursday; }))
    {
        recs.emplace_back("Guruvara: reserve time for study, guidance, or one act of teaching.");
    }

    // The anchor line is always kept
    if (recs.size() >= kMaxLifestyleLines)
    {
        recs.resize(kMaxLifestyleLines - 1);
    }
    recs.emplace_back("Daily anchor: avoid digital overload for one focused hour after sunrise.");
    return recs;
}

// -----------------------------------------------------------------
// assemble
// -----------------------------------------------------------------

WeeklyDigest WeeklyDigestAssembler::assemble(const astro::CivilDate& week_start,
                                             const astro::GeoLocation& location,
                                             const verse::Corpus& corpus)
{
    if (corpus.empty())
    {
        core::fail(core::ErrorKind::CorpusEmpty, "cannot assemble a digest without verses");
    }

    VDK_INFO("Assembling digest for week of {} at {}", TimeSystem::format_date(week_start), location.name);

    const auto days = m_calculator.compute_range(week_start, kDaysPerWeek, location);
    const auto observances = panchang::ObservanceClassifier::classify(days);

    WeeklyDigest digest;
    digest.week_start = week_start;
    digest.week_end = TimeSystem::add_days(week_start, kDaysPerWeek - 1);
    digest.location = location;
    digest.ephemeris = m_calculator.adapter().source();
    digest.days.reserve(days.size());

    for (std::size_t i = 0; i < days.size(); ++i)
    {
        DigestDay entry{
            .panchang    = days[i],
            .observances = observances[i],
            .query_tags  = day_query_tags(days[i], observances[i]),
            .verse       = {},
        };
        entry.verse = m_recommender.recommend(corpus, entry.query_tags, 1).front();

        for (const auto& obs : observances[i].observances)
        {
            for (const auto& tag : obs.tags)
            {
                append_unique(digest.week_query_tags, tag);
            }
        }
        digest.days.push_back(std::move(entry));
    }

    digest.verse_of_week = m_recommender.recommend(corpus, digest.week_query_tags, 1).front();
    digest.lifestyle = lifestyle_recommendations(days, observances);

    VDK_INFO("Digest {} .. {}: verse of the week '{}'{}",
             TimeSystem::format_date(digest.week_start), TimeSystem::format_date(digest.week_end),
             digest.verse_of_week.verse.id, digest.verse_of_week.fallback ? " (default)" : "");
    return digest;
}

} // namespace vedika::digest
