// digest/digest_renderer.cpp
#include "digest/digest_renderer.hpp"

#include "panchang/calendar_indices.hpp"

#include <iomanip>
#include <sstream>

namespace vedika::digest
{

using astro::TimeSystem;

// -----------------------------------------------------------------------
// Panel helpers
// -----------------------------------------------------------------------
void DigestRenderer::hline(std::ostream& out, char c) const
{
    out << '+';
    for (int i = 0; i < panel_w - 2; ++i) out << c;
    out << '+' << '\n';
}

void DigestRenderer::title(std::ostream& out, const std::string& text) const
{
    hline(out, '=');
    out << "| " << std::left << std::setw(panel_w - 4) << text << " |" << '\n';
    hline(out, '-');
}

void DigestRenderer::row(std::ostream& out, const std::string& label, const std::string& value) const
{
    out << "| " << std::left << std::setw(18) << label
        << " : " << std::left << std::setw(panel_w - 25) << value
        << "|\n";
}

void DigestRenderer::verse_block(std::ostream& out, const verse::RecommendationResult& result,
                                 const std::string& indent)
{
    const auto& v = result.verse;
    if (!v.devanagari.empty()) out << indent << v.devanagari << '\n';
    if (!v.transliteration.empty()) out << indent << v.transliteration << '\n';
    out << indent << "-- " << v.meaning;
    if (!v.source.empty()) out << " [" << v.source << "]";
    if (result.fallback) out << " (default)";
    out << '\n';
}

// -----------------------------------------------------------------------
// render_day
// -----------------------------------------------------------------------
void DigestRenderer::render_day(std::ostream& out,
                                const panchang::PanchangDay& day,
                                const panchang::ObservanceSet& observances) const
{
    using namespace panchang;

    title(out, "PANCHANG  " + TimeSystem::format_date(day.date) + "  " + day.location.name);
    row(out, "Vaara", std::string(vaara_name(static_cast<i32>(day.weekday)))
                          + " (" + std::string(astro::weekday_name(day.weekday)) + ")");
    row(out, "Tithi", std::string(paksha_name(day.paksha)) + " " + std::string(tithi_name(day.tithi))
                          + " (" + std::to_string(day.tithi) + ")");
    if (day.skipped_tithi)
    {
        row(out, "Kshaya tithi", std::string(tithi_name(*day.skipped_tithi))
                                     + " (" + std::to_string(*day.skipped_tithi) + ")");
    }
    row(out, "Nakshatra", std::string(nakshatra_name(day.nakshatra)));
    row(out, "Yoga", std::string(yoga_name(day.yoga)));
    row(out, "Karana", std::string(karana_name(day.karana)));
    row(out, "Moon rashi", std::string(rashi_name(day.rashi)));
    row(out, "Sunrise / sunset", TimeSystem::format_time(day.sunrise) + " / " + TimeSystem::format_time(day.sunset));
    hline(out, '-');
    if (observances.empty())
    {
        row(out, "Observances", "none");
    }
    for (const auto& obs : observances.observances)
    {
        row(out, obs.name, obs.deity + ": " + obs.description + (obs.from_skipped_tithi ? " (kshaya)" : ""));
    }
    hline(out, '=');
}

// -----------------------------------------------------------------------
// render_digest
// -----------------------------------------------------------------------
void DigestRenderer::render_digest(std::ostream& out, const WeeklyDigest& digest) const
{
    using namespace panchang;

    title(out, "VEDIC WISDOM WEEKLY  " + TimeSystem::format_date(digest.week_start)
                   + " -> " + TimeSystem::format_date(digest.week_end));
    row(out, "Location", digest.location.name);
    hline(out, '-');

    for (const auto& d : digest.days)
    {
        const auto& p = d.panchang;
        std::ostringstream line;
        line << std::left << std::setw(12) << std::string(vaara_name(static_cast<i32>(p.weekday)))
             << std::setw(22) << (std::string(paksha_name(p.paksha)) + " " + std::string(tithi_name(p.tithi)))
             << std::setw(18) << std::string(nakshatra_name(p.nakshatra))
             << "rise " << TimeSystem::format_time(p.sunrise);
        row(out, TimeSystem::format_date(p.date), line.str());
    }
    hline(out, '=');

    out << '\n';
    bool any_observance = false;
    for (const auto& d : digest.days)
    {
        for (const auto& obs : d.observances.observances)
        {
            if (!any_observance)
            {
                out << "Observances this week:\n";
                any_observance = true;
            }
            out << "  * " << TimeSystem::format_date(d.panchang.date) << "  " << obs.name
                << " (" << obs.deity << "): " << obs.description
                << (obs.from_skipped_tithi ? " [kshaya tithi]" : "") << '\n';
        }
    }
    if (!any_observance)
    {
        out << "No major observances this week.\n";
    }

    out << "\nShloka by tithi:\n";
    for (const auto& d : digest.days)
    {
        out << "  " << TimeSystem::format_date(d.panchang.date) << " ("
            << paksha_name(d.panchang.paksha) << " " << tithi_name(d.panchang.tithi) << ")\n";
        verse_block(out, d.verse, "    ");
    }

    out << "\nVerse of the week:\n";
    verse_block(out, digest.verse_of_week, "  ");

    if (!digest.lifestyle.empty())
    {
        out << "\nLifestyle recommendations:\n";
        for (const auto& line : digest.lifestyle)
        {
            out << "  * " << line << '\n';
        }
    }
}

// -----------------------------------------------------------------------
// render_janam_patri
// -----------------------------------------------------------------------
void DigestRenderer::render_janam_patri(std::ostream& out, const panchang::JanamPatri& chart) const
{
    const auto& t = chart.birth.local_time;
    std::ostringstream birth;
    birth << TimeSystem::format_date({t.year, t.month, t.day}) << ' '
          << std::setfill('0') << std::setw(2) << t.hour << ':' << std::setw(2) << t.minute
          << " (" << chart.birth.place.name << ")";

    title(out, "JANAM PATRI" + (chart.birth.name.empty() ? std::string{} : "  " + chart.birth.name));
    row(out, "Birth", birth.str());
    row(out, "Janma nakshatra", std::string(panchang::nakshatra_name(chart.nakshatra))
                                    + (chart.overridden ? " (given)" : ""));
    row(out, "Rashi", std::string(panchang::rashi_name(chart.rashi)));
    row(out, "Theme", chart.theme);
    hline(out, '=');

    out << "\nLifestyle recommendations:\n";
    for (const auto& line : chart.lifestyle)
    {
        out << "  * " << line << '\n';
    }

    out << "\nRecommended verses:\n";
    render_verses(out, chart.verses);
}

// -----------------------------------------------------------------------
// render_verses
// -----------------------------------------------------------------------
void DigestRenderer::render_verses(std::ostream& out,
                                   const std::vector<verse::RecommendationResult>& results) const
{
    for (const auto& r : results)
    {
        out << "  " << r.rank << ". " << (r.verse.source.empty() ? r.verse.id : r.verse.source)
            << "  (score " << std::fixed << std::setprecision(2) << r.score << ")\n";
        verse_block(out, r, "     ");
    }
}

} // namespace vedika::digest
