/// @file observance_classifier.cpp
/// @brief Observance rule table.

#include "panchang/observance_classifier.hpp"

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <string_view>

namespace vedika::panchang
{

namespace
{
    using astro::Weekday;

    struct ObservanceRule
    {
        std::string_view name;
        std::string_view deity;
        std::string_view description;
        std::vector<std::string_view> tags;
        bool (*applies)(i32 tithi, Weekday weekday);
    };

    const std::vector<ObservanceRule> kRules{
        {"Ekadashi", "Vishnu", "Fast and Vishnu worship",
         {"ekadashi", "vishnu", "fasting", "devotion"},
         [](i32 t, Weekday) { return t == 11 || t == 26; }},

        {"Pradosham", "Shiva", "Shiva puja during twilight",
         {"pradosham", "shiva", "twilight"},
         [](i32 t, Weekday w) { return t == 13 && (w == Weekday::Monday || w == Weekday::Tuesday); }},

        {"Amavasya", "Pitrus", "Tarpanam for ancestors",
         {"amavasya", "pitru", "ancestors", "tarpanam"},
         [](i32 t, Weekday) { return t == 30; }},

        {"Purnima", "All", "Full moon observance",
         {"purnima", "full moon", "devotion"},
         [](i32 t, Weekday) { return t == 15; }},

        // Krishna paksha Chaturthi
        {"Sankashti Chaturthi", "Ganesha", "Ganesha vrata",
         {"chaturthi", "ganesha", "obstacles"},
         [](i32 t, Weekday) { return t == 19; }},
    };

    [[nodiscard]] Observance make_observance(const ObservanceRule& rule, bool from_skipped)
    {
        Observance obs;
        obs.name = rule.name;
        obs.deity = rule.deity;
        obs.description = rule.description;
        obs.tags.assign(rule.tags.begin(), rule.tags.end());
        obs.from_skipped_tithi = from_skipped;
        return obs;
    }

    void require_tithi(i32 tithi, const astro::CivilDate& date)
    {
        if (tithi < 1 || tithi > calendar_constants::kTithiCount)
        {
            core::fail(core::ErrorKind::InvalidDate,
                       fmt::format("tithi {} on {} is outside 1..30", tithi, astro::TimeSystem::format_date(date)));
        }
    }
}

std::vector<Observance> ObservanceClassifier::match(i32 tithi, astro::Weekday weekday)
{
    std::vector<Observance> result;
    for (const auto& rule : kRules)
    {
        if (rule.applies(tithi, weekday))
        {
            result.push_back(make_observance(rule, false));
        }
    }
    return result;
}

ObservanceSet ObservanceClassifier::classify_day(const PanchangDay& day)
{
    require_tithi(day.tithi, day.date);
    if (day.skipped_tithi)
    {
        require_tithi(*day.skipped_tithi, day.date);
    }

    ObservanceSet set{.date = day.date, .observances = {}};
    for (const auto& rule : kRules)
    {
        if (rule.applies(day.tithi, day.weekday))
        {
            set.observances.push_back(make_observance(rule, false));
        }
        else if (day.skipped_tithi && rule.applies(*day.skipped_tithi, day.weekday))
        {
            set.observances.push_back(make_observance(rule, true));
        }
    }
    return set;
}

std::vector<ObservanceSet> ObservanceClassifier::classify(const std::vector<PanchangDay>& week)
{
    std::vector<ObservanceSet> result;
    result.reserve(week.size());
    for (const auto& day : week)
    {
        result.push_back(classify_day(day));
    }
    return result;
}

} // namespace vedika::panchang
