/// @file panchang_calculator.cpp
/// @brief Sunrise sampling and the skipped-tithi check.

#include "panchang/panchang_calculator.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

namespace vedika::panchang
{

using astro::TimeSystem;

PanchangCalculator::PanchangCalculator(ephemeris::EphemerisAdapter& adapter)
    : m_adapter(adapter)
{
}

PanchangCalculator::SunriseSample PanchangCalculator::sample(const astro::CivilDate& date,
                                                             const astro::GeoLocation& location)
{
    const auto times = m_adapter.sunrise_sunset(date, location);
    const auto positions = m_adapter.positions(times.sunrise, location);
    return SunriseSample{
        .date      = date,
        .times     = times,
        .positions = positions,
        .indices   = zodiacal_positions_to_calendar_indices(positions.sun_longitude, positions.moon_longitude),
    };
}

PanchangDay PanchangCalculator::make_day(const SunriseSample& today,
                                         const SunriseSample& tomorrow,
                                         const astro::GeoLocation& location)
{
    const CalendarIndices& idx = today.indices;

    // A tithi lasts longer than a day on average, so the sunrise tithi
    // advances by 0, 1 or 2. Advancing by 2 means one tithi saw no sunrise.
    std::optional<i32> skipped;
    const i32 advance = (tomorrow.indices.tithi - idx.tithi + calendar_constants::kTithiCount)
                      % calendar_constants::kTithiCount;
    if (advance == 2)
    {
        skipped = idx.tithi % calendar_constants::kTithiCount + 1;
    }

    return PanchangDay{
        .date          = today.date,
        .weekday       = TimeSystem::weekday(today.date),
        .location      = location,
        .sunrise       = today.times.sunrise,
        .sunset        = today.times.sunset,
        .tithi         = idx.tithi,
        .paksha        = idx.paksha,
        .nakshatra     = idx.nakshatra,
        .yoga          = idx.yoga,
        .karana        = idx.karana,
        .rashi         = idx.rashi,
        .skipped_tithi = skipped,
        .positions     = today.positions,
    };
}

PanchangDay PanchangCalculator::compute(const astro::CivilDate& date,
                                        const astro::GeoLocation& location)
{
    const auto today = sample(date, location);
    const auto tomorrow = sample(TimeSystem::add_days(date, 1), location);
    const auto day = make_day(today, tomorrow, location);

    VDK_CORE_DEBUG("panchang {} @ {}: {} {} ({}) | {} | {} | {}",
                   TimeSystem::format_date(date), location.name,
                   paksha_name(day.paksha), tithi_name(day.tithi), day.tithi,
                   nakshatra_name(day.nakshatra), yoga_name(day.yoga), karana_name(day.karana));
    return day;
}

std::vector<PanchangDay> PanchangCalculator::compute_range(const astro::CivilDate& start,
                                                           i32 days,
                                                           const astro::GeoLocation& location)
{
    if (days < 1)
    {
        core::fail(core::ErrorKind::InvalidDate,
                   fmt::format("date range starting {} must cover at least one day (got {})",
                               TimeSystem::format_date(start), days));
    }

    std::vector<PanchangDay> result;
    result.reserve(static_cast<std::size_t>(days));

    // Each day needs the following sunrise too; share samples between neighbours
    auto today = sample(start, location);
    for (i32 i = 0; i < days; ++i)
    {
        auto tomorrow = sample(TimeSystem::add_days(start, i + 1), location);
        result.push_back(make_day(today, tomorrow, location));
        today = tomorrow;
    }

    VDK_CORE_DEBUG("panchang range {} + {} days @ {}", TimeSystem::format_date(start), days, location.name);
    return result;
}

} // namespace vedika::panchang
