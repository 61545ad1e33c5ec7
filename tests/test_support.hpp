#pragma once

/// @file test_support.hpp
/// @brief Shared fixtures for the Vedika test executables.
///
/// ScriptedProvider stands in for a real ephemeris: the Moon-Sun elongation
/// grows linearly from a chosen value at 06:00 local time on an anchor
/// date, so every sunrise tithi of a test week is known in advance.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"
#include "verse/verse_record.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vedika::testing
{
    /// Mean daily motions (degrees per day).
    constexpr f64 kSunRate = 0.985647;
    constexpr f64 kElongationRate = 12.190749;

    class ScriptedProvider final : public ephemeris::EphemerisProvider
    {
    public:
        /// @param anchor Date whose 06:00 local sunrise carries `elongation_deg`.
        /// @param utc_offset_hours Offset of the sites this provider serves.
        ScriptedProvider(const astro::CivilDate& anchor, f64 elongation_deg, f64 utc_offset_hours)
            : m_anchor_jd(sunrise_jd(anchor, utc_offset_hours))
            , m_elongation(elongation_deg)
        {
        }

        [[nodiscard]] std::string_view name() const override { return "scripted"; }

        [[nodiscard]] ephemeris::EclipticState ecliptic_state(f64 jd_ut) override
        {
            ++ecliptic_calls;
            if (fail_positions)
            {
                throw std::runtime_error("scripted position outage");
            }

            const f64 dt = jd_ut - m_anchor_jd;
            const f64 sun = sun_at_anchor + kSunRate * dt;
            const f64 moon = sun + m_elongation + elongation_rate * dt;
            return ephemeris::EclipticState{
                .sun_longitude  = sun,
                .moon_longitude = return_nan ? std::numeric_limits<f64>::quiet_NaN() : moon,
                .moon_latitude  = moon_latitude,
                .obliquity      = obliquity,
            };
        }

        [[nodiscard]] ephemeris::RiseSet rise_set(const astro::CivilDate& date,
                                                  f64 /*latitude_deg*/,
                                                  f64 /*longitude_deg*/,
                                                  f64 utc_offset_hours) override
        {
            ++rise_set_calls;
            if (fail_on_date && *fail_on_date == date)
            {
                throw std::runtime_error("scripted sunrise outage on " + astro::TimeSystem::format_date(date));
            }
            if (status != ephemeris::RiseSetStatus::Ok)
            {
                return ephemeris::RiseSet{.status = status, .sunrise_jd = 0.0, .sunset_jd = 0.0};
            }

            const f64 rise = sunrise_jd(date, utc_offset_hours) + sunrise_shift_days;
            return ephemeris::RiseSet{
                .status     = ephemeris::RiseSetStatus::Ok,
                .sunrise_jd = rise,
                .sunset_jd  = rise + day_length_days,
            };
        }

        [[nodiscard]] f64 ayanamsa(f64 /*jd_ut*/) override
        {
            ++ayanamsa_calls;
            return ayanamsa_deg;
        }

        /// 06:00 local on `date`, as a UT Julian Date.
        [[nodiscard]] static f64 sunrise_jd(const astro::CivilDate& date, f64 utc_offset_hours)
        {
            return astro::TimeSystem::to_julian_date(date) + (6.0 - utc_offset_hours) / 24.0;
        }

        // Knobs
        f64 sun_at_anchor{0.0};
        f64 elongation_rate{kElongationRate};
        f64 ayanamsa_deg{0.0};
        f64 moon_latitude{0.0};
        f64 obliquity{23.44};
        f64 day_length_days{0.5};
        f64 sunrise_shift_days{0.0};
        ephemeris::RiseSetStatus status{ephemeris::RiseSetStatus::Ok};
        std::optional<astro::CivilDate> fail_on_date;
        bool fail_positions{false};
        bool return_nan{false};

        // Counters
        i32 ecliptic_calls{0};
        i32 rise_set_calls{0};
        i32 ayanamsa_calls{0};

    private:
        f64 m_anchor_jd;
        f64 m_elongation;
    };

    /// Temporary file removed when the helper goes out of scope.
    class TempFile
    {
    public:
        TempFile(const std::string& filename, const std::string& content)
            : m_path(std::filesystem::temp_directory_path() / filename)
        {
            std::ofstream file(m_path);
            file << content;
        }

        explicit TempFile(const std::string& filename)
            : m_path(std::filesystem::temp_directory_path() / filename)
        {
            std::filesystem::remove(m_path);
        }

        ~TempFile()
        {
            std::filesystem::remove(m_path);
        }

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        TempFile(const TempFile&) = delete;
        TempFile& operator=(const TempFile&) = delete;

    private:
        std::filesystem::path m_path;
    };

    inline verse::VerseRecord make_verse(std::string id, std::vector<std::string> tags,
                                         std::string meaning = "A verse.", std::string deity = "")
    {
        verse::VerseRecord v;
        v.id = std::move(id);
        v.meaning = std::move(meaning);
        v.deity = std::move(deity);
        v.source = "Test";
        v.tags = std::move(tags);
        return v;
    }

} // namespace vedika::testing
