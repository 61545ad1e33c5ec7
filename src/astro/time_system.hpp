#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, civil dates, local moments.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vedika::astro
{
    /// @brief Civil calendar date (proleptic Gregorian).
    struct CivilDate
    {
        i32 year;
        i32 month;
        i32 day;

        friend bool operator==(const CivilDate&, const CivilDate&) = default;
    };

    /// @brief Civil date/time representation.
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief An instant in time together with the UTC offset used to present it.
    struct Moment
    {
        f64 jd_ut;              ///< Julian Date (UT)
        f64 utc_offset_hours;   ///< Offset of the local clock from UTC, hours
    };

    /// @brief Day of the week, Sunday first (matches the vaara order).
    enum class Weekday : i32
    {
        Sunday = 0,
        Monday,
        Tuesday,
        Wednesday,
        Thursday,
        Friday,
        Saturday,
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// civil date arithmetic, local/UT moment conversion and an approximate ΔT.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UT) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Julian Date of 0h UT on a civil date.
        [[nodiscard]] static f64 to_julian_date(const CivilDate& date);

        /// @brief Convert Julian Date back to civil date/time (UT).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Approximate ΔT = TT − UT in seconds (Espenak & Meeus polynomials).
        [[nodiscard]] static f64 delta_t_seconds(f64 jd_ut);

        /// @brief Convert a UT Julian Date to Terrestrial Time.
        [[nodiscard]] static f64 ut_to_tt(f64 jd_ut);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Date (UT).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Date (UT).
        /// @param longitude_rad Observer longitude in radians (east positive).
        /// @return LMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Build a moment from local wall-clock time and its UTC offset.
        [[nodiscard]] static Moment from_local(const DateTime& local, f64 utc_offset_hours);

        /// @brief Local wall-clock date/time of a moment.
        [[nodiscard]] static DateTime to_local(const Moment& moment);

        /// @brief Local civil date of a moment.
        [[nodiscard]] static CivilDate local_date(const Moment& moment);

        /// @brief Shift a civil date by a number of days (may be negative).
        [[nodiscard]] static CivilDate add_days(const CivilDate& date, i32 days);

        /// @brief Day of the week for a civil date.
        [[nodiscard]] static Weekday weekday(const CivilDate& date);

        /// @brief Get current system time as a Julian Date.
        /// @return Julian Date corresponding to the current UTC system clock.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Parse "YYYY-MM-DD". Returns std::nullopt on malformed or impossible dates.
        [[nodiscard]] static std::optional<CivilDate> parse_date(std::string_view text);

        /// @brief Parse "HH:MM" or "HH:MM:SS" into a time of day on the given date.
        [[nodiscard]] static std::optional<DateTime> parse_time(const CivilDate& date, std::string_view text);

        /// @brief Format as "YYYY-MM-DD".
        [[nodiscard]] static std::string format_date(const CivilDate& date);

        /// @brief Format the local wall-clock time of a moment as "HH:MM".
        [[nodiscard]] static std::string format_time(const Moment& moment);

        /// @brief Format as "YYYY-MM-DDTHH:MM", both parts from the same rounded minute.
        [[nodiscard]] static std::string format_datetime(const Moment& moment);

        /// @brief Number of days in a month of a given year.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

    /// @brief English weekday name ("Sunday", ...).
    [[nodiscard]] std::string_view weekday_name(Weekday day);

} // namespace vedika::astro
