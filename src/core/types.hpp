#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace vedika
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for astronomy)
    using Vec3d = glm::dvec3;
    using Mat3d = glm::dmat3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerCentury = 36525.0;
        constexpr f64 kFullCircle  = 360.0;
    }

    // Divisions of the zodiac used by the panchang
    namespace calendar_constants
    {
        constexpr i32 kTithiCount      = 30;
        constexpr i32 kNakshatraCount  = 27;
        constexpr i32 kYogaCount       = 27;
        constexpr i32 kKaranaCount     = 11;
        constexpr i32 kRashiCount      = 12;
        constexpr i32 kDaysPerWeek     = 7;

        constexpr f64 kTithiSpanDeg     = 12.0;
        constexpr f64 kKaranaSpanDeg    = 6.0;
        constexpr f64 kNakshatraSpanDeg = astro_constants::kFullCircle / kNakshatraCount;
        constexpr f64 kYogaSpanDeg      = astro_constants::kFullCircle / kYogaCount;
        constexpr f64 kRashiSpanDeg     = 30.0;
    }
}
