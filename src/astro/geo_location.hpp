#pragma once
// astro/geo_location.hpp - Observer site for panchang and birth-chart queries

#include "core/types.hpp"

#include <string>

namespace vedika::astro
{

// -----------------------------------------------------------------------
// GeoLocation
// -----------------------------------------------------------------------
struct GeoLocation
{
    std::string name{"Observer"};
    f64 latitude{0.0};          ///< Geodetic latitude [degrees, N positive]
    f64 longitude{0.0};         ///< Longitude [degrees, E positive]
    f64 utc_offset_hours{0.0};  ///< Standard UTC offset [hours]
};

// -----------------------------------------------------------------------
// Factory helpers
// -----------------------------------------------------------------------

/// Default site: New Jersey, USA on Eastern Standard Time.
inline GeoLocation make_new_jersey_site()
{
    GeoLocation site;
    site.name = "New Jersey";
    site.latitude = 40.7128;
    site.longitude = -74.2060;
    site.utc_offset_hours = -5.0;
    return site;
}

/// Ujjain, the traditional prime meridian of Indian astronomy (IST).
inline GeoLocation make_ujjain_site()
{
    GeoLocation site;
    site.name = "Ujjain";
    site.latitude = 23.1765;
    site.longitude = 75.7885;
    site.utc_offset_hours = 5.5;
    return site;
}

} // namespace vedika::astro
