#pragma once

#include <string>

#include "hexzset/types.hpp"

namespace hexzset {

constexpr double DEG_TO_RAD = 0.017453292519943295769236907684886;
constexpr double EARTH_RADIUS_IN_METERS = 6372797.560856;

constexpr double deg_rad(double ang) noexcept { return ang * DEG_TO_RAD; }
constexpr double rad_deg(double ang) noexcept { return ang / DEG_TO_RAD; }

/**
 * Haversine great-circle distance in meters between two points given in
 * degrees. The asin argument is clamped to [-1, 1] so rounding at antipodal
 * points cannot produce NaN.
 */
double haversine_distance(double lon1, double lat1, double lon2, double lat2) noexcept;

inline double haversine_distance(const GeoPoint& a, const GeoPoint& b) noexcept {
    return haversine_distance(a.lon, a.lat, b.lon, b.lat);
}

enum class DistanceUnit {
    Meters,
    Kilometers,
    Feet,
    Miles
};

// Meters per unit: m 1.0, km 1000.0, ft 0.3048, mi 1609.34
double meters_per_unit(DistanceUnit unit) noexcept;

const char* unit_name(DistanceUnit unit) noexcept;

/**
 * Case-insensitive unit token ("m", "KM", "ft", "Mi").
 * @throws UnsupportedUnitError for anything else
 */
DistanceUnit parse_unit(const std::string& token);

inline double meters_to(double meters, DistanceUnit unit) noexcept {
    return meters / meters_per_unit(unit);
}

} // namespace hexzset
