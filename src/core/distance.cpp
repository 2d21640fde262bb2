#include "hexzset/distance.hpp"
#include "hexzset/error.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace hexzset {

double haversine_distance(double lon1d, double lat1d, double lon2d, double lat2d) noexcept {
    const double lat1r = deg_rad(lat1d);
    const double lon1r = deg_rad(lon1d);
    const double lat2r = deg_rad(lat2d);
    const double lon2r = deg_rad(lon2d);
    const double u = std::sin((lat2r - lat1r) / 2.0);
    const double v = std::sin((lon2r - lon1r) / 2.0);
    const double a = std::sqrt(u * u + std::cos(lat1r) * std::cos(lat2r) * v * v);
    return 2.0 * EARTH_RADIUS_IN_METERS * std::asin(std::clamp(a, -1.0, 1.0));
}

double meters_per_unit(DistanceUnit unit) noexcept {
    switch (unit) {
        case DistanceUnit::Meters:     return 1.0;
        case DistanceUnit::Kilometers: return 1000.0;
        case DistanceUnit::Feet:       return 0.3048;
        case DistanceUnit::Miles:      return 1609.34;
    }
    return 1.0;
}

const char* unit_name(DistanceUnit unit) noexcept {
    switch (unit) {
        case DistanceUnit::Meters:     return "m";
        case DistanceUnit::Kilometers: return "km";
        case DistanceUnit::Feet:       return "ft";
        case DistanceUnit::Miles:      return "mi";
    }
    return "m";
}

DistanceUnit parse_unit(const std::string& token) {
    std::string unit = token;
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (unit == "m") return DistanceUnit::Meters;
    if (unit == "km") return DistanceUnit::Kilometers;
    if (unit == "ft") return DistanceUnit::Feet;
    if (unit == "mi") return DistanceUnit::Miles;
    throw UnsupportedUnitError(token);
}

} // namespace hexzset
