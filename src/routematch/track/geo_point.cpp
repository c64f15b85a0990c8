#include <routematch/track/geo_point.hpp>

#include <cmath>

#include <routematch/types/angles.hpp>

namespace routematch::track {

kilometers geo_point::distance_to(const geo_point& other, kilometers radius) const noexcept {
    return haversine_distance(*this, other, radius);
}

kilometers haversine_distance(const geo_point& a, const geo_point& b, kilometers radius) noexcept {
    const double lat1 = degrees_to_radians(a.latitude());
    const double lon1 = degrees_to_radians(a.longitude());
    const double lat2 = degrees_to_radians(b.latitude());
    const double lon2 = degrees_to_radians(b.longitude());

    const double d_lat = lat2 - lat1;
    const double d_lon = lon2 - lon1;

    const double sin_half_lat = std::sin(d_lat / 2.0);
    const double sin_half_lon = std::sin(d_lon / 2.0);
    const double h = (sin_half_lat * sin_half_lat) + (std::cos(lat1) * std::cos(lat2) * sin_half_lon * sin_half_lon);
    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

    return radius * c;
}

std::ostream& operator<<(std::ostream& os, const geo_point& p) {
    os << '(' << p.latitude() << ", " << p.longitude();
    if (p.elevation()) {
        os << ", " << *p.elevation() << " m";
    }
    return os << ')';
}

}  // namespace routematch::track
