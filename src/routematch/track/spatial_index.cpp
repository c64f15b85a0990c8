#include <routematch/track/private/spatial_index.hpp>

#include <cmath>
#include <iterator>
#include <vector>

#include <routematch/types/angles.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

Eigen::Vector3d to_cartesian(const geo_point& p, bool include_elevation) {
    double radius = static_cast<double>(k_earth_radius);
    if (include_elevation && p.elevation()) {
        radius += static_cast<double>(kilometers::from_meters(*p.elevation()));
    }
    const double lat = degrees_to_radians(p.latitude());
    const double lon = degrees_to_radians(p.longitude());
    return radius * Eigen::Vector3d(std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat));
}

spatial_index::spatial_index(const elevation_profile& profile, bool include_elevation) : include_elevation_{include_elevation} {
    std::vector<value_type> values;
    values.reserve(profile.size());
    const auto& points = profile.points();
    for (std::size_t i = 0; i < points.size(); ++i) {
        values.emplace_back(to_point(to_cartesian(points[i], include_elevation_)), i);
    }
    // Bulk loading packs the tree in one pass.
    tree_ = decltype(tree_){values.begin(), values.end()};
}

std::size_t spatial_index::nearest(const geo_point& p) const {
    std::vector<value_type> found;
    tree_.query(boost::geometry::index::nearest(to_point(to_cartesian(p, include_elevation_)), 1), std::back_inserter(found));
    return found.front().second;
}

std::size_t spatial_index::size() const noexcept {
    return tree_.size();
}

spatial_index::point_type spatial_index::to_point(const Eigen::Vector3d& v) {
    return point_type{v.x(), v.y(), v.z()};
}

}  // namespace routematch::track
