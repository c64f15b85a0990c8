#pragma once

#include <cstddef>
#include <utility>

#include <Eigen/Core>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

#include <routematch/track/elevation_profile.hpp>
#include <routematch/track/geo_point.hpp>

namespace routematch::track {

///
/// Maps a geographic point to Earth-centred cartesian coordinates in kilometers.
///
/// The radius is k_earth_radius, plus the elevation when `include_elevation` is
/// set (a missing elevation counts as zero).
///
Eigen::Vector3d to_cartesian(const geo_point& p, bool include_elevation);

///
/// Nearest-neighbour index over the points of one profile.
///
/// Built once per tolerance call and discarded with it.
///
class spatial_index {
   public:
    ///
    /// Indexes every point of a profile.
    ///
    /// @param profile Points to index
    /// @param include_elevation Whether elevation lifts points off the sphere
    ///
    spatial_index(const elevation_profile& profile, bool include_elevation);

    ///
    /// Finds the indexed point closest to `p` in straight-line distance.
    ///
    /// @return Index of that point in the indexed profile
    ///
    std::size_t nearest(const geo_point& p) const;

    std::size_t size() const noexcept;

   private:
    using point_type = boost::geometry::model::point<double, 3, boost::geometry::cs::cartesian>;
    using value_type = std::pair<point_type, std::size_t>;

    static point_type to_point(const Eigen::Vector3d& v);

    bool include_elevation_;
    boost::geometry::index::rtree<value_type, boost::geometry::index::quadratic<16>> tree_;
};

}  // namespace routematch::track
