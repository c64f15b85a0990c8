#pragma once

#include <optional>
#include <vector>

#if __has_include(<xtensor/containers/xarray.hpp>)
#include <xtensor/containers/xarray.hpp>
#else
#include <xtensor/xarray.hpp>
#endif

#include <routematch/track/geo_point.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

class elevation_source;

///
/// Point sequence parameterized by cumulative great-circle distance.
///
/// The distance axis is computed once at construction: distances[0] is zero and
/// distances[i] adds the haversine distance between points i-1 and i. Later
/// elevation changes never touch it, so the point count and the distance count
/// stay equal for the lifetime of the profile.
///
/// Copying a profile yields an independent value. Operations that derive a
/// profile with different elevations (with_elevations) copy first and leave
/// the receiver untouched; set_elevations is the only mutating operation.
///
class elevation_profile {
   public:
    ///
    /// Summary statistics over the elevations that are present.
    ///
    struct elevation_stats {
        double min;
        double max;
        double mean;

        /// Population standard deviation (divides by the sample count).
        double std_dev;

        /// Number of points that contributed.
        std::size_t count;
    };

    ///
    /// Climb totals over consecutive elevation differences, in meters.
    ///
    struct climb_stats {
        double total_ascent;
        double total_descent;
        double max_ascent;
        double max_descent;
    };

    ///
    /// Builds a profile and its cumulative distance axis.
    ///
    /// @param points Ordered points, at least one
    /// @throws invalid_input_error if points is empty
    ///
    explicit elevation_profile(std::vector<geo_point> points);

    ///
    /// Number of points (and distances).
    ///
    std::size_t size() const noexcept;

    const std::vector<geo_point>& points() const noexcept;

    ///
    /// Latitudes in degrees, one per point.
    ///
    xt::xarray<double> get_latitudes() const;

    ///
    /// Longitudes in degrees, one per point.
    ///
    xt::xarray<double> get_longitudes() const;

    ///
    /// Elevations in meters, absent where the point has none.
    ///
    std::vector<std::optional<double>> get_elevations() const;

    ///
    /// Cumulative distances in kilometers; non-decreasing, starting at zero.
    ///
    const xt::xarray<double>& get_distances() const noexcept;

    ///
    /// Distance from the first to the last point along the profile.
    ///
    kilometers total_distance() const noexcept;

    ///
    /// Checks whether every point carries an elevation.
    ///
    bool has_complete_elevations() const noexcept;

    ///
    /// Replaces the elevation of every point, by position.
    ///
    /// Positions and cumulative distances are unchanged.
    ///
    /// @param values New elevations in meters, one per point
    /// @throws length_mismatch_error if values.size() != size()
    ///
    void set_elevations(const std::vector<double>& values);

    ///
    /// Computes min, max, mean and standard deviation of the present elevations.
    ///
    /// @return Statistics over the points that carry an elevation
    /// @throws no_elevation_data_error if no point carries one
    ///
    elevation_stats get_elevation_stats() const;

    ///
    /// Sums rises and drops between consecutive elevations.
    ///
    /// @throws no_elevation_data_error if any point lacks an elevation
    ///
    climb_stats get_climb_stats() const;

    ///
    /// Copies this profile and applies elevations produced by a source.
    ///
    /// @param source Elevation source queried with this profile's points
    /// @return New profile with the source's elevations
    /// @throws length_mismatch_error if the source returns the wrong count
    ///
    [[nodiscard]] elevation_profile with_elevations(const elevation_source& source) const;

   private:
    std::vector<geo_point> points_;
    xt::xarray<double> distances_;
};

}  // namespace routematch::track
