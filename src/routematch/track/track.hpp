#pragma once

#include <optional>
#include <vector>

#if __has_include(<xtensor/containers/xarray.hpp>)
#include <xtensor/containers/xarray.hpp>
#else
#include <xtensor/xarray.hpp>
#endif

#include <routematch/track/elevation_profile.hpp>
#include <routematch/track/geo_point.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

class elevation_source;

///
/// An ordered sequence of recorded positions.
///
/// The elevation profile is derived on first use and cached. The cache is not
/// synchronized; a track shared between threads must have its profile built
/// (e.g. by calling total_distance()) before it is shared.
///
class track {
   public:
    ///
    /// Constructs a track from points ordered by recording time.
    ///
    /// @param points Track points, possibly empty
    ///
    explicit track(std::vector<geo_point> points = {});

    const std::vector<geo_point>& points() const noexcept;

    std::size_t size() const noexcept;

    bool empty() const noexcept;

    const geo_point& operator[](std::size_t i) const noexcept;

    const geo_point& front() const noexcept;

    const geo_point& back() const noexcept;

    ///
    /// Gets the cumulative-distance profile, building it on first use.
    ///
    /// @throws invalid_input_error if the track is empty
    ///
    const class elevation_profile& elevation_profile() const;

    ///
    /// Distance along the track from first to last point.
    ///
    /// @return Last cumulative distance, or zero for fewer than two points
    ///
    kilometers total_distance() const;

    xt::xarray<double> get_latitudes() const;
    xt::xarray<double> get_longitudes() const;
    std::vector<std::optional<double>> get_elevations() const;

    ///
    /// Replaces the elevation of every point, by position.
    ///
    /// @param values New elevations in meters, one per point
    /// @throws length_mismatch_error if values.size() != size()
    ///
    void set_elevations(const std::vector<double>& values);

    ///
    /// Copies this track and applies elevations produced by a source.
    ///
    /// @throws length_mismatch_error if the source returns the wrong count
    ///
    [[nodiscard]] track with_elevations(const elevation_source& source) const;

    ///
    /// Extracts the points in the inclusive index range [first, last].
    ///
    /// @param first Index of the first point kept
    /// @param last Index of the last point kept
    /// @return New track with last - first + 1 points
    /// @throws std::out_of_range if first > last or last >= size()
    ///
    [[nodiscard]] track slice(std::size_t first, std::size_t last) const;

   private:
    std::vector<geo_point> points_;
    mutable std::optional<class elevation_profile> profile_;
};

}  // namespace routematch::track
