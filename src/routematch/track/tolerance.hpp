#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <routematch/track/elevation_profile.hpp>
#include <routematch/track/geo_point.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

///
/// One flag per compared point pair, true when the pair is within tolerance.
///
using tolerance_vector = std::vector<bool>;

///
/// Options shared by every tolerance computation.
///
struct tolerance_options {
    static constexpr kilometers k_default_tolerance{0.1};

    ///
    /// Largest separation counted as a match. Zero demands coincident points.
    ///
    kilometers tolerance{k_default_tolerance};

    ///
    /// Whether elevation difference contributes to the separation.
    ///
    /// When set, every compared point needs an elevation and the separation is
    /// sqrt(h^2 + dz^2), with h the haversine distance and dz the elevation
    /// difference, both in kilometers.
    ///
    bool include_elevation{false};
};

///
/// Strategy used to pair points of the two profiles.
///
enum class match_method {
    k_direct,      ///< point i against point i
    k_kdtree,      ///< each profile1 point against its nearest profile2 point
    k_along_track  ///< each profile2 point against the profile1 point at the same cumulative distance
};

///
/// Parses a method name: "direct", "kdtree" or "along_track".
///
/// @throws invalid_input_error for any other name
///
match_method parse_match_method(std::string_view name);

std::string_view to_string(match_method method) noexcept;

///
/// Separation between two points under the given options.
///
/// @throws no_elevation_data_error if include_elevation is set and either point lacks elevation
///
kilometers point_separation(const geo_point& a, const geo_point& b, const tolerance_options& opts);

///
/// Compares two profiles point by point.
///
/// @param p1 First profile
/// @param p2 Second profile, same point count as p1
/// @param opts Tolerance and elevation handling
/// @return Flag i is true when p1[i] and p2[i] are within tolerance
/// @throws length_mismatch_error if the point counts differ
/// @throws invalid_input_error if the tolerance is negative
/// @throws no_elevation_data_error if elevation is requested but missing
///
tolerance_vector get_tolerance_vector(const elevation_profile& p1, const elevation_profile& p2, const tolerance_options& opts = {});

///
/// Compares each point of p1 with its nearest neighbour in p2.
///
/// Neighbours are found through a spatial index over p2 in Earth-centred
/// cartesian coordinates (lifted by elevation when requested). The chosen pair
/// is then measured with point_separation, so for equal-length profiles whose
/// nearest neighbours are the same-index points the result equals
/// get_tolerance_vector.
///
/// @return One flag per p1 point
/// @throws invalid_input_error if the tolerance is negative
/// @throws no_elevation_data_error if elevation is requested but missing
///
tolerance_vector kdtree_tolerance(const elevation_profile& p1, const elevation_profile& p2, const tolerance_options& opts = {});

///
/// Compares each point of p2 with the p1 point nearest along the track.
///
/// The p2 point at cumulative distance d is paired with the p1 point whose
/// cumulative distance is closest to d + offset (the earlier one on ties).
/// Points whose shifted distance falls outside p1's range are false.
///
/// @param offset Shift applied to p2's distances, e.g. from elevation_sync
/// @return One flag per p2 point
/// @throws invalid_input_error if the tolerance is negative
/// @throws no_elevation_data_error if elevation is requested but missing on a compared pair
///
tolerance_vector along_track_tolerance(const elevation_profile& p1,
                                       const elevation_profile& p2,
                                       const tolerance_options& opts = {},
                                       kilometers offset = kilometers{0.0});

///
/// Dispatches to the tolerance computation selected by `method`.
///
tolerance_vector compute_tolerance_vector(const elevation_profile& p1,
                                          const elevation_profile& p2,
                                          match_method method,
                                          const tolerance_options& opts = {});

///
/// Maximal index range [begin, end) of equal flags.
///
struct tolerance_run {
    std::size_t begin;
    std::size_t end;
    bool within;

    bool operator==(const tolerance_run&) const = default;
};

///
/// Aggregate view of a tolerance vector.
///
struct tolerance_summary {
    std::size_t matched;
    std::size_t total;

    /// matched / total, zero for an empty vector.
    double matched_fraction;

    /// Runs in index order; adjacent runs alternate in `within`.
    std::vector<tolerance_run> runs;
};

tolerance_summary summarize(const tolerance_vector& flags);

}  // namespace routematch::track
