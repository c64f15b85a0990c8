#pragma once

#include <routematch/track/elevation_profile.hpp>
#include <routematch/track/track.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

///
/// Resamples a track onto the point count of another track.
///
/// Produces subset.size() points evenly spaced in cumulative distance along
/// `full`, from its first point to its last. Latitude, longitude and elevation
/// are linearly interpolated against full's cumulative-distance axis. Only the
/// count of `subset` is used, never its positions or distances.
///
/// Elevation is carried only when every point of `full` has one; otherwise
/// every output point lacks elevation.
///
/// @code
///   const track dense = load_dense_recording();
///   const track sparse = load_sparse_recording();
///   const track resampled = interpolate_to_match_points(dense, sparse);
///   // resampled.size() == sparse.size()
/// @endcode
///
/// @param full Track to resample, at least two points
/// @param subset Track whose point count is matched, at least two points
/// @return New track; first and last positions equal full's
/// @throws invalid_input_error if either track has fewer than two points
///
track interpolate_to_match_points(const track& full, const track& subset);

///
/// Transfers elevations from one profile onto another's distance axis.
///
/// Each base point at cumulative distance d receives the comparison profile's
/// elevation interpolated at d + offset. Distances outside the comparison's
/// range take its first or last elevation.
///
/// @param base Profile whose positions and distances are kept
/// @param comparison Profile providing elevations, every point with one
/// @param offset Shift applied to base distances before lookup
/// @return Copy of base with the transferred elevations
/// @throws no_elevation_data_error if comparison lacks any elevation
///
elevation_profile resample_elevations(const elevation_profile& base, const elevation_profile& comparison, kilometers offset = kilometers{0.0});

}  // namespace routematch::track
