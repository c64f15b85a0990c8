#pragma once

#include <routematch/track/alignment.hpp>
#include <routematch/track/tolerance.hpp>
#include <routematch/track/track.hpp>

namespace routematch::track {

///
/// Options for compare_tracks.
///
struct comparison_options {
    ///
    /// Endpoint alignment settings. The observer, if any, receives the alignment events.
    ///
    alignment_options alignment{};

    ///
    /// Tolerance for the point-wise comparison.
    ///
    tolerance_options matching{};

    ///
    /// How resampled track1 points are paired with aligned track2 points.
    ///
    match_method method{match_method::k_direct};
};

///
/// Everything produced by comparing two tracks.
///
struct comparison_result {
    class track aligned1;
    class track aligned2;

    ///
    /// aligned1 resampled onto aligned2's point count.
    ///
    class track resampled;

    alignment_offsets offsets;
    tolerance_vector within_tolerance;
    tolerance_summary summary;
};

///
/// Aligns, resamples and compares two recordings of the same route.
///
/// Runs align_track_endpoints on the inputs, resamples the aligned track1 onto
/// the aligned track2's point count with interpolate_to_match_points, then
/// compares the resampled track1 profile with the aligned track2 profile using
/// the configured method. Errors from each stage propagate unchanged.
///
/// @param t1 Track to resample
/// @param t2 Reference track whose cadence is kept
/// @param opts Alignment, matching and method settings
/// @return Intermediate tracks, offsets, tolerance vector and its summary
///
comparison_result compare_tracks(const track& t1, const track& t2, const comparison_options& opts = {});

}  // namespace routematch::track
