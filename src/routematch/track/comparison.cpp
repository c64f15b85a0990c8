#include <routematch/track/comparison.hpp>

#include <routematch/track/interpolation.hpp>

namespace routematch::track {

comparison_result compare_tracks(const track& t1, const track& t2, const comparison_options& opts) {
    auto aligned = align_track_endpoints(t1, t2, opts.alignment);
    auto resampled = interpolate_to_match_points(aligned.track1, aligned.track2);

    auto flags = compute_tolerance_vector(resampled.elevation_profile(), aligned.track2.elevation_profile(), opts.method, opts.matching);
    auto summary = summarize(flags);

    return {.aligned1 = std::move(aligned.track1),
            .aligned2 = std::move(aligned.track2),
            .resampled = std::move(resampled),
            .offsets = aligned.offsets,
            .within_tolerance = std::move(flags),
            .summary = std::move(summary)};
}

}  // namespace routematch::track
