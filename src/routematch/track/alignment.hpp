#pragma once

#include <cstddef>

#include <routematch/track/track.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

class alignment_observer;

///
/// Options for endpoint alignment.
///
struct alignment_options {
    ///
    /// Default gate for boundary matches.
    ///
    static constexpr kilometers k_default_tolerance{0.1};

    ///
    /// Default share of each track searched at either end.
    ///
    static constexpr double k_default_boundary_fraction = 0.2;

    ///
    /// Largest accepted distance between the matched boundary points. Must be non-negative.
    ///
    kilometers tolerance{k_default_tolerance};

    ///
    /// Share of each track's points searched at the start and at the end, in (0, 1].
    ///
    /// The window holds ceil(boundary_fraction * size) points, never fewer than one.
    ///
    double boundary_fraction{k_default_boundary_fraction};

    ///
    /// Observer for search events (optional).
    ///
    alignment_observer* observer = nullptr;
};

///
/// Indices into the original tracks at which the aligned tracks start and end (inclusive).
///
struct alignment_offsets {
    std::size_t start1;
    std::size_t end1;
    std::size_t start2;
    std::size_t end2;

    bool operator==(const alignment_offsets&) const = default;
};

///
/// Result of truncating two tracks to a common start and end.
///
struct aligned_tracks {
    class track track1;
    class track track2;
    alignment_offsets offsets;
};

///
/// Receives notifications about the boundary searches of endpoint alignment.
///
class alignment_observer {
   public:
    ///
    /// Which end of the tracks a search concerns.
    ///
    enum class boundary { k_start, k_end };

    ///
    /// Emitted before a boundary search with the number of points searched in each track.
    ///
    struct search_window_event {
        boundary which;
        std::size_t window1;
        std::size_t window2;
    };

    ///
    /// Emitted when the closest boundary pair passes the tolerance gate.
    ///
    struct match_event {
        boundary which;
        std::size_t index1;
        std::size_t index2;
        kilometers distance;
    };

    ///
    /// Emitted when even the closest boundary pair is farther than the tolerance.
    ///
    struct no_match_event {
        boundary which;
        kilometers closest;
        kilometers tolerance;
    };

    ///
    /// Destructor.
    ///
    virtual ~alignment_observer();

    virtual void on_search_window(search_window_event event) = 0;

    virtual void on_match(match_event event) = 0;

    virtual void on_no_match(no_match_event event) = 0;
};

///
/// Truncates two tracks so that their starts and their ends coincide within a tolerance.
///
/// Searches only the first and last windows of each track (see
/// alignment_options::boundary_fraction). At the start, the pair (i, j) with the
/// smallest haversine distance wins, ties going to the smallest indices; at the
/// end, ties go to the largest indices. Both pairs must be within tolerance.
///
/// @code
///   const auto aligned = align_track_endpoints(recorded, reference, {.tolerance = kilometers{0.05}});
///   // aligned.track1.front() and aligned.track2.front() are within 50 m
/// @endcode
///
/// @param t1 First track, at least two points
/// @param t2 Second track, at least two points
/// @param opts Tolerance, window size and observer
/// @return New tracks t1[start1..end1] and t2[start2..end2] with their offsets
/// @throws invalid_input_error if a track has fewer than two points or opts is invalid
/// @throws no_alignment_found_error if no start or no end pair is within tolerance
/// @throws insufficient_overlap_error if a truncated track would keep fewer than two points
///
aligned_tracks align_track_endpoints(const track& t1, const track& t2, const alignment_options& opts = {});

///
/// Trims only the heads of two tracks at their closest pair of early points.
///
/// Considers the first `window` points of each track; ties go to the smallest
/// indices. The ends are left as recorded.
///
/// @param t1 First track, at least two points
/// @param t2 Second track, at least two points
/// @param tolerance Largest accepted distance for the chosen pair
/// @param window Number of leading points searched in each track, at least one
/// @return New tracks t1[start1..] and t2[start2..] with their offsets
/// @throws invalid_input_error on too few points, a zero window or a negative tolerance
/// @throws no_alignment_found_error if the closest pair is farther than tolerance
/// @throws insufficient_overlap_error if a trimmed track would keep fewer than two points
///
aligned_tracks start_sync(const track& t1, const track& t2, kilometers tolerance = alignment_options::k_default_tolerance, std::size_t window = 50);

}  // namespace routematch::track
