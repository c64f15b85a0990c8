#pragma once

#include <iosfwd>
#include <string>

#include <routematch/track/comparison.hpp>
#include <routematch/track/observers.hpp>

namespace routematch::track {

///
/// Serializes a comparison result to JSON.
///
/// Point sequences are written as struct of arrays; absent elevations are null.
///
/// JSON structure:
/// @code{.json}
/// {
///   "metadata": {
///     "num_points1": <int>,
///     "num_points2": <int>,
///     "num_resampled": <int>,
///     "total_distance1_km": <number>,
///     "total_distance2_km": <number>,
///     "offsets": {"start1": <int>, "end1": <int>, "start2": <int>, "end2": <int>},
///     "matched": <int>,
///     "matched_fraction": <number>
///   },
///   "aligned_track1": {"latitude": [...], "longitude": [...], "elevation": [<number|null>, ...]},
///   "aligned_track2": {...},
///   "resampled_track1": {...},
///   "within_tolerance": [<bool>, ...],
///   "runs": [{"begin": <int>, "end": <int>, "within": <bool>}, ...],
///   "events": {
///     "search_windows": [{"boundary": <string>, "window1": <int>, "window2": <int>}, ...],
///     "matches": [{"boundary": <string>, "index1": <int>, "index2": <int>, "distance_km": <number>}, ...],
///     "no_matches": [{"boundary": <string>, "closest_km": <number>, "tolerance_km": <number>}, ...]
///   }
/// }
/// @endcode
///
/// The "events" member is present only when a collector is given.
///
/// @param result Comparison to serialize
/// @return JSON string
///
std::string serialize_comparison_to_json(const comparison_result& result);

///
/// Serializes a comparison result together with the alignment events that produced it.
///
/// @param result Comparison to serialize
/// @param collector Collector that observed the alignment
/// @return JSON string
///
std::string serialize_comparison_to_json(const comparison_result& result, const alignment_event_collector& collector);

///
/// Writes comparison JSON directly to output stream.
///
/// Convenience wrapper around serialize_comparison_to_json().
///
void write_comparison_json(std::ostream& out, const comparison_result& result);

void write_comparison_json(std::ostream& out, const comparison_result& result, const alignment_event_collector& collector);

}  // namespace routematch::track
