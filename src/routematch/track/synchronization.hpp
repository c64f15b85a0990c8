#pragma once

#include <cstddef>

#include <routematch/track/elevation_profile.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch::track {

///
/// Options for elevation_sync.
///
struct elevation_sync_options {
    ///
    /// Number of common distances both profiles are resampled onto.
    ///
    std::size_t samples{1000};

    ///
    /// Largest shift tried in either direction, in samples. Must be below `samples`.
    ///
    std::size_t max_shift{50};
};

///
/// Along-track shift that best superimposes two elevation profiles.
///
/// A profile2 point at cumulative distance d corresponds to the profile1 point
/// at distance d + offset.
///
struct elevation_shift {
    kilometers offset;

    /// Shift in samples, in [-max_shift, max_shift].
    std::ptrdiff_t shift_samples;

    /// Mean squared elevation difference at the chosen shift, in square meters.
    double mean_squared_error;
};

///
/// Finds the distance shift that minimizes the elevation mismatch of two profiles.
///
/// Both profiles are resampled onto `samples` evenly spaced distances covering
/// the overlap of their distance ranges. For every integer shift in
/// [-max_shift, max_shift] the mean squared difference of the overlapping
/// samples is computed; the smallest wins, ties going to the most negative
/// shift. The sample step is the overlap length divided by `samples`.
///
/// @param p1 Reference profile
/// @param p2 Profile to shift
/// @param opts Sample count and shift range
/// @return Best shift and its error
/// @throws invalid_input_error if a profile has fewer than two points or opts is invalid
/// @throws no_elevation_data_error if any point lacks an elevation
/// @throws insufficient_overlap_error if the distance ranges do not overlap
///
elevation_shift elevation_sync(const elevation_profile& p1, const elevation_profile& p2, const elevation_sync_options& opts = {});

}  // namespace routematch::track
