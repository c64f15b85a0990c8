#include <routematch/track/synchronization.hpp>

#include <algorithm>
#include <limits>
#include <string>

#if __has_include(<xtensor/core/xmath.hpp>)
#include <xtensor/core/xmath.hpp>
#include <xtensor/generators/xbuilder.hpp>
#else
#include <xtensor/xbuilder.hpp>
#include <xtensor/xmath.hpp>
#endif

#include <routematch/track/errors.hpp>

namespace routematch::track {

namespace {

xt::xarray<double> elevations_at(const elevation_profile& profile, const xt::xarray<double>& at) {
    xt::xarray<double> elevations = xt::zeros<double>({profile.size()});
    const auto& points = profile.points();
    for (std::size_t i = 0; i < points.size(); ++i) {
        elevations(i) = *points[i].elevation();
    }
    return xt::interp(at, profile.get_distances(), elevations);
}

}  // namespace

elevation_shift elevation_sync(const elevation_profile& p1, const elevation_profile& p2, const elevation_sync_options& opts) {
    if (p1.size() < 2 || p2.size() < 2) {
        throw invalid_input_error{"elevation_sync: both profiles need at least 2 points, got " + std::to_string(p1.size()) + " and " +
                                  std::to_string(p2.size())};
    }
    if (opts.samples < 2 || opts.max_shift >= opts.samples) {
        throw invalid_input_error{"elevation_sync: need samples >= 2 and max_shift < samples, got " + std::to_string(opts.samples) +
                                  " and " + std::to_string(opts.max_shift)};
    }
    if (!p1.has_complete_elevations() || !p2.has_complete_elevations()) {
        throw no_elevation_data_error{"elevation_sync: every point of both profiles needs an elevation"};
    }

    // Both distance axes start at zero, so the overlap ends at the shorter total.
    const double max_distance = std::min(static_cast<double>(p1.total_distance()), static_cast<double>(p2.total_distance()));
    if (max_distance <= 0.0) {
        throw insufficient_overlap_error{"elevation_sync: the profiles share no distance range"};
    }

    const xt::xarray<double> common = xt::linspace<double>(0.0, max_distance, opts.samples);
    const xt::xarray<double> elevations1 = elevations_at(p1, common);
    const xt::xarray<double> elevations2 = elevations_at(p2, common);

    const auto n = static_cast<std::ptrdiff_t>(opts.samples);
    const auto max_shift = static_cast<std::ptrdiff_t>(opts.max_shift);

    std::ptrdiff_t best_shift = 0;
    double best_error = std::numeric_limits<double>::infinity();

    for (std::ptrdiff_t shift = -max_shift; shift <= max_shift; ++shift) {
        // Positive shifts pair profile2 sample k with profile1 sample k + shift.
        const std::ptrdiff_t first2 = std::max<std::ptrdiff_t>(0, -shift);
        const std::ptrdiff_t first1 = std::max<std::ptrdiff_t>(0, shift);
        const std::ptrdiff_t count = n - (shift < 0 ? -shift : shift);

        double sum = 0.0;
        for (std::ptrdiff_t k = 0; k < count; ++k) {
            const double delta = elevations2(static_cast<std::size_t>(first2 + k)) - elevations1(static_cast<std::size_t>(first1 + k));
            sum += delta * delta;
        }
        const double error = sum / static_cast<double>(count);
        if (error < best_error) {
            best_error = error;
            best_shift = shift;
        }
    }

    const double step = max_distance / static_cast<double>(opts.samples);
    return {.offset = kilometers{static_cast<double>(best_shift) * step}, .shift_samples = best_shift, .mean_squared_error = best_error};
}

}  // namespace routematch::track
