#include <routematch/track/interpolation.hpp>

#include <string>
#include <vector>

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

xt::xarray<double> complete_elevations(const elevation_profile& profile) {
    xt::xarray<double> result = xt::zeros<double>({profile.size()});
    const auto& points = profile.points();
    for (std::size_t i = 0; i < points.size(); ++i) {
        result(i) = *points[i].elevation();
    }
    return result;
}

}  // namespace

track interpolate_to_match_points(const track& full, const track& subset) {
    if (full.size() < 2) {
        throw invalid_input_error{"interpolate_to_match_points: full track needs at least 2 points, got " + std::to_string(full.size())};
    }
    if (subset.size() < 2) {
        throw invalid_input_error{"interpolate_to_match_points: subset track needs at least 2 points, got " +
                                  std::to_string(subset.size())};
    }

    const auto& profile = full.elevation_profile();
    const auto& distances = profile.get_distances();
    const double total = static_cast<double>(profile.total_distance());
    const std::size_t n = subset.size();

    xt::xarray<double> targets = xt::linspace<double>(0.0, total, n);
    // Pin the end exactly so the last sample lands on the last source point.
    targets(n - 1) = total;

    const xt::xarray<double> latitudes = xt::interp(targets, distances, profile.get_latitudes());
    const xt::xarray<double> longitudes = xt::interp(targets, distances, profile.get_longitudes());

    std::vector<geo_point> points;
    points.reserve(n);

    if (profile.has_complete_elevations()) {
        const xt::xarray<double> elevations = xt::interp(targets, distances, complete_elevations(profile));
        for (std::size_t i = 0; i < n; ++i) {
            points.emplace_back(latitudes(i), longitudes(i), elevations(i));
        }
    } else {
        for (std::size_t i = 0; i < n; ++i) {
            points.emplace_back(latitudes(i), longitudes(i));
        }
    }

    return track{std::move(points)};
}

elevation_profile resample_elevations(const elevation_profile& base, const elevation_profile& comparison, kilometers offset) {
    if (!comparison.has_complete_elevations()) {
        throw no_elevation_data_error{"resample_elevations: every comparison point needs an elevation"};
    }

    const xt::xarray<double> lookup = base.get_distances() + static_cast<double>(offset);
    const xt::xarray<double> values = xt::interp(lookup, comparison.get_distances(), complete_elevations(comparison));

    elevation_profile result{base};
    result.set_elevations(std::vector<double>(values.begin(), values.end()));
    return result;
}

}  // namespace routematch::track
