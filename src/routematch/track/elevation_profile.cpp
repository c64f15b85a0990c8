#include <routematch/track/elevation_profile.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

#if __has_include(<xtensor/generators/xbuilder.hpp>)
#include <xtensor/generators/xbuilder.hpp>
#else
#include <xtensor/xbuilder.hpp>
#endif

#include <routematch/track/elevation_source.hpp>
#include <routematch/track/errors.hpp>

namespace routematch::track {

elevation_profile::elevation_profile(std::vector<geo_point> points) : points_{std::move(points)} {
    if (points_.empty()) {
        throw invalid_input_error{"elevation_profile: at least one point is required"};
    }

    distances_ = xt::zeros<double>({points_.size()});
    for (std::size_t i = 1; i < points_.size(); ++i) {
        distances_(i) = distances_(i - 1) + static_cast<double>(haversine_distance(points_[i - 1], points_[i]));
    }
}

std::size_t elevation_profile::size() const noexcept {
    return points_.size();
}

const std::vector<geo_point>& elevation_profile::points() const noexcept {
    return points_;
}

xt::xarray<double> elevation_profile::get_latitudes() const {
    xt::xarray<double> result = xt::zeros<double>({points_.size()});
    for (std::size_t i = 0; i < points_.size(); ++i) {
        result(i) = points_[i].latitude();
    }
    return result;
}

xt::xarray<double> elevation_profile::get_longitudes() const {
    xt::xarray<double> result = xt::zeros<double>({points_.size()});
    for (std::size_t i = 0; i < points_.size(); ++i) {
        result(i) = points_[i].longitude();
    }
    return result;
}

std::vector<std::optional<double>> elevation_profile::get_elevations() const {
    std::vector<std::optional<double>> result;
    result.reserve(points_.size());
    std::ranges::transform(points_, std::back_inserter(result), [](const geo_point& p) { return p.elevation(); });
    return result;
}

const xt::xarray<double>& elevation_profile::get_distances() const noexcept {
    return distances_;
}

kilometers elevation_profile::total_distance() const noexcept {
    return kilometers{distances_(points_.size() - 1)};
}

bool elevation_profile::has_complete_elevations() const noexcept {
    return std::ranges::all_of(points_, &geo_point::has_elevation);
}

void elevation_profile::set_elevations(const std::vector<double>& values) {
    if (values.size() != points_.size()) {
        throw length_mismatch_error{"elevation_profile::set_elevations", points_.size(), values.size()};
    }
    for (std::size_t i = 0; i < points_.size(); ++i) {
        points_[i] = points_[i].with_elevation(values[i]);
    }
}

elevation_profile::elevation_stats elevation_profile::get_elevation_stats() const {
    std::size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double sum = 0.0;

    for (const auto& p : points_) {
        if (!p.elevation()) {
            continue;
        }
        const double e = *p.elevation();
        if (count == 0) {
            min = max = e;
        } else {
            min = std::min(min, e);
            max = std::max(max, e);
        }
        sum += e;
        ++count;
    }

    if (count == 0) {
        throw no_elevation_data_error{"elevation_profile::get_elevation_stats: no point has an elevation"};
    }

    const double mean = sum / static_cast<double>(count);
    double squared = 0.0;
    for (const auto& p : points_) {
        if (p.elevation()) {
            const double delta = *p.elevation() - mean;
            squared += delta * delta;
        }
    }

    return {.min = min, .max = max, .mean = mean, .std_dev = std::sqrt(squared / static_cast<double>(count)), .count = count};
}

elevation_profile::climb_stats elevation_profile::get_climb_stats() const {
    if (!has_complete_elevations()) {
        throw no_elevation_data_error{"elevation_profile::get_climb_stats: every point needs an elevation"};
    }

    climb_stats stats{.total_ascent = 0.0, .total_descent = 0.0, .max_ascent = 0.0, .max_descent = 0.0};
    for (std::size_t i = 1; i < points_.size(); ++i) {
        const double delta = *points_[i].elevation() - *points_[i - 1].elevation();
        if (delta > 0.0) {
            stats.total_ascent += delta;
            stats.max_ascent = std::max(stats.max_ascent, delta);
        } else {
            stats.total_descent -= delta;
            stats.max_descent = std::max(stats.max_descent, -delta);
        }
    }
    return stats;
}

elevation_profile elevation_profile::with_elevations(const elevation_source& source) const {
    elevation_profile copy{*this};
    auto values = source.elevations_for(points_);
    if (values.size() != points_.size()) {
        throw length_mismatch_error{"elevation source '" + source.name() + "'", points_.size(), values.size()};
    }
    copy.set_elevations(values);
    return copy;
}

}  // namespace routematch::track
