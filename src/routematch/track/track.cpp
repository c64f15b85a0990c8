#include <routematch/track/track.hpp>

#include <stdexcept>
#include <string>

#include <routematch/track/elevation_source.hpp>
#include <routematch/track/errors.hpp>

namespace routematch::track {

track::track(std::vector<geo_point> points) : points_{std::move(points)} {}

const std::vector<geo_point>& track::points() const noexcept {
    return points_;
}

std::size_t track::size() const noexcept {
    return points_.size();
}

bool track::empty() const noexcept {
    return points_.empty();
}

const geo_point& track::operator[](std::size_t i) const noexcept {
    return points_[i];
}

const geo_point& track::front() const noexcept {
    return points_.front();
}

const geo_point& track::back() const noexcept {
    return points_.back();
}

const class elevation_profile& track::elevation_profile() const {
    if (!profile_) {
        if (points_.empty()) {
            throw invalid_input_error{"track: cannot build an elevation profile from an empty track"};
        }
        profile_.emplace(points_);
    }
    return *profile_;
}

kilometers track::total_distance() const {
    if (points_.size() < 2) {
        return kilometers{0.0};
    }
    return elevation_profile().total_distance();
}

xt::xarray<double> track::get_latitudes() const {
    return elevation_profile().get_latitudes();
}

xt::xarray<double> track::get_longitudes() const {
    return elevation_profile().get_longitudes();
}

std::vector<std::optional<double>> track::get_elevations() const {
    return elevation_profile().get_elevations();
}

void track::set_elevations(const std::vector<double>& values) {
    if (values.size() != points_.size()) {
        throw length_mismatch_error{"track::set_elevations", points_.size(), values.size()};
    }
    for (std::size_t i = 0; i < points_.size(); ++i) {
        points_[i] = points_[i].with_elevation(values[i]);
    }
    // Distances depend on position only, so a built profile stays valid once its elevations follow.
    if (profile_) {
        profile_->set_elevations(values);
    }
}

track track::with_elevations(const elevation_source& source) const {
    track copy{*this};
    auto values = source.elevations_for(points_);
    if (values.size() != points_.size()) {
        throw length_mismatch_error{"elevation source '" + source.name() + "'", points_.size(), values.size()};
    }
    copy.set_elevations(values);
    return copy;
}

track track::slice(std::size_t first, std::size_t last) const {
    if (first > last || last >= points_.size()) {
        throw std::out_of_range{"track::slice: range [" + std::to_string(first) + ", " + std::to_string(last) + "] is invalid for " +
                                std::to_string(points_.size()) + " points"};
    }
    using difference_type = std::vector<geo_point>::difference_type;
    return track{std::vector<geo_point>(points_.begin() + static_cast<difference_type>(first),
                                        points_.begin() + static_cast<difference_type>(last) + 1)};
}

}  // namespace routematch::track
