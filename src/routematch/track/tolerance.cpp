#include <routematch/track/tolerance.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <string>

#include <routematch/track/errors.hpp>
#include <routematch/track/private/spatial_index.hpp>

namespace routematch::track {

namespace {

void validate(const tolerance_options& opts, const char* caller) {
    if (!(opts.tolerance >= kilometers{0.0})) {
        std::ostringstream buffer;
        buffer << caller << ": tolerance must be non-negative, got " << opts.tolerance;
        throw invalid_input_error{buffer.str()};
    }
}

void require_elevations(const elevation_profile& profile, const char* caller) {
    if (!profile.has_complete_elevations()) {
        throw no_elevation_data_error{std::string{caller} + ": include_elevation requires an elevation on every point"};
    }
}

bool within(const geo_point& a, const geo_point& b, const tolerance_options& opts) {
    return point_separation(a, b, opts) <= opts.tolerance;
}

}  // namespace

match_method parse_match_method(std::string_view name) {
    if (name == "direct") {
        return match_method::k_direct;
    }
    if (name == "kdtree") {
        return match_method::k_kdtree;
    }
    if (name == "along_track") {
        return match_method::k_along_track;
    }
    throw invalid_input_error{"unknown match method '" + std::string{name} + "', expected direct, kdtree or along_track"};
}

std::string_view to_string(match_method method) noexcept {
    switch (method) {
        case match_method::k_direct:
            return "direct";
        case match_method::k_kdtree:
            return "kdtree";
        case match_method::k_along_track:
            return "along_track";
    }
    return "unknown";
}

kilometers point_separation(const geo_point& a, const geo_point& b, const tolerance_options& opts) {
    const kilometers horizontal = haversine_distance(a, b);
    if (!opts.include_elevation) {
        return horizontal;
    }
    if (!a.elevation() || !b.elevation()) {
        throw no_elevation_data_error{"point_separation: include_elevation requires elevation on both points"};
    }
    const double h = static_cast<double>(horizontal);
    const double dz = static_cast<double>(kilometers::from_meters(*a.elevation() - *b.elevation()));
    return kilometers{std::sqrt((h * h) + (dz * dz))};
}

tolerance_vector get_tolerance_vector(const elevation_profile& p1, const elevation_profile& p2, const tolerance_options& opts) {
    validate(opts, "get_tolerance_vector");
    if (p1.size() != p2.size()) {
        throw length_mismatch_error{"get_tolerance_vector: profile2 must match profile1", p1.size(), p2.size()};
    }
    if (opts.include_elevation) {
        require_elevations(p1, "get_tolerance_vector");
        require_elevations(p2, "get_tolerance_vector");
    }

    tolerance_vector result(p1.size());
    for (std::size_t i = 0; i < p1.size(); ++i) {
        result[i] = within(p1.points()[i], p2.points()[i], opts);
    }
    return result;
}

tolerance_vector kdtree_tolerance(const elevation_profile& p1, const elevation_profile& p2, const tolerance_options& opts) {
    validate(opts, "kdtree_tolerance");
    if (opts.include_elevation) {
        require_elevations(p1, "kdtree_tolerance");
        require_elevations(p2, "kdtree_tolerance");
    }

    const spatial_index index{p2, opts.include_elevation};

    tolerance_vector result(p1.size());
    for (std::size_t i = 0; i < p1.size(); ++i) {
        const auto& p = p1.points()[i];
        result[i] = within(p, p2.points()[index.nearest(p)], opts);
    }
    return result;
}

tolerance_vector along_track_tolerance(const elevation_profile& p1,
                                       const elevation_profile& p2,
                                       const tolerance_options& opts,
                                       kilometers offset) {
    validate(opts, "along_track_tolerance");

    const auto& distances1 = p1.get_distances();
    const auto& distances2 = p2.get_distances();
    const double first = distances1(0);
    const double last = distances1(p1.size() - 1);

    tolerance_vector result(p2.size(), false);
    for (std::size_t i = 0; i < p2.size(); ++i) {
        const double target = distances2(i) + static_cast<double>(offset);
        if (target < first || target > last) {
            continue;
        }

        const auto it = std::lower_bound(distances1.cbegin(), distances1.cend(), target);
        auto j = static_cast<std::size_t>(std::distance(distances1.cbegin(), it));
        if (j == p1.size() || (j > 0 && std::abs(distances1(j - 1) - target) <= std::abs(distances1(j) - target))) {
            --j;
        }

        result[i] = within(p1.points()[j], p2.points()[i], opts);
    }
    return result;
}

tolerance_vector compute_tolerance_vector(const elevation_profile& p1,
                                          const elevation_profile& p2,
                                          match_method method,
                                          const tolerance_options& opts) {
    switch (method) {
        case match_method::k_direct:
            return get_tolerance_vector(p1, p2, opts);
        case match_method::k_kdtree:
            return kdtree_tolerance(p1, p2, opts);
        case match_method::k_along_track:
            return along_track_tolerance(p1, p2, opts);
    }
    throw invalid_input_error{"compute_tolerance_vector: unknown match method"};
}

tolerance_summary summarize(const tolerance_vector& flags) {
    tolerance_summary summary{.matched = 0, .total = flags.size(), .matched_fraction = 0.0, .runs = {}};

    for (std::size_t i = 0; i < flags.size(); ++i) {
        if (flags[i]) {
            ++summary.matched;
        }
        if (summary.runs.empty() || summary.runs.back().within != flags[i]) {
            summary.runs.push_back({.begin = i, .end = i + 1, .within = flags[i]});
        } else {
            summary.runs.back().end = i + 1;
        }
    }

    if (summary.total > 0) {
        summary.matched_fraction = static_cast<double>(summary.matched) / static_cast<double>(summary.total);
    }
    return summary;
}

}  // namespace routematch::track
