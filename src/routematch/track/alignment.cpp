#include <routematch/track/alignment.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include <routematch/track/errors.hpp>

namespace routematch::track {

namespace {

// Distances closer than this count as equal when choosing the boundary pair.
constexpr double k_tie_epsilon_km = 1e-9;

// Guards ceil() against products such as 0.2 * 15 landing a hair above an integer.
constexpr double k_window_epsilon = 1e-9;

struct boundary_pair {
    std::size_t index1 = 0;
    std::size_t index2 = 0;
    double distance = std::numeric_limits<double>::infinity();

    void consider(const track& t1, const track& t2, std::size_t i, std::size_t j) {
        const double d = static_cast<double>(haversine_distance(t1[i], t2[j]));
        if (d < distance - k_tie_epsilon_km) {
            index1 = i;
            index2 = j;
            distance = d;
        }
    }
};

std::size_t window_size(std::size_t n, double fraction) {
    const auto raw = static_cast<std::size_t>(std::ceil((fraction * static_cast<double>(n)) - k_window_epsilon));
    return std::clamp<std::size_t>(raw, 1, n);
}

void require_points(const track& t, const char* name, const char* caller) {
    if (t.size() < 2) {
        throw invalid_input_error{std::string{caller} + ": " + name + " needs at least 2 points, got " + std::to_string(t.size())};
    }
}

void require_tolerance(kilometers tolerance, const char* caller) {
    if (!(tolerance >= kilometers{0.0})) {
        std::ostringstream buffer;
        buffer << caller << ": tolerance must be non-negative, got " << tolerance;
        throw invalid_input_error{buffer.str()};
    }
}

[[noreturn]] void throw_no_match(alignment_observer::boundary which, kilometers closest, kilometers tolerance, const char* caller) {
    std::ostringstream buffer;
    buffer << caller << ": no " << (which == alignment_observer::boundary::k_start ? "start" : "end")
           << " point pair within tolerance " << tolerance << " (closest " << closest << ")";
    throw no_alignment_found_error{buffer.str()};
}

aligned_tracks truncate(const track& t1, const track& t2, const alignment_offsets& offsets, const char* caller) {
    if (offsets.start1 >= offsets.end1 || offsets.start2 >= offsets.end2) {
        std::ostringstream buffer;
        buffer << caller << ": aligned range [" << offsets.start1 << ", " << offsets.end1 << "] / [" << offsets.start2 << ", "
               << offsets.end2 << "] leaves fewer than 2 points";
        throw insufficient_overlap_error{buffer.str()};
    }
    return {.track1 = t1.slice(offsets.start1, offsets.end1), .track2 = t2.slice(offsets.start2, offsets.end2), .offsets = offsets};
}

}  // namespace

alignment_observer::~alignment_observer() = default;

aligned_tracks align_track_endpoints(const track& t1, const track& t2, const alignment_options& opts) {
    constexpr const char* k_caller = "align_track_endpoints";

    require_points(t1, "track1", k_caller);
    require_points(t2, "track2", k_caller);
    require_tolerance(opts.tolerance, k_caller);
    if (!(opts.boundary_fraction > 0.0 && opts.boundary_fraction <= 1.0)) {
        throw invalid_input_error{std::string{k_caller} + ": boundary_fraction must be in (0, 1], got " + std::to_string(opts.boundary_fraction)};
    }

    const std::size_t n1 = t1.size();
    const std::size_t n2 = t2.size();
    const std::size_t w1 = window_size(n1, opts.boundary_fraction);
    const std::size_t w2 = window_size(n2, opts.boundary_fraction);
    const double tolerance = static_cast<double>(opts.tolerance);

    using boundary = alignment_observer::boundary;

    if (opts.observer) {
        opts.observer->on_search_window({.which = boundary::k_start, .window1 = w1, .window2 = w2});
    }
    boundary_pair start;
    for (std::size_t i = 0; i < w1; ++i) {
        for (std::size_t j = 0; j < w2; ++j) {
            start.consider(t1, t2, i, j);
        }
    }
    if (start.distance > tolerance) {
        if (opts.observer) {
            opts.observer->on_no_match({.which = boundary::k_start, .closest = kilometers{start.distance}, .tolerance = opts.tolerance});
        }
        throw_no_match(boundary::k_start, kilometers{start.distance}, opts.tolerance, k_caller);
    }
    if (opts.observer) {
        opts.observer->on_match(
            {.which = boundary::k_start, .index1 = start.index1, .index2 = start.index2, .distance = kilometers{start.distance}});
    }

    if (opts.observer) {
        opts.observer->on_search_window({.which = boundary::k_end, .window1 = w1, .window2 = w2});
    }
    // Walk backwards so the first strict improvement found wins ties for the latest indices.
    boundary_pair end;
    for (std::size_t i = n1; i-- > n1 - w1;) {
        for (std::size_t j = n2; j-- > n2 - w2;) {
            end.consider(t1, t2, i, j);
        }
    }
    if (end.distance > tolerance) {
        if (opts.observer) {
            opts.observer->on_no_match({.which = boundary::k_end, .closest = kilometers{end.distance}, .tolerance = opts.tolerance});
        }
        throw_no_match(boundary::k_end, kilometers{end.distance}, opts.tolerance, k_caller);
    }
    if (opts.observer) {
        opts.observer->on_match({.which = boundary::k_end, .index1 = end.index1, .index2 = end.index2, .distance = kilometers{end.distance}});
    }

    return truncate(t1, t2, {.start1 = start.index1, .end1 = end.index1, .start2 = start.index2, .end2 = end.index2}, k_caller);
}

aligned_tracks start_sync(const track& t1, const track& t2, kilometers tolerance, std::size_t window) {
    constexpr const char* k_caller = "start_sync";

    require_points(t1, "track1", k_caller);
    require_points(t2, "track2", k_caller);
    require_tolerance(tolerance, k_caller);
    if (window == 0) {
        throw invalid_input_error{std::string{k_caller} + ": window must hold at least one point"};
    }

    boundary_pair start;
    const std::size_t w1 = std::min(window, t1.size());
    const std::size_t w2 = std::min(window, t2.size());
    for (std::size_t i = 0; i < w1; ++i) {
        for (std::size_t j = 0; j < w2; ++j) {
            start.consider(t1, t2, i, j);
        }
    }
    if (start.distance > static_cast<double>(tolerance)) {
        throw_no_match(alignment_observer::boundary::k_start, kilometers{start.distance}, tolerance, k_caller);
    }

    return truncate(
        t1, t2, {.start1 = start.index1, .end1 = t1.size() - 1, .start2 = start.index2, .end2 = t2.size() - 1}, k_caller);
}

}  // namespace routematch::track
