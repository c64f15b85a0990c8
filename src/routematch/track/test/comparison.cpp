#include <routematch/track/comparison.hpp>
#include <routematch/track/errors.hpp>
#include <routematch/track/observers.hpp>

#include <vector>

#include "test_utils.hpp"

#include <boost/test/unit_test.hpp>

namespace {

using namespace routematch::track;
using namespace routematch::track::test;
using routematch::kilometers;

std::vector<double> kilometer_marks(double first, double last, double step) {
    std::vector<double> marks;
    for (double d = first; d <= last + 1e-9; d += step) {
        marks.push_back(d);
    }
    return marks;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(comparison_tests)

BOOST_AUTO_TEST_CASE(same_route_different_cadence) {
    const auto dense = equator_track(kilometer_marks(0.0, 10.0, 0.5));
    const auto sparse = equator_track(kilometer_marks(0.0, 10.0, 1.0));

    const auto result = compare_tracks(dense, sparse);

    BOOST_CHECK(result.offsets == (alignment_offsets{.start1 = 0, .end1 = 20, .start2 = 0, .end2 = 10}));
    BOOST_CHECK_EQUAL(result.aligned1.size(), 21);
    BOOST_CHECK_EQUAL(result.aligned2.size(), 11);
    BOOST_CHECK_EQUAL(result.resampled.size(), 11);
    BOOST_CHECK_EQUAL(result.within_tolerance.size(), 11);
    BOOST_CHECK_EQUAL(result.summary.matched, 11);
    BOOST_CHECK_CLOSE(result.summary.matched_fraction, 1.0, 1e-12);
    BOOST_REQUIRE_EQUAL(result.summary.runs.size(), 1);
    BOOST_CHECK(result.summary.runs.front().within);
}

BOOST_AUTO_TEST_CASE(detour_shows_as_outside_run) {
    const auto reference = equator_track(kilometer_marks(0.0, 10.0, 1.0));

    // Same cadence, but km 4 to 6 run half a kilometer to the north
    std::vector<geo_point> points;
    for (int i = 0; i <= 10; ++i) {
        const double north = (i >= 4 && i <= 6) ? 0.5 : 0.0;
        points.push_back(equator_point(static_cast<double>(i), std::nullopt, north));
    }
    const track detour{std::move(points)};

    const auto result = compare_tracks(detour, reference, {.matching = {.tolerance = kilometers{0.2}}});

    BOOST_REQUIRE_EQUAL(result.within_tolerance.size(), 11);
    BOOST_CHECK_EQUAL(result.summary.matched, 8);
    BOOST_REQUIRE_EQUAL(result.summary.runs.size(), 3);
    BOOST_CHECK(result.summary.runs[1] == (tolerance_run{.begin = 4, .end = 7, .within = false}));
}

BOOST_AUTO_TEST_CASE(kdtree_method_over_trimmed_tracks) {
    const auto t1 = equator_track(kilometer_marks(-1.0, 11.0, 0.25));
    const auto t2 = equator_track(kilometer_marks(0.0, 10.0, 1.0));

    alignment_event_collector collector;
    comparison_options opts;
    opts.alignment.boundary_fraction = 0.25;
    opts.alignment.observer = &collector;
    opts.method = match_method::k_kdtree;

    const auto result = compare_tracks(t1, t2, opts);

    BOOST_CHECK_EQUAL(result.offsets.start1, 4);
    BOOST_CHECK_EQUAL(result.offsets.end1, 44);
    BOOST_CHECK_EQUAL(result.within_tolerance.size(), result.resampled.size());
    BOOST_CHECK_EQUAL(result.summary.matched, 11);
    BOOST_CHECK_EQUAL(collector.events().size(), 4);
}

BOOST_AUTO_TEST_CASE(inputs_are_not_mutated) {
    const auto t1 = equator_track(kilometer_marks(0.0, 5.0, 0.5));
    const auto t2 = equator_track(kilometer_marks(0.0, 5.0, 1.0));
    const auto before = t1.points();

    static_cast<void>(compare_tracks(t1, t2));

    BOOST_CHECK(t1.points() == before);
}

BOOST_AUTO_TEST_CASE(stage_errors_propagate) {
    const auto here = equator_track({0.0, 1.0, 2.0});
    std::vector<geo_point> far_points{equator_point(0.0, std::nullopt, 50.0), equator_point(2.0, std::nullopt, 50.0)};
    const track far{std::move(far_points)};

    BOOST_CHECK_THROW(static_cast<void>(compare_tracks(here, far)), no_alignment_found_error);
    BOOST_CHECK_THROW(static_cast<void>(compare_tracks(here, equator_track({0.0}))), invalid_input_error);

    comparison_options opts;
    opts.matching.include_elevation = true;
    BOOST_CHECK_THROW(static_cast<void>(compare_tracks(here, here, opts)), no_elevation_data_error);
}

BOOST_AUTO_TEST_SUITE_END()
