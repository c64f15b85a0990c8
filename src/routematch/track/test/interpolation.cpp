#include <routematch/track/errors.hpp>
#include <routematch/track/interpolation.hpp>

#include <cmath>

#include "test_utils.hpp"

#include <boost/test/unit_test.hpp>

namespace {

using namespace routematch::track;
using namespace routematch::track::test;
using routematch::kilometers;

// Five points one degree apart along the equator, climbing 10 m per point
track five_degree_route() {
    return track{{geo_point{0.0, 0.0, 0.0}, geo_point{0.0, 1.0, 10.0}, geo_point{0.0, 2.0, 20.0}, geo_point{0.0, 3.0, 30.0}, geo_point{0.0, 4.0, 40.0}}};
}

}  // namespace

BOOST_AUTO_TEST_SUITE(interpolation_tests)

BOOST_AUTO_TEST_CASE(downsample_five_degree_route) {
    const auto full = five_degree_route();
    const track subset{{geo_point{0.0, 0.0}, geo_point{0.0, 1.7}, geo_point{0.0, 3.2}}};

    const auto resampled = interpolate_to_match_points(full, subset);

    BOOST_REQUIRE_EQUAL(resampled.size(), 3);
    BOOST_CHECK_SMALL(resampled[0].longitude(), 1e-9);
    BOOST_CHECK_CLOSE(resampled[1].longitude(), 2.0, 1e-9);
    BOOST_CHECK_CLOSE(resampled[2].longitude(), 4.0, 1e-9);

    BOOST_REQUIRE(resampled[1].has_elevation());
    BOOST_CHECK_SMALL(*resampled[0].elevation(), 1e-9);
    BOOST_CHECK_CLOSE(*resampled[1].elevation(), 20.0, 1e-9);
    BOOST_CHECK_CLOSE(*resampled[2].elevation(), 40.0, 1e-9);

    for (size_t i = 0; i < resampled.size(); ++i) {
        BOOST_CHECK_SMALL(resampled[i].latitude(), 1e-12);
    }
}

BOOST_AUTO_TEST_CASE(endpoints_match_full_route) {
    const track full{{geo_point{46.0, 7.0, 500.0}, geo_point{46.01, 7.02, 520.0}, geo_point{46.03, 7.03, 560.0}, geo_point{46.04, 7.05, 540.0}}};
    const auto subset = equator_track({0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0});

    const auto resampled = interpolate_to_match_points(full, subset);

    BOOST_REQUIRE_EQUAL(resampled.size(), subset.size());
    BOOST_CHECK_SMALL(resampled.front().latitude() - full.front().latitude(), 1e-9);
    BOOST_CHECK_SMALL(resampled.front().longitude() - full.front().longitude(), 1e-9);
    BOOST_CHECK_SMALL(resampled.back().latitude() - full.back().latitude(), 1e-9);
    BOOST_CHECK_SMALL(resampled.back().longitude() - full.back().longitude(), 1e-9);
}

BOOST_AUTO_TEST_CASE(samples_are_evenly_spaced_along_full_route) {
    // Uneven source spacing; targets depend only on the full route's length
    const auto full = equator_track({0.0, 0.5, 3.0, 4.0, 8.0});
    const auto subset = equator_track({0.0, 0.1, 0.2, 0.3, 0.4});

    const auto resampled = interpolate_to_match_points(full, subset);

    BOOST_REQUIRE_EQUAL(resampled.size(), 5);
    const auto& distances = resampled.elevation_profile().get_distances();
    for (size_t i = 0; i < resampled.size(); ++i) {
        BOOST_CHECK_CLOSE(distances(i) + 1.0, 2.0 * static_cast<double>(i) + 1.0, 1e-6);
    }
}

BOOST_AUTO_TEST_CASE(upsample_adds_points) {
    const auto full = equator_track({0.0, 2.0, 4.0}, {0.0, 100.0, 0.0});
    const auto subset = equator_track({0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0});

    const auto resampled = interpolate_to_match_points(full, subset);

    BOOST_REQUIRE_EQUAL(resampled.size(), 9);
    BOOST_CHECK_CLOSE(*resampled[2].elevation(), 50.0, 1e-6);
    BOOST_CHECK_CLOSE(*resampled[4].elevation(), 100.0, 1e-6);
    BOOST_CHECK_CLOSE(*resampled[6].elevation(), 50.0, 1e-6);
}

BOOST_AUTO_TEST_CASE(partial_elevation_is_dropped) {
    const track full{{equator_point(0.0, 10.0), equator_point(1.0), equator_point(2.0, 30.0)}};
    const auto subset = equator_track({0.0, 1.0});

    const auto resampled = interpolate_to_match_points(full, subset);

    for (const auto& p : resampled.points()) {
        BOOST_CHECK(!p.has_elevation());
    }
}

BOOST_AUTO_TEST_CASE(inputs_are_not_mutated) {
    const auto full = five_degree_route();
    const auto subset = equator_track({0.0, 1.0, 2.0});
    const auto full_before = full.points();
    const auto subset_before = subset.points();

    static_cast<void>(interpolate_to_match_points(full, subset));

    BOOST_CHECK(full.points() == full_before);
    BOOST_CHECK(subset.points() == subset_before);
}

BOOST_AUTO_TEST_CASE(too_few_points_rejected) {
    const auto one = equator_track({0.0});
    const auto two = equator_track({0.0, 1.0});
    const track none;

    BOOST_CHECK_THROW(static_cast<void>(interpolate_to_match_points(one, two)), invalid_input_error);
    BOOST_CHECK_THROW(static_cast<void>(interpolate_to_match_points(two, one)), invalid_input_error);
    BOOST_CHECK_THROW(static_cast<void>(interpolate_to_match_points(two, none)), invalid_input_error);
    BOOST_CHECK_NO_THROW(static_cast<void>(interpolate_to_match_points(two, two)));
}

BOOST_AUTO_TEST_CASE(resample_elevations_onto_base_distances) {
    const auto base = equator_profile({0.0, 1.0, 2.0});
    const auto comparison = equator_profile({0.0, 2.0}, {0.0, 100.0});

    const auto result = resample_elevations(base, comparison);
    const auto elevations = result.get_elevations();

    BOOST_CHECK_SMALL(*elevations[0], 1e-9);
    BOOST_CHECK_CLOSE(*elevations[1], 50.0, 1e-6);
    BOOST_CHECK_CLOSE(*elevations[2], 100.0, 1e-6);
    BOOST_CHECK(result.get_distances() == base.get_distances());
    BOOST_CHECK(!base.has_complete_elevations());
}

BOOST_AUTO_TEST_CASE(resample_elevations_clamps_outside_range) {
    const auto base = equator_profile({0.0, 1.0, 2.0});
    const auto comparison = equator_profile({0.0, 2.0}, {0.0, 100.0});

    const auto elevations = resample_elevations(base, comparison, kilometers{1.0}).get_elevations();

    BOOST_CHECK_CLOSE(*elevations[0], 50.0, 1e-6);
    BOOST_CHECK_EQUAL(*elevations[1], 100.0);
    BOOST_CHECK_EQUAL(*elevations[2], 100.0);

    const auto shifted_back = resample_elevations(base, comparison, kilometers{-1.0}).get_elevations();
    BOOST_CHECK_EQUAL(*shifted_back[0], 0.0);
}

BOOST_AUTO_TEST_CASE(resample_elevations_needs_comparison_elevations) {
    const auto base = equator_profile({0.0, 1.0});
    BOOST_CHECK_THROW(static_cast<void>(resample_elevations(base, base)), no_elevation_data_error);
}

BOOST_AUTO_TEST_SUITE_END()
