#include <routematch/track/geo_point.hpp>

#include <numbers>
#include <sstream>

#include "test_utils.hpp"

#include <boost/test/unit_test.hpp>

namespace {

using namespace routematch::track;
using namespace routematch::track::test;
using routematch::k_earth_radius;
using routematch::kilometers;

}  // namespace

BOOST_AUTO_TEST_SUITE(geo_point_tests)

BOOST_AUTO_TEST_CASE(haversine_of_point_with_itself_is_zero) {
    const geo_point p{47.3769, 8.5417, 408.0};
    BOOST_CHECK_EQUAL(static_cast<double>(haversine_distance(p, p)), 0.0);
    BOOST_CHECK_EQUAL(static_cast<double>(p.distance_to(p)), 0.0);
}

BOOST_AUTO_TEST_CASE(haversine_is_symmetric) {
    const geo_point london{51.5074, -0.1278};
    const geo_point paris{48.8566, 2.3522};
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(london, paris)), static_cast<double>(haversine_distance(paris, london)), 1e-12);
}

BOOST_AUTO_TEST_CASE(haversine_known_distances) {
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(geo_point{0.0, 0.0}, geo_point{0.0, 1.0})), 111.19492664455873, 1e-9);
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(geo_point{51.5074, -0.1278}, geo_point{48.8566, 2.3522})), 343.55606034104153, 1e-9);
}

BOOST_AUTO_TEST_CASE(haversine_ignores_elevation) {
    const geo_point low{10.0, 20.0, 0.0};
    const geo_point high{10.0, 20.0, 8848.0};
    BOOST_CHECK_EQUAL(static_cast<double>(haversine_distance(low, high)), 0.0);
}

BOOST_AUTO_TEST_CASE(haversine_scales_with_radius) {
    const geo_point a{0.0, 0.0};
    const geo_point b{0.0, 90.0};
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(a, b, kilometers{1.0})), std::numbers::pi / 2.0, 1e-12);
    BOOST_CHECK_CLOSE(static_cast<double>(a.distance_to(b, kilometers{2.0})), std::numbers::pi, 1e-12);
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(a, b)), static_cast<double>(k_earth_radius) * std::numbers::pi / 2.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(equator_helper_spaces_points_by_kilometers) {
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(equator_point(0.0), equator_point(2.5))), 2.5, 1e-9);
    BOOST_CHECK_CLOSE(static_cast<double>(haversine_distance(equator_point(1.0), equator_point(1.0, std::nullopt, 0.3))), 0.3, 1e-6);
}

BOOST_AUTO_TEST_CASE(elevation_is_optional) {
    const geo_point without{1.0, 2.0};
    BOOST_CHECK(!without.has_elevation());
    BOOST_CHECK(!without.elevation().has_value());

    const geo_point with{1.0, 2.0, 150.0};
    BOOST_CHECK(with.has_elevation());
    BOOST_CHECK_EQUAL(*with.elevation(), 150.0);
}

BOOST_AUTO_TEST_CASE(with_elevation_returns_new_value) {
    const geo_point p{45.0, 7.0};
    const geo_point q = p.with_elevation(1200.0);

    BOOST_CHECK(!p.has_elevation());
    BOOST_CHECK_EQUAL(q.latitude(), 45.0);
    BOOST_CHECK_EQUAL(q.longitude(), 7.0);
    BOOST_CHECK_EQUAL(*q.elevation(), 1200.0);

    const geo_point r = q.without_elevation();
    BOOST_CHECK(!r.has_elevation());
    BOOST_CHECK(r == p);
    BOOST_CHECK(q != p);
}

BOOST_AUTO_TEST_CASE(streams_readable_form) {
    std::ostringstream os;
    os << geo_point{1.5, -2.0} << ' ' << geo_point{0.0, 3.0, 12.0};
    BOOST_CHECK_EQUAL(os.str(), "(1.5, -2) (0, 3, 12 m)");
}

BOOST_AUTO_TEST_SUITE_END()
