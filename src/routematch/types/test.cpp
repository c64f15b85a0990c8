#define BOOST_TEST_MODULE routematch_types_test

#include <sstream>

#include <routematch/types/angles.hpp>
#include <routematch/types/kilometers.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#include <boost/test/included/unit_test.hpp>
#pragma GCC diagnostic pop

BOOST_AUTO_TEST_SUITE(kilometers_tests)

BOOST_AUTO_TEST_CASE(kilometers_arithmetic) {
    using namespace routematch;

    const kilometers a{5.0};
    const kilometers b{3.0};

    BOOST_CHECK_EQUAL(static_cast<double>(a + b), 8.0);
    BOOST_CHECK_EQUAL(static_cast<double>(a - b), 2.0);
    BOOST_CHECK_EQUAL(static_cast<double>(a * 2.0), 10.0);
    BOOST_CHECK_EQUAL(static_cast<double>(2.0 * a), 10.0);
    BOOST_CHECK_EQUAL(static_cast<double>(a / 2.0), 2.5);
    BOOST_CHECK_EQUAL(a / kilometers{2.0}, 2.5);

    kilometers c{10.0};
    c += b;
    BOOST_CHECK_EQUAL(static_cast<double>(c), 13.0);
    c -= kilometers{3.0};
    BOOST_CHECK_EQUAL(static_cast<double>(c), 10.0);
    c *= 2.0;
    BOOST_CHECK_EQUAL(static_cast<double>(c), 20.0);
    c /= 4.0;
    BOOST_CHECK_EQUAL(static_cast<double>(c), 5.0);

    BOOST_CHECK_EQUAL(static_cast<double>(-c), -5.0);
    BOOST_CHECK_EQUAL(static_cast<double>(abs(-c)), 5.0);
}

BOOST_AUTO_TEST_CASE(kilometers_comparison) {
    using namespace routematch;

    const kilometers a{5.0};
    const kilometers b{3.0};
    const kilometers c{5.0};

    BOOST_CHECK(a > b);
    BOOST_CHECK(b < a);
    BOOST_CHECK(a >= c);
    BOOST_CHECK(a <= c);
    BOOST_CHECK(a == c);
    BOOST_CHECK(a != b);
}

BOOST_AUTO_TEST_CASE(kilometers_meters_conversion) {
    using namespace routematch;

    const auto hundred_meters = kilometers::from_meters(100.0);
    BOOST_CHECK_CLOSE(static_cast<double>(hundred_meters), 0.1, 1e-12);
    BOOST_CHECK_CLOSE(kilometers{1.5}.meters(), 1500.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(kilometers_streaming) {
    using namespace routematch;

    std::ostringstream os;
    os << kilometers{2.5};
    BOOST_CHECK_EQUAL(os.str(), "2.5km");
}

BOOST_AUTO_TEST_CASE(earth_radius_constant) {
    using namespace routematch;

    BOOST_CHECK_EQUAL(static_cast<double>(k_earth_radius), 6371.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(angle_tests)

BOOST_AUTO_TEST_CASE(degree_radian_round_trip) {
    using namespace routematch;

    BOOST_CHECK_CLOSE(degrees_to_radians(180.0), std::numbers::pi, 1e-12);
    BOOST_CHECK_CLOSE(radians_to_degrees(std::numbers::pi / 2.0), 90.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(coordinate_ranges) {
    using namespace routematch;

    BOOST_CHECK(is_valid_latitude(90.0));
    BOOST_CHECK(is_valid_latitude(-90.0));
    BOOST_CHECK(!is_valid_latitude(90.5));
    BOOST_CHECK(!is_valid_latitude(std::nan("")));

    BOOST_CHECK(is_valid_longitude(-180.0));
    BOOST_CHECK(is_valid_longitude(179.9));
    BOOST_CHECK(!is_valid_longitude(181.0));
}

BOOST_AUTO_TEST_SUITE_END()
