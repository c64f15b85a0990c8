#include <routematch/track/json_serialization.hpp>

#include <memory>
#include <sstream>
#include <string>

#include <json/json.h>

#include "test_utils.hpp"

#include <boost/test/unit_test.hpp>

namespace {

using namespace routematch::track;
using namespace routematch::track::test;
using routematch::kilometers;

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    Json::Value root;
    std::string errors;
    BOOST_REQUIRE_MESSAGE(reader->parse(text.data(), text.data() + text.size(), &root, &errors), errors);
    return root;
}

comparison_result sample_comparison(alignment_observer* observer = nullptr) {
    const track t1{{equator_point(0.0, 100.0), equator_point(1.0, 110.0), equator_point(2.0, 120.0), equator_point(3.0, 130.0)}};
    const track t2{{equator_point(0.0), equator_point(1.5, std::nullopt, 0.3), equator_point(3.0)}};

    comparison_options opts;
    opts.alignment.observer = observer;
    return compare_tracks(t1, t2, opts);
}

}  // namespace

BOOST_AUTO_TEST_SUITE(json_serialization_tests)

BOOST_AUTO_TEST_CASE(metadata_and_sequences) {
    const auto result = sample_comparison();
    const auto root = parse(serialize_comparison_to_json(result));

    const auto& metadata = root["metadata"];
    BOOST_CHECK_EQUAL(metadata["num_points1"].asUInt64(), 4);
    BOOST_CHECK_EQUAL(metadata["num_points2"].asUInt64(), 3);
    BOOST_CHECK_EQUAL(metadata["num_resampled"].asUInt64(), 3);
    BOOST_CHECK_CLOSE(metadata["total_distance1_km"].asDouble(), 3.0, 1e-6);
    BOOST_CHECK_EQUAL(metadata["offsets"]["end1"].asUInt64(), 3);
    BOOST_CHECK_EQUAL(metadata["offsets"]["end2"].asUInt64(), 2);
    BOOST_CHECK_EQUAL(metadata["matched"].asUInt64(), result.summary.matched);

    const auto& resampled = root["resampled_track1"];
    BOOST_REQUIRE_EQUAL(resampled["latitude"].size(), 3);
    BOOST_REQUIRE_EQUAL(resampled["elevation"].size(), 3);
    BOOST_CHECK_CLOSE(resampled["elevation"][1].asDouble(), 115.0, 1e-6);

    // Absent elevations are null
    const auto& aligned2 = root["aligned_track2"];
    BOOST_CHECK(aligned2["elevation"][0].isNull());
    BOOST_CHECK_CLOSE(aligned2["latitude"][1].asDouble(), 0.3 * degrees_per_km(), 1e-6);
}

BOOST_AUTO_TEST_CASE(tolerance_vector_and_runs) {
    const auto result = sample_comparison();
    const auto root = parse(serialize_comparison_to_json(result));

    const auto& flags = root["within_tolerance"];
    BOOST_REQUIRE_EQUAL(flags.size(), 3);
    BOOST_CHECK(flags[0].asBool());
    BOOST_CHECK(!flags[1].asBool());
    BOOST_CHECK(flags[2].asBool());

    const auto& runs = root["runs"];
    BOOST_REQUIRE_EQUAL(runs.size(), 3);
    BOOST_CHECK_EQUAL(runs[1]["begin"].asUInt64(), 1);
    BOOST_CHECK_EQUAL(runs[1]["end"].asUInt64(), 2);
    BOOST_CHECK(!runs[1]["within"].asBool());

    BOOST_CHECK(!root.isMember("events"));
}

BOOST_AUTO_TEST_CASE(events_included_with_collector) {
    alignment_event_collector collector;
    const auto result = sample_comparison(&collector);

    std::ostringstream out;
    write_comparison_json(out, result, collector);
    const auto root = parse(out.str());

    BOOST_REQUIRE(root.isMember("events"));
    const auto& events = root["events"];
    BOOST_CHECK_EQUAL(events["search_windows"].size(), 2);
    BOOST_CHECK_EQUAL(events["matches"].size(), 2);
    BOOST_CHECK_EQUAL(events["no_matches"].size(), 0);
    BOOST_CHECK_EQUAL(events["matches"][1]["boundary"].asString(), "end");
}

BOOST_AUTO_TEST_CASE(stream_and_string_agree) {
    const auto result = sample_comparison();
    std::ostringstream out;
    write_comparison_json(out, result);
    BOOST_CHECK_EQUAL(out.str(), serialize_comparison_to_json(result));
}

BOOST_AUTO_TEST_SUITE_END()
