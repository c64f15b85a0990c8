#include <routematch/track/json_serialization.hpp>

#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include <json/json.h>

namespace routematch::track {

namespace {

const char* boundary_to_string(alignment_observer::boundary which) {
    switch (which) {
        case alignment_observer::boundary::k_start:
            return "start";
        case alignment_observer::boundary::k_end:
            return "end";
    }
    throw std::invalid_argument("Unknown alignment boundary");
}

// Serialize a track as struct of arrays
Json::Value serialize_track(const track& t) {
    Json::Value result(Json::objectValue);

    Json::Value latitudes(Json::arrayValue);
    Json::Value longitudes(Json::arrayValue);
    Json::Value elevations(Json::arrayValue);

    latitudes.resize(static_cast<Json::ArrayIndex>(t.size()));
    longitudes.resize(static_cast<Json::ArrayIndex>(t.size()));
    elevations.resize(static_cast<Json::ArrayIndex>(t.size()));

    for (size_t i = 0; i < t.size(); ++i) {
        const auto idx = static_cast<Json::ArrayIndex>(i);
        latitudes[idx] = t[i].latitude();
        longitudes[idx] = t[i].longitude();
        if (t[i].elevation()) {
            elevations[idx] = *t[i].elevation();
        } else {
            elevations[idx] = Json::Value::null;
        }
    }

    result["latitude"] = std::move(latitudes);
    result["longitude"] = std::move(longitudes);
    result["elevation"] = std::move(elevations);

    return result;
}

Json::Value serialize_offsets(const alignment_offsets& offsets) {
    Json::Value result(Json::objectValue);
    result["start1"] = static_cast<Json::UInt64>(offsets.start1);
    result["end1"] = static_cast<Json::UInt64>(offsets.end1);
    result["start2"] = static_cast<Json::UInt64>(offsets.start2);
    result["end2"] = static_cast<Json::UInt64>(offsets.end2);
    return result;
}

// Serialize events by type (struct of arrays)
Json::Value serialize_events(const std::vector<alignment_event_collector::event>& events) {
    Json::Value result(Json::objectValue);

    Json::Value search_windows(Json::arrayValue);
    Json::Value matches(Json::arrayValue);
    Json::Value no_matches(Json::arrayValue);

    for (const auto& event : events) {
        std::visit(
            [&](auto&& ev) {
                using T = std::decay_t<decltype(ev)>;

                Json::Value obj;
                obj["boundary"] = boundary_to_string(ev.which);
                if constexpr (std::is_same_v<T, alignment_observer::search_window_event>) {
                    obj["window1"] = static_cast<Json::UInt64>(ev.window1);
                    obj["window2"] = static_cast<Json::UInt64>(ev.window2);
                    search_windows.append(std::move(obj));
                } else if constexpr (std::is_same_v<T, alignment_observer::match_event>) {
                    obj["index1"] = static_cast<Json::UInt64>(ev.index1);
                    obj["index2"] = static_cast<Json::UInt64>(ev.index2);
                    obj["distance_km"] = static_cast<double>(ev.distance);
                    matches.append(std::move(obj));
                } else if constexpr (std::is_same_v<T, alignment_observer::no_match_event>) {
                    obj["closest_km"] = static_cast<double>(ev.closest);
                    obj["tolerance_km"] = static_cast<double>(ev.tolerance);
                    no_matches.append(std::move(obj));
                }
            },
            event);
    }

    result["search_windows"] = std::move(search_windows);
    result["matches"] = std::move(matches);
    result["no_matches"] = std::move(no_matches);

    return result;
}

Json::Value serialize_result(const comparison_result& result) {
    Json::Value root;

    Json::Value metadata;
    metadata["num_points1"] = static_cast<Json::UInt64>(result.aligned1.size());
    metadata["num_points2"] = static_cast<Json::UInt64>(result.aligned2.size());
    metadata["num_resampled"] = static_cast<Json::UInt64>(result.resampled.size());
    metadata["total_distance1_km"] = static_cast<double>(result.aligned1.total_distance());
    metadata["total_distance2_km"] = static_cast<double>(result.aligned2.total_distance());
    metadata["offsets"] = serialize_offsets(result.offsets);
    metadata["matched"] = static_cast<Json::UInt64>(result.summary.matched);
    metadata["matched_fraction"] = result.summary.matched_fraction;
    root["metadata"] = std::move(metadata);

    root["aligned_track1"] = serialize_track(result.aligned1);
    root["aligned_track2"] = serialize_track(result.aligned2);
    root["resampled_track1"] = serialize_track(result.resampled);

    Json::Value flags(Json::arrayValue);
    for (const bool flag : result.within_tolerance) {
        flags.append(flag);
    }
    root["within_tolerance"] = std::move(flags);

    Json::Value runs(Json::arrayValue);
    for (const auto& run : result.summary.runs) {
        Json::Value obj;
        obj["begin"] = static_cast<Json::UInt64>(run.begin);
        obj["end"] = static_cast<Json::UInt64>(run.end);
        obj["within"] = run.within;
        runs.append(std::move(obj));
    }
    root["runs"] = std::move(runs);

    return root;
}

std::string write_string(const Json::Value& root) {
    // Format with indentation
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";

    return Json::writeString(writer, root);
}

}  // namespace

std::string serialize_comparison_to_json(const comparison_result& result) {
    return write_string(serialize_result(result));
}

std::string serialize_comparison_to_json(const comparison_result& result, const alignment_event_collector& collector) {
    Json::Value root = serialize_result(result);
    root["events"] = serialize_events(collector.events());
    return write_string(root);
}

void write_comparison_json(std::ostream& out, const comparison_result& result) {
    out << serialize_comparison_to_json(result);
}

void write_comparison_json(std::ostream& out, const comparison_result& result, const alignment_event_collector& collector) {
    out << serialize_comparison_to_json(result, collector);
}

}  // namespace routematch::track
