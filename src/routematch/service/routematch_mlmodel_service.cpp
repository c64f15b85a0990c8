#include <routematch/service/routematch_mlmodel_service.hpp>

#include <cmath>
#include <cstdint>
#include <ios>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/variant/get.hpp>

#include <viam/sdk/log/logging.hpp>

#include <routematch/track/comparison.hpp>
#include <routematch/track/errors.hpp>
#include <routematch/track/geo_point.hpp>
#include <routematch/track/track.hpp>
#include <routematch/types/angles.hpp>

namespace routematch {

namespace {

namespace vsdk = ::viam::sdk;

// Holds owned output data and the named_tensor_views that reference it.
// Returned via an aliasing shared_ptr so the views remain valid for the caller.
struct infer_result {
    std::vector<double> aligned_track1;
    std::vector<double> aligned_track2;
    std::vector<double> resampled_track1;
    std::vector<std::uint8_t> within_tolerance;
    std::vector<std::int64_t> alignment_offsets;
    std::vector<double> matched_fraction;
    routematch_mlmodel_service::named_tensor_views views;
};

template <typename T>
std::optional<T> find_config_attribute(const vsdk::ResourceConfig& cfg, const std::string& attribute) {
    const auto key = cfg.attributes().find(attribute);
    if (key == cfg.attributes().end()) {
        return std::nullopt;
    }
    const auto* const val = key->second.get<T>();
    if (!val) {
        std::ostringstream buffer;
        buffer << "attribute `" << attribute << "` could not be converted to the required type";
        throw std::invalid_argument(buffer.str());
    }
    return std::make_optional(*val);
}

// Extract a required tensor_view<double> from the input map.
const auto& get_double_tensor(const routematch_mlmodel_service::named_tensor_views& inputs, const std::string& name) {
    const auto it = inputs.find(name);
    if (it == inputs.end()) {
        throw std::invalid_argument("missing required input tensor: " + name);
    }
    const auto* view = boost::get<routematch_mlmodel_service::tensor_view<double>>(&it->second);
    if (!view) {
        throw std::invalid_argument("input tensor '" + name + "' has wrong type (expected float64)");
    }
    return *view;
}

// Extract an optional scalar double from a shape-[1] tensor.
std::optional<double> find_scalar_double(const routematch_mlmodel_service::named_tensor_views& inputs, const std::string& name) {
    if (inputs.find(name) == inputs.end()) {
        return std::nullopt;
    }
    const auto& view = get_double_tensor(inputs, name);
    if (view.size() != 1) {
        throw std::invalid_argument("input tensor '" + name + "' must be a scalar (shape [1])");
    }
    return view.flat(0);
}

// Decode an [n, 3] tensor of (latitude, longitude, elevation) rows; NaN elevation means absent.
track::track get_track(const routematch_mlmodel_service::named_tensor_views& inputs, const std::string& name) {
    const auto& view = get_double_tensor(inputs, name);
    if (view.dimension() != 2 || view.shape(1) != 3) {
        throw std::invalid_argument(name + " must be 2-dimensional [n_points, 3]");
    }

    std::vector<track::geo_point> points;
    points.reserve(view.shape(0));
    for (std::size_t i = 0; i < view.shape(0); ++i) {
        const double latitude = view(i, 0);
        const double longitude = view(i, 1);
        const double elevation = view(i, 2);
        if (!is_valid_latitude(latitude) || !is_valid_longitude(longitude)) {
            std::ostringstream buffer;
            buffer << name << ": point " << i << " has invalid coordinates (" << latitude << ", " << longitude << ")";
            throw std::invalid_argument(buffer.str());
        }
        points.emplace_back(latitude, longitude, std::isnan(elevation) ? std::nullopt : std::optional{elevation});
    }
    return track::track{std::move(points)};
}

// Flatten a track into [n, 3] row-major storage; absent elevations become NaN.
std::vector<double> flatten(const track::track& t) {
    std::vector<double> result;
    result.reserve(t.size() * 3);
    for (const auto& p : t.points()) {
        result.push_back(p.latitude());
        result.push_back(p.longitude());
        result.push_back(p.elevation().value_or(std::numeric_limits<double>::quiet_NaN()));
    }
    return result;
}

}  // namespace

routematch_mlmodel_service::routematch_mlmodel_service(vsdk::Dependencies deps, vsdk::ResourceConfig config)
    : MLModelService(config.name()) {
    reconfigure(deps, config);
}

std::vector<std::string> routematch_mlmodel_service::validate(const vsdk::ResourceConfig&) {
    return {};
}

void routematch_mlmodel_service::reconfigure(const vsdk::Dependencies&, const vsdk::ResourceConfig& cfg) try {
    config new_config;

    if (const auto tolerance = find_config_attribute<double>(cfg, "tolerance_km")) {
        if (!(*tolerance >= 0.0)) {
            throw std::invalid_argument("tolerance_km must be a non-negative number, got " + std::to_string(*tolerance));
        }
        new_config.tolerance = kilometers{*tolerance};
    }

    if (const auto method = find_config_attribute<std::string>(cfg, "method")) {
        try {
            new_config.method = track::parse_match_method(*method);
        } catch (const track::invalid_input_error& ex) {
            throw std::invalid_argument(std::string{"method: "} + ex.what());
        }
    }

    if (const auto include_elevation = find_config_attribute<bool>(cfg, "include_elevation")) {
        new_config.include_elevation = *include_elevation;
    }

    if (const auto fraction = find_config_attribute<double>(cfg, "boundary_fraction")) {
        if (!(*fraction > 0.0 && *fraction <= 1.0)) {
            throw std::invalid_argument("boundary_fraction must be in (0, 1], got " + std::to_string(*fraction));
        }
        new_config.boundary_fraction = *fraction;
    }

    VIAM_SDK_LOG(info) << "routematch configured: tolerance " << new_config.tolerance << ", method "
                       << track::to_string(new_config.method) << ", include_elevation " << std::boolalpha
                       << new_config.include_elevation << ", boundary_fraction " << new_config.boundary_fraction;

    const std::unique_lock lock{config_mutex_};
    config_ = std::move(new_config);
} catch (const std::exception& ex) {
    VIAM_SDK_LOG(error) << "rejecting routematch configuration: " << ex.what();
    throw;
}

std::shared_ptr<routematch_mlmodel_service::named_tensor_views> routematch_mlmodel_service::infer(const named_tensor_views& inputs,
                                                                                                  const vsdk::ProtoStruct&) {
    // Snapshot config under the read lock, then release
    config local_config;
    {
        const std::shared_lock lock{config_mutex_};
        local_config = config_;
    }

    const auto track1 = get_track(inputs, "track1_points");
    const auto track2 = get_track(inputs, "track2_points");

    kilometers tolerance = local_config.tolerance;
    if (const auto override_km = find_scalar_double(inputs, "tolerance_km")) {
        if (!(*override_km >= 0.0)) {
            throw std::invalid_argument("tolerance_km must be non-negative, got " + std::to_string(*override_km));
        }
        tolerance = kilometers{*override_km};
    }

    const auto comparison = track::compare_tracks(track1,
                                                  track2,
                                                  {
                                                      .alignment = {.tolerance = tolerance,
                                                                    .boundary_fraction = local_config.boundary_fraction,
                                                                    .observer = nullptr},
                                                      .matching = {.tolerance = tolerance,
                                                                   .include_elevation = local_config.include_elevation},
                                                      .method = local_config.method,
                                                  });

    VIAM_SDK_LOG(debug) << "compared tracks of " << track1.size() << " and " << track2.size() << " points: " << comparison.summary.matched
                        << "/" << comparison.summary.total << " within " << tolerance << " ("
                        << track::to_string(local_config.method) << ")";

    // Pack output using aliasing shared_ptr for zero-copy output
    auto result_holder = std::make_shared<infer_result>();
    result_holder->aligned_track1 = flatten(comparison.aligned1);
    result_holder->aligned_track2 = flatten(comparison.aligned2);
    result_holder->resampled_track1 = flatten(comparison.resampled);
    result_holder->within_tolerance.assign(comparison.within_tolerance.begin(), comparison.within_tolerance.end());
    result_holder->alignment_offsets = {
        static_cast<std::int64_t>(comparison.offsets.start1),
        static_cast<std::int64_t>(comparison.offsets.end1),
        static_cast<std::int64_t>(comparison.offsets.start2),
        static_cast<std::int64_t>(comparison.offsets.end2),
    };
    result_holder->matched_fraction = {comparison.summary.matched_fraction};

    const auto n1 = comparison.aligned1.size();
    const auto n2 = comparison.aligned2.size();
    const auto n_resampled = comparison.resampled.size();
    const auto n_flags = result_holder->within_tolerance.size();

    result_holder->views.emplace("aligned_track1", make_tensor_view(result_holder->aligned_track1.data(), n1 * 3, {n1, 3}));
    result_holder->views.emplace("aligned_track2", make_tensor_view(result_holder->aligned_track2.data(), n2 * 3, {n2, 3}));
    result_holder->views.emplace("resampled_track1",
                                 make_tensor_view(result_holder->resampled_track1.data(), n_resampled * 3, {n_resampled, 3}));
    result_holder->views.emplace("within_tolerance", make_tensor_view(result_holder->within_tolerance.data(), n_flags, {n_flags}));
    result_holder->views.emplace("alignment_offsets", make_tensor_view(result_holder->alignment_offsets.data(), 4, {4}));
    result_holder->views.emplace("matched_fraction", make_tensor_view(result_holder->matched_fraction.data(), 1, {1}));

    auto* views = &result_holder->views;
    return {std::move(result_holder), views};
}

struct routematch_mlmodel_service::metadata routematch_mlmodel_service::metadata(const vsdk::ProtoStruct&) {
    const std::shared_lock lock{config_mutex_};
    return {
        .name = "routematch",
        .type = "other",
        .description = "Endpoint alignment and point-wise tolerance comparison of two GPS tracks",
        .inputs =
            {
                {.name = "track1_points",
                 .description = "Track to resample: latitude (deg), longitude (deg), elevation (m, NaN if absent) [n_points, 3]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 3},
                 .associated_files = {},
                 .extra = {}},
                {.name = "track2_points",
                 .description = "Reference track: latitude (deg), longitude (deg), elevation (m, NaN if absent) [n_points, 3]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 3},
                 .associated_files = {},
                 .extra = {}},
                {.name = "tolerance_km",
                 .description = "Optional override of the configured tolerance (in kilometers) [scalar]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {1},
                 .associated_files = {},
                 .extra = {}},
            },
        .outputs =
            {
                {.name = "aligned_track1",
                 .description = "Track 1 truncated to the common endpoints [n_aligned1, 3]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 3},
                 .associated_files = {},
                 .extra = {}},
                {.name = "aligned_track2",
                 .description = "Track 2 truncated to the common endpoints [n_aligned2, 3]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 3},
                 .associated_files = {},
                 .extra = {}},
                {.name = "resampled_track1",
                 .description = "Aligned track 1 resampled onto the aligned track 2 point count [n_aligned2, 3]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {-1, 3},
                 .associated_files = {},
                 .extra = {}},
                {.name = "within_tolerance",
                 .description = "1 where a resampled point lies within tolerance of its counterpart, else 0 [n_aligned2]",
                 .data_type = tensor_info::data_types::k_uint8,
                 .shape = {-1},
                 .associated_files = {},
                 .extra = {}},
                {.name = "alignment_offsets",
                 .description = "Inclusive indices start1, end1, start2, end2 into the input tracks [4]",
                 .data_type = tensor_info::data_types::k_int64,
                 .shape = {4},
                 .associated_files = {},
                 .extra = {}},
                {.name = "matched_fraction",
                 .description = "Share of points within tolerance [scalar]",
                 .data_type = tensor_info::data_types::k_float64,
                 .shape = {1},
                 .associated_files = {},
                 .extra = {}},
            },
    };
}

}  // namespace routematch
