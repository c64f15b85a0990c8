#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <viam/sdk/config/resource.hpp>
#include <viam/sdk/resource/reconfigurable.hpp>
#include <viam/sdk/services/mlmodel.hpp>

#include <routematch/track/alignment.hpp>
#include <routematch/track/tolerance.hpp>
#include <routematch/types/kilometers.hpp>

namespace routematch {

///
/// MLModel service comparing two recordings of the same route.
///
/// Each infer() call aligns the endpoints of `track1_points` and `track2_points`,
/// resamples the aligned track1 onto the aligned track2's point count and reports
/// which resampled points lie within tolerance of their counterparts.
///
class routematch_mlmodel_service final : public ::viam::sdk::MLModelService, public ::viam::sdk::Reconfigurable {
   public:
    routematch_mlmodel_service(::viam::sdk::Dependencies deps, ::viam::sdk::ResourceConfig config);

    ///
    /// Replaces the service configuration.
    ///
    /// @throws std::invalid_argument if any attribute has the wrong type or an out-of-range value;
    ///         the previous configuration stays in effect
    ///
    void reconfigure(const ::viam::sdk::Dependencies&, const ::viam::sdk::ResourceConfig&) override;

    std::shared_ptr<named_tensor_views> infer(const named_tensor_views& inputs, const ::viam::sdk::ProtoStruct& extra) override;

    struct metadata metadata(const ::viam::sdk::ProtoStruct& extra) override;

    static std::vector<std::string> validate(const ::viam::sdk::ResourceConfig& cfg);

   private:
    struct config {
        kilometers tolerance{track::tolerance_options::k_default_tolerance};
        track::match_method method{track::match_method::k_direct};
        bool include_elevation = false;
        double boundary_fraction = track::alignment_options::k_default_boundary_fraction;
    };

    mutable std::shared_mutex config_mutex_;
    config config_;
};

}  // namespace routematch
