#pragma once

#include <string>
#include <vector>

#include <routematch/track/geo_point.hpp>

namespace routematch::track {

///
/// Capability that assigns an elevation to each of a sequence of points.
///
/// Implementations wrap whatever produces elevations (a terrain lookup, a
/// smoothing pass over recorded values, a fixed table in tests). The caller
/// picks the implementation explicitly; the profile and track code only sees
/// this interface.
///
/// Contract: the result has exactly one value per input point, in input order.
/// Callers check the count and raise length_mismatch_error otherwise.
///
class elevation_source {
   public:
    virtual ~elevation_source();

    ///
    /// Produces elevations for the given points.
    ///
    /// @param points Ordered points to look up
    /// @return Elevations in meters, same order and count as points
    ///
    virtual std::vector<double> elevations_for(const std::vector<geo_point>& points) const = 0;

    ///
    /// Short name for diagnostics.
    ///
    virtual std::string name() const = 0;
};

}  // namespace routematch::track
