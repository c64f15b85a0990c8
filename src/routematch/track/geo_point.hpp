#pragma once

#include <optional>
#include <ostream>

#include <routematch/types/kilometers.hpp>

namespace routematch::track {

///
/// Immutable geographic position with optional elevation.
///
/// Latitude and longitude are decimal degrees; elevation is meters above sea
/// level. Ranges are assumed valid rather than enforced, as the distance
/// computations only need finite values.
///
/// Changing a field yields a new value:
/// @code
///   const geo_point p{48.76, 11.42};
///   const geo_point q = p.with_elevation(371.0);
///   const kilometers d = haversine_distance(p, q);  // 0 km, elevation is ignored
/// @endcode
///
class geo_point {
   public:
    ///
    /// Constructs a point.
    ///
    /// @param latitude Latitude in degrees
    /// @param longitude Longitude in degrees
    /// @param elevation Elevation in meters, if known
    ///
    constexpr geo_point(double latitude, double longitude, std::optional<double> elevation = std::nullopt) noexcept
        : latitude_{latitude}, longitude_{longitude}, elevation_{elevation} {}

    constexpr double latitude() const noexcept {
        return latitude_;
    }

    constexpr double longitude() const noexcept {
        return longitude_;
    }

    constexpr const std::optional<double>& elevation() const noexcept {
        return elevation_;
    }

    constexpr bool has_elevation() const noexcept {
        return elevation_.has_value();
    }

    ///
    /// Returns a copy of this point carrying the given elevation.
    ///
    /// @param meters New elevation in meters
    /// @return Point at the same position with the new elevation
    ///
    [[nodiscard]] constexpr geo_point with_elevation(double meters) const noexcept {
        return geo_point{latitude_, longitude_, meters};
    }

    ///
    /// Returns a copy of this point with the elevation removed.
    ///
    [[nodiscard]] constexpr geo_point without_elevation() const noexcept {
        return geo_point{latitude_, longitude_};
    }

    ///
    /// Great-circle distance from this point to another.
    ///
    /// @param other Destination point
    /// @param radius Sphere radius
    /// @return Haversine distance
    ///
    kilometers distance_to(const geo_point& other, kilometers radius = k_earth_radius) const noexcept;

    constexpr bool operator==(const geo_point&) const = default;

   private:
    double latitude_;
    double longitude_;
    std::optional<double> elevation_;
};

///
/// Great-circle distance between two points by the haversine formula.
///
/// Elevation does not participate. The result is symmetric and exactly zero for
/// identical positions.
///
/// @param a First point
/// @param b Second point
/// @param radius Sphere radius, k_earth_radius unless a test injects another
/// @return Distance along the sphere surface
///
kilometers haversine_distance(const geo_point& a, const geo_point& b, kilometers radius = k_earth_radius) noexcept;

///
/// Streams point as (lat, lon[, elev m]) for test output.
///
std::ostream& operator<<(std::ostream& os, const geo_point& p);

}  // namespace routematch::track
