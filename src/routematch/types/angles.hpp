#pragma once

#include <cmath>
#include <numbers>
#include <utility>

namespace routematch {

///
/// Converts degrees to radians.
///
/// Uses perfect forwarding to work with scalars, arrays, and expression templates.
///
/// @param degrees Angle in degrees
/// @return Angle in radians
///
template <typename T>
[[nodiscard]] constexpr decltype(auto) degrees_to_radians(T&& degrees) {
    return std::forward<T>(degrees) * (std::numbers::pi / 180.0);
}

///
/// Converts radians to degrees.
///
/// @param radians Angle in radians
/// @return Angle in degrees
///
template <typename T>
[[nodiscard]] constexpr decltype(auto) radians_to_degrees(T&& radians) {
    return std::forward<T>(radians) * (180.0 / std::numbers::pi);
}

///
/// Checks that a latitude lies in [-90, 90] degrees.
///
[[nodiscard]] inline bool is_valid_latitude(double degrees) noexcept {
    return std::isfinite(degrees) && degrees >= -90.0 && degrees <= 90.0;
}

///
/// Checks that a longitude lies in [-180, 180] degrees.
///
[[nodiscard]] inline bool is_valid_longitude(double degrees) noexcept {
    return std::isfinite(degrees) && degrees >= -180.0 && degrees <= 180.0;
}

}  // namespace routematch
