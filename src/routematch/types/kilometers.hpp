#pragma once

#include <cmath>
#include <compare>
#include <ostream>

namespace routematch {

///
/// Strong type for great-circle and along-track distances.
///
/// Keeps distances from being mixed up with degrees, meters of elevation or
/// plain ratios. Conversion to and from double is explicit.
///
class kilometers {
   public:
    ///
    /// Constructs from raw double value.
    ///
    /// @param v Distance in kilometers
    ///
    explicit constexpr kilometers(double v) noexcept : value_{v} {}

    ///
    /// Constructs from a distance given in meters.
    ///
    /// @param m Distance in meters
    /// @return Equivalent distance in kilometers
    ///
    static constexpr kilometers from_meters(double m) noexcept {
        return kilometers{m / 1000.0};
    }

    ///
    /// Converts to double explicitly.
    ///
    /// @return Distance in kilometers as double
    ///
    explicit constexpr operator double() const noexcept {
        return value_;
    }

    ///
    /// Gets the distance in meters.
    ///
    constexpr double meters() const noexcept {
        return value_ * 1000.0;
    }

    // clang-format off
    constexpr auto operator<=>(const kilometers&) const = default;
    // clang-format on

    constexpr kilometers& operator+=(kilometers other) noexcept {
        value_ += other.value_;
        return *this;
    }

    constexpr kilometers& operator-=(kilometers other) noexcept {
        value_ -= other.value_;
        return *this;
    }

    constexpr kilometers& operator*=(double scalar) noexcept {
        value_ *= scalar;
        return *this;
    }

    constexpr kilometers& operator/=(double scalar) noexcept {
        value_ /= scalar;
        return *this;
    }

    constexpr kilometers operator-() const noexcept {
        return kilometers{-value_};
    }

   private:
    double value_;
};

constexpr kilometers operator+(kilometers lhs, kilometers rhs) noexcept {
    return lhs += rhs;
}

constexpr kilometers operator-(kilometers lhs, kilometers rhs) noexcept {
    return lhs -= rhs;
}

constexpr kilometers operator*(kilometers len, double scalar) noexcept {
    return len *= scalar;
}

constexpr kilometers operator*(double scalar, kilometers len) noexcept {
    return len *= scalar;
}

constexpr kilometers operator/(kilometers len, double scalar) noexcept {
    return len /= scalar;
}

///
/// Divides two distances, yielding a dimensionless ratio.
///
constexpr double operator/(kilometers lhs, kilometers rhs) noexcept {
    return static_cast<double>(lhs) / static_cast<double>(rhs);
}

///
/// Streams distance for debugging and test output.
///
inline std::ostream& operator<<(std::ostream& os, kilometers len) {
    return os << static_cast<double>(len) << "km";
}

inline kilometers abs(kilometers len) noexcept {
    return kilometers{std::abs(static_cast<double>(len))};
}

///
/// Mean Earth radius used by every great-circle computation.
///
/// Tolerance thresholds are calibrated against this exact value.
///
inline constexpr kilometers k_earth_radius{6371.0};

}  // namespace routematch
