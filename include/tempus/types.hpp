#pragma once

/// @file include/tempus/types.hpp
/// @brief Shared primitive types for the tempus temporal-value library.
///
/// All modules include this file. It defines the time axis, the closed set of
/// value domains a temporal value may range over, and the interpolation modes.

#include "tempus/constants.hpp"

#include <Eigen/Dense>

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace tempus {

// ─── Time Axis ────────────────────────────────────────────────────────────────

/// Signed distance between two timestamps, microsecond resolution.
using Duration = std::chrono::microseconds;

/// UTC instant with microsecond resolution.
using Timestamp = std::chrono::sys_time<Duration>;

/// Calendar day (used by DateSpan).
using Date = std::chrono::sys_days;

// ─── Interpolation ────────────────────────────────────────────────────────────

/// Policy for computing a value between two samples.
///
/// `None` is only carried by single instants; sequences are Discrete, Step or
/// Linear.
enum class Interpolation : std::uint8_t {
    None     = 0,
    Discrete = 1,
    Step     = 2,
    Linear   = 3,
};

[[nodiscard]] const char* to_string(Interpolation interp) noexcept;

// ─── Point ────────────────────────────────────────────────────────────────────

/// A 2D or 3D point with an optional spatial reference.
///
/// Geodetic points (longitude, latitude[, height]) are a separate value domain
/// (`ValueType::GeogPoint`); their distances come from a caller-supplied
/// DistanceMetric.
struct Point {
    Eigen::Vector3d coords{0.0, 0.0, 0.0};  ///< z is 0 when !has_z
    bool            has_z    = false;
    std::int32_t    srid     = constants::NO_SRID;
    bool            geodetic = false;

    [[nodiscard]] static Point xy(double x, double y,
                                  std::int32_t srid = constants::NO_SRID) {
        return Point{Eigen::Vector3d{x, y, 0.0}, false, srid, false};
    }

    [[nodiscard]] static Point xyz(double x, double y, double z,
                                   std::int32_t srid = constants::NO_SRID) {
        return Point{Eigen::Vector3d{x, y, z}, true, srid, false};
    }

    [[nodiscard]] double x() const noexcept { return coords.x(); }
    [[nodiscard]] double y() const noexcept { return coords.y(); }
    [[nodiscard]] double z() const noexcept { return coords.z(); }

    /// Same coordinate dimension, SRID and geodetic flag.
    [[nodiscard]] bool compatible_with(const Point& other) const noexcept {
        return has_z == other.has_z && srid == other.srid &&
               geodetic == other.geodetic;
    }
};

[[nodiscard]] bool operator==(const Point& a, const Point& b) noexcept;

/// Lexicographic on (x, y, z, srid).
[[nodiscard]] bool operator<(const Point& a, const Point& b) noexcept;

// ─── Value ────────────────────────────────────────────────────────────────────

/// Value domain of a temporal value.
enum class ValueType : std::uint8_t {
    Bool      = 1,
    Int       = 2,
    Float     = 3,
    Text      = 4,
    GeomPoint = 5,
    GeogPoint = 6,
};

[[nodiscard]] const char* to_string(ValueType type) noexcept;

/// Closed set of base values a temporal value may take.
using Value = std::variant<bool, std::int64_t, double, std::string, Point>;

/// Domain of a value. Points map to GeomPoint or GeogPoint by their flag.
[[nodiscard]] ValueType value_type(const Value& value) noexcept;

/// True for domains that admit Linear interpolation (Float and points).
[[nodiscard]] bool is_linear_interpolable(ValueType type) noexcept;

/// True for Int and Float.
[[nodiscard]] bool is_numeric(ValueType type) noexcept;

/// True for GeomPoint and GeogPoint.
[[nodiscard]] bool is_spatial(ValueType type) noexcept;

/// Numeric value as double. Precondition: is_numeric(value_type(value)).
[[nodiscard]] double as_double(const Value& value) noexcept;

/// Total order used by TInstant ordering and min/max queries.
/// Values of different domains order by their ValueType.
[[nodiscard]] bool value_less(const Value& a, const Value& b) noexcept;

}  // namespace tempus
