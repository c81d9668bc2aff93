#pragma once

/// @file include/tempus/geometry.hpp
/// @brief Geometry capability consumed by spatial temporal values.
///
/// # Module: Geometry
///
/// ## Responsibility
/// Distances between points are an external primitive. Temporal points only
/// see the `DistanceMetric` interface; the library ships the planar metric and
/// callers plug in geodetic implementations (e.g. backed by a projection
/// library) for geography points.
///
/// ## NOT Responsible For
/// - Geodetic distance internals
/// - Spatial indexing

#include "tempus/types.hpp"

#include <optional>

namespace tempus {

/// Distance between two points of the same spatial reference.
class DistanceMetric {
public:
    virtual ~DistanceMetric() = default;

    [[nodiscard]] virtual double distance(const Point& a, const Point& b) const noexcept = 0;
};

/// Euclidean distance. Uses z only when both points carry it.
class PlanarMetric final : public DistanceMetric {
public:
    [[nodiscard]] double distance(const Point& a, const Point& b) const noexcept override;
};

/// Shared stateless planar metric.
[[nodiscard]] const DistanceMetric& planar_metric() noexcept;

/// Point at fraction `f` ∈ [0, 1] along the segment a → b.
[[nodiscard]] Point lerp(const Point& a, const Point& b, double f) noexcept;

/// Fraction along a → b at which the segment passes through `p`.
///
/// # Returns
/// - `f` ∈ [0, 1] when `p` lies on the segment within COORD_EPSILON
/// - nullopt otherwise, or when the segment is degenerate (a == b)
[[nodiscard]] std::optional<double>
locate_on_segment(const Point& a, const Point& b, const Point& p) noexcept;

}  // namespace tempus
