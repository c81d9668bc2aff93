/// @file src/geometry/geometry.cpp
/// @brief Planar metric and segment helpers for point values.

#include "tempus/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace tempus {

namespace {

/// Coordinates used for a planar computation: z is dropped unless both
/// points are 3D.
Eigen::Vector3d planar_delta(const Point& a, const Point& b) noexcept {
    Eigen::Vector3d d = b.coords - a.coords;
    if (!(a.has_z && b.has_z)) d.z() = 0.0;
    return d;
}

}  // namespace

// ─── PlanarMetric ─────────────────────────────────────────────────────────────

double PlanarMetric::distance(const Point& a, const Point& b) const noexcept {
    return planar_delta(a, b).norm();
}

const DistanceMetric& planar_metric() noexcept {
    static const PlanarMetric metric;
    return metric;
}

// ─── Segment helpers ──────────────────────────────────────────────────────────

Point lerp(const Point& a, const Point& b, double f) noexcept {
    Point p = a;
    p.coords = a.coords + (b.coords - a.coords) * f;
    // Keep the end points exact.
    if (f == 0.0) p.coords = a.coords;
    if (f == 1.0) p.coords = b.coords;
    return p;
}

std::optional<double>
locate_on_segment(const Point& a, const Point& b, const Point& p) noexcept {
    const Eigen::Vector3d ab = planar_delta(a, b);
    const double len2 = ab.squaredNorm();
    if (len2 <= 0.0) {
        return std::nullopt;
    }
    const Eigen::Vector3d ap = planar_delta(a, p);
    const double f = ap.dot(ab) / len2;
    if (f < -constants::COORD_EPSILON || f > 1.0 + constants::COORD_EPSILON) {
        return std::nullopt;
    }
    // Distance from p to its projection on the segment.
    const Eigen::Vector3d off = ap - ab * f;
    if (off.norm() > constants::COORD_EPSILON * std::max(1.0, std::sqrt(len2))) {
        return std::nullopt;
    }
    return std::clamp(f, 0.0, 1.0);
}

}  // namespace tempus
