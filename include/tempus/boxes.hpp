#pragma once

/// @file include/tempus/boxes.hpp
/// @brief Bounding boxes of numeric (TBox) and spatial (STBox) temporal values.
///
/// Boxes are derived from the instants of a temporal value; they are never
/// stored independently of it.

#include "tempus/span.hpp"
#include "tempus/types.hpp"

#include <Eigen/Geometry>

#include <cstdint>
#include <span>
#include <string>

namespace tempus {

// ─── TBox ─────────────────────────────────────────────────────────────────────

/// Value range × time span of a numeric temporal value.
struct TBox {
    FloatSpan value;
    TsTzSpan  period;

    [[nodiscard]] bool overlaps(const TBox& other) const noexcept;
    [[nodiscard]] bool contains(const TBox& other) const noexcept;

    /// Smallest box enclosing both.
    [[nodiscard]] TBox expand(const TBox& other) const;

    /// `TBOXFLOAT XT([1.5, 2.5],[2000-01-01 ..., ...])`
    [[nodiscard]] std::string to_string() const;
};

// ─── STBox ────────────────────────────────────────────────────────────────────

/// Spatial extent × time span of a point temporal value.
struct STBox {
    Eigen::AlignedBox3d extent;
    bool                has_z    = false;
    std::int32_t        srid     = 0;
    bool                geodetic = false;
    TsTzSpan            period;

    /// Box of a single point at a single instant.
    [[nodiscard]] static STBox from_point(const Point& p, Timestamp t);

    [[nodiscard]] bool overlaps(const STBox& other) const noexcept;
    [[nodiscard]] bool contains(const STBox& other) const noexcept;

    /// Smallest box enclosing both.
    [[nodiscard]] STBox expand(const STBox& other) const;

    /// Grow the spatial extent by `distance` in every dimension.
    [[nodiscard]] STBox expand_space(double distance) const;

    /// `STBOX XT(((1,1),(2,2)),[2000-01-01 ..., ...])`
    [[nodiscard]] std::string to_string() const;
};

}  // namespace tempus
