/// @file src/boxes/boxes.cpp
/// @brief TBox and STBox predicates, union and rendering.

#include "tempus/boxes.hpp"
#include "tempus/time.hpp"

#include <fmt/format.h>

namespace tempus {

namespace {

std::string period_text(const TsTzSpan& period) {
    return fmt::format("{}{}, {}{}", period.lower_inc() ? '[' : '(',
                       format_timestamp(period.lower()),
                       format_timestamp(period.upper()),
                       period.upper_inc() ? ']' : ')');
}

std::string corner_text(const Eigen::Vector3d& c, bool has_z) {
    if (has_z) return fmt::format("({},{},{})", c.x(), c.y(), c.z());
    return fmt::format("({},{})", c.x(), c.y());
}

}  // namespace

// ─── TBox ─────────────────────────────────────────────────────────────────────

bool TBox::overlaps(const TBox& other) const noexcept {
    return value.overlaps(other.value) && period.overlaps(other.period);
}

bool TBox::contains(const TBox& other) const noexcept {
    return value.contains(other.value) && period.contains(other.period);
}

TBox TBox::expand(const TBox& other) const {
    return TBox{*value.union_with(other.value, false),
                *period.union_with(other.period, false)};
}

std::string TBox::to_string() const {
    return fmt::format("TBOXFLOAT XT({}{}, {}{},{})", value.lower_inc() ? '[' : '(',
                       value.lower(), value.upper(), value.upper_inc() ? ']' : ')',
                       period_text(period));
}

// ─── STBox ────────────────────────────────────────────────────────────────────

STBox STBox::from_point(const Point& p, Timestamp t) {
    return STBox{Eigen::AlignedBox3d(p.coords, p.coords), p.has_z, p.srid,
                 p.geodetic, TsTzSpan::singleton(t)};
}

bool STBox::overlaps(const STBox& other) const noexcept {
    return extent.intersects(other.extent) && period.overlaps(other.period);
}

bool STBox::contains(const STBox& other) const noexcept {
    return extent.contains(other.extent) && period.contains(other.period);
}

STBox STBox::expand(const STBox& other) const {
    STBox out = *this;
    out.extent = extent.merged(other.extent);
    out.period = *period.union_with(other.period, false);
    return out;
}

STBox STBox::expand_space(double distance) const {
    STBox out = *this;
    Eigen::Vector3d grow{distance, distance, has_z ? distance : 0.0};
    out.extent.min() -= grow;
    out.extent.max() += grow;
    return out;
}

std::string STBox::to_string() const {
    const std::string srid_prefix = srid != constants::NO_SRID
        ? fmt::format("SRID={};", srid) : std::string{};
    return fmt::format("{}{} {}T(({},{}),{})", srid_prefix,
                       geodetic ? "GEODSTBOX" : "STBOX", has_z ? 'Z' : 'X',
                       corner_text(extent.min(), has_z),
                       corner_text(extent.max(), has_z),
                       period_text(period));
}

}  // namespace tempus
