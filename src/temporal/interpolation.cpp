/// @file src/temporal/interpolation.cpp
/// @brief Interpolator: value between two bracketing samples.

#include "tempus/interpolation.hpp"
#include "tempus/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace tempus {

// ─── Interpolator::interpolate ────────────────────────────────────────────────

Result<Value>
Interpolator::interpolate(const TInstant& start, const TInstant& end, Timestamp t,
                          Interpolation mode, bool final_upper_inclusive) {
    const Timestamp t0 = start.timestamp();
    const Timestamp t1 = end.timestamp();
    if (t0 == t1) {
        return Error::make(ErrorKind::DuplicateTimestamp,
                           "bracketing instants share a timestamp");
    }
    if (t1 < t0) {
        return Error::make(ErrorKind::UnorderedInstants,
                           "bracketing instants are out of order");
    }
    if (t < t0 || t1 < t) {
        return Error::make(ErrorKind::NoValueAtTimestamp,
                           "timestamp outside the bracketing instants");
    }

    switch (mode) {
        case Interpolation::None:
            break;

        case Interpolation::Discrete:
            if (t == t0) return start.value();
            if (t == t1) return end.value();
            return Error::make(ErrorKind::NoValueAtTimestamp,
                               "discrete value undefined between samples");

        case Interpolation::Step:
            // Right-continuous: the end value only closes the sequence.
            if (t == t1 && final_upper_inclusive) return end.value();
            return start.value();

        case Interpolation::Linear:
            if (!is_linear_interpolable(start.value_type())) break;
            if (t == t0) return start.value();
            if (t == t1) return end.value();
            return linear(start.value(), end.value(), fraction(t0, t1, t));
    }
    return Error::make(ErrorKind::IncompatibleInterpolation,
                       std::string("interpolation ") + to_string(mode) +
                       " not valid for " + to_string(start.value_type()));
}

// ─── Interpolator::linear ─────────────────────────────────────────────────────

Result<Value>
Interpolator::linear(const Value& v0, const Value& v1, double f) {
    if (const auto* a = std::get_if<double>(&v0)) {
        if (const auto* b = std::get_if<double>(&v1)) {
            if (f == 0.0) return *a;
            if (f == 1.0) return *b;
            return *a + (*b - *a) * f;
        }
    }
    if (const auto* a = std::get_if<Point>(&v0)) {
        if (const auto* b = std::get_if<Point>(&v1)) {
            if (!a->compatible_with(*b)) {
                return Error::make(ErrorKind::TypeMismatch,
                                   "points differ in SRID or dimension");
            }
            return lerp(*a, *b, f);
        }
    }
    if (v0.index() != v1.index()) {
        return Error::make(ErrorKind::TypeMismatch, "values of different domains");
    }
    return Error::make(ErrorKind::IncompatibleInterpolation,
                       std::string("linear interpolation not valid for ") +
                       to_string(value_type(v0)));
}

// ─── Time fractions ───────────────────────────────────────────────────────────

double Interpolator::fraction(Timestamp t0, Timestamp t1, Timestamp t) noexcept {
    return static_cast<double>((t - t0).count()) /
           static_cast<double>((t1 - t0).count());
}

Timestamp Interpolator::at_fraction(Timestamp t0, Timestamp t1, double f) noexcept {
    const double offset = f * static_cast<double>((t1 - t0).count());
    return t0 + Duration{std::llround(offset)};
}

// ─── Interpolator::locate ─────────────────────────────────────────────────────

std::optional<double>
Interpolator::locate(const Value& v0, const Value& v1, const Value& target) noexcept {
    if (const auto* a = std::get_if<double>(&v0)) {
        const auto* b = std::get_if<double>(&v1);
        const auto* x = std::get_if<double>(&target);
        if (!b || !x || *a == *b) return std::nullopt;
        if (*x < std::min(*a, *b) || *x > std::max(*a, *b)) return std::nullopt;
        return std::clamp((*x - *a) / (*b - *a), 0.0, 1.0);
    }
    if (const auto* a = std::get_if<Point>(&v0)) {
        const auto* b = std::get_if<Point>(&v1);
        const auto* x = std::get_if<Point>(&target);
        if (!b || !x || !a->compatible_with(*x)) return std::nullopt;
        return locate_on_segment(*a, *b, *x);
    }
    return std::nullopt;
}

}  // namespace tempus
