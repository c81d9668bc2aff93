#pragma once

/// @file include/tempus/interpolation.hpp
/// @brief Interpolation Engine: value of a temporal value between samples.
///
/// # Module: Interpolation Engine
///
/// ## Responsibility
/// Given two bracketing samples (v0, t0), (v1, t1) and a query time t with
/// t0 <= t <= t1, compute the value at t under an interpolation mode:
///
///   Discrete: defined only at t0 and t1
///   Step    : v0 on [t0, t1); v1 at t1 only when t1 closes the sequence with
///              an inclusive upper bound (right-continuous step function)
///   Linear  : v0 + (v1 − v0) · (t − t0)/(t1 − t0), exact at both ends
///
/// ## Guarantees
/// - Pure functions; no allocation beyond the returned value
/// - Never divides by zero: t0 == t1 is reported as DuplicateTimestamp

#include "tempus/error.hpp"
#include "tempus/tinstant.hpp"
#include "tempus/types.hpp"

#include <optional>

namespace tempus {

class Interpolator {
public:
    Interpolator() = delete;  // pure static: not instantiable

    /// Value at `t` between `start` and `end`.
    ///
    /// # Arguments
    /// * `final_upper_inclusive`: true when `end` is the last instant of its
    ///   sequence and the sequence's upper bound is inclusive
    ///
    /// # Returns
    /// - `NoValueAtTimestamp` if t is outside [t0, t1] or in a Discrete gap
    /// - `DuplicateTimestamp` if t0 == t1
    /// - `IncompatibleInterpolation` for Linear on a non-interpolable domain
    ///   or mode None
    [[nodiscard]] static Result<Value>
    interpolate(const TInstant& start, const TInstant& end, Timestamp t,
                Interpolation mode, bool final_upper_inclusive);

    /// Affine combination v0 + (v1 − v0) · f for Float and point values.
    [[nodiscard]] static Result<Value>
    linear(const Value& v0, const Value& v1, double fraction);

    /// Fraction of the elapsed time between t0 and t1 at t.
    /// Precondition: t0 < t1.
    [[nodiscard]] static double
    fraction(Timestamp t0, Timestamp t1, Timestamp t) noexcept;

    /// Timestamp at `fraction` of [t0, t1], rounded to the microsecond.
    [[nodiscard]] static Timestamp
    at_fraction(Timestamp t0, Timestamp t1, double fraction) noexcept;

    /// Fraction ∈ [0, 1] at which a linear segment v0 → v1 takes `target`.
    ///
    /// # Returns
    /// nullopt when the segment never takes the value or is constant (a
    /// constant segment equal to `target` takes it everywhere; callers test
    /// that case with value equality).
    [[nodiscard]] static std::optional<double>
    locate(const Value& v0, const Value& v1, const Value& target) noexcept;
};

}  // namespace tempus
