#pragma once

/// @file include/tempus/operations.hpp
/// @brief Base-value operations lifted over temporal values.
///
/// # Module: Temporal Operations
///
/// ## Responsibility
/// Arithmetic on temporal numbers, logic on temporal booleans, comparison
/// against a constant, instant accessors and point kinematics. Every function
/// takes and returns `Temporal`, so callers never dispatch on the subtype.
///
/// ## Synchronisation
/// An operation on two temporal values is evaluated on their common time only.
/// Continuous operands are cut at the union of their instants; a Discrete
/// operand (or an instant) samples the other at its own timestamps. Where a
/// Step operand jumps inside a Linear result, the result is split into
/// separate sequences.
///
/// ## Result shapes
/// - With a constant operand the result keeps the subtype of the temporal one
/// - With two temporal operands, an instant operand gives an instant and
///   anything else gives a sequence set (empty when no time is shared)
/// - Int ⊕ Int stays Int except for division; anything else is Float

#include "tempus/error.hpp"
#include "tempus/geometry.hpp"
#include "tempus/temporal.hpp"
#include "tempus/types.hpp"

#include <vector>

namespace tempus {

// ─── Accessors ────────────────────────────────────────────────────────────────

/// First / last value. `InvalidArgument` for an empty sequence set.
[[nodiscard]] Result<Value> start_value(const Temporal& temporal);
[[nodiscard]] Result<Value> end_value(const Temporal& temporal);

/// Instant holding the smallest / largest value, the earliest one on ties.
///
/// # Returns
/// - `TypeMismatch` for points
/// - `InvalidArgument` for an empty sequence set
[[nodiscard]] Result<TInstant> min_instant(const Temporal& temporal);
[[nodiscard]] Result<TInstant> max_instant(const Temporal& temporal);

/// Distinct instant values in ascending order.
[[nodiscard]] std::vector<Value> value_set(const Temporal& temporal);

// ─── Temporal numbers ─────────────────────────────────────────────────────────

/// `temporal ⊕ value` at every instant.
///
/// # Returns
/// - `TypeMismatch` unless both operands are Int or Float
/// - `InvalidArgument` for division by zero or Int overflow
[[nodiscard]] Result<Temporal> add(const Temporal& temporal, const Value& value);
[[nodiscard]] Result<Temporal> sub(const Temporal& temporal, const Value& value);
[[nodiscard]] Result<Temporal> mul(const Temporal& temporal, const Value& value);
[[nodiscard]] Result<Temporal> div(const Temporal& temporal, const Value& value);

/// `lhs ⊕ rhs` on the common time of both operands.
///
/// Products of two Linear operands gain an instant where the product turns.
/// Quotients of Linear operands are interpolated linearly between the cuts.
///
/// # Returns
/// - `TypeMismatch` unless both operands are temporal numbers
/// - `InvalidArgument` where the divisor is or crosses zero
/// - `NoValueAtTimestamp` when an instant operand has no counterpart
[[nodiscard]] Result<Temporal> add(const Temporal& lhs, const Temporal& rhs);
[[nodiscard]] Result<Temporal> sub(const Temporal& lhs, const Temporal& rhs);
[[nodiscard]] Result<Temporal> mul(const Temporal& lhs, const Temporal& rhs);
[[nodiscard]] Result<Temporal> div(const Temporal& lhs, const Temporal& rhs);

/// Absolute value; Linear segments crossing zero gain an instant at the zero.
[[nodiscard]] Result<Temporal> abs(const Temporal& temporal);

/// Float values rounded to `digits` decimals; Int values are unchanged.
/// `InvalidArgument` for negative digits.
[[nodiscard]] Result<Temporal> round(const Temporal& temporal, int digits);

/// Change between successive instants as a Step value.
///
/// Instant i carries `v[i+1] - v[i]`; the last instant repeats the final change
/// and the upper bound becomes exclusive. Members of a set with a single
/// instant are dropped.
///
/// # Returns
/// - `UndefinedForDiscrete` for instants and Discrete sequences
/// - `InvalidArgument` for a one-instant sequence
[[nodiscard]] Result<Temporal> delta_value(const Temporal& temporal);

// ─── Temporal booleans ────────────────────────────────────────────────────────

/// `TypeMismatch` unless the temporal operands are temporal booleans.
[[nodiscard]] Result<Temporal> logical_not(const Temporal& temporal);
[[nodiscard]] Result<Temporal> logical_and(const Temporal& temporal, bool value);
[[nodiscard]] Result<Temporal> logical_or(const Temporal& temporal, bool value);
[[nodiscard]] Result<Temporal> logical_and(const Temporal& lhs, const Temporal& rhs);
[[nodiscard]] Result<Temporal> logical_or(const Temporal& lhs, const Temporal& rhs);

// ─── Comparison ───────────────────────────────────────────────────────────────

/// Temporal boolean that is true wherever `temporal` equals `value`.
///
/// Instants and Discrete sequences keep their shape. A continuous sequence
/// gives a Step sequence set, since the value may be met at single instants
/// (the crossings of a Linear segment).
///
/// `TypeMismatch` when `value` is of another domain.
[[nodiscard]] Result<Temporal> temporal_eq(const Temporal& temporal, const Value& value);
[[nodiscard]] Result<Temporal> temporal_ne(const Temporal& temporal, const Value& value);

// ─── Temporal points ──────────────────────────────────────────────────────────

/// Distance per second along each Linear segment, as a Step temporal float.
///
/// # Returns
/// - `TypeMismatch` for non-point values
/// - `UndefinedForDiscrete` for instants and Discrete sequences
/// - `IncompatibleInterpolation` for Step sequences
/// - `InvalidArgument` for a one-instant sequence
[[nodiscard]] Result<Temporal>
speed(const Temporal& temporal, const DistanceMetric& metric = planar_metric());

/// Distance travelled since the first instant, carried across the members of
/// a set. Linear input gives a Linear result; Step and Discrete input never
/// move and stay at zero.
///
/// `TypeMismatch` for non-point values.
[[nodiscard]] Result<Temporal>
cumulative_length(const Temporal& temporal, const DistanceMetric& metric = planar_metric());

}  // namespace tempus
