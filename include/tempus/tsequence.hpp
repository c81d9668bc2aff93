#pragma once

/// @file include/tempus/tsequence.hpp
/// @brief TSequence: a time-ordered run of instants with one interpolation.
///
/// # Module: TSequence
///
/// ## Invariants
/// - At least one instant; timestamps strictly increasing
/// - All instants share one value domain (and, for points, SRID and dimension)
/// - Discrete sequences have both bounds inclusive
/// - Single-instant sequences have both bounds inclusive
/// - Linear only for Float and point domains
///
/// ## Guarantees
/// - Immutable; owns its instants
/// - value_at is O(log n); at_value under Linear is O(n)

#include "tempus/boxes.hpp"
#include "tempus/error.hpp"
#include "tempus/geometry.hpp"
#include "tempus/span_set.hpp"
#include "tempus/tinstant.hpp"
#include "tempus/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace tempus {

class TSequenceSet;

class TSequence {
public:
    /// Validate and build a sequence.
    ///
    /// # Returns
    /// - `InvalidArgument` for an empty instant list
    /// - `TypeMismatch` for mixed value domains, SRIDs or dimensions
    /// - `DuplicateTimestamp` / `UnorderedInstants` for bad time order
    /// - `IncompatibleInterpolation` for Linear on Bool/Int/Text, for mode
    ///   None, or for a Discrete sequence with an exclusive bound
    [[nodiscard]] static Result<TSequence>
    make(std::vector<TInstant> instants,
         Interpolation interpolation,
         bool lower_inc = true,
         bool upper_inc = true);

    /// Constant value over a time span (Step, or Linear when interpolable).
    [[nodiscard]] static Result<TSequence>
    from_value_and_span(const Value& value, const TsTzSpan& period,
                        Interpolation interpolation);

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] Interpolation interpolation() const noexcept { return interp_; }
    [[nodiscard]] ValueType     value_type() const noexcept { return instants_.front().value_type(); }
    [[nodiscard]] bool          lower_inc() const noexcept { return lower_inc_; }
    [[nodiscard]] bool          upper_inc() const noexcept { return upper_inc_; }

    [[nodiscard]] std::size_t num_instants() const noexcept { return instants_.size(); }
    [[nodiscard]] std::span<const TInstant> instants() const noexcept { return instants_; }
    [[nodiscard]] std::optional<TInstant> instant_n(std::size_t n) const;
    [[nodiscard]] const TInstant& start_instant() const noexcept { return instants_.front(); }
    [[nodiscard]] const TInstant& end_instant() const noexcept { return instants_.back(); }
    [[nodiscard]] Timestamp start_timestamp() const noexcept { return instants_.front().timestamp(); }
    [[nodiscard]] Timestamp end_timestamp() const noexcept { return instants_.back().timestamp(); }
    [[nodiscard]] std::vector<Timestamp> timestamps() const;
    [[nodiscard]] std::vector<Value> values() const;

    // ── Time ─────────────────────────────────────────────────────────────────

    /// `[first, last]` with the sequence's own inclusivity flags.
    [[nodiscard]] TsTzSpan bounding_box() const;

    /// Time on which the sequence is defined: one singleton span per instant
    /// for Discrete, the bounding span otherwise.
    [[nodiscard]] TsTzSpanSet time() const;

    /// Elapsed time between the first and last instant (zero for Discrete).
    [[nodiscard]] Duration duration() const noexcept;

    // ── Values ───────────────────────────────────────────────────────────────

    /// Value at `t`.
    ///
    /// # Returns
    /// `NoValueAtTimestamp` if t is outside the bounds (honouring
    /// inclusivity) or falls between the samples of a Discrete sequence.
    [[nodiscard]] Result<Value> value_at(Timestamp t) const;

    /// Smallest / largest value taken (ordered domains). For Float under
    /// Linear the extremes are always at instants.
    [[nodiscard]] Result<Value> min_value() const;
    [[nodiscard]] Result<Value> max_value() const;

    // ── Restriction ──────────────────────────────────────────────────────────

    /// Sub-periods where the sequence equals `value` (may be empty).
    [[nodiscard]] TSequenceSet at_value(const Value& value) const;

    /// Sub-periods where the sequence differs from `value` (may be empty).
    [[nodiscard]] TSequenceSet minus_value(const Value& value) const;

    /// Sub-periods where the sequence equals any of `values`. Values of
    /// another domain never match; repeated values count once.
    [[nodiscard]] TSequenceSet at_values(std::span<const Value> values) const;

    /// Sub-periods where the sequence equals none of `values`.
    [[nodiscard]] TSequenceSet minus_values(std::span<const Value> values) const;

    /// Restriction to a time span; nullopt when they do not overlap.
    [[nodiscard]] std::optional<TSequence> at_period(const TsTzSpan& period) const;

    /// Restriction to a set of time spans (may be empty).
    [[nodiscard]] TSequenceSet at_time(const TsTzSpanSet& periods) const;

    /// Restriction to the complement of a time span (may be empty).
    [[nodiscard]] TSequenceSet minus_period(const TsTzSpan& period) const;

    // ── Aggregates ───────────────────────────────────────────────────────────

    /// Travelled distance of a point sequence.
    ///
    /// # Returns
    /// - Sum of per-segment distances under Linear, 0 under Step/Discrete
    /// - `TypeMismatch` for non-point domains
    [[nodiscard]] Result<double>
    length(const DistanceMetric& metric = planar_metric()) const;

    /// Area under a numeric sequence, time measured in seconds.
    ///
    /// # Returns
    /// - `UndefinedForDiscrete` for Discrete sequences
    /// - `TypeMismatch` for non-numeric domains
    [[nodiscard]] Result<double> integral() const;

    /// integral / duration; the mean of the sample values when the duration is
    /// zero.
    [[nodiscard]] Result<double> time_weighted_average() const;

    // ── Boxes ────────────────────────────────────────────────────────────────

    /// Range of a numeric sequence.
    [[nodiscard]] Result<FloatSpan> value_span() const;

    [[nodiscard]] Result<TBox>  tbox() const;
    [[nodiscard]] Result<STBox> stbox() const;

    // ── Transformations ──────────────────────────────────────────────────────

    [[nodiscard]] TSequence shift_time(Duration delta) const;

    /// Stretch the time axis so the sequence lasts `width`, keeping the start.
    /// `InvalidArgument` if width is not positive for a multi-instant sequence.
    [[nodiscard]] Result<TSequence> scale_time(Duration width) const;

    friend bool operator==(const TSequence& a, const TSequence& b) noexcept;
    friend bool operator!=(const TSequence& a, const TSequence& b) noexcept { return !(a == b); }

private:
    TSequence(std::vector<TInstant> instants, Interpolation interp,
              bool lower_inc, bool upper_inc) noexcept;

    /// Index of the last instant with timestamp <= t. Precondition: t >= start.
    [[nodiscard]] std::size_t segment_index(Timestamp t) const noexcept;

    /// Value at t ignoring bound inclusivity. Precondition: start <= t <= end.
    [[nodiscard]] Value value_within(Timestamp t) const;

    /// Step value immediately before t. Precondition: start < t <= end.
    [[nodiscard]] const Value& left_limit(Timestamp t) const noexcept;

    /// Periods (within the bounds) where the sequence equals `value`.
    [[nodiscard]] TsTzSpanSet periods_equal_to(const Value& value) const;

    std::vector<TInstant> instants_;
    Interpolation         interp_;
    bool                  lower_inc_;
    bool                  upper_inc_;
};

}  // namespace tempus
