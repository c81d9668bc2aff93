#pragma once

/// @file include/tempus/tsequence_set.hpp
/// @brief TSequenceSet: time-disjoint sequences forming one logical value.
///
/// # Module: TSequenceSet
///
/// ## Invariants
/// - Members sorted by start time, pairwise time-disjoint
/// - All members share one interpolation and one value domain
/// - May be empty only when built through `empty()` (the result of a
///   restriction that matched nothing)
///
/// ## Guarantees
/// - value_at is O(log m + log n) for m members of n instants
/// - Aggregates integrate across members weighted by their durations

#include "tempus/boxes.hpp"
#include "tempus/error.hpp"
#include "tempus/geometry.hpp"
#include "tempus/span_set.hpp"
#include "tempus/tsequence.hpp"
#include "tempus/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace tempus {

class TSequenceSet {
public:
    /// Validate and build a sequence set.
    ///
    /// # Returns
    /// - `InvalidArgument` for an empty list (use `empty()` instead)
    /// - `IncompatibleInterpolation` for mixed interpolation
    /// - `TypeMismatch` for mixed value domains
    /// - `UnorderedInstants` when members overlap in time or are out of order
    [[nodiscard]] static Result<TSequenceSet> make(std::vector<TSequence> sequences);

    /// The empty set of a given domain and interpolation.
    [[nodiscard]] static TSequenceSet empty(ValueType type, Interpolation interpolation);

    [[nodiscard]] bool          is_empty() const noexcept { return sequences_.empty(); }
    [[nodiscard]] ValueType     value_type() const noexcept { return type_; }
    [[nodiscard]] Interpolation interpolation() const noexcept { return interp_; }

    [[nodiscard]] std::size_t num_sequences() const noexcept { return sequences_.size(); }
    [[nodiscard]] std::span<const TSequence> sequences() const noexcept { return sequences_; }
    [[nodiscard]] std::optional<TSequence> sequence_n(std::size_t n) const;

    [[nodiscard]] std::size_t num_instants() const noexcept;
    [[nodiscard]] std::vector<TInstant> instants() const;
    [[nodiscard]] std::vector<Timestamp> timestamps() const;

    /// Hull of the member bounding boxes; nullopt when empty.
    [[nodiscard]] std::optional<TsTzSpan> bounding_box() const;

    /// Union of the member time sets.
    [[nodiscard]] TsTzSpanSet time() const;

    /// Sum of member durations (`ignore_gaps = true`) or first start to last
    /// end (`ignore_gaps = false`).
    [[nodiscard]] Duration duration(bool ignore_gaps = true) const noexcept;

    /// Value of the unique member containing `t`.
    [[nodiscard]] Result<Value> value_at(Timestamp t) const;

    [[nodiscard]] Result<Value> min_value() const;
    [[nodiscard]] Result<Value> max_value() const;

    [[nodiscard]] TSequenceSet at_value(const Value& value) const;
    [[nodiscard]] TSequenceSet minus_value(const Value& value) const;
    [[nodiscard]] TSequenceSet at_values(std::span<const Value> values) const;
    [[nodiscard]] TSequenceSet minus_values(std::span<const Value> values) const;
    [[nodiscard]] TSequenceSet at_period(const TsTzSpan& period) const;
    [[nodiscard]] TSequenceSet at_time(const TsTzSpanSet& periods) const;
    [[nodiscard]] TSequenceSet minus_period(const TsTzSpan& period) const;

    [[nodiscard]] Result<double>
    length(const DistanceMetric& metric = planar_metric()) const;
    [[nodiscard]] Result<double> integral() const;
    [[nodiscard]] Result<double> time_weighted_average() const;

    [[nodiscard]] Result<FloatSpan> value_span() const;
    [[nodiscard]] Result<TBox>  tbox() const;
    [[nodiscard]] Result<STBox> stbox() const;

    [[nodiscard]] TSequenceSet shift_time(Duration delta) const;

    friend bool operator==(const TSequenceSet& a, const TSequenceSet& b) noexcept;
    friend bool operator!=(const TSequenceSet& a, const TSequenceSet& b) noexcept { return !(a == b); }

private:
    TSequenceSet(std::vector<TSequence> sequences, ValueType type,
                 Interpolation interp) noexcept;

    friend class TSequence;

    /// Build from pieces already known to be ordered and disjoint.
    [[nodiscard]] static TSequenceSet
    from_pieces(std::vector<TSequence> pieces, ValueType type, Interpolation interp);

    std::vector<TSequence> sequences_;
    ValueType              type_;
    Interpolation          interp_;
};

}  // namespace tempus
