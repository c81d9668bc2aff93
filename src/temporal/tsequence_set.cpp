/// @file src/temporal/tsequence_set.cpp
/// @brief TSequenceSet: validation, delegation and cross-member aggregates.

#include "tempus/tsequence_set.hpp"

#include <algorithm>
#include <utility>

namespace tempus {

// ─── Construction ─────────────────────────────────────────────────────────────

TSequenceSet::TSequenceSet(std::vector<TSequence> sequences, ValueType type,
                           Interpolation interp) noexcept
    : sequences_(std::move(sequences)), type_(type), interp_(interp) {}

Result<TSequenceSet> TSequenceSet::make(std::vector<TSequence> sequences) {
    if (sequences.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence set has no sequences");
    }
    const TSequence& first = sequences.front();
    for (std::size_t i = 0; i < sequences.size(); ++i) {
        const TSequence& s = sequences[i];
        if (s.interpolation() != first.interpolation()) {
            return Error::make(ErrorKind::IncompatibleInterpolation,
                               "sequences mix interpolation modes");
        }
        if (s.value_type() != first.value_type()) {
            return Error::make(ErrorKind::TypeMismatch, "sequences mix value domains");
        }
        if (is_spatial(first.value_type()) &&
            !std::get<Point>(s.start_instant().value())
                 .compatible_with(std::get<Point>(first.start_instant().value()))) {
            return Error::make(ErrorKind::TypeMismatch,
                               "points differ in SRID or dimension");
        }
        if (i > 0 && !sequences[i - 1].bounding_box().is_left(s.bounding_box())) {
            return Error::make(ErrorKind::UnorderedInstants,
                               "sequences overlap or are out of order");
        }
    }
    const ValueType     type   = first.value_type();
    const Interpolation interp = first.interpolation();
    return TSequenceSet(std::move(sequences), type, interp);
}

TSequenceSet TSequenceSet::empty(ValueType type, Interpolation interpolation) {
    return TSequenceSet({}, type, interpolation);
}

TSequenceSet
TSequenceSet::from_pieces(std::vector<TSequence> pieces, ValueType type, Interpolation interp) {
    return TSequenceSet(std::move(pieces), type, interp);
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::optional<TSequence> TSequenceSet::sequence_n(std::size_t n) const {
    if (n >= sequences_.size()) return std::nullopt;
    return sequences_[n];
}

std::size_t TSequenceSet::num_instants() const noexcept {
    std::size_t total = 0;
    for (const auto& s : sequences_) total += s.num_instants();
    return total;
}

std::vector<TInstant> TSequenceSet::instants() const {
    std::vector<TInstant> out;
    out.reserve(num_instants());
    for (const auto& s : sequences_) {
        out.insert(out.end(), s.instants().begin(), s.instants().end());
    }
    return out;
}

std::vector<Timestamp> TSequenceSet::timestamps() const {
    std::vector<Timestamp> out;
    out.reserve(num_instants());
    for (const auto& s : sequences_) {
        for (const auto& i : s.instants()) out.push_back(i.timestamp());
    }
    return out;
}

// ─── Time ─────────────────────────────────────────────────────────────────────

std::optional<TsTzSpan> TSequenceSet::bounding_box() const {
    if (sequences_.empty()) return std::nullopt;
    return sequences_.front().bounding_box().union_with(sequences_.back().bounding_box(), false);
}

TsTzSpanSet TSequenceSet::time() const {
    std::vector<TsTzSpan> spans;
    for (const auto& s : sequences_) {
        const TsTzSpanSet t = s.time();
        spans.insert(spans.end(), t.spans().begin(), t.spans().end());
    }
    return TsTzSpanSet::make(std::move(spans));
}

Duration TSequenceSet::duration(bool ignore_gaps) const noexcept {
    if (sequences_.empty()) return Duration{0};
    if (!ignore_gaps) {
        return sequences_.back().end_timestamp() - sequences_.front().start_timestamp();
    }
    Duration total{0};
    for (const auto& s : sequences_) total += s.duration();
    return total;
}

// ─── Values ───────────────────────────────────────────────────────────────────

Result<Value> TSequenceSet::value_at(Timestamp t) const {
    auto it = std::partition_point(sequences_.begin(), sequences_.end(),
        [&](const TSequence& s) { return s.end_timestamp() < t; });
    // A member ending exactly at t with an exclusive bound may be followed by
    // one starting at t.
    for (; it != sequences_.end() && it->start_timestamp() <= t; ++it) {
        if (it->bounding_box().contains(t)) return it->value_at(t);
    }
    return Error::make(ErrorKind::NoValueAtTimestamp,
                       "timestamp outside every sequence");
}

Result<Value> TSequenceSet::min_value() const {
    if (sequences_.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence set is empty");
    }
    auto best = sequences_.front().min_value();
    if (!best) return best;
    for (const auto& s : sequences_) {
        auto v = s.min_value();
        if (value_less(*v, *best)) best = std::move(v);
    }
    return best;
}

Result<Value> TSequenceSet::max_value() const {
    if (sequences_.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence set is empty");
    }
    auto best = sequences_.front().max_value();
    if (!best) return best;
    for (const auto& s : sequences_) {
        auto v = s.max_value();
        if (value_less(*best, *v)) best = std::move(v);
    }
    return best;
}

// ─── Restriction ──────────────────────────────────────────────────────────────

namespace {

/// Concatenate the members of per-sequence restriction results.
template <typename Fn>
std::vector<TSequence> collect(std::span<const TSequence> sequences, Fn&& restrict) {
    std::vector<TSequence> out;
    for (const auto& s : sequences) {
        const TSequenceSet part = restrict(s);
        out.insert(out.end(), part.sequences().begin(), part.sequences().end());
    }
    return out;
}

}  // namespace

TSequenceSet TSequenceSet::at_value(const Value& value) const {
    return from_pieces(collect(sequences_, [&](const TSequence& s) { return s.at_value(value); }),
                       type_, interp_);
}

TSequenceSet TSequenceSet::minus_value(const Value& value) const {
    return from_pieces(collect(sequences_, [&](const TSequence& s) { return s.minus_value(value); }),
                       type_, interp_);
}

TSequenceSet TSequenceSet::at_values(std::span<const Value> values) const {
    return from_pieces(collect(sequences_, [&](const TSequence& s) { return s.at_values(values); }),
                       type_, interp_);
}

TSequenceSet TSequenceSet::minus_values(std::span<const Value> values) const {
    return from_pieces(collect(sequences_, [&](const TSequence& s) { return s.minus_values(values); }),
                       type_, interp_);
}

TSequenceSet TSequenceSet::at_period(const TsTzSpan& period) const {
    return at_time(TsTzSpanSet::from_span(period));
}

TSequenceSet TSequenceSet::at_time(const TsTzSpanSet& periods) const {
    return from_pieces(collect(sequences_, [&](const TSequence& s) { return s.at_time(periods); }),
                       type_, interp_);
}

TSequenceSet TSequenceSet::minus_period(const TsTzSpan& period) const {
    return from_pieces(collect(sequences_, [&](const TSequence& s) { return s.minus_period(period); }),
                       type_, interp_);
}

// ─── Aggregates ───────────────────────────────────────────────────────────────

Result<double> TSequenceSet::length(const DistanceMetric& metric) const {
    if (!is_spatial(type_)) {
        return Error::make(ErrorKind::TypeMismatch, "length is defined for points only");
    }
    double total = 0.0;
    for (const auto& s : sequences_) {
        auto part = s.length(metric);
        if (!part) return part;
        total += *part;
    }
    return total;
}

Result<double> TSequenceSet::integral() const {
    if (interp_ == Interpolation::Discrete) {
        return Error::make(ErrorKind::UndefinedForDiscrete,
                           "integral of a discrete sequence set");
    }
    if (!is_numeric(type_)) {
        return Error::make(ErrorKind::TypeMismatch, "integral needs a numeric sequence set");
    }
    double total = 0.0;
    for (const auto& s : sequences_) {
        auto part = s.integral();
        if (!part) return part;
        total += *part;
    }
    return total;
}

Result<double> TSequenceSet::time_weighted_average() const {
    auto area = integral();
    if (!area) return area;
    if (sequences_.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence set is empty");
    }
    const Duration total = duration(true);
    if (total == Duration{0}) {
        double sum = 0.0;
        for (const auto& i : instants()) sum += as_double(i.value());
        return sum / static_cast<double>(num_instants());
    }
    return *area / (static_cast<double>(total.count()) /
                    static_cast<double>(constants::USECS_PER_SEC));
}

// ─── Boxes ────────────────────────────────────────────────────────────────────

Result<FloatSpan> TSequenceSet::value_span() const {
    if (!is_numeric(type_)) {
        return Error::make(ErrorKind::TypeMismatch, "value span needs a numeric sequence set");
    }
    if (sequences_.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence set is empty");
    }
    auto hull = sequences_.front().value_span();
    for (const auto& s : sequences_) {
        auto part = s.value_span();
        if (!hull || !part) return part;
        hull = *hull->union_with(*part, false);
    }
    return hull;
}

Result<TBox> TSequenceSet::tbox() const {
    auto range = value_span();
    if (!range) return std::move(range).error();
    return TBox{*range, *bounding_box()};
}

Result<STBox> TSequenceSet::stbox() const {
    if (!is_spatial(type_)) {
        return Error::make(ErrorKind::TypeMismatch, "spatial box needs a point sequence set");
    }
    if (sequences_.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence set is empty");
    }
    auto box = sequences_.front().stbox();
    for (const auto& s : sequences_) {
        auto part = s.stbox();
        if (!box || !part) return part;
        box = box->expand(*part);
    }
    return box;
}

TSequenceSet TSequenceSet::shift_time(Duration delta) const {
    std::vector<TSequence> out;
    out.reserve(sequences_.size());
    for (const auto& s : sequences_) out.push_back(s.shift_time(delta));
    return TSequenceSet(std::move(out), type_, interp_);
}

bool operator==(const TSequenceSet& a, const TSequenceSet& b) noexcept {
    return a.type_ == b.type_ && a.interp_ == b.interp_ && a.sequences_ == b.sequences_;
}

}  // namespace tempus
