/// @file src/temporal/tsequence.cpp
/// @brief TSequence: construction, lookup, restriction and aggregates.

#include "tempus/tsequence.hpp"
#include "tempus/interpolation.hpp"
#include "tempus/tsequence_set.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace tempus {

namespace {

double seconds_between(Timestamp t0, Timestamp t1) noexcept {
    return static_cast<double>((t1 - t0).count()) /
           static_cast<double>(constants::USECS_PER_SEC);
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

TSequence::TSequence(std::vector<TInstant> instants, Interpolation interp,
                     bool lower_inc, bool upper_inc) noexcept
    : instants_(std::move(instants)), interp_(interp),
      lower_inc_(lower_inc), upper_inc_(upper_inc) {}

Result<TSequence>
TSequence::make(std::vector<TInstant> instants, Interpolation interpolation,
                bool lower_inc, bool upper_inc) {
    if (instants.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "sequence has no instants");
    }
    if (interpolation == Interpolation::None) {
        return Error::make(ErrorKind::IncompatibleInterpolation,
                           "sequence interpolation cannot be None");
    }

    const TInstant& first = instants.front();
    const ValueType type  = first.value_type();
    for (std::size_t i = 0; i < instants.size(); ++i) {
        if (instants[i].value_type() != type) {
            return Error::make(ErrorKind::TypeMismatch,
                               std::string("instant value is ") +
                               to_string(instants[i].value_type()) + ", expected " +
                               to_string(type));
        }
        if (is_spatial(type) &&
            !std::get<Point>(instants[i].value()).compatible_with(std::get<Point>(first.value()))) {
            return Error::make(ErrorKind::TypeMismatch,
                               "points differ in SRID or dimension");
        }
        if (i == 0) continue;
        const Timestamp prev = instants[i - 1].timestamp();
        const Timestamp cur  = instants[i].timestamp();
        if (cur == prev) {
            return Error::make(ErrorKind::DuplicateTimestamp,
                               "two instants share a timestamp");
        }
        if (cur < prev) {
            return Error::make(ErrorKind::UnorderedInstants,
                               "instant timestamps are not increasing");
        }
    }

    if (interpolation == Interpolation::Linear && !is_linear_interpolable(type)) {
        return Error::make(ErrorKind::IncompatibleInterpolation,
                           std::string("linear interpolation not valid for ") +
                           to_string(type));
    }
    if (instants.size() == 1) {
        lower_inc = upper_inc = true;
    }
    if (interpolation == Interpolation::Discrete && !(lower_inc && upper_inc)) {
        return Error::make(ErrorKind::IncompatibleInterpolation,
                           "discrete sequence bounds must be inclusive");
    }
    return TSequence(std::move(instants), interpolation, lower_inc, upper_inc);
}

Result<TSequence>
TSequence::from_value_and_span(const Value& value, const TsTzSpan& period,
                               Interpolation interpolation) {
    if (interpolation == Interpolation::Discrete) {
        return Error::make(ErrorKind::IncompatibleInterpolation,
                           "a constant over a span is not discrete");
    }
    std::vector<TInstant> instants{TInstant(value, period.lower())};
    if (period.upper() != period.lower()) {
        instants.emplace_back(value, period.upper());
    }
    return make(std::move(instants), interpolation, period.lower_inc(), period.upper_inc());
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::optional<TInstant> TSequence::instant_n(std::size_t n) const {
    if (n >= instants_.size()) return std::nullopt;
    return instants_[n];
}

std::vector<Timestamp> TSequence::timestamps() const {
    std::vector<Timestamp> out;
    out.reserve(instants_.size());
    for (const auto& i : instants_) out.push_back(i.timestamp());
    return out;
}

std::vector<Value> TSequence::values() const {
    std::vector<Value> out;
    out.reserve(instants_.size());
    for (const auto& i : instants_) out.push_back(i.value());
    return out;
}

// ─── Time ─────────────────────────────────────────────────────────────────────

TsTzSpan TSequence::bounding_box() const {
    return *TsTzSpan::make(start_timestamp(), end_timestamp(), lower_inc_, upper_inc_);
}

TsTzSpanSet TSequence::time() const {
    if (interp_ != Interpolation::Discrete) {
        return TsTzSpanSet::from_span(bounding_box());
    }
    std::vector<TsTzSpan> spans;
    spans.reserve(instants_.size());
    for (const auto& i : instants_) spans.push_back(TsTzSpan::singleton(i.timestamp()));
    return TsTzSpanSet::make(std::move(spans));
}

Duration TSequence::duration() const noexcept {
    if (interp_ == Interpolation::Discrete) return Duration{0};
    return end_timestamp() - start_timestamp();
}

// ─── Lookup ───────────────────────────────────────────────────────────────────

std::size_t TSequence::segment_index(Timestamp t) const noexcept {
    auto it = std::upper_bound(instants_.begin(), instants_.end(), t,
        [](Timestamp lhs, const TInstant& rhs) { return lhs < rhs.timestamp(); });
    return static_cast<std::size_t>(it - instants_.begin()) - 1;
}

Value TSequence::value_within(Timestamp t) const {
    const std::size_t i = segment_index(t);
    if (i + 1 >= instants_.size()) return instants_.back().value();
    if (interp_ != Interpolation::Linear) return instants_[i].value();
    return Interpolator::interpolate(instants_[i], instants_[i + 1], t,
                                     interp_, false).value();
}

const Value& TSequence::left_limit(Timestamp t) const noexcept {
    auto it = std::lower_bound(instants_.begin(), instants_.end(), t,
        [](const TInstant& lhs, Timestamp rhs) { return lhs.timestamp() < rhs; });
    return std::prev(it)->value();
}

Result<Value> TSequence::value_at(Timestamp t) const {
    if (!bounding_box().contains(t)) {
        return Error::make(ErrorKind::NoValueAtTimestamp,
                           "timestamp outside the sequence");
    }
    if (instants_.size() == 1) return instants_.front().value();

    if (interp_ == Interpolation::Discrete) {
        const std::size_t i = segment_index(t);
        if (instants_[i].timestamp() == t) return instants_[i].value();
        return Error::make(ErrorKind::NoValueAtTimestamp,
                           "discrete sequence has no sample at timestamp");
    }

    const std::size_t i = segment_index(t);
    if (i + 1 == instants_.size()) {
        return Interpolator::interpolate(instants_[i - 1], instants_[i], t,
                                         interp_, upper_inc_);
    }
    return Interpolator::interpolate(instants_[i], instants_[i + 1], t, interp_, false);
}

Result<Value> TSequence::min_value() const {
    if (is_spatial(value_type())) {
        return Error::make(ErrorKind::TypeMismatch, "points have no order");
    }
    return std::min_element(instants_.begin(), instants_.end(),
        [](const TInstant& a, const TInstant& b) { return value_less(a.value(), b.value()); })
        ->value();
}

Result<Value> TSequence::max_value() const {
    if (is_spatial(value_type())) {
        return Error::make(ErrorKind::TypeMismatch, "points have no order");
    }
    return std::max_element(instants_.begin(), instants_.end(),
        [](const TInstant& a, const TInstant& b) { return value_less(a.value(), b.value()); })
        ->value();
}

// ─── Restriction ──────────────────────────────────────────────────────────────

std::optional<TSequence> TSequence::at_period(const TsTzSpan& period) const {
    const auto inter = bounding_box().intersection(period);
    if (!inter) return std::nullopt;

    if (interp_ == Interpolation::Discrete) {
        std::vector<TInstant> kept;
        for (const auto& i : instants_) {
            if (inter->contains(i.timestamp())) kept.push_back(i);
        }
        if (kept.empty()) return std::nullopt;
        return TSequence(std::move(kept), interp_, true, true);
    }
    if (instants_.size() == 1) return *this;

    const Timestamp lo = inter->lower();
    const Timestamp hi = inter->upper();
    if (lo == hi) {
        return TSequence({TInstant(value_within(lo), lo)}, interp_, true, true);
    }

    std::vector<TInstant> out;
    out.emplace_back(value_within(lo), lo);
    for (const auto& i : instants_) {
        if (lo < i.timestamp() && i.timestamp() < hi) out.push_back(i);
    }
    if (interp_ == Interpolation::Step && !inter->upper_inc()) {
        out.emplace_back(left_limit(hi), hi);
    } else {
        out.emplace_back(value_within(hi), hi);
    }
    return TSequence(std::move(out), interp_, inter->lower_inc(), inter->upper_inc());
}

TSequenceSet TSequence::at_time(const TsTzSpanSet& periods) const {
    if (interp_ == Interpolation::Discrete) {
        std::vector<TInstant> kept;
        for (const auto& i : instants_) {
            if (periods.contains(i.timestamp())) kept.push_back(i);
        }
        if (kept.empty()) return TSequenceSet::empty(value_type(), interp_);
        return TSequenceSet::from_pieces({TSequence(std::move(kept), interp_, true, true)},
                                         value_type(), interp_);
    }
    std::vector<TSequence> pieces;
    for (const auto& p : periods.spans()) {
        if (auto piece = at_period(p)) pieces.push_back(std::move(*piece));
    }
    return TSequenceSet::from_pieces(std::move(pieces), value_type(), interp_);
}

TSequenceSet TSequence::minus_period(const TsTzSpan& period) const {
    return at_time(time().minus(period));
}

TsTzSpanSet TSequence::periods_equal_to(const Value& value) const {
    std::vector<TsTzSpan> found;
    const std::size_t n = instants_.size();
    if (n == 1) {
        if (instants_.front().value() == value) {
            found.push_back(TsTzSpan::singleton(instants_.front().timestamp()));
        }
        return TsTzSpanSet::make(std::move(found));
    }

    for (std::size_t i = 0; i + 1 < n; ++i) {
        const Value&    v0 = instants_[i].value();
        const Value&    v1 = instants_[i + 1].value();
        const Timestamp t0 = instants_[i].timestamp();
        const Timestamp t1 = instants_[i + 1].timestamp();

        if (interp_ == Interpolation::Step || v0 == v1) {
            if (v0 == value) {
                const bool closed = interp_ == Interpolation::Linear;
                found.push_back(*TsTzSpan::make(t0, t1, true, closed));
            }
            continue;
        }
        // Linear segment with distinct end values: at most one crossing.
        if (v0 == value) {
            found.push_back(TsTzSpan::singleton(t0));
        } else if (v1 == value) {
            found.push_back(TsTzSpan::singleton(t1));
        } else if (auto f = Interpolator::locate(v0, v1, value)) {
            found.push_back(TsTzSpan::singleton(Interpolator::at_fraction(t0, t1, *f)));
        }
    }
    if (interp_ == Interpolation::Step && instants_.back().value() == value) {
        found.push_back(TsTzSpan::singleton(instants_.back().timestamp()));
    }
    return TsTzSpanSet::make(std::move(found)).intersection(bounding_box());
}

TSequenceSet TSequence::at_value(const Value& value) const {
    if (tempus::value_type(value) != value_type()) {
        return TSequenceSet::empty(value_type(), interp_);
    }
    if (interp_ == Interpolation::Discrete) {
        std::vector<TInstant> kept;
        for (const auto& i : instants_) {
            if (i.value() == value) kept.push_back(i);
        }
        if (kept.empty()) return TSequenceSet::empty(value_type(), interp_);
        return TSequenceSet::from_pieces({TSequence(std::move(kept), interp_, true, true)},
                                         value_type(), interp_);
    }

    const TsTzSpanSet periods = periods_equal_to(value);
    std::vector<TSequence> pieces;
    for (const auto& p : periods.spans()) {
        if (p.lower() == p.upper()) {
            // Crossing instants carry the requested value itself.
            pieces.push_back(TSequence({TInstant(value, p.lower())}, interp_, true, true));
        } else if (auto piece = at_period(p)) {
            pieces.push_back(std::move(*piece));
        }
    }
    return TSequenceSet::from_pieces(std::move(pieces), value_type(), interp_);
}

TSequenceSet TSequence::minus_value(const Value& value) const {
    if (tempus::value_type(value) != value_type()) {
        return TSequenceSet::from_pieces({*this}, value_type(), interp_);
    }
    if (interp_ == Interpolation::Discrete) {
        std::vector<TInstant> kept;
        for (const auto& i : instants_) {
            if (i.value() != value) kept.push_back(i);
        }
        if (kept.empty()) return TSequenceSet::empty(value_type(), interp_);
        return TSequenceSet::from_pieces({TSequence(std::move(kept), interp_, true, true)},
                                         value_type(), interp_);
    }
    return at_time(time().minus(periods_equal_to(value)));
}

namespace {

/// `values` restricted to one domain, each value once, in input order.
std::vector<Value> distinct_of_type(std::span<const Value> values, ValueType type) {
    std::vector<Value> out;
    for (const auto& v : values) {
        if (value_type(v) != type) continue;
        if (std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
    }
    return out;
}

}  // namespace

TSequenceSet TSequence::at_values(std::span<const Value> values) const {
    const std::vector<Value> wanted = distinct_of_type(values, value_type());
    if (interp_ == Interpolation::Discrete) {
        std::vector<TInstant> kept;
        for (const auto& i : instants_) {
            if (std::find(wanted.begin(), wanted.end(), i.value()) != wanted.end()) {
                kept.push_back(i);
            }
        }
        if (kept.empty()) return TSequenceSet::empty(value_type(), interp_);
        return TSequenceSet::from_pieces({TSequence(std::move(kept), interp_, true, true)},
                                         value_type(), interp_);
    }
    // A sequence takes one value at a time, so the pieces of distinct values
    // never overlap and only need ordering.
    std::vector<TSequence> pieces;
    for (const auto& v : wanted) {
        const TSequenceSet part = at_value(v);
        pieces.insert(pieces.end(), part.sequences().begin(), part.sequences().end());
    }
    std::sort(pieces.begin(), pieces.end(), [](const TSequence& a, const TSequence& b) {
        return a.bounding_box() < b.bounding_box();
    });
    return TSequenceSet::from_pieces(std::move(pieces), value_type(), interp_);
}

TSequenceSet TSequence::minus_values(std::span<const Value> values) const {
    const std::vector<Value> unwanted = distinct_of_type(values, value_type());
    if (interp_ == Interpolation::Discrete) {
        std::vector<TInstant> kept;
        for (const auto& i : instants_) {
            if (std::find(unwanted.begin(), unwanted.end(), i.value()) == unwanted.end()) {
                kept.push_back(i);
            }
        }
        if (kept.empty()) return TSequenceSet::empty(value_type(), interp_);
        return TSequenceSet::from_pieces({TSequence(std::move(kept), interp_, true, true)},
                                         value_type(), interp_);
    }
    TsTzSpanSet removed;
    for (const auto& v : unwanted) removed = removed.union_with(periods_equal_to(v));
    return at_time(time().minus(removed));
}

// ─── Aggregates ───────────────────────────────────────────────────────────────

Result<double> TSequence::length(const DistanceMetric& metric) const {
    if (!is_spatial(value_type())) {
        return Error::make(ErrorKind::TypeMismatch, "length is defined for points only");
    }
    if (interp_ != Interpolation::Linear) return 0.0;
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < instants_.size(); ++i) {
        total += metric.distance(std::get<Point>(instants_[i].value()),
                                 std::get<Point>(instants_[i + 1].value()));
    }
    return total;
}

Result<double> TSequence::integral() const {
    if (interp_ == Interpolation::Discrete) {
        return Error::make(ErrorKind::UndefinedForDiscrete,
                           "integral of a discrete sequence");
    }
    if (!is_numeric(value_type())) {
        return Error::make(ErrorKind::TypeMismatch, "integral needs a numeric sequence");
    }
    double total = 0.0;
    for (std::size_t i = 0; i + 1 < instants_.size(); ++i) {
        const double v0 = as_double(instants_[i].value());
        const double dt = seconds_between(instants_[i].timestamp(),
                                          instants_[i + 1].timestamp());
        if (interp_ == Interpolation::Step) {
            total += v0 * dt;
        } else {
            total += (v0 + as_double(instants_[i + 1].value())) * 0.5 * dt;
        }
    }
    return total;
}

Result<double> TSequence::time_weighted_average() const {
    auto area = integral();
    if (!area) return std::move(area).error();

    const Duration span = duration();
    if (span == Duration{0}) {
        double sum = 0.0;
        for (const auto& i : instants_) sum += as_double(i.value());
        return sum / static_cast<double>(instants_.size());
    }
    return *area / seconds_between(start_timestamp(), end_timestamp());
}

// ─── Boxes ────────────────────────────────────────────────────────────────────

Result<FloatSpan> TSequence::value_span() const {
    if (!is_numeric(value_type())) {
        return Error::make(ErrorKind::TypeMismatch, "value span needs a numeric sequence");
    }
    double lo = as_double(instants_.front().value());
    double hi = lo;
    for (const auto& i : instants_) {
        lo = std::min(lo, as_double(i.value()));
        hi = std::max(hi, as_double(i.value()));
    }
    return FloatSpan::make(lo, hi, true, true);
}

Result<TBox> TSequence::tbox() const {
    auto range = value_span();
    if (!range) return std::move(range).error();
    return TBox{*range, bounding_box()};
}

Result<STBox> TSequence::stbox() const {
    if (!is_spatial(value_type())) {
        return Error::make(ErrorKind::TypeMismatch, "spatial box needs a point sequence");
    }
    STBox box = STBox::from_point(std::get<Point>(instants_.front().value()),
                                  start_timestamp());
    for (const auto& i : instants_) {
        box.extent.extend(std::get<Point>(i.value()).coords);
    }
    box.period = bounding_box();
    return box;
}

// ─── Transformations ──────────────────────────────────────────────────────────

TSequence TSequence::shift_time(Duration delta) const {
    std::vector<TInstant> out;
    out.reserve(instants_.size());
    for (const auto& i : instants_) out.push_back(i.shift_time(delta));
    return TSequence(std::move(out), interp_, lower_inc_, upper_inc_);
}

Result<TSequence> TSequence::scale_time(Duration width) const {
    if (instants_.size() == 1) return *this;
    if (width <= Duration{0}) {
        return Error::make(ErrorKind::InvalidArgument, "scale width must be positive");
    }
    const Timestamp t0 = start_timestamp();
    const Timestamp t1 = end_timestamp();
    std::vector<TInstant> out;
    out.reserve(instants_.size());
    for (const auto& i : instants_) {
        const double f = Interpolator::fraction(t0, t1, i.timestamp());
        out.emplace_back(i.value(), Interpolator::at_fraction(t0, t0 + width, f));
    }
    return make(std::move(out), interp_, lower_inc_, upper_inc_);
}

bool operator==(const TSequence& a, const TSequence& b) noexcept {
    return a.interp_ == b.interp_ && a.lower_inc_ == b.lower_inc_ &&
           a.upper_inc_ == b.upper_inc_ && a.instants_ == b.instants_;
}

}  // namespace tempus
