/// @file src/temporal/operations.cpp
/// @brief Arithmetic, logic, comparison and kinematics over temporal values.

#include "tempus/operations.hpp"

#include "tempus/interpolation.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>

namespace tempus {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

enum class ArithOp { Add, Sub, Mul, Div };

// ─── Base values ──────────────────────────────────────────────────────────────

std::optional<std::int64_t> checked(ArithOp op, std::int64_t x, std::int64_t y) noexcept {
    constexpr auto lo = std::numeric_limits<std::int64_t>::min();
    constexpr auto hi = std::numeric_limits<std::int64_t>::max();
    switch (op) {
        case ArithOp::Add:
            if ((y > 0 && x > hi - y) || (y < 0 && x < lo - y)) return std::nullopt;
            return x + y;
        case ArithOp::Sub:
            if ((y < 0 && x > hi + y) || (y > 0 && x < lo + y)) return std::nullopt;
            return x - y;
        case ArithOp::Mul:
            if (x > 0) {
                if (y > 0 ? x > hi / y : y < lo / x) return std::nullopt;
            } else if (x < 0) {
                if (y > 0 ? x < lo / y : y < hi / x) return std::nullopt;
            }
            return x * y;
        case ArithOp::Div:
            break;
    }
    return std::nullopt;
}

Result<Value> combine(ArithOp op, const Value& a, const Value& b) {
    if (op == ArithOp::Div) {
        const double divisor = as_double(b);
        if (divisor == 0.0) {
            return Error::make(ErrorKind::InvalidArgument, "division by zero");
        }
        return as_double(a) / divisor;
    }
    const auto* x = std::get_if<std::int64_t>(&a);
    const auto* y = std::get_if<std::int64_t>(&b);
    if (x && y) {
        const auto r = checked(op, *x, *y);
        if (!r) return Error::make(ErrorKind::InvalidArgument, "integer overflow");
        return *r;
    }
    const double l = as_double(a);
    const double r = as_double(b);
    switch (op) {
        case ArithOp::Add: return l + r;
        case ArithOp::Sub: return l - r;
        case ArithOp::Mul: return l * r;
        case ArithOp::Div: break;
    }
    return l / r;
}

ValueType arith_type(ArithOp op, ValueType a, ValueType b) noexcept {
    return op != ArithOp::Div && a == ValueType::Int && b == ValueType::Int
        ? ValueType::Int : ValueType::Float;
}

// ─── Shape helpers ────────────────────────────────────────────────────────────

/// Members of any temporal value; an instant becomes a one-instant Discrete
/// sequence.
std::vector<TSequence> members_of(const Temporal& temporal) {
    return std::visit(overloaded{
        [](const TInstant& i) {
            return std::vector<TSequence>{*TSequence::make({i}, Interpolation::Discrete)};
        },
        [](const TSequence& s) { return std::vector<TSequence>{s}; },
        [](const TSequenceSet& s) {
            return std::vector<TSequence>(s.sequences().begin(), s.sequences().end());
        },
    }, temporal);
}

std::vector<TInstant> all_instants(const Temporal& temporal) {
    return std::visit(overloaded{
        [](const TInstant& i) { return std::vector<TInstant>{i}; },
        [](const TSequence& s) {
            return std::vector<TInstant>(s.instants().begin(), s.instants().end());
        },
        [](const TSequenceSet& s) { return s.instants(); },
    }, temporal);
}

Result<Temporal> to_set(std::vector<TSequence> pieces, ValueType type, Interpolation interp) {
    if (pieces.empty()) return TSequenceSet::empty(type, interp);
    auto set = TSequenceSet::make(std::move(pieces));
    if (!set) return std::move(set).error();
    return std::move(*set);
}

/// Closes `run` into a sequence appended to `pieces`.
std::optional<Error> emit(std::vector<TInstant>& run, Interpolation interp,
                          bool lower_inc, bool upper_inc, std::vector<TSequence>& pieces) {
    if (run.size() == 1) lower_inc = upper_inc = true;
    auto seq = TSequence::make(std::move(run), interp, lower_inc, upper_inc);
    run.clear();
    if (!seq) return std::move(seq).error();
    pieces.push_back(std::move(*seq));
    return std::nullopt;
}

/// Same instants and bounds with every value replaced by `fn(value)`.
template <typename Fn>
Result<TSequence> map_sequence(const TSequence& seq, Fn& fn) {
    std::vector<TInstant> out;
    out.reserve(seq.num_instants());
    for (const auto& inst : seq.instants()) {
        auto v = fn(inst.value());
        if (!v) return std::move(v).error();
        out.emplace_back(std::move(*v), inst.timestamp());
    }
    return TSequence::make(std::move(out), seq.interpolation(), seq.lower_inc(), seq.upper_inc());
}

template <typename Fn>
Result<Temporal> map_values(const Temporal& temporal, ValueType result_type, Fn fn) {
    return std::visit(overloaded{
        [&](const TInstant& i) -> Result<Temporal> {
            auto v = fn(i.value());
            if (!v) return std::move(v).error();
            return TInstant(std::move(*v), i.timestamp());
        },
        [&](const TSequence& s) -> Result<Temporal> {
            auto mapped = map_sequence(s, fn);
            if (!mapped) return std::move(mapped).error();
            return std::move(*mapped);
        },
        [&](const TSequenceSet& s) -> Result<Temporal> {
            std::vector<TSequence> out;
            out.reserve(s.num_sequences());
            for (const auto& member : s.sequences()) {
                auto mapped = map_sequence(member, fn);
                if (!mapped) return std::move(mapped).error();
                out.push_back(std::move(*mapped));
            }
            return to_set(std::move(out), result_type, s.interpolation());
        },
    }, temporal);
}

// ─── Synchronisation ──────────────────────────────────────────────────────────

/// Value of a continuous sequence at t in [start, end], ignoring bounds.
Value value_within(const TSequence& seq, Timestamp t) {
    const auto inst = seq.instants();
    const auto next = std::upper_bound(inst.begin(), inst.end(), t,
        [](Timestamp x, const TInstant& i) { return x < i.timestamp(); });
    if (next == inst.begin()) return inst.front().value();
    const auto& at = *std::prev(next);
    if (next == inst.end() || at.timestamp() == t ||
        seq.interpolation() != Interpolation::Linear) {
        return at.value();
    }
    const double f = Interpolator::fraction(at.timestamp(), next->timestamp(), t);
    return *Interpolator::linear(at.value(), next->value(), f);
}

/// Value approached from the left of t. Precondition: start < t <= end.
Value value_before(const TSequence& seq, Timestamp t) {
    if (seq.interpolation() == Interpolation::Linear) return value_within(seq, t);
    const auto inst = seq.instants();
    const auto at = std::lower_bound(inst.begin(), inst.end(), t,
        [](const TInstant& i, Timestamp x) { return i.timestamp() < x; });
    return std::prev(at)->value();
}

struct SyncOptions {
    bool turning_points  = false;  ///< cut products of two Linear operands at their extremum
    bool nonzero_divisor = false;  ///< the right operand may not change sign on a segment
};

/// Cuts of [lo, hi]: both operands' instants plus the extra cuts `opts` asks for.
Result<std::vector<Timestamp>>
cuts_of(const TSequence& a, const TSequence& b, Timestamp lo, Timestamp hi,
        const SyncOptions& opts) {
    std::vector<Timestamp> cuts{lo, hi};
    for (const TSequence* s : {&a, &b}) {
        for (const auto& inst : s->instants()) {
            if (inst.timestamp() > lo && inst.timestamp() < hi) cuts.push_back(inst.timestamp());
        }
    }
    std::sort(cuts.begin(), cuts.end());
    cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());
    if (!opts.turning_points && !opts.nonzero_divisor) return cuts;

    const bool both_linear = a.interpolation() == Interpolation::Linear &&
                             b.interpolation() == Interpolation::Linear;
    std::vector<Timestamp> extra;
    for (std::size_t k = 0; k + 1 < cuts.size(); ++k) {
        const double a0 = as_double(value_within(a, cuts[k]));
        const double a1 = as_double(value_before(a, cuts[k + 1]));
        const double b0 = as_double(value_within(b, cuts[k]));
        const double b1 = as_double(value_before(b, cuts[k + 1]));
        if (opts.nonzero_divisor && ((b0 < 0.0 && b1 > 0.0) || (b0 > 0.0 && b1 < 0.0))) {
            return Error::make(ErrorKind::InvalidArgument, "divisor crosses zero");
        }
        if (!opts.turning_points || !both_linear) continue;
        // (a0 + da·f)(b0 + db·f) is extremal where its derivative vanishes.
        const double da = a1 - a0;
        const double db = b1 - b0;
        if (da == 0.0 || db == 0.0) continue;
        const double f = -(a0 * db + b0 * da) / (2.0 * da * db);
        if (f <= 0.0 || f >= 1.0) continue;
        const Timestamp t = Interpolator::at_fraction(cuts[k], cuts[k + 1], f);
        if (t > cuts[k] && t < cuts[k + 1]) extra.push_back(t);
    }
    cuts.insert(cuts.end(), extra.begin(), extra.end());
    std::sort(cuts.begin(), cuts.end());
    return cuts;
}

/// `fn` applied to two sequences on their common time.
template <typename Fn>
Result<std::vector<TSequence>>
synchronize(const TSequence& a, const TSequence& b, Fn& fn, const SyncOptions& opts) {
    std::vector<TSequence> pieces;

    if (a.interpolation() == Interpolation::Discrete ||
        b.interpolation() == Interpolation::Discrete) {
        const TSequence& sampler = a.interpolation() == Interpolation::Discrete ? a : b;
        std::vector<TInstant> out;
        for (const auto& inst : sampler.instants()) {
            const auto va = a.value_at(inst.timestamp());
            const auto vb = b.value_at(inst.timestamp());
            if (!va || !vb) continue;  // not defined on both sides
            auto r = fn(*va, *vb);
            if (!r) return std::move(r).error();
            out.emplace_back(std::move(*r), inst.timestamp());
        }
        if (!out.empty()) {
            auto seq = TSequence::make(std::move(out), Interpolation::Discrete);
            if (!seq) return std::move(seq).error();
            pieces.push_back(std::move(*seq));
        }
        return pieces;
    }

    const auto common = a.bounding_box().intersection(b.bounding_box());
    if (!common) return pieces;
    const Interpolation interp =
        a.interpolation() == Interpolation::Linear || b.interpolation() == Interpolation::Linear
            ? Interpolation::Linear : Interpolation::Step;
    const Timestamp lo = common->lower();
    const Timestamp hi = common->upper();

    std::vector<TInstant> run;
    if (lo == hi) {
        auto r = fn(value_within(a, lo), value_within(b, lo));
        if (!r) return std::move(r).error();
        run.emplace_back(std::move(*r), lo);
        if (auto err = emit(run, interp, true, true, pieces)) return std::move(*err);
        return pieces;
    }

    auto cuts = cuts_of(a, b, lo, hi, opts);
    if (!cuts) return std::move(cuts).error();

    if (interp == Interpolation::Step) {
        for (std::size_t k = 0; k + 1 < cuts->size(); ++k) {
            const Timestamp t = (*cuts)[k];
            auto r = fn(value_within(a, t), value_within(b, t));
            if (!r) return std::move(r).error();
            run.emplace_back(std::move(*r), t);
        }
        auto last = common->upper_inc() ? fn(value_within(a, hi), value_within(b, hi))
                                        : fn(value_before(a, hi), value_before(b, hi));
        if (!last) return std::move(last).error();
        run.emplace_back(std::move(*last), hi);
        if (auto err = emit(run, interp, common->lower_inc(), common->upper_inc(), pieces)) {
            return std::move(*err);
        }
        return pieces;
    }

    // Linear result: a Step operand that jumps at a cut splits the result there.
    bool lower_inc = common->lower_inc();
    auto first = fn(value_within(a, lo), value_within(b, lo));
    if (!first) return std::move(first).error();
    run.emplace_back(std::move(*first), lo);
    for (std::size_t k = 1; k < cuts->size(); ++k) {
        const Timestamp t = (*cuts)[k];
        const bool last = k + 1 == cuts->size();
        auto before = fn(value_before(a, t), value_before(b, t));
        if (!before) return std::move(before).error();
        if (last && !common->upper_inc()) {
            run.emplace_back(std::move(*before), t);
            if (auto err = emit(run, interp, lower_inc, false, pieces)) return std::move(*err);
            break;
        }
        auto at = fn(value_within(a, t), value_within(b, t));
        if (!at) return std::move(at).error();
        if (*at == *before) {
            run.emplace_back(std::move(*at), t);
            if (last) {
                if (auto err = emit(run, interp, lower_inc, true, pieces)) return std::move(*err);
            }
            continue;
        }
        run.emplace_back(std::move(*before), t);
        if (auto err = emit(run, interp, lower_inc, false, pieces)) return std::move(*err);
        run.emplace_back(std::move(*at), t);
        lower_inc = true;
        if (last) {
            if (auto err = emit(run, interp, true, true, pieces)) return std::move(*err);
        }
    }
    return pieces;
}

Interpolation result_interpolation(const Temporal& lhs, const Temporal& rhs, ValueType type) {
    const auto l = interpolation_of(lhs);
    const auto r = interpolation_of(rhs);
    const auto sampled = [](Interpolation i) {
        return i == Interpolation::None || i == Interpolation::Discrete;
    };
    if (sampled(l) || sampled(r)) return Interpolation::Discrete;
    if ((l == Interpolation::Linear || r == Interpolation::Linear) && is_linear_interpolable(type)) {
        return Interpolation::Linear;
    }
    return Interpolation::Step;
}

template <typename Fn>
Result<Temporal> lift_binary(const Temporal& lhs, const Temporal& rhs, ValueType result_type,
                             Fn fn, const SyncOptions& opts = {}) {
    const auto xs = members_of(lhs);
    const auto ys = members_of(rhs);
    std::vector<TSequence> pieces;
    for (const auto& x : xs) {
        for (const auto& y : ys) {
            if (!x.bounding_box().overlaps(y.bounding_box())) continue;
            auto part = synchronize(x, y, fn, opts);
            if (!part) return std::move(part).error();
            for (auto& p : *part) pieces.push_back(std::move(p));
        }
    }
    if (std::holds_alternative<TInstant>(lhs) || std::holds_alternative<TInstant>(rhs)) {
        if (pieces.empty()) {
            return Error::make(ErrorKind::NoValueAtTimestamp, "operands share no timestamp");
        }
        return pieces.front().start_instant();
    }
    return to_set(std::move(pieces), result_type, result_interpolation(lhs, rhs, result_type));
}

// ─── Arithmetic ───────────────────────────────────────────────────────────────

Result<Temporal> arithmetic(const Temporal& temporal, const Value& value, ArithOp op) {
    const ValueType type = value_type_of(temporal);
    if (!is_numeric(type) || !is_numeric(value_type(value))) {
        return Error::make(ErrorKind::TypeMismatch, "arithmetic needs Int or Float operands");
    }
    if (op == ArithOp::Div && as_double(value) == 0.0) {
        return Error::make(ErrorKind::InvalidArgument, "division by zero");
    }
    return map_values(temporal, arith_type(op, type, value_type(value)),
                      [&](const Value& v) { return combine(op, v, value); });
}

Result<Temporal> arithmetic(const Temporal& lhs, const Temporal& rhs, ArithOp op) {
    const ValueType l = value_type_of(lhs);
    const ValueType r = value_type_of(rhs);
    if (!is_numeric(l) || !is_numeric(r)) {
        return Error::make(ErrorKind::TypeMismatch, "arithmetic needs temporal numbers");
    }
    SyncOptions opts;
    opts.turning_points  = op == ArithOp::Mul;
    opts.nonzero_divisor = op == ArithOp::Div;
    return lift_binary(lhs, rhs, arith_type(op, l, r),
                       [op](const Value& a, const Value& b) { return combine(op, a, b); }, opts);
}

/// Linear sequence with an instant added wherever a segment crosses zero.
Result<TSequence> with_zero_crossings(const TSequence& seq) {
    if (seq.interpolation() != Interpolation::Linear) return seq;
    const auto inst = seq.instants();
    std::vector<TInstant> out;
    out.reserve(inst.size());
    for (std::size_t i = 0; i < inst.size(); ++i) {
        out.push_back(inst[i]);
        if (i + 1 == inst.size()) break;
        const double v0 = std::get<double>(inst[i].value());
        const double v1 = std::get<double>(inst[i + 1].value());
        if ((v0 < 0.0 && v1 > 0.0) || (v0 > 0.0 && v1 < 0.0)) {
            const Timestamp t = Interpolator::at_fraction(
                inst[i].timestamp(), inst[i + 1].timestamp(), v0 / (v0 - v1));
            if (t > inst[i].timestamp() && t < inst[i + 1].timestamp()) {
                out.emplace_back(Value(0.0), t);
            }
        }
    }
    return TSequence::make(std::move(out), Interpolation::Linear, seq.lower_inc(), seq.upper_inc());
}

Result<TSequence> delta_sequence(const TSequence& seq) {
    const auto inst = seq.instants();
    if (inst.size() < 2) {
        return Error::make(ErrorKind::InvalidArgument, "delta needs at least two instants");
    }
    std::vector<TInstant> out;
    out.reserve(inst.size());
    for (std::size_t i = 0; i + 1 < inst.size(); ++i) {
        auto d = combine(ArithOp::Sub, inst[i + 1].value(), inst[i].value());
        if (!d) return std::move(d).error();
        out.emplace_back(std::move(*d), inst[i].timestamp());
    }
    Value last = out.back().value();
    out.emplace_back(std::move(last), inst.back().timestamp());
    return TSequence::make(std::move(out), Interpolation::Step, seq.lower_inc(), false);
}

// ─── Comparison ───────────────────────────────────────────────────────────────

/// Step boolean runs of a continuous sequence: true on the time it equals
/// `value`, false elsewhere.
Result<std::vector<TSequence>> equality_runs(const TSequence& seq, const Value& value) {
    const TsTzSpanSet equal  = seq.at_value(value).time();
    const TsTzSpanSet differ = seq.time().minus(equal);

    std::vector<std::pair<TsTzSpan, bool>> parts;
    for (const auto& s : equal.spans())  parts.emplace_back(s, true);
    for (const auto& s : differ.spans()) parts.emplace_back(s, false);
    std::sort(parts.begin(), parts.end(),
              [](const auto& x, const auto& y) { return x.first < y.first; });

    std::vector<TSequence> pieces;
    std::vector<TInstant> run;
    bool run_lower_inc = true;
    for (std::size_t k = 0; k < parts.size(); ++k) {
        const auto& [span, flag] = parts[k];
        if (run.empty()) run_lower_inc = span.lower_inc();
        run.emplace_back(Value(flag), span.lower());
        const bool joins_next = k + 1 < parts.size() && !span.upper_inc() &&
                                parts[k + 1].first.lower_inc() &&
                                parts[k + 1].first.lower() == span.upper();
        if (joins_next) continue;
        if (span.upper() > span.lower()) run.emplace_back(Value(flag), span.upper());
        if (auto err = emit(run, Interpolation::Step, run_lower_inc, span.upper_inc(), pieces)) {
            return std::move(*err);
        }
    }
    return pieces;
}

// ─── Points ───────────────────────────────────────────────────────────────────

Result<TSequence> speed_sequence(const TSequence& seq, const DistanceMetric& metric) {
    if (seq.interpolation() == Interpolation::Discrete) {
        return Error::make(ErrorKind::UndefinedForDiscrete, "speed of a discrete sequence");
    }
    if (seq.interpolation() == Interpolation::Step) {
        return Error::make(ErrorKind::IncompatibleInterpolation,
                           "speed needs linear interpolation");
    }
    const auto inst = seq.instants();
    if (inst.size() < 2) {
        return Error::make(ErrorKind::InvalidArgument, "speed needs at least two instants");
    }
    std::vector<TInstant> out;
    out.reserve(inst.size());
    for (std::size_t i = 0; i + 1 < inst.size(); ++i) {
        const double seconds = std::chrono::duration<double>(
            inst[i + 1].timestamp() - inst[i].timestamp()).count();
        const double d = metric.distance(std::get<Point>(inst[i].value()),
                                         std::get<Point>(inst[i + 1].value()));
        out.emplace_back(Value(d / seconds), inst[i].timestamp());
    }
    Value last = out.back().value();
    out.emplace_back(std::move(last), inst.back().timestamp());
    return TSequence::make(std::move(out), Interpolation::Step, seq.lower_inc(), seq.upper_inc());
}

/// Running distance along `seq`, starting from `travelled` and advancing it.
Result<TSequence> cumulative_sequence(const TSequence& seq, const DistanceMetric& metric,
                                      double& travelled) {
    const auto inst = seq.instants();
    std::vector<TInstant> out;
    out.reserve(inst.size());
    for (std::size_t i = 0; i < inst.size(); ++i) {
        if (i > 0 && seq.interpolation() == Interpolation::Linear) {
            travelled += metric.distance(std::get<Point>(inst[i - 1].value()),
                                         std::get<Point>(inst[i].value()));
        }
        out.emplace_back(Value(travelled), inst[i].timestamp());
    }
    return TSequence::make(std::move(out), seq.interpolation(), seq.lower_inc(), seq.upper_inc());
}

Result<TInstant> extreme_instant(const Temporal& temporal, bool largest) {
    if (is_spatial(value_type_of(temporal))) {
        return Error::make(ErrorKind::TypeMismatch, "points have no value order");
    }
    const auto instants = all_instants(temporal);
    if (instants.empty()) {
        return Error::make(ErrorKind::InvalidArgument, "empty sequence set has no instants");
    }
    const auto less = [](const TInstant& a, const TInstant& b) {
        return value_less(a.value(), b.value());
    };
    return largest ? *std::max_element(instants.begin(), instants.end(), less)
                   : *std::min_element(instants.begin(), instants.end(), less);
}

}  // namespace

// ─── Accessors ────────────────────────────────────────────────────────────────

Result<Value> start_value(const Temporal& temporal) {
    return std::visit(overloaded{
        [](const TInstant& i) -> Result<Value> { return i.value(); },
        [](const TSequence& s) -> Result<Value> { return s.start_instant().value(); },
        [](const TSequenceSet& s) -> Result<Value> {
            if (s.is_empty()) {
                return Error::make(ErrorKind::InvalidArgument, "empty sequence set has no start");
            }
            return s.sequences().front().start_instant().value();
        },
    }, temporal);
}

Result<Value> end_value(const Temporal& temporal) {
    return std::visit(overloaded{
        [](const TInstant& i) -> Result<Value> { return i.value(); },
        [](const TSequence& s) -> Result<Value> { return s.end_instant().value(); },
        [](const TSequenceSet& s) -> Result<Value> {
            if (s.is_empty()) {
                return Error::make(ErrorKind::InvalidArgument, "empty sequence set has no end");
            }
            return s.sequences().back().end_instant().value();
        },
    }, temporal);
}

Result<TInstant> min_instant(const Temporal& temporal) { return extreme_instant(temporal, false); }
Result<TInstant> max_instant(const Temporal& temporal) { return extreme_instant(temporal, true); }

std::vector<Value> value_set(const Temporal& temporal) {
    std::vector<Value> values;
    for (const auto& inst : all_instants(temporal)) values.push_back(inst.value());
    std::sort(values.begin(), values.end(), value_less);
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

// ─── Temporal numbers ─────────────────────────────────────────────────────────

Result<Temporal> add(const Temporal& t, const Value& v) { return arithmetic(t, v, ArithOp::Add); }
Result<Temporal> sub(const Temporal& t, const Value& v) { return arithmetic(t, v, ArithOp::Sub); }
Result<Temporal> mul(const Temporal& t, const Value& v) { return arithmetic(t, v, ArithOp::Mul); }
Result<Temporal> div(const Temporal& t, const Value& v) { return arithmetic(t, v, ArithOp::Div); }

Result<Temporal> add(const Temporal& l, const Temporal& r) { return arithmetic(l, r, ArithOp::Add); }
Result<Temporal> sub(const Temporal& l, const Temporal& r) { return arithmetic(l, r, ArithOp::Sub); }
Result<Temporal> mul(const Temporal& l, const Temporal& r) { return arithmetic(l, r, ArithOp::Mul); }
Result<Temporal> div(const Temporal& l, const Temporal& r) { return arithmetic(l, r, ArithOp::Div); }

Result<Temporal> abs(const Temporal& temporal) {
    const ValueType type = value_type_of(temporal);
    if (!is_numeric(type)) {
        return Error::make(ErrorKind::TypeMismatch, "abs needs a temporal number");
    }
    Result<Temporal> crossed = std::visit(overloaded{
        [](const TInstant& i) -> Result<Temporal> { return i; },
        [](const TSequence& s) -> Result<Temporal> {
            auto r = with_zero_crossings(s);
            if (!r) return std::move(r).error();
            return std::move(*r);
        },
        [&](const TSequenceSet& s) -> Result<Temporal> {
            std::vector<TSequence> out;
            for (const auto& member : s.sequences()) {
                auto r = with_zero_crossings(member);
                if (!r) return std::move(r).error();
                out.push_back(std::move(*r));
            }
            return to_set(std::move(out), type, s.interpolation());
        },
    }, temporal);
    if (!crossed) return crossed;

    return map_values(*crossed, type, [](const Value& v) -> Result<Value> {
        if (const auto* i = std::get_if<std::int64_t>(&v)) {
            if (*i == std::numeric_limits<std::int64_t>::min()) {
                return Error::make(ErrorKind::InvalidArgument, "integer overflow");
            }
            return *i < 0 ? -*i : *i;
        }
        return std::fabs(std::get<double>(v));
    });
}

Result<Temporal> round(const Temporal& temporal, int digits) {
    const ValueType type = value_type_of(temporal);
    if (!is_numeric(type)) {
        return Error::make(ErrorKind::TypeMismatch, "round needs a temporal number");
    }
    if (digits < 0) {
        return Error::make(ErrorKind::InvalidArgument, "round needs a non-negative digit count");
    }
    const double scale = std::pow(10.0, digits);
    return map_values(temporal, type, [scale](const Value& v) -> Result<Value> {
        const auto* d = std::get_if<double>(&v);
        if (!d) return v;
        const double scaled = *d * scale;
        if (!std::isfinite(scaled)) return v;  // already finer than the digits kept
        return std::round(scaled) / scale;
    });
}

Result<Temporal> delta_value(const Temporal& temporal) {
    const ValueType type = value_type_of(temporal);
    if (!is_numeric(type)) {
        return Error::make(ErrorKind::TypeMismatch, "delta needs a temporal number");
    }
    const Interpolation interp = interpolation_of(temporal);
    if (interp == Interpolation::None || interp == Interpolation::Discrete) {
        return Error::make(ErrorKind::UndefinedForDiscrete, "delta of discrete values");
    }
    if (const auto* seq = std::get_if<TSequence>(&temporal)) {
        auto r = delta_sequence(*seq);
        if (!r) return std::move(r).error();
        return std::move(*r);
    }
    std::vector<TSequence> out;
    for (const auto& member : std::get<TSequenceSet>(temporal).sequences()) {
        if (member.num_instants() < 2) continue;
        auto r = delta_sequence(member);
        if (!r) return std::move(r).error();
        out.push_back(std::move(*r));
    }
    return to_set(std::move(out), type, Interpolation::Step);
}

// ─── Temporal booleans ────────────────────────────────────────────────────────

namespace {

Error not_boolean() {
    return Error::make(ErrorKind::TypeMismatch, "logical operators need temporal booleans");
}

}  // namespace

Result<Temporal> logical_not(const Temporal& temporal) {
    if (value_type_of(temporal) != ValueType::Bool) return not_boolean();
    return map_values(temporal, ValueType::Bool,
                      [](const Value& v) -> Result<Value> { return !std::get<bool>(v); });
}

Result<Temporal> logical_and(const Temporal& temporal, bool value) {
    if (value_type_of(temporal) != ValueType::Bool) return not_boolean();
    return map_values(temporal, ValueType::Bool, [value](const Value& v) -> Result<Value> {
        return std::get<bool>(v) && value;
    });
}

Result<Temporal> logical_or(const Temporal& temporal, bool value) {
    if (value_type_of(temporal) != ValueType::Bool) return not_boolean();
    return map_values(temporal, ValueType::Bool, [value](const Value& v) -> Result<Value> {
        return std::get<bool>(v) || value;
    });
}

Result<Temporal> logical_and(const Temporal& lhs, const Temporal& rhs) {
    if (value_type_of(lhs) != ValueType::Bool || value_type_of(rhs) != ValueType::Bool) {
        return not_boolean();
    }
    return lift_binary(lhs, rhs, ValueType::Bool,
                       [](const Value& a, const Value& b) -> Result<Value> {
                           return std::get<bool>(a) && std::get<bool>(b);
                       });
}

Result<Temporal> logical_or(const Temporal& lhs, const Temporal& rhs) {
    if (value_type_of(lhs) != ValueType::Bool || value_type_of(rhs) != ValueType::Bool) {
        return not_boolean();
    }
    return lift_binary(lhs, rhs, ValueType::Bool,
                       [](const Value& a, const Value& b) -> Result<Value> {
                           return std::get<bool>(a) || std::get<bool>(b);
                       });
}

// ─── Comparison ───────────────────────────────────────────────────────────────

Result<Temporal> temporal_eq(const Temporal& temporal, const Value& value) {
    if (value_type(value) != value_type_of(temporal)) {
        return Error::make(ErrorKind::TypeMismatch, "compared value is of another domain");
    }
    auto equals = [&](const Value& v) -> Result<Value> { return v == value; };
    return std::visit(overloaded{
        [&](const TInstant& i) -> Result<Temporal> {
            return TInstant(i.value() == value, i.timestamp());
        },
        [&](const TSequence& s) -> Result<Temporal> {
            if (s.interpolation() == Interpolation::Discrete) {
                auto mapped = map_sequence(s, equals);
                if (!mapped) return std::move(mapped).error();
                return std::move(*mapped);
            }
            auto pieces = equality_runs(s, value);
            if (!pieces) return std::move(pieces).error();
            return to_set(std::move(*pieces), ValueType::Bool, Interpolation::Step);
        },
        [&](const TSequenceSet& s) -> Result<Temporal> {
            if (s.interpolation() == Interpolation::Discrete) {
                return map_values(temporal, ValueType::Bool, equals);
            }
            std::vector<TSequence> out;
            for (const auto& member : s.sequences()) {
                auto pieces = equality_runs(member, value);
                if (!pieces) return std::move(pieces).error();
                for (auto& p : *pieces) out.push_back(std::move(p));
            }
            return to_set(std::move(out), ValueType::Bool, Interpolation::Step);
        },
    }, temporal);
}

Result<Temporal> temporal_ne(const Temporal& temporal, const Value& value) {
    auto eq = temporal_eq(temporal, value);
    if (!eq) return eq;
    return logical_not(*eq);
}

// ─── Temporal points ──────────────────────────────────────────────────────────

Result<Temporal> speed(const Temporal& temporal, const DistanceMetric& metric) {
    if (!is_spatial(value_type_of(temporal))) {
        return Error::make(ErrorKind::TypeMismatch, "speed needs a temporal point");
    }
    return std::visit(overloaded{
        [](const TInstant&) -> Result<Temporal> {
            return Error::make(ErrorKind::UndefinedForDiscrete, "speed of an instant");
        },
        [&](const TSequence& s) -> Result<Temporal> {
            auto r = speed_sequence(s, metric);
            if (!r) return std::move(r).error();
            return std::move(*r);
        },
        [&](const TSequenceSet& s) -> Result<Temporal> {
            if (s.interpolation() == Interpolation::Discrete) {
                return Error::make(ErrorKind::UndefinedForDiscrete, "speed of a discrete sequence");
            }
            if (s.interpolation() == Interpolation::Step) {
                return Error::make(ErrorKind::IncompatibleInterpolation,
                                   "speed needs linear interpolation");
            }
            std::vector<TSequence> out;
            for (const auto& member : s.sequences()) {
                if (member.num_instants() < 2) continue;
                auto r = speed_sequence(member, metric);
                if (!r) return std::move(r).error();
                out.push_back(std::move(*r));
            }
            return to_set(std::move(out), ValueType::Float, Interpolation::Step);
        },
    }, temporal);
}

Result<Temporal> cumulative_length(const Temporal& temporal, const DistanceMetric& metric) {
    if (!is_spatial(value_type_of(temporal))) {
        return Error::make(ErrorKind::TypeMismatch, "cumulative length needs a temporal point");
    }
    double travelled = 0.0;
    return std::visit(overloaded{
        [](const TInstant& i) -> Result<Temporal> { return TInstant(Value(0.0), i.timestamp()); },
        [&](const TSequence& s) -> Result<Temporal> {
            auto r = cumulative_sequence(s, metric, travelled);
            if (!r) return std::move(r).error();
            return std::move(*r);
        },
        [&](const TSequenceSet& s) -> Result<Temporal> {
            std::vector<TSequence> out;
            out.reserve(s.num_sequences());
            for (const auto& member : s.sequences()) {
                auto r = cumulative_sequence(member, metric, travelled);
                if (!r) return std::move(r).error();
                out.push_back(std::move(*r));
            }
            return to_set(std::move(out), ValueType::Float, s.interpolation());
        },
    }, temporal);
}

}  // namespace tempus
