/// @file tests/temporal/test_operations.cpp
/// @brief Tests for arithmetic, logic, comparison and point kinematics over
///        temporal values.

#include "tempus/operations.hpp"
#include "tempus/time.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace tempus;

namespace {

Timestamp ts(unsigned day, unsigned hour = 0) {
    return *make_timestamp(2000, 1, day, hour);
}

TsTzSpan period(Timestamp lo, Timestamp hi, bool li = true, bool ui = true) {
    return *TsTzSpan::make(lo, hi, li, ui);
}

TSequence make_seq(std::vector<TInstant> instants, Interpolation interp,
                   bool li = true, bool ui = true) {
    auto s = TSequence::make(std::move(instants), interp, li, ui);
    EXPECT_TRUE(s.has_value());
    return *s;
}

/// 0 → 10 → 0, one day per segment.
TSequence tent() {
    return make_seq({TInstant(0.0, ts(1)), TInstant(10.0, ts(2)), TInstant(0.0, ts(3))},
                    Interpolation::Linear);
}

/// 1, 2, 1, 1 under step interpolation.
TSequence steps() {
    return make_seq({TInstant(std::int64_t{1}, ts(1)), TInstant(std::int64_t{2}, ts(2)),
                     TInstant(std::int64_t{1}, ts(3)), TInstant(std::int64_t{1}, ts(4))},
                    Interpolation::Step);
}

/// -1 → 1 over two days.
TSequence rising() {
    return make_seq({TInstant(-1.0, ts(1)), TInstant(1.0, ts(3))}, Interpolation::Linear);
}

const TSequenceSet& as_set(const Result<Temporal>& r) {
    return std::get<TSequenceSet>(*r);
}

double at(const TSequenceSet& set, Timestamp t) {
    return std::get<double>(*set.value_at(t));
}

bool flag_at(const TSequenceSet& set, Timestamp t) {
    return std::get<bool>(*set.value_at(t));
}

}  // namespace

// ─── Accessors ────────────────────────────────────────────────────────────────

TEST(Accessors, StartAndEndValue) {
    const Temporal r = make_seq({TInstant(1.0, ts(1)), TInstant(3.0, ts(2)), TInstant(2.0, ts(3))},
                                Interpolation::Linear);
    EXPECT_EQ(*start_value(r), Value(1.0));
    EXPECT_EQ(*end_value(r), Value(2.0));
    EXPECT_EQ(*start_value(Temporal(TInstant(true, ts(1)))), Value(true));

    const Temporal empty = TSequenceSet::empty(ValueType::Float, Interpolation::Linear);
    EXPECT_EQ(start_value(empty).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(end_value(empty).error_kind(), ErrorKind::InvalidArgument);
}

TEST(Accessors, ExtremeInstantsPreferEarliest) {
    const Temporal s = steps();
    const auto lo = min_instant(s);
    ASSERT_TRUE(lo.has_value());
    EXPECT_EQ(lo->timestamp(), ts(1));
    const auto hi = max_instant(s);
    ASSERT_TRUE(hi.has_value());
    EXPECT_EQ(hi->timestamp(), ts(2));
    EXPECT_EQ(hi->value(), Value(std::int64_t{2}));
}

TEST(Accessors, ExtremeInstantsNeedOrderedValues) {
    const Temporal p = TInstant(Point::xy(0, 0), ts(1));
    EXPECT_EQ(min_instant(p).error_kind(), ErrorKind::TypeMismatch);
    const Temporal empty = TSequenceSet::empty(ValueType::Int, Interpolation::Step);
    EXPECT_EQ(max_instant(empty).error_kind(), ErrorKind::InvalidArgument);
}

TEST(Accessors, ValueSetIsDistinctAndSorted) {
    EXPECT_EQ(value_set(steps()), (std::vector<Value>{std::int64_t{1}, std::int64_t{2}}));
    EXPECT_EQ(value_set(tent()), (std::vector<Value>{0.0, 10.0}));
    EXPECT_TRUE(value_set(TSequenceSet::empty(ValueType::Text, Interpolation::Step)).empty());
}

// ─── Arithmetic with a constant ───────────────────────────────────────────────

TEST(ScalarArithmetic, IntPlusIntStaysInt) {
    const auto r = add(steps(), Value(std::int64_t{3}));
    ASSERT_TRUE(r.has_value());
    const auto& seq = std::get<TSequence>(*r);
    EXPECT_EQ(seq.interpolation(), Interpolation::Step);
    EXPECT_EQ(seq.values(), (std::vector<Value>{std::int64_t{4}, std::int64_t{5},
                                                std::int64_t{4}, std::int64_t{4}}));
}

TEST(ScalarArithmetic, DivisionIsAlwaysFloat) {
    const auto r = div(steps(), Value(std::int64_t{2}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(value_type_of(*r), ValueType::Float);
    EXPECT_EQ(std::get<TSequence>(*r).start_instant().value(), Value(0.5));
}

TEST(ScalarArithmetic, LinearKeepsShape) {
    const auto r = mul(tent(), Value(2.0));
    ASSERT_TRUE(r.has_value());
    const auto& seq = std::get<TSequence>(*r);
    EXPECT_EQ(seq.interpolation(), Interpolation::Linear);
    EXPECT_DOUBLE_EQ(std::get<double>(*seq.value_at(ts(1, 12))), 10.0);

    const auto shifted = sub(tent(), Value(std::int64_t{1}));
    EXPECT_EQ(std::get<TSequence>(*shifted).start_instant().value(), Value(-1.0));
}

TEST(ScalarArithmetic, Errors) {
    EXPECT_EQ(div(tent(), Value(0.0)).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(div(steps(), Value(std::int64_t{0})).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(add(tent(), Value(std::string("1"))).error_kind(), ErrorKind::TypeMismatch);
    const Temporal text = TInstant(std::string("a"), ts(1));
    EXPECT_EQ(add(text, Value(1.0)).error_kind(), ErrorKind::TypeMismatch);

    const Temporal big = TInstant(std::numeric_limits<std::int64_t>::max(), ts(1));
    EXPECT_EQ(add(big, Value(std::int64_t{1})).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(mul(big, Value(std::int64_t{2})).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_TRUE(sub(big, Value(std::int64_t{1})).has_value());
}

TEST(ScalarArithmetic, EmptySetTakesResultType) {
    const Temporal empty = TSequenceSet::empty(ValueType::Int, Interpolation::Step);
    const auto r = div(empty, Value(std::int64_t{2}));
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(as_set(r).is_empty());
    EXPECT_EQ(as_set(r).value_type(), ValueType::Float);
}

// ─── Arithmetic on two temporal numbers ───────────────────────────────────────

TEST(TemporalArithmetic, EvaluatedOnCommonTime) {
    const Temporal a = make_seq({TInstant(0.0, ts(1)), TInstant(10.0, ts(3))},
                                Interpolation::Linear);
    const Temporal b = make_seq({TInstant(5.0, ts(2)), TInstant(5.0, ts(4))},
                                Interpolation::Linear);
    const auto r = add(a, b);
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    ASSERT_EQ(set.num_sequences(), 1u);
    EXPECT_EQ(set.sequences()[0].bounding_box(), period(ts(2), ts(3)));
    EXPECT_DOUBLE_EQ(at(set, ts(2)), 10.0);
    EXPECT_DOUBLE_EQ(at(set, ts(3)), 15.0);
}

TEST(TemporalArithmetic, ProductGainsTurningPoint) {
    const auto r = mul(rising(), rising());
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    ASSERT_EQ(set.num_sequences(), 1u);
    EXPECT_EQ(set.sequences()[0].timestamps(), (std::vector<Timestamp>{ts(1), ts(2), ts(3)}));
    EXPECT_DOUBLE_EQ(at(set, ts(2)), 0.0);
    EXPECT_DOUBLE_EQ(at(set, ts(3)), 1.0);
}

TEST(TemporalArithmetic, StepJumpSplitsLinearResult) {
    const Temporal step = make_seq({TInstant(1.0, ts(1)), TInstant(2.0, ts(2)),
                                    TInstant(2.0, ts(3))}, Interpolation::Step);
    const Temporal line = make_seq({TInstant(0.0, ts(1)), TInstant(2.0, ts(3))},
                                   Interpolation::Linear);
    const auto r = add(step, line);
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    EXPECT_EQ(set.interpolation(), Interpolation::Linear);
    ASSERT_EQ(set.num_sequences(), 2u);
    EXPECT_EQ(set.sequences()[0].bounding_box(), period(ts(1), ts(2), true, false));
    EXPECT_EQ(set.sequences()[1].bounding_box(), period(ts(2), ts(3)));
    EXPECT_DOUBLE_EQ(at(set, ts(1, 12)), 1.5);
    EXPECT_DOUBLE_EQ(at(set, ts(2)), 3.0);
    EXPECT_DOUBLE_EQ(at(set, ts(3)), 4.0);
}

TEST(TemporalArithmetic, StepOperandsStayStepAndInt) {
    const auto r = add(steps(), steps());
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    EXPECT_EQ(set.interpolation(), Interpolation::Step);
    EXPECT_EQ(std::get<std::int64_t>(*set.value_at(ts(2, 12))), 4);
}

TEST(TemporalArithmetic, DiscreteSamplesTheOtherOperand) {
    const Temporal d = make_seq({TInstant(1.0, ts(2)), TInstant(1.0, ts(5))},
                                Interpolation::Discrete);
    const auto r = add(d, tent());
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    EXPECT_EQ(set.interpolation(), Interpolation::Discrete);
    ASSERT_EQ(set.num_instants(), 1u);
    EXPECT_EQ(set.instants()[0], TInstant(11.0, ts(2)));
}

TEST(TemporalArithmetic, InstantOperandGivesInstant) {
    const Temporal i = TInstant(2.0, ts(2));
    const auto r = mul(i, tent());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(std::get<TInstant>(*r), TInstant(20.0, ts(2)));

    const Temporal outside = TInstant(2.0, ts(9));
    EXPECT_EQ(mul(outside, tent()).error_kind(), ErrorKind::NoValueAtTimestamp);
}

TEST(TemporalArithmetic, DisjointOperandsGiveEmptySet) {
    const Temporal later = tent().shift_time(std::chrono::days{10});
    const auto r = sub(tent(), later);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(as_set(r).is_empty());
    EXPECT_EQ(as_set(r).interpolation(), Interpolation::Linear);
}

TEST(TemporalArithmetic, DivisionByConstantSequence) {
    const Temporal two = make_seq({TInstant(2.0, ts(1)), TInstant(2.0, ts(3))},
                                  Interpolation::Linear);
    const auto r = div(tent(), two);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(at(as_set(r), ts(2)), 5.0);
}

TEST(TemporalArithmetic, DivisorCrossingZeroIsRejected) {
    EXPECT_EQ(div(tent(), rising()).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(add(tent(), TInstant(true, ts(1))).error_kind(), ErrorKind::TypeMismatch);
}

// ─── abs / round / delta_value ────────────────────────────────────────────────

TEST(Abs, LinearGainsZeroCrossing) {
    const auto r = abs(rising());
    ASSERT_TRUE(r.has_value());
    const auto& seq = std::get<TSequence>(*r);
    EXPECT_EQ(seq.values(), (std::vector<Value>{1.0, 0.0, 1.0}));
    EXPECT_EQ(seq.instants()[1].timestamp(), ts(2));
}

TEST(Abs, IntValues) {
    const Temporal neg = TInstant(std::int64_t{-3}, ts(1));
    EXPECT_EQ(std::get<TInstant>(*abs(neg)).value(), Value(std::int64_t{3}));
    const Temporal lowest = TInstant(std::numeric_limits<std::int64_t>::min(), ts(1));
    EXPECT_EQ(abs(lowest).error_kind(), ErrorKind::InvalidArgument);
}

TEST(Round, FloatsToDigits) {
    const Temporal v = make_seq({TInstant(1.23456, ts(1)), TInstant(-2.5, ts(2))},
                                Interpolation::Linear);
    const auto r = round(v, 2);
    ASSERT_TRUE(r.has_value());
    const auto& seq = std::get<TSequence>(*r);
    EXPECT_DOUBLE_EQ(std::get<double>(seq.start_instant().value()), 1.23);
    EXPECT_DOUBLE_EQ(std::get<double>(seq.end_instant().value()), -2.5);

    EXPECT_EQ(round(v, -1).error_kind(), ErrorKind::InvalidArgument);
    EXPECT_EQ(std::get<TSequence>(*round(steps(), 0)), steps());
    EXPECT_EQ(round(TInstant(true, ts(1)), 0).error_kind(), ErrorKind::TypeMismatch);
}

TEST(DeltaValue, ChangeBetweenInstants) {
    const auto r = delta_value(steps());
    ASSERT_TRUE(r.has_value());
    const auto& seq = std::get<TSequence>(*r);
    EXPECT_EQ(seq.interpolation(), Interpolation::Step);
    EXPECT_FALSE(seq.upper_inc());
    EXPECT_EQ(seq.values(), (std::vector<Value>{std::int64_t{1}, std::int64_t{-1},
                                                std::int64_t{0}, std::int64_t{0}}));
}

TEST(DeltaValue, SetDropsSingleInstantMembers) {
    const auto set = TSequenceSet::make({make_seq({TInstant(1.0, ts(1))}, Interpolation::Linear),
                                         tent().shift_time(std::chrono::days{2})});
    ASSERT_TRUE(set.has_value());
    const auto r = delta_value(*set);
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& out = as_set(r);
    ASSERT_EQ(out.num_sequences(), 1u);
    EXPECT_DOUBLE_EQ(at(out, ts(3)), 10.0);
    EXPECT_DOUBLE_EQ(at(out, ts(3, 12)), 10.0);
    EXPECT_DOUBLE_EQ(at(out, ts(4, 12)), -10.0);
    EXPECT_EQ(out.value_at(ts(5)).error_kind(), ErrorKind::NoValueAtTimestamp);
}

TEST(DeltaValue, Errors) {
    const Temporal d = make_seq({TInstant(1.0, ts(1)), TInstant(2.0, ts(2))},
                                Interpolation::Discrete);
    EXPECT_EQ(delta_value(d).error_kind(), ErrorKind::UndefinedForDiscrete);
    EXPECT_EQ(delta_value(TInstant(1.0, ts(1))).error_kind(), ErrorKind::UndefinedForDiscrete);
    const Temporal single = make_seq({TInstant(1.0, ts(1))}, Interpolation::Step);
    EXPECT_EQ(delta_value(single).error_kind(), ErrorKind::InvalidArgument);
}

// ─── Temporal booleans ────────────────────────────────────────────────────────

namespace {

/// true, false, false under step interpolation.
TSequence switch_off() {
    return make_seq({TInstant(true, ts(1)), TInstant(false, ts(2)), TInstant(false, ts(3))},
                    Interpolation::Step);
}

}  // namespace

TEST(Logic, NotAndConstantOperands) {
    const auto negated = logical_not(switch_off());
    ASSERT_TRUE(negated.has_value());
    EXPECT_EQ(std::get<TSequence>(*negated).values(), (std::vector<Value>{false, true, true}));

    EXPECT_EQ(std::get<TSequence>(*logical_and(switch_off(), true)), switch_off());
    EXPECT_EQ(std::get<TSequence>(*logical_or(switch_off(), true)).values(),
              (std::vector<Value>{true, true, true}));
}

TEST(Logic, TwoTemporalBooleans) {
    const Temporal a = make_seq({TInstant(true, ts(1)), TInstant(false, ts(3))},
                                Interpolation::Step);
    const Temporal b = make_seq({TInstant(true, ts(2)), TInstant(true, ts(4))},
                                Interpolation::Step);
    const auto both = logical_and(a, b);
    ASSERT_TRUE(both.has_value());
    const TSequenceSet& set = as_set(both);
    ASSERT_EQ(set.num_sequences(), 1u);
    EXPECT_EQ(set.sequences()[0].bounding_box(), period(ts(2), ts(3)));
    EXPECT_TRUE(flag_at(set, ts(2, 12)));
    EXPECT_FALSE(flag_at(set, ts(3)));

    EXPECT_TRUE(flag_at(as_set(logical_or(a, b)), ts(3)));
}

TEST(Logic, NeedsBooleans) {
    EXPECT_EQ(logical_not(steps()).error_kind(), ErrorKind::TypeMismatch);
    EXPECT_EQ(logical_and(switch_off(), Temporal(steps())).error_kind(), ErrorKind::TypeMismatch);
}

// ─── Comparison with a value ──────────────────────────────────────────────────

TEST(TemporalEq, LinearCrossingsAreSingleTrueInstants) {
    const auto r = temporal_eq(tent(), Value(5.0));
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    EXPECT_EQ(set.interpolation(), Interpolation::Step);
    ASSERT_EQ(set.num_sequences(), 3u);
    EXPECT_EQ(set.sequences()[0].bounding_box(), period(ts(1), ts(1, 12)));
    EXPECT_EQ(set.sequences()[1].bounding_box(), period(ts(1, 12), ts(2, 12), false, true));
    EXPECT_FALSE(flag_at(set, ts(1, 6)));
    EXPECT_TRUE(flag_at(set, ts(1, 12)));
    EXPECT_FALSE(flag_at(set, ts(2)));
    EXPECT_TRUE(flag_at(set, ts(2, 12)));
    EXPECT_FALSE(flag_at(set, ts(3)));
}

TEST(TemporalEq, StepRunsMergeIntoOneSequence) {
    const auto r = temporal_eq(steps(), Value(std::int64_t{1}));
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& set = as_set(r);
    ASSERT_EQ(set.num_sequences(), 1u);
    EXPECT_EQ(set.sequences()[0].values(), (std::vector<Value>{true, false, true, true}));
}

TEST(TemporalNe, NegatesEquality) {
    const auto r = temporal_ne(tent(), Value(5.0));
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(flag_at(as_set(r), ts(1, 12)));
    EXPECT_TRUE(flag_at(as_set(r), ts(2)));
}

TEST(TemporalEq, DiscreteAndInstantKeepShape) {
    const Temporal d = make_seq({TInstant(1.0, ts(1)), TInstant(2.0, ts(2))},
                                Interpolation::Discrete);
    const auto r = temporal_eq(d, Value(2.0));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(std::get<TSequence>(*r).values(), (std::vector<Value>{false, true}));

    const auto i = temporal_eq(TInstant(std::string("a"), ts(1)), Value(std::string("a")));
    EXPECT_EQ(std::get<TInstant>(*i).value(), Value(true));

    EXPECT_EQ(temporal_eq(tent(), Value(std::int64_t{5})).error_kind(), ErrorKind::TypeMismatch);
}

// ─── Temporal points ──────────────────────────────────────────────────────────

namespace {

/// (0,0) → (3600,0) → (3600,7200), one hour per segment.
TSequence walk() {
    return make_seq({TInstant(Point::xy(0, 0), ts(1, 0)),
                     TInstant(Point::xy(3600, 0), ts(1, 1)),
                     TInstant(Point::xy(3600, 7200), ts(1, 2))},
                    Interpolation::Linear);
}

}  // namespace

TEST(Speed, DistancePerSecondPerSegment) {
    const auto r = speed(walk());
    ASSERT_TRUE(r.has_value());
    const auto& seq = std::get<TSequence>(*r);
    EXPECT_EQ(seq.interpolation(), Interpolation::Step);
    EXPECT_EQ(seq.values(), (std::vector<Value>{1.0, 2.0, 2.0}));
}

TEST(Speed, Errors) {
    const Temporal stepped = make_seq({TInstant(Point::xy(0, 0), ts(1)),
                                       TInstant(Point::xy(1, 0), ts(2))}, Interpolation::Step);
    EXPECT_EQ(speed(stepped).error_kind(), ErrorKind::IncompatibleInterpolation);
    const Temporal sampled = make_seq({TInstant(Point::xy(0, 0), ts(1)),
                                       TInstant(Point::xy(1, 0), ts(2))}, Interpolation::Discrete);
    EXPECT_EQ(speed(sampled).error_kind(), ErrorKind::UndefinedForDiscrete);
    EXPECT_EQ(speed(TInstant(Point::xy(0, 0), ts(1))).error_kind(),
              ErrorKind::UndefinedForDiscrete);
    EXPECT_EQ(speed(tent()).error_kind(), ErrorKind::TypeMismatch);
}

TEST(CumulativeLength, CarriesAcrossMembers) {
    const auto set = TSequenceSet::make({walk(), walk().shift_time(std::chrono::days{1})});
    ASSERT_TRUE(set.has_value());
    const auto r = cumulative_length(*set);
    ASSERT_TRUE(r.has_value());
    const TSequenceSet& out = as_set(r);
    EXPECT_EQ(out.interpolation(), Interpolation::Linear);
    EXPECT_DOUBLE_EQ(at(out, ts(1, 1)), 3600.0);
    EXPECT_DOUBLE_EQ(at(out, ts(1, 2)), 10800.0);
    EXPECT_DOUBLE_EQ(at(out, ts(2, 0)), 10800.0);
    EXPECT_DOUBLE_EQ(at(out, ts(2, 2)), 21600.0);
}

TEST(CumulativeLength, StepPointsNeverMove) {
    const Temporal stepped = make_seq({TInstant(Point::xy(0, 0), ts(1)),
                                       TInstant(Point::xy(1, 0), ts(2))}, Interpolation::Step);
    const auto r = cumulative_length(stepped);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(std::get<TSequence>(*r).values(), (std::vector<Value>{0.0, 0.0}));
    EXPECT_EQ(cumulative_length(tent()).error_kind(), ErrorKind::TypeMismatch);
}
