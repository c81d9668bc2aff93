/// @file tests/collections/test_span.cpp
/// @brief Tests for Span<T>: construction, predicates, algebra, distances.

#include "tempus/span.hpp"
#include "tempus/time.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace tempus;

namespace {

FloatSpan fspan(double lo, double hi, bool li = true, bool ui = false) {
    auto s = FloatSpan::make(lo, hi, li, ui);
    EXPECT_TRUE(s.has_value());
    return *s;
}

IntSpan ispan(std::int64_t lo, std::int64_t hi, bool li = true, bool ui = false) {
    auto s = IntSpan::make(lo, hi, li, ui);
    EXPECT_TRUE(s.has_value());
    return *s;
}

Timestamp ts(int y, unsigned m, unsigned d, unsigned h = 0) {
    return *make_timestamp(y, m, d, h);
}

}  // namespace

// ─── make: validation ─────────────────────────────────────────────────────────

TEST(SpanMake, AcceptsOrderedBounds) {
    auto s = FloatSpan::make(1.0, 2.0, true, false);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->lower(), 1.0);
    EXPECT_DOUBLE_EQ(s->upper(), 2.0);
    EXPECT_TRUE(s->lower_inc());
    EXPECT_FALSE(s->upper_inc());
}

TEST(SpanMake, RejectsLowerAboveUpper) {
    auto s = FloatSpan::make(2.0, 1.0);
    ASSERT_FALSE(s.has_value());
    EXPECT_EQ(s.error_kind(), ErrorKind::InvalidSpan);
}

TEST(SpanMake, RejectsEmptyZeroWidth) {
    EXPECT_EQ(FloatSpan::make(1.0, 1.0, true, false).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_EQ(FloatSpan::make(1.0, 1.0, false, true).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_TRUE(FloatSpan::make(1.0, 1.0, true, true).has_value());
}

TEST(SpanMake, RejectsNaNBound) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(FloatSpan::make(nan, 1.0).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_EQ(FloatSpan::make(0.0, nan).error_kind(), ErrorKind::InvalidSpan);
}

TEST(SpanMake, DiscreteDomainIsCanonicalised) {
    // [1, 3] == [1, 4) and (0, 3) == [1, 3)
    EXPECT_EQ(ispan(1, 3, true, true), ispan(1, 4, true, false));
    EXPECT_EQ(ispan(0, 3, false, false), ispan(1, 3, true, false));
}

TEST(SpanMake, DiscreteEmptyAfterCanonicalisationIsRejected) {
    // (1, 2) holds no integer.
    EXPECT_EQ(IntSpan::make(1, 2, false, false).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_EQ(IntSpan::make(1, 1, false, false).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_EQ(IntSpan::make(1, 1, false, true).error_kind(), ErrorKind::InvalidSpan);
}

TEST(SpanMake, IntegerBoundsAtDomainLimits) {
    constexpr std::int64_t lo = std::numeric_limits<std::int64_t>::min();
    constexpr std::int64_t hi = std::numeric_limits<std::int64_t>::max();

    // Nothing follows INT64_MAX, so neither bound may be canonicalised past it.
    EXPECT_EQ(IntSpan::make(0, hi, true, true).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_EQ(IntSpan::make(hi, hi, false, true).error_kind(), ErrorKind::InvalidSpan);
    EXPECT_EQ(IntSpan::make(hi, hi, true, true).error_kind(), ErrorKind::InvalidSpan);

    const IntSpan top = ispan(0, hi, true, false);
    EXPECT_EQ(top.upper(), hi);
    EXPECT_TRUE(top.contains(hi - 1));
    EXPECT_FALSE(top.contains(hi));
    EXPECT_EQ(top.distance_to_value(hi), 1);

    const IntSpan bottom = ispan(lo, 0, true, false);
    EXPECT_EQ(bottom.lower(), lo);
    EXPECT_TRUE(bottom.contains(lo));
    EXPECT_EQ(ispan(lo, lo + 1, false, true), ispan(lo + 1, lo + 2));
    EXPECT_EQ(IntSpan::singleton(lo).upper(), lo + 1);
}

TEST(SpanMake, DateSpanCanonical) {
    const Date d1 = *parse_date("2000-01-01");
    const Date d3 = *parse_date("2000-01-03");
    auto s = DateSpan::make(d1, d3, true, true);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->upper(), *parse_date("2000-01-04"));
    EXPECT_FALSE(s->upper_inc());
    EXPECT_EQ(s->width(), std::chrono::days{3});
    EXPECT_EQ(DateSpan::make(d1, Date::max(), true, true).error_kind(), ErrorKind::InvalidSpan);
}

// ─── Bound containment ────────────────────────────────────────────────────────

TEST(SpanContains, BoundsFollowInclusivity) {
    for (bool li : {true, false}) {
        for (bool ui : {true, false}) {
            const FloatSpan s = fspan(1.0, 2.0, li, ui);
            EXPECT_EQ(s.contains(s.lower()), s.lower_inc());
            EXPECT_EQ(s.contains(s.upper()), s.upper_inc());
        }
    }
}

TEST(SpanContains, InteriorAndExterior) {
    const FloatSpan s = fspan(1.0, 2.0);
    EXPECT_TRUE(s.contains(1.5));
    EXPECT_FALSE(s.contains(0.5));
    EXPECT_FALSE(s.contains(2.5));
}

TEST(SpanContains, SpanInSpan) {
    const FloatSpan outer = fspan(0.0, 10.0, true, true);
    EXPECT_TRUE(outer.contains(fspan(0.0, 10.0, true, true)));
    EXPECT_TRUE(outer.contains(fspan(2.0, 3.0)));
    EXPECT_FALSE(fspan(0.0, 10.0, false, true).contains(fspan(0.0, 1.0)));
    EXPECT_FALSE(outer.contains(fspan(5.0, 11.0)));
}

// ─── Topology ─────────────────────────────────────────────────────────────────

TEST(SpanOverlaps, SharedBoundNeedsBothInclusive) {
    EXPECT_TRUE(fspan(1, 2, true, true).overlaps(fspan(2, 3, true, true)));
    EXPECT_FALSE(fspan(1, 2, true, false).overlaps(fspan(2, 3, true, true)));
    EXPECT_FALSE(fspan(1, 2, true, true).overlaps(fspan(2, 3, false, true)));
}

TEST(SpanAdjacent, ComplementaryInclusivity) {
    EXPECT_TRUE(fspan(1, 2, true, false).is_adjacent(fspan(2, 3)));
    EXPECT_TRUE(fspan(2, 3).is_adjacent(fspan(1, 2, true, false)));
    EXPECT_FALSE(fspan(1, 2, true, true).is_adjacent(fspan(2, 3, true, true)));
    EXPECT_FALSE(fspan(1, 2, true, false).is_adjacent(fspan(2, 3, false, true)));
    EXPECT_FALSE(fspan(1, 2).is_adjacent(fspan(3, 4)));
}

TEST(SpanPosition, LeftAndRight) {
    const FloatSpan a = fspan(1, 2);
    const FloatSpan b = fspan(2, 3);
    EXPECT_TRUE(a.is_left(b));
    EXPECT_TRUE(b.is_right(a));
    EXPECT_FALSE(fspan(1, 2, true, true).is_left(fspan(2, 3)));
}

TEST(SpanPosition, OverOrLeftAndOverOrRight) {
    EXPECT_TRUE(fspan(1, 3).is_over_or_left(fspan(2, 3)));
    EXPECT_FALSE(fspan(1, 3, true, true).is_over_or_left(fspan(2, 3)));
    EXPECT_TRUE(fspan(2, 4).is_over_or_right(fspan(1, 3)));
    EXPECT_FALSE(fspan(1, 4).is_over_or_right(fspan(2, 3)));
}

// ─── Intersection / union ─────────────────────────────────────────────────────

TEST(SpanIntersection, OverlappingFloatSpans) {
    auto r = fspan(17.5, 18.5).intersection(fspan(18.0, 20.0));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, fspan(18.0, 18.5));
}

TEST(SpanIntersection, DisjointIsEmpty) {
    EXPECT_FALSE(fspan(17.5, 18.5).intersection(fspan(19.0, 20.0)).has_value());
}

TEST(SpanIntersection, SinglePointWhenBoundsTouchInclusively) {
    auto r = fspan(1, 2, true, true).intersection(fspan(2, 3, true, true));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, FloatSpan::singleton(2.0));
}

TEST(SpanIntersection, IsCommutative) {
    const FloatSpan a = fspan(0, 5, false, true);
    const FloatSpan b = fspan(3, 8, true, false);
    EXPECT_EQ(*a.intersection(b), *b.intersection(a));
}

TEST(SpanUnion, AdjacentMergesStrict) {
    auto r = fspan(1, 2).union_with(fspan(2, 3), true);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, fspan(1, 3));
}

TEST(SpanUnion, DisjointStrictFails) {
    EXPECT_FALSE(fspan(1, 2).union_with(fspan(3, 4), true).has_value());
}

TEST(SpanUnion, DisjointNonStrictReturnsHull) {
    auto r = fspan(1, 2).union_with(fspan(3, 4, true, true), false);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, fspan(1, 4, true, true));
}

TEST(SpanUnion, SameBoundKeepsInclusiveSide) {
    auto r = fspan(1, 2, false, false).union_with(fspan(1, 2, true, true));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, fspan(1, 2, true, true));
}

// ─── Transformations ──────────────────────────────────────────────────────────

TEST(SpanShift, MovesBothBounds) {
    EXPECT_EQ(fspan(1, 2, false, true).shift(10.0), fspan(11, 12, false, true));
    const TsTzSpan t = *TsTzSpan::make(ts(2000, 1, 1), ts(2000, 1, 2));
    EXPECT_EQ(t.shift(std::chrono::hours{24}).lower(), ts(2000, 1, 2));
}

TEST(SpanScale, AnchorsOnMidpoint) {
    auto r = fspan(2, 4).scale(6.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->lower(), 0.0);
    EXPECT_DOUBLE_EQ(r->upper(), 6.0);
    EXPECT_TRUE(r->lower_inc());
    EXPECT_FALSE(r->upper_inc());
}

TEST(SpanScale, NegativeWidthIsInvalidArgument) {
    EXPECT_EQ(fspan(0, 1).scale(-1.0).error_kind(), ErrorKind::InvalidArgument);
}

TEST(SpanScale, ZeroWidthWithExclusiveBoundIsInvalidSpan) {
    EXPECT_EQ(fspan(0, 1, true, false).scale(0.0).error_kind(), ErrorKind::InvalidSpan);
    auto point = fspan(0, 2, true, true).scale(0.0);
    ASSERT_TRUE(point.has_value());
    EXPECT_DOUBLE_EQ(point->lower(), 1.0);
}

TEST(SpanShiftScale, ShiftThenResize) {
    auto r = fspan(0, 2).shift_scale(10.0, 4.0);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->lower(), 9.0);
    EXPECT_DOUBLE_EQ(r->upper(), 13.0);
}

TEST(SpanShiftScale, TimestampSpan) {
    const TsTzSpan t = *TsTzSpan::make(ts(2000, 1, 1), ts(2000, 1, 3), true, true);
    auto r = t.shift_scale(std::chrono::hours{24}, std::chrono::hours{24});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->lower(), ts(2000, 1, 2, 12));
    EXPECT_EQ(r->upper(), ts(2000, 1, 3, 12));
    EXPECT_TRUE(r->upper_inc());
}

// ─── Distances ────────────────────────────────────────────────────────────────

TEST(SpanDistance, ToValue) {
    const FloatSpan s = fspan(1, 2);
    EXPECT_DOUBLE_EQ(s.distance_to_value(1.5), 0.0);
    EXPECT_DOUBLE_EQ(s.distance_to_value(0.0), 1.0);
    EXPECT_DOUBLE_EQ(s.distance_to_value(5.0), 3.0);
}

TEST(SpanDistance, DiscreteUsesLastMember) {
    // [1, 4) holds 1..3, so 5 is two away.
    EXPECT_EQ(ispan(1, 4).distance_to_value(5), 2);
    EXPECT_EQ(ispan(1, 4).distance_to_span(ispan(6, 9)), 3);
}

TEST(SpanDistance, ToSpanZeroWhenTouching) {
    EXPECT_DOUBLE_EQ(fspan(1, 2).distance_to_span(fspan(2, 3)), 0.0);
    EXPECT_DOUBLE_EQ(fspan(1, 2).distance_to_span(fspan(4, 5)), 2.0);
    EXPECT_DOUBLE_EQ(fspan(4, 5).distance_to_span(fspan(1, 2)), 2.0);
}

// ─── Ordering ─────────────────────────────────────────────────────────────────

TEST(SpanOrder, LowerThenInclusivityThenUpper) {
    EXPECT_LT(fspan(1, 2), fspan(2, 3));
    EXPECT_LT(fspan(1, 2, true, false), fspan(1, 2, false, false));
    EXPECT_LT(fspan(1, 2), fspan(1, 3));
    EXPECT_LT(fspan(1, 2, true, false), fspan(1, 2, true, true));
    EXPECT_FALSE(fspan(1, 2) < fspan(1, 2));
}

TEST(SpanEquality, Structural) {
    EXPECT_EQ(fspan(1, 2), fspan(1, 2));
    EXPECT_NE(fspan(1, 2), fspan(1, 2, true, true));
}
