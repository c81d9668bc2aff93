/// @file tests/boxes/test_boxes.cpp
/// @brief Tests for TBox / STBox predicates, expansion and rendering.

#include "tempus/boxes.hpp"
#include "tempus/geometry.hpp"
#include "tempus/time.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace tempus;

namespace {

Timestamp ts(unsigned day, unsigned hour = 0) {
    return *make_timestamp(2000, 1, day, hour);
}

TsTzSpan period(Timestamp lo, Timestamp hi) {
    return *TsTzSpan::make(lo, hi, true, true);
}

TBox tbox(double lo, double hi, Timestamp t0, Timestamp t1) {
    return TBox{*FloatSpan::make(lo, hi, true, true), period(t0, t1)};
}

}  // namespace

// ─── TBox ─────────────────────────────────────────────────────────────────────

TEST(TBox, OverlapsNeedsBothDimensions) {
    const TBox a = tbox(0, 10, ts(1), ts(3));
    EXPECT_TRUE(a.overlaps(tbox(5, 15, ts(2), ts(4))));
    EXPECT_FALSE(a.overlaps(tbox(11, 15, ts(2), ts(4))));
    EXPECT_FALSE(a.overlaps(tbox(5, 15, ts(5), ts(6))));
}

TEST(TBox, Contains) {
    const TBox a = tbox(0, 10, ts(1), ts(5));
    EXPECT_TRUE(a.contains(tbox(1, 2, ts(2), ts(3))));
    EXPECT_FALSE(a.contains(tbox(1, 12, ts(2), ts(3))));
}

TEST(TBox, ExpandIsHull) {
    const TBox e = tbox(0, 1, ts(1), ts(2)).expand(tbox(5, 6, ts(4), ts(5)));
    EXPECT_EQ(e.value, *FloatSpan::make(0, 6, true, true));
    EXPECT_EQ(e.period, period(ts(1), ts(5)));
}

TEST(TBox, Renders) {
    EXPECT_EQ(tbox(1.5, 2.5, ts(1), ts(2)).to_string(),
              "TBOXFLOAT XT([1.5, 2.5],[2000-01-01 00:00:00+00, 2000-01-02 00:00:00+00])");
}

// ─── STBox ────────────────────────────────────────────────────────────────────

TEST(STBox, FromPointIsDegenerate) {
    const STBox b = STBox::from_point(Point::xy(1, 2, 4326), ts(1));
    EXPECT_EQ(b.extent.min(), b.extent.max());
    EXPECT_EQ(b.srid, 4326);
    EXPECT_FALSE(b.has_z);
    EXPECT_EQ(b.period, TsTzSpan::singleton(ts(1)));
}

TEST(STBox, ExpandAndContain) {
    const STBox a = STBox::from_point(Point::xy(0, 0), ts(1));
    const STBox b = STBox::from_point(Point::xy(2, 3), ts(3));
    const STBox hull = a.expand(b);
    EXPECT_TRUE(hull.contains(a));
    EXPECT_TRUE(hull.contains(b));
    EXPECT_TRUE(hull.overlaps(STBox::from_point(Point::xy(1, 1), ts(2))));
    EXPECT_FALSE(hull.overlaps(STBox::from_point(Point::xy(1, 1), ts(4))));
    EXPECT_FALSE(hull.overlaps(STBox::from_point(Point::xy(5, 5), ts(2))));
}

TEST(STBox, ExpandSpaceGrowsXYOnly) {
    const STBox b = STBox::from_point(Point::xy(1, 1), ts(1)).expand_space(0.5);
    EXPECT_DOUBLE_EQ(b.extent.min().x(), 0.5);
    EXPECT_DOUBLE_EQ(b.extent.max().y(), 1.5);
    EXPECT_DOUBLE_EQ(b.extent.max().z(), 0.0);
}

TEST(STBox, Renders) {
    const STBox b = STBox::from_point(Point::xy(1, 1, 4326), ts(1))
                        .expand(STBox::from_point(Point::xy(2, 2, 4326), ts(2)));
    EXPECT_EQ(b.to_string(),
              "SRID=4326;STBOX XT(((1,1),(2,2)),[2000-01-01 00:00:00+00, 2000-01-02 00:00:00+00])");
}

TEST(STBox, RendersGeodeticZ) {
    Point p = Point::xyz(4, 50, 10, 4326);
    p.geodetic = true;
    const STBox b = STBox::from_point(p, ts(1));
    EXPECT_EQ(b.to_string(),
              "SRID=4326;GEODSTBOX ZT(((4,50,10),(4,50,10)),[2000-01-01 00:00:00+00, 2000-01-01 00:00:00+00])");
}

// ─── Geometry ─────────────────────────────────────────────────────────────────

TEST(Geometry, PlanarDistance) {
    EXPECT_DOUBLE_EQ(planar_metric().distance(Point::xy(1, 1), Point::xy(2, 2)), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(planar_metric().distance(Point::xyz(0, 0, 0), Point::xyz(2, 3, 6)), 7.0);
    // z is ignored unless both points carry it.
    EXPECT_DOUBLE_EQ(planar_metric().distance(Point::xy(0, 0), Point::xyz(3, 4, 100)), 5.0);
}

TEST(Geometry, LerpExactAtEnds) {
    const Point a = Point::xy(0.1, 0.2);
    const Point b = Point::xy(0.7, 0.9);
    EXPECT_EQ(lerp(a, b, 0.0), a);
    EXPECT_EQ(lerp(a, b, 1.0), b);
    EXPECT_NEAR(lerp(a, b, 0.5).x(), 0.4, 1e-12);
}

TEST(Geometry, LocateOnSegment) {
    EXPECT_NEAR(*locate_on_segment(Point::xy(0, 0), Point::xy(4, 0), Point::xy(1, 0)), 0.25, 1e-12);
    EXPECT_FALSE(locate_on_segment(Point::xy(0, 0), Point::xy(4, 0), Point::xy(1, 1)).has_value());
    EXPECT_FALSE(locate_on_segment(Point::xy(0, 0), Point::xy(0, 0), Point::xy(0, 0)).has_value());
}
