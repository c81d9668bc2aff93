/**
 * @file  prop_linear_midpoint.cpp
 * @brief Property: ∀ segment (v0@t0, v1@t1): value_at(midpoint) == (v0 + v1) / 2
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_linear_midpoint
 *
 * Basis:
 *   Under Linear interpolation v(t) = v0 + (v1 − v0) · (t − t0) / (t1 − t0).
 *   At t = (t0 + t1) / 2 the fraction is exactly 1/2, so the value is the
 *   arithmetic mean of the endpoints, componentwise for points. Under Step
 *   the value is v0 everywhere on [t0, t1).
 *
 * A failure would indicate:
 *   • An off-by-one in the segment search.
 *   • Loss of precision when converting durations to fractions.
 */

#include <rapidcheck.h>

#include <chrono>
#include <cmath>
#include <cstdlib>

#include "tempus/time.hpp"
#include "tempus/tsequence.hpp"

using namespace tempus;

namespace {

struct Segment {
    Timestamp t0;
    Timestamp t1;
    Timestamp mid;
};

Segment random_segment() {
    const Timestamp t0 = *make_timestamp(2000, 1, 1) +
                         std::chrono::seconds(*rc::gen::inRange(0, 1000000));
    const auto half = std::chrono::microseconds(*rc::gen::inRange<std::int64_t>(1, 1000000000));
    return Segment{t0, t0 + 2 * half, t0 + half};
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: float midpoint is the mean ───────────────────────────────
    ok &= rc::check(
        "linear_midpoint: float value at the midpoint is the mean of the ends",
        []() {
            const auto seg = random_segment();
            const double v0 = *rc::gen::inRange(-100000, 100000) / 8.0;
            const double v1 = *rc::gen::inRange(-100000, 100000) / 8.0;
            auto seq = TSequence::make({TInstant(v0, seg.t0), TInstant(v1, seg.t1)},
                                       Interpolation::Linear);
            RC_ASSERT(seq.has_value());
            const auto mid = seq->value_at(seg.mid);
            RC_ASSERT(mid.has_value());
            RC_ASSERT(std::abs(std::get<double>(*mid) - (v0 + v1) / 2.0) < 1e-9);
        }
    );

    // ── Property 2: point midpoint is componentwise ──────────────────────────
    ok &= rc::check(
        "linear_midpoint: point value at the midpoint is the segment midpoint",
        []() {
            const auto seg = random_segment();
            const Point p0 = Point::xyz(*rc::gen::inRange(-1000, 1000), *rc::gen::inRange(-1000, 1000),
                                        *rc::gen::inRange(-1000, 1000));
            const Point p1 = Point::xyz(*rc::gen::inRange(-1000, 1000), *rc::gen::inRange(-1000, 1000),
                                        *rc::gen::inRange(-1000, 1000));
            auto seq = TSequence::make({TInstant(p0, seg.t0), TInstant(p1, seg.t1)},
                                       Interpolation::Linear);
            RC_ASSERT(seq.has_value());
            const auto mid = seq->value_at(seg.mid);
            RC_ASSERT(mid.has_value());
            const Point& m = std::get<Point>(*mid);
            RC_ASSERT((m.coords - (p0.coords + p1.coords) / 2.0).norm() < 1e-9);
            RC_ASSERT(m.has_z);
        }
    );

    // ── Property 3: step holds the left value ────────────────────────────────
    ok &= rc::check(
        "linear_midpoint: step value anywhere before t1 is v0",
        []() {
            const auto seg = random_segment();
            const auto v0 = *rc::gen::arbitrary<std::int64_t>();
            const auto v1 = *rc::gen::arbitrary<std::int64_t>();
            auto seq = TSequence::make({TInstant(v0, seg.t0), TInstant(v1, seg.t1)},
                                       Interpolation::Step);
            RC_ASSERT(seq.has_value());
            const auto at_mid = seq->value_at(seg.mid);
            const auto at_end = seq->value_at(seg.t1);
            RC_ASSERT(at_mid.has_value());
            RC_ASSERT(at_end.has_value());
            RC_ASSERT(std::get<std::int64_t>(*at_mid) == v0);
            RC_ASSERT(std::get<std::int64_t>(*at_end) == v1);
        }
    );

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
