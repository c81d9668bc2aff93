#pragma once

/// @file include/tempus/span.hpp
/// @brief Span<T>: a bounded interval over an ordered scalar domain.
///
/// # Module: Span
///
/// ## Responsibility
/// One generic algebra for every scalar domain (integers, floats, timestamps,
/// dates). Domain-specific facts live in `SpanDomain<T>`; the algebra itself is
/// written once.
///
/// ## Invariants
/// - lower <= upper
/// - lower == upper only when both bounds are inclusive
/// - Discrete domains (integers, dates) are stored canonically as `[a, b)`,
///   so `[1, 3]` and `[1, 4)` are the same span
///
/// ## Guarantees
/// - Immutable: shift/scale return new spans
/// - Algebra that can produce nothing returns `std::nullopt`, never an error

#include "tempus/error.hpp"
#include "tempus/types.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace tempus {

// ─── SpanDomain ───────────────────────────────────────────────────────────────

/// Capability describing an ordered scalar domain usable as span bounds.
///
/// Each specialisation provides:
///   delta_type    : type of `upper - lower`
///   discrete      : true when every value has a successor
///   wkb_tag       : domain tag written by the WKB codec
///   successor(v)  : next value (discrete domains only)
///   predecessor(v): previous value (discrete domains only)
///   has_successor(v): false at the top of a discrete domain
///   is_valid(v)   : false for values that cannot bound a span (NaN)
template <typename T>
struct SpanDomain;

template <>
struct SpanDomain<std::int64_t> {
    using delta_type = std::int64_t;
    static constexpr bool         discrete = true;
    static constexpr std::uint8_t wkb_tag  = 2;
    static std::int64_t successor(std::int64_t v) noexcept { return v + 1; }
    static std::int64_t predecessor(std::int64_t v) noexcept { return v - 1; }
    static bool has_successor(std::int64_t v) noexcept {
        return v < std::numeric_limits<std::int64_t>::max();
    }
    static bool is_valid(std::int64_t) noexcept { return true; }
};

template <>
struct SpanDomain<double> {
    using delta_type = double;
    static constexpr bool         discrete = false;
    static constexpr std::uint8_t wkb_tag  = 3;
    static double successor(double v) noexcept { return v; }
    static double predecessor(double v) noexcept { return v; }
    static bool has_successor(double) noexcept { return true; }
    static bool is_valid(double v) noexcept { return !std::isnan(v); }
};

template <>
struct SpanDomain<Timestamp> {
    using delta_type = Duration;
    static constexpr bool         discrete = false;
    static constexpr std::uint8_t wkb_tag  = 7;
    static Timestamp successor(Timestamp v) noexcept { return v; }
    static Timestamp predecessor(Timestamp v) noexcept { return v; }
    static bool has_successor(Timestamp) noexcept { return true; }
    static bool is_valid(Timestamp) noexcept { return true; }
};

template <>
struct SpanDomain<Date> {
    using delta_type = std::chrono::days;
    static constexpr bool         discrete = true;
    static constexpr std::uint8_t wkb_tag  = 8;
    static Date successor(Date v) noexcept { return v + std::chrono::days{1}; }
    static Date predecessor(Date v) noexcept { return v - std::chrono::days{1}; }
    static bool has_successor(Date v) noexcept { return v < Date::max(); }
    static bool is_valid(Date) noexcept { return true; }
};

template <typename T>
class SpanSet;

// ─── Span ─────────────────────────────────────────────────────────────────────

template <typename T>
class Span {
public:
    using value_type = T;
    using domain     = SpanDomain<T>;
    using delta_type = typename domain::delta_type;

    /// Validate and build a span.
    ///
    /// # Returns
    /// - `InvalidSpan` if lower > upper, a bound is NaN, or the bounds are
    ///   equal without both being inclusive (after canonicalisation for
    ///   discrete domains)
    /// - `InvalidSpan` if canonicalisation would step past the largest value
    ///   of a discrete domain, e.g. `[0, INT64_MAX]`
    [[nodiscard]] static Result<Span>
    make(T lower, T upper, bool lower_inc = true, bool upper_inc = false) {
        if (!domain::is_valid(lower) || !domain::is_valid(upper)) {
            return Error::make(ErrorKind::InvalidSpan, "span bound is not a number");
        }
        if (upper < lower) {
            return Error::make(ErrorKind::InvalidSpan, "lower bound exceeds upper bound");
        }
        if constexpr (domain::discrete) {
            if ((!lower_inc && !domain::has_successor(lower)) ||
                (upper_inc && !domain::has_successor(upper))) {
                return Error::make(ErrorKind::InvalidSpan, "span bound out of range");
            }
            if (!lower_inc) {
                lower     = domain::successor(lower);
                lower_inc = true;
            }
            if (upper_inc) {
                upper     = domain::successor(upper);
                upper_inc = false;
            }
        }
        if (upper < lower || (lower == upper && !(lower_inc && upper_inc))) {
            return Error::make(ErrorKind::InvalidSpan, "span is empty");
        }
        return Span(lower, upper, lower_inc, upper_inc);
    }

    /// Span holding a single value: `[v, v]`.
    /// Precondition: `domain::has_successor(value)` for discrete domains.
    [[nodiscard]] static Span singleton(T value) {
        return *make(value, value, true, true);
    }

    [[nodiscard]] T    lower() const noexcept { return lower_; }
    [[nodiscard]] T    upper() const noexcept { return upper_; }
    [[nodiscard]] bool lower_inc() const noexcept { return lower_inc_; }
    [[nodiscard]] bool upper_inc() const noexcept { return upper_inc_; }

    [[nodiscard]] delta_type width() const noexcept { return upper_ - lower_; }

    // ── Topological predicates ───────────────────────────────────────────────

    [[nodiscard]] bool contains(T value) const noexcept {
        const bool after_lower  = lower_ < value || (value == lower_ && lower_inc_);
        const bool before_upper = value < upper_ || (value == upper_ && upper_inc_);
        return after_lower && before_upper;
    }

    [[nodiscard]] bool contains(const Span& other) const noexcept {
        const bool lower_ok = lower_ < other.lower_ ||
            (lower_ == other.lower_ && (lower_inc_ || !other.lower_inc_));
        const bool upper_ok = other.upper_ < upper_ ||
            (upper_ == other.upper_ && (upper_inc_ || !other.upper_inc_));
        return lower_ok && upper_ok;
    }

    [[nodiscard]] bool overlaps(const Span& other) const noexcept {
        return starts_before_end(lower_, lower_inc_, other.upper_, other.upper_inc_) &&
               starts_before_end(other.lower_, other.lower_inc_, upper_, upper_inc_);
    }

    /// Bounds touch with complementary inclusivity, e.g. `[a, b)` and `[b, c)`.
    [[nodiscard]] bool is_adjacent(const Span& other) const noexcept {
        return (upper_ == other.lower_ && upper_inc_ != other.lower_inc_) ||
               (other.upper_ == lower_ && other.upper_inc_ != lower_inc_);
    }

    // ── Positional predicates ────────────────────────────────────────────────

    /// Strictly before `other`, no shared value.
    [[nodiscard]] bool is_left(const Span& other) const noexcept {
        return !starts_before_end(other.lower_, other.lower_inc_, upper_, upper_inc_);
    }

    /// Does not extend to the right of `other`.
    [[nodiscard]] bool is_over_or_left(const Span& other) const noexcept {
        return upper_ < other.upper_ ||
               (upper_ == other.upper_ && (!upper_inc_ || other.upper_inc_));
    }

    /// Strictly after `other`, no shared value.
    [[nodiscard]] bool is_right(const Span& other) const noexcept {
        return other.is_left(*this);
    }

    /// Does not extend to the left of `other`.
    [[nodiscard]] bool is_over_or_right(const Span& other) const noexcept {
        return other.lower_ < lower_ ||
               (lower_ == other.lower_ && (!lower_inc_ || other.lower_inc_));
    }

    // ── Set operations ───────────────────────────────────────────────────────

    /// Shared part of both spans, nullopt when disjoint.
    [[nodiscard]] std::optional<Span> intersection(const Span& other) const {
        if (!overlaps(other)) {
            return std::nullopt;
        }
        T    lo    = lower_;
        bool lo_in = lower_inc_;
        if (lower_ < other.lower_) {
            lo = other.lower_;  lo_in = other.lower_inc_;
        } else if (lower_ == other.lower_) {
            lo_in = lower_inc_ && other.lower_inc_;
        }
        T    hi    = upper_;
        bool hi_in = upper_inc_;
        if (other.upper_ < upper_) {
            hi = other.upper_;  hi_in = other.upper_inc_;
        } else if (upper_ == other.upper_) {
            hi_in = upper_inc_ && other.upper_inc_;
        }
        return Span(lo, hi, lo_in, hi_in);
    }

    /// Merge two spans.
    ///
    /// Overlapping or adjacent spans merge into one contiguous span. Otherwise
    /// `strict` decides: true returns nullopt, false returns the bounding hull.
    [[nodiscard]] std::optional<Span>
    union_with(const Span& other, bool strict = true) const {
        if (strict && !overlaps(other) && !is_adjacent(other)) {
            return std::nullopt;
        }
        T    lo    = lower_;
        bool lo_in = lower_inc_;
        if (other.lower_ < lower_) {
            lo = other.lower_;  lo_in = other.lower_inc_;
        } else if (lower_ == other.lower_) {
            lo_in = lower_inc_ || other.lower_inc_;
        }
        T    hi    = upper_;
        bool hi_in = upper_inc_;
        if (upper_ < other.upper_) {
            hi = other.upper_;  hi_in = other.upper_inc_;
        } else if (upper_ == other.upper_) {
            hi_in = upper_inc_ || other.upper_inc_;
        }
        return Span(lo, hi, lo_in, hi_in);
    }

    // ── Transformations ──────────────────────────────────────────────────────

    [[nodiscard]] Span shift(delta_type delta) const {
        return Span(lower_ + delta, upper_ + delta, lower_inc_, upper_inc_);
    }

    /// Resize to `width` around the current midpoint.
    [[nodiscard]] Result<Span> scale(delta_type width) const {
        return shift_scale(delta_type{}, width);
    }

    /// Shift by `delta`, then resize to `width` around the shifted midpoint.
    /// The inclusivity flags are preserved.
    ///
    /// # Returns
    /// - `InvalidArgument` if width is negative
    /// - `InvalidSpan` if width is zero and a bound is exclusive
    [[nodiscard]] Result<Span> shift_scale(delta_type delta, delta_type width) const {
        if (width < delta_type{}) {
            return Error::make(ErrorKind::InvalidArgument, "span width must be non-negative");
        }
        const T lo  = lower_ + delta;
        const T mid = lo + (upper_ - lower_) / 2;
        const T new_lower = mid - width / 2;
        return make(new_lower, new_lower + width, lower_inc_, upper_inc_);
    }

    // ── Distances ────────────────────────────────────────────────────────────

    /// Gap between the span and `value`, zero when contained.
    [[nodiscard]] delta_type distance_to_value(T value) const noexcept {
        if (contains(value)) return delta_type{};
        if (value < lower_) return lower_ - value;
        const T last = last_value();
        return value < last ? delta_type{} : value - last;
    }

    /// Gap between two spans, zero when they overlap or touch.
    [[nodiscard]] delta_type distance_to_span(const Span& other) const noexcept {
        if (overlaps(other)) return delta_type{};
        if (is_left(other)) {
            const T last = last_value();
            return other.lower_ < last ? delta_type{} : other.lower_ - last;
        }
        return other.distance_to_span(*this);
    }

    // ── Comparison ───────────────────────────────────────────────────────────

    friend bool operator==(const Span& a, const Span& b) noexcept {
        return a.lower_ == b.lower_ && a.upper_ == b.upper_ &&
               a.lower_inc_ == b.lower_inc_ && a.upper_inc_ == b.upper_inc_;
    }

    friend bool operator!=(const Span& a, const Span& b) noexcept { return !(a == b); }

    /// Lower bound first (inclusive before exclusive), then upper bound
    /// (exclusive before inclusive).
    friend bool operator<(const Span& a, const Span& b) noexcept {
        if (a.lower_ != b.lower_) return a.lower_ < b.lower_;
        if (a.lower_inc_ != b.lower_inc_) return a.lower_inc_;
        if (a.upper_ != b.upper_) return a.upper_ < b.upper_;
        if (a.upper_inc_ != b.upper_inc_) return !a.upper_inc_;
        return false;
    }

private:
    friend class SpanSet<T>;

    Span(T lower, T upper, bool lower_inc, bool upper_inc) noexcept
        : lower_(lower), upper_(upper), lower_inc_(lower_inc), upper_inc_(upper_inc) {}

    /// True when a span starting at (lo, lo_inc) shares a value with one
    /// ending at (hi, hi_inc).
    static bool starts_before_end(T lo, bool lo_inc, T hi, bool hi_inc) noexcept {
        return lo < hi || (lo == hi && lo_inc && hi_inc);
    }

    /// Largest member value: the predecessor of the exclusive upper bound for
    /// discrete domains, the upper bound otherwise.
    T last_value() const noexcept {
        if constexpr (domain::discrete) {
            return upper_inc_ ? upper_ : domain::predecessor(upper_);
        } else {
            return upper_;
        }
    }

    T    lower_;
    T    upper_;
    bool lower_inc_;
    bool upper_inc_;
};

// ─── Aliases ──────────────────────────────────────────────────────────────────

using IntSpan   = Span<std::int64_t>;
using FloatSpan = Span<double>;
using TsTzSpan  = Span<Timestamp>;
using DateSpan  = Span<Date>;

}  // namespace tempus
