#pragma once

/// @file include/tempus/span_set.hpp
/// @brief SpanSet<T>: a normalised set of disjoint, non-adjacent spans.
///
/// # Module: SpanSet
///
/// ## Responsibility
/// Set algebra over collections of spans of one domain. Construction always
/// normalises: spans are sorted and any pair that overlaps or touches is merged
/// (non-strict union), so the stored spans are strictly increasing, pairwise
/// disjoint and non-adjacent.
///
/// ## Guarantees
/// - The empty set is a valid value (the result of a disjoint intersection)
/// - Normalisation is idempotent: rebuilding from the stored spans of a
///   set yields the same set
/// - Immutable; every operation returns a new set

#include "tempus/span.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace tempus {

template <typename T>
class SpanSet {
public:
    using value_type = T;
    using span_type  = Span<T>;
    using delta_type = typename Span<T>::delta_type;

    /// The empty set.
    SpanSet() = default;

    /// Normalise an arbitrary collection of spans.
    [[nodiscard]] static SpanSet make(std::vector<Span<T>> spans) {
        std::sort(spans.begin(), spans.end());
        std::vector<Span<T>> merged;
        merged.reserve(spans.size());
        for (const auto& s : spans) {
            if (!merged.empty() &&
                (merged.back().overlaps(s) || merged.back().is_adjacent(s))) {
                merged.back() = *merged.back().union_with(s, false);
            } else {
                merged.push_back(s);
            }
        }
        return SpanSet(std::move(merged));
    }

    [[nodiscard]] static SpanSet from_span(const Span<T>& span) {
        return SpanSet(std::vector<Span<T>>{span});
    }

    // ── Accessors ────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_empty() const noexcept { return spans_.empty(); }
    [[nodiscard]] std::size_t num_spans() const noexcept { return spans_.size(); }
    [[nodiscard]] std::span<const Span<T>> spans() const noexcept { return spans_; }

    /// First and last member, nullopt when empty.
    [[nodiscard]] std::optional<Span<T>> start_span() const {
        if (spans_.empty()) return std::nullopt;
        return spans_.front();
    }

    [[nodiscard]] std::optional<Span<T>> end_span() const {
        if (spans_.empty()) return std::nullopt;
        return spans_.back();
    }

    [[nodiscard]] std::optional<Span<T>> span_n(std::size_t n) const {
        if (n >= spans_.size()) return std::nullopt;
        return spans_[n];
    }

    /// Bounding span of the whole set, nullopt when empty.
    [[nodiscard]] std::optional<Span<T>> span() const {
        if (spans_.empty()) return std::nullopt;
        return spans_.front().union_with(spans_.back(), false);
    }

    /// Total extent.
    ///
    /// `ignore_gaps = true` sums the widths of the member spans;
    /// `ignore_gaps = false` measures from the first lower to the last upper bound.
    [[nodiscard]] delta_type width(bool ignore_gaps) const noexcept {
        if (spans_.empty()) return delta_type{};
        if (!ignore_gaps) {
            return spans_.back().upper() - spans_.front().lower();
        }
        delta_type total{};
        for (const auto& s : spans_) total += s.width();
        return total;
    }

    // ── Topological predicates ───────────────────────────────────────────────

    [[nodiscard]] bool contains(T value) const noexcept {
        // First span whose upper bound is not below the value; a later span
        // cannot contain it because members are disjoint and non-adjacent.
        auto it = std::partition_point(spans_.begin(), spans_.end(),
            [&](const Span<T>& s) { return s.upper() < value; });
        return it != spans_.end() && it->contains(value);
    }

    [[nodiscard]] bool contains(const Span<T>& span) const noexcept {
        return std::any_of(spans_.begin(), spans_.end(),
            [&](const Span<T>& s) { return s.contains(span); });
    }

    [[nodiscard]] bool overlaps(const Span<T>& span) const noexcept {
        return std::any_of(spans_.begin(), spans_.end(),
            [&](const Span<T>& s) { return s.overlaps(span); });
    }

    [[nodiscard]] bool overlaps(const SpanSet& other) const noexcept {
        std::size_t i = 0, j = 0;
        while (i < spans_.size() && j < other.spans_.size()) {
            if (spans_[i].overlaps(other.spans_[j])) return true;
            if (spans_[i].is_over_or_left(other.spans_[j])) ++i; else ++j;
        }
        return false;
    }

    // ── Positional predicates (first/last member) ────────────────────────────

    [[nodiscard]] bool is_left(const SpanSet& other) const noexcept {
        return !is_empty() && !other.is_empty() && spans_.back().is_left(other.spans_.front());
    }

    [[nodiscard]] bool is_over_or_left(const SpanSet& other) const noexcept {
        return !is_empty() && !other.is_empty() && spans_.back().is_over_or_left(other.spans_.back());
    }

    [[nodiscard]] bool is_right(const SpanSet& other) const noexcept {
        return !is_empty() && !other.is_empty() && spans_.front().is_right(other.spans_.back());
    }

    [[nodiscard]] bool is_over_or_right(const SpanSet& other) const noexcept {
        return !is_empty() && !other.is_empty() && spans_.front().is_over_or_right(other.spans_.front());
    }

    // ── Set operations ───────────────────────────────────────────────────────

    /// Pairwise intersections of the members; empty when nothing overlaps.
    [[nodiscard]] SpanSet intersection(const SpanSet& other) const {
        std::vector<Span<T>> out;
        std::size_t i = 0, j = 0;
        while (i < spans_.size() && j < other.spans_.size()) {
            if (auto piece = spans_[i].intersection(other.spans_[j])) {
                out.push_back(*piece);
            }
            if (spans_[i].is_over_or_left(other.spans_[j])) ++i; else ++j;
        }
        return make(std::move(out));
    }

    [[nodiscard]] SpanSet intersection(const Span<T>& span) const {
        return intersection(from_span(span));
    }

    [[nodiscard]] SpanSet union_with(const SpanSet& other) const {
        std::vector<Span<T>> all(spans_);
        all.insert(all.end(), other.spans_.begin(), other.spans_.end());
        return make(std::move(all));
    }

    /// Values of this set not covered by `other`.
    [[nodiscard]] SpanSet minus(const SpanSet& other) const {
        std::vector<Span<T>> out;
        for (const auto& s : spans_) {
            std::optional<Span<T>> rest = s;
            for (const auto& cut : other.spans_) {
                if (!rest) break;
                if (cut.is_left(*rest)) continue;
                if (cut.is_right(*rest)) break;
                // Part of `rest` before `cut`.
                if (auto left = try_make(rest->lower(), cut.lower(),
                                         rest->lower_inc(), !cut.lower_inc())) {
                    out.push_back(*left);
                }
                // Part of `rest` after `cut`.
                if (cut.upper() < rest->upper() ||
                    (cut.upper() == rest->upper() && rest->upper_inc() && !cut.upper_inc())) {
                    rest = try_make(cut.upper(), rest->upper(), !cut.upper_inc(), rest->upper_inc());
                } else {
                    rest.reset();
                }
            }
            if (rest) out.push_back(*rest);
        }
        return make(std::move(out));
    }

    [[nodiscard]] SpanSet minus(const Span<T>& span) const {
        return minus(from_span(span));
    }

    // ── Transformations ──────────────────────────────────────────────────────

    [[nodiscard]] SpanSet shift(delta_type delta) const {
        std::vector<Span<T>> out;
        out.reserve(spans_.size());
        for (const auto& s : spans_) out.push_back(s.shift(delta));
        return SpanSet(std::move(out));
    }

    // ── Distances ────────────────────────────────────────────────────────────

    /// Smallest distance from any member to `value`, nullopt when empty.
    [[nodiscard]] std::optional<delta_type> distance_to_value(T value) const {
        std::optional<delta_type> best;
        for (const auto& s : spans_) {
            const delta_type d = s.distance_to_value(value);
            if (!best || d < *best) best = d;
        }
        return best;
    }

    [[nodiscard]] std::optional<delta_type> distance_to_span(const Span<T>& span) const {
        std::optional<delta_type> best;
        for (const auto& s : spans_) {
            const delta_type d = s.distance_to_span(span);
            if (!best || d < *best) best = d;
        }
        return best;
    }

    /// Nullopt when either set is empty.
    [[nodiscard]] std::optional<delta_type> distance_to_span_set(const SpanSet& other) const {
        std::optional<delta_type> best;
        for (const auto& s : other.spans_) {
            const auto d = distance_to_span(s);
            if (!d) return std::nullopt;
            if (!best || *d < *best) best = d;
        }
        return best;
    }

    friend bool operator==(const SpanSet& a, const SpanSet& b) noexcept {
        return a.spans_ == b.spans_;
    }

    friend bool operator!=(const SpanSet& a, const SpanSet& b) noexcept { return !(a == b); }

private:
    explicit SpanSet(std::vector<Span<T>> normalized) : spans_(std::move(normalized)) {}

    static std::optional<Span<T>> try_make(T lower, T upper, bool lower_inc, bool upper_inc) {
        auto r = Span<T>::make(lower, upper, lower_inc, upper_inc);
        if (!r) return std::nullopt;
        return *r;
    }

    std::vector<Span<T>> spans_;
};

// ─── Aliases ──────────────────────────────────────────────────────────────────

using IntSpanSet   = SpanSet<std::int64_t>;
using FloatSpanSet = SpanSet<double>;
using TsTzSpanSet  = SpanSet<Timestamp>;
using DateSpanSet  = SpanSet<Date>;

}  // namespace tempus
