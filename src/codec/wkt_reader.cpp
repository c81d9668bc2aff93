/// @file src/codec/wkt_reader.cpp
/// @brief Recursive-descent WKT reader.

#include "tempus/wkt.hpp"

#include "text_scanner.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace tempus::codec {

namespace {

using detail::TextScanner;

/// Settings shared by every instant of one temporal value.
struct ReadContext {
    ValueType     type;
    std::int32_t  srid   = constants::NO_SRID;
    Interpolation interp = Interpolation::Linear;
};

Result<Value> read_point(TextScanner& sc, const ReadContext& ctx) {
    if (!sc.consume_keyword("POINT")) {
        return sc.error("expected POINT");
    }
    const bool has_z = sc.consume_keyword("Z");
    if (auto open = sc.expect('(', "after POINT"); !open) return std::move(open).error();

    double c[3] = {0.0, 0.0, 0.0};
    const int n = has_z ? 3 : 2;
    for (int i = 0; i < n; ++i) {
        auto v = sc.read_double();
        if (!v) return std::move(v).error();
        c[i] = *v;
    }
    if (auto close = sc.expect(')', "closing POINT"); !close) return std::move(close).error();

    Point p = has_z ? Point::xyz(c[0], c[1], c[2], ctx.srid)
                    : Point::xy(c[0], c[1], ctx.srid);
    p.geodetic = ctx.type == ValueType::GeogPoint;
    return p;
}

Result<Value> read_value(TextScanner& sc, const ReadContext& ctx) {
    switch (ctx.type) {
        case ValueType::Bool:
            if (sc.consume_keyword("true") || sc.consume_keyword("t")) return true;
            if (sc.consume_keyword("false") || sc.consume_keyword("f")) return false;
            return sc.error("expected a boolean");
        case ValueType::Int: {
            auto v = sc.read_int();
            if (!v) return std::move(v).error();
            return *v;
        }
        case ValueType::Float: {
            auto v = sc.read_double();
            if (!v) return std::move(v).error();
            return *v;
        }
        case ValueType::Text: {
            auto v = sc.read_quoted();
            if (!v) return std::move(v).error();
            return std::move(*v);
        }
        case ValueType::GeomPoint:
        case ValueType::GeogPoint:
            return read_point(sc, ctx);
    }
    return sc.error("unknown value type");
}

Result<TInstant> read_instant(TextScanner& sc, const ReadContext& ctx) {
    auto value = read_value(sc, ctx);
    if (!value) return std::move(value).error();
    if (auto at = sc.expect('@', "between value and timestamp"); !at) return std::move(at).error();
    auto t = sc.read_timestamp();
    if (!t) return std::move(t).error();
    return TInstant(std::move(*value), *t);
}

/// Comma-separated instants up to (not including) the closing bracket.
Result<std::vector<TInstant>> read_instants(TextScanner& sc, const ReadContext& ctx) {
    std::vector<TInstant> out;
    do {
        auto instant = read_instant(sc, ctx);
        if (!instant) return std::move(instant).error();
        out.push_back(std::move(*instant));
    } while (sc.consume(','));
    return out;
}

/// `{ instant, ... }`
Result<TSequence> read_discrete(TextScanner& sc, const ReadContext& ctx) {
    if (auto open = sc.expect('{', "opening a discrete sequence"); !open) {
        return std::move(open).error();
    }
    auto instants = read_instants(sc, ctx);
    if (!instants) return std::move(instants).error();
    if (auto close = sc.expect('}', "closing a discrete sequence"); !close) {
        return std::move(close).error();
    }
    return TSequence::make(std::move(*instants), Interpolation::Discrete);
}

/// `[ instant, ... )` and its inclusivity variants.
Result<TSequence> read_sequence(TextScanner& sc, const ReadContext& ctx) {
    if (ctx.interp == Interpolation::Discrete) {
        return sc.error("Interp=Discrete allows only '{' sequences");
    }
    bool lower_inc = true;
    if (sc.consume('(')) {
        lower_inc = false;
    } else if (!sc.consume('[')) {
        return sc.error("expected '[' or '(' opening a sequence");
    }
    auto instants = read_instants(sc, ctx);
    if (!instants) return std::move(instants).error();
    bool upper_inc = true;
    if (sc.consume(')')) {
        upper_inc = false;
    } else if (!sc.consume(']')) {
        return sc.error("expected ']' or ')' closing a sequence");
    }
    return TSequence::make(std::move(*instants), ctx.interp, lower_inc, upper_inc);
}

Result<TSequence> read_member(TextScanner& sc, const ReadContext& ctx) {
    if (sc.peek() == '{') return read_discrete(sc, ctx);
    return read_sequence(sc, ctx);
}

/// `{ sequence, ... }`, or `{}` for the empty set.
Result<TSequenceSet> read_set(TextScanner& sc, const ReadContext& ctx) {
    if (auto open = sc.expect('{', "opening a sequence set"); !open) {
        return std::move(open).error();
    }
    if (sc.consume('}')) {
        return TSequenceSet::empty(ctx.type, ctx.interp);
    }
    std::vector<TSequence> members;
    do {
        auto seq = read_member(sc, ctx);
        if (!seq) return std::move(seq).error();
        members.push_back(std::move(*seq));
    } while (sc.consume(','));
    if (auto close = sc.expect('}', "closing a sequence set"); !close) {
        return std::move(close).error();
    }
    return TSequenceSet::make(std::move(members));
}

/// Lifts a subtype result into a Temporal result.
template <typename T>
Result<Temporal> lift(Result<T> r) {
    if (!r) return std::move(r).error();
    return Temporal(std::move(*r));
}

Result<Temporal> read_body(TextScanner& sc, const ReadContext& ctx) {
    const char c = sc.peek();
    if (c == '[' || c == '(') return lift(read_sequence(sc, ctx));
    if (c != '{') return lift(read_instant(sc, ctx));

    // `{` opens a discrete sequence or a set; look past it to decide.
    TextScanner ahead = sc;
    (void)ahead.consume('{');
    const char next = ahead.peek();
    if (next == '[' || next == '(' || next == '{' || next == '}') {
        return lift(read_set(sc, ctx));
    }
    return lift(read_discrete(sc, ctx));
}

template <typename T>
Result<T> read_bound(TextScanner& sc) {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return sc.read_int();
    } else if constexpr (std::is_same_v<T, double>) {
        return sc.read_double();
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        return sc.read_timestamp();
    } else {
        return sc.read_date();
    }
}

template <typename T>
Result<Span<T>> read_span(TextScanner& sc) {
    bool lower_inc = true;
    if (sc.consume('(')) {
        lower_inc = false;
    } else if (!sc.consume('[')) {
        return sc.error("expected '[' or '(' opening a span");
    }
    auto lower = read_bound<T>(sc);
    if (!lower) return std::move(lower).error();
    if (auto comma = sc.expect(',', "between span bounds"); !comma) return std::move(comma).error();
    auto upper = read_bound<T>(sc);
    if (!upper) return std::move(upper).error();
    bool upper_inc = true;
    if (sc.consume(')')) {
        upper_inc = false;
    } else if (!sc.consume(']')) {
        return sc.error("expected ']' or ')' closing a span");
    }
    return Span<T>::make(*lower, *upper, lower_inc, upper_inc);
}

}  // namespace

// ─── Public entry points ──────────────────────────────────────────────────────

Result<Value> value_from_wkt(std::string_view text, ValueType type) {
    TextScanner sc(text, Format::Wkt);
    auto value = read_value(sc, ReadContext{type});
    if (!value) return value;
    if (!sc.at_end()) return sc.error("unexpected trailing characters");
    return value;
}

Result<Temporal> temporal_from_wkt(std::string_view text, ValueType type) {
    TextScanner sc(text, Format::Wkt);
    ReadContext ctx{type};
    ctx.interp = is_linear_interpolable(type) ? Interpolation::Linear : Interpolation::Step;

    if (sc.consume_keyword("SRID=")) {
        if (!is_spatial(type)) {
            return sc.error("SRID prefix on a non-spatial value");
        }
        auto srid = sc.read_int();
        if (!srid) return std::move(srid).error();
        if (*srid < std::numeric_limits<std::int32_t>::min() ||
            *srid > std::numeric_limits<std::int32_t>::max()) {
            return sc.error("SRID out of range");
        }
        ctx.srid = static_cast<std::int32_t>(*srid);
        if (auto semi = sc.expect(';', "after SRID"); !semi) return std::move(semi).error();
    }
    if (sc.consume_keyword("Interp=")) {
        if (sc.consume_keyword("Step")) {
            ctx.interp = Interpolation::Step;
        } else if (sc.consume_keyword("Linear")) {
            ctx.interp = Interpolation::Linear;
        } else if (sc.consume_keyword("Discrete")) {
            ctx.interp = Interpolation::Discrete;
        } else {
            return sc.error("expected Step, Linear or Discrete after Interp=");
        }
        if (auto semi = sc.expect(';', "after interpolation"); !semi) return std::move(semi).error();
    }

    auto result = read_body(sc, ctx);
    if (!result) return result;
    if (!sc.at_end()) return sc.error("unexpected trailing characters");
    return result;
}

template <typename T>
Result<Span<T>> span_from_wkt(std::string_view text) {
    TextScanner sc(text, Format::Wkt);
    auto span = read_span<T>(sc);
    if (!span) return span;
    if (!sc.at_end()) return sc.error("unexpected trailing characters");
    return span;
}

template <typename T>
Result<SpanSet<T>> span_set_from_wkt(std::string_view text) {
    TextScanner sc(text, Format::Wkt);
    if (auto open = sc.expect('{', "opening a span set"); !open) return std::move(open).error();
    std::vector<Span<T>> spans;
    if (!sc.consume('}')) {
        do {
            auto span = read_span<T>(sc);
            if (!span) return std::move(span).error();
            spans.push_back(*span);
        } while (sc.consume(','));
        if (auto close = sc.expect('}', "closing a span set"); !close) {
            return std::move(close).error();
        }
    }
    if (!sc.at_end()) return sc.error("unexpected trailing characters");
    return SpanSet<T>::make(std::move(spans));
}

template Result<Span<std::int64_t>> span_from_wkt<std::int64_t>(std::string_view);
template Result<Span<double>>       span_from_wkt<double>(std::string_view);
template Result<Span<Timestamp>>    span_from_wkt<Timestamp>(std::string_view);
template Result<Span<Date>>         span_from_wkt<Date>(std::string_view);

template Result<SpanSet<std::int64_t>> span_set_from_wkt<std::int64_t>(std::string_view);
template Result<SpanSet<double>>       span_set_from_wkt<double>(std::string_view);
template Result<SpanSet<Timestamp>>    span_set_from_wkt<Timestamp>(std::string_view);
template Result<SpanSet<Date>>         span_set_from_wkt<Date>(std::string_view);

}  // namespace tempus::codec
