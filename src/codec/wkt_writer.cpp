/// @file src/codec/wkt_writer.cpp
/// @brief WKT rendering of values, spans, span sets and temporal values.

#include "tempus/wkt.hpp"
#include "tempus/time.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace tempus::codec {

namespace {

std::string quote(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (const char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

/// `SRID=n;` for points with a spatial reference, `Interp=Step;` for step
/// sequences of domains that would otherwise read back as linear.
std::string prefix(ValueType type, const Value& sample, Interpolation interp) {
    std::string out;
    if (const auto* p = std::get_if<Point>(&sample); p && p->srid != constants::NO_SRID) {
        out += fmt::format("SRID={};", p->srid);
    }
    if (interp == Interpolation::Step && is_linear_interpolable(type)) {
        out += "Interp=Step;";
    }
    return out;
}

void append_instant(std::string& out, const TInstant& instant) {
    out += value_to_wkt(instant.value());
    out += '@';
    out += format_timestamp(instant.timestamp());
}

void append_sequence(std::string& out, const TSequence& seq) {
    const bool discrete = seq.interpolation() == Interpolation::Discrete;
    out += discrete ? '{' : (seq.lower_inc() ? '[' : '(');
    bool first = true;
    for (const auto& i : seq.instants()) {
        if (!first) out += ", ";
        first = false;
        append_instant(out, i);
    }
    out += discrete ? '}' : (seq.upper_inc() ? ']' : ')');
}

void append_set(std::string& out, const TSequenceSet& set) {
    out += '{';
    bool first = true;
    for (const auto& s : set.sequences()) {
        if (!first) out += ", ";
        first = false;
        append_sequence(out, s);
    }
    out += '}';
}

template <typename T>
std::string bound_to_wkt(T value) {
    if constexpr (std::is_same_v<T, Timestamp>) {
        return format_timestamp(value);
    } else if constexpr (std::is_same_v<T, Date>) {
        return format_date(value);
    } else {
        return fmt::format("{}", value);
    }
}

template <typename T>
void append_span(std::string& out, const Span<T>& span) {
    out += span.lower_inc() ? '[' : '(';
    out += bound_to_wkt(span.lower());
    out += ", ";
    out += bound_to_wkt(span.upper());
    out += span.upper_inc() ? ']' : ')';
}

}  // namespace

// ─── Values ───────────────────────────────────────────────────────────────────

std::string value_to_wkt(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            return v ? "t" : "f";
        } else if constexpr (std::is_same_v<V, std::string>) {
            return quote(v);
        } else if constexpr (std::is_same_v<V, Point>) {
            if (v.has_z) return fmt::format("POINT Z({} {} {})", v.x(), v.y(), v.z());
            return fmt::format("POINT({} {})", v.x(), v.y());
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

// ─── Temporal values ──────────────────────────────────────────────────────────

std::string to_wkt(const TInstant& instant) {
    std::string out = prefix(instant.value_type(), instant.value(), Interpolation::None);
    append_instant(out, instant);
    return out;
}

std::string to_wkt(const TSequence& sequence) {
    std::string out = prefix(sequence.value_type(), sequence.start_instant().value(),
                             sequence.interpolation());
    append_sequence(out, sequence);
    return out;
}

std::string to_wkt(const TSequenceSet& set) {
    std::string out;
    if (!set.is_empty()) {
        out = prefix(set.value_type(), set.sequences().front().start_instant().value(),
                     set.interpolation());
    } else if (set.interpolation() == Interpolation::Discrete) {
        // Nothing inside `{}` shows the members were discrete.
        out = "Interp=Discrete;";
    } else if (set.interpolation() == Interpolation::Step &&
               is_linear_interpolable(set.value_type())) {
        out = "Interp=Step;";
    }
    append_set(out, set);
    return out;
}

std::string to_wkt(const Temporal& temporal) {
    return std::visit([](const auto& t) { return to_wkt(t); }, temporal);
}

// ─── Spans ────────────────────────────────────────────────────────────────────

template <typename T>
std::string to_wkt(const Span<T>& span) {
    std::string out;
    append_span(out, span);
    return out;
}

template <typename T>
std::string to_wkt(const SpanSet<T>& set) {
    std::string out = "{";
    bool first = true;
    for (const auto& s : set.spans()) {
        if (!first) out += ", ";
        first = false;
        append_span(out, s);
    }
    out += '}';
    return out;
}

template std::string to_wkt<std::int64_t>(const Span<std::int64_t>&);
template std::string to_wkt<double>(const Span<double>&);
template std::string to_wkt<Timestamp>(const Span<Timestamp>&);
template std::string to_wkt<Date>(const Span<Date>&);

template std::string to_wkt<std::int64_t>(const SpanSet<std::int64_t>&);
template std::string to_wkt<double>(const SpanSet<double>&);
template std::string to_wkt<Timestamp>(const SpanSet<Timestamp>&);
template std::string to_wkt<Date>(const SpanSet<Date>&);

}  // namespace tempus::codec
