/// @file src/codec/wkb.cpp
/// @brief WKB encoder and validating decoder.

#include "tempus/wkb.hpp"
#include "tempus/time.hpp"

#include "byte_buffer.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace tempus::codec {

using namespace constants;

namespace {

using detail::ByteReader;
using detail::ByteWriter;

constexpr std::uint8_t BOUND_FLAGS = WKB_FLAG_LOWER_INC | WKB_FLAG_UPPER_INC;
constexpr std::uint8_t KNOWN_FLAGS = BOUND_FLAGS | WKB_FLAG_HAS_Z | WKB_FLAG_HAS_SRID;

/// Smallest encoded instant: a bool value plus its timestamp.
constexpr std::size_t MIN_INSTANT_SIZE = 1 + 8;

std::uint8_t bound_flags(bool lower_inc, bool upper_inc) noexcept {
    return static_cast<std::uint8_t>((lower_inc ? WKB_FLAG_LOWER_INC : 0) |
                                     (upper_inc ? WKB_FLAG_UPPER_INC : 0));
}

// ─── Encoding helpers ─────────────────────────────────────────────────────────

void write_header(ByteWriter& w, const CodecConfig& config, WkbType type,
                  std::uint8_t interp, std::uint8_t domain, std::uint8_t flags,
                  std::uint32_t count, std::int32_t srid) {
    if (config.wkb_variant == WkbVariant::Extended) {
        w.u8(WKB_EXTENDED_MARKER | WKB_VERSION);
    }
    w.u8(static_cast<std::uint8_t>(type));
    w.u8(interp);
    w.u8(domain);
    w.u8(flags);
    w.u32(count);
    if (flags & WKB_FLAG_HAS_SRID) w.i32(srid);
}

void write_value(ByteWriter& w, const Value& value) {
    std::visit([&](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            w.u8(v ? 1 : 0);
        } else if constexpr (std::is_same_v<V, std::int64_t>) {
            w.i64(v);
        } else if constexpr (std::is_same_v<V, double>) {
            w.f64(v);
        } else if constexpr (std::is_same_v<V, std::string>) {
            w.u32(static_cast<std::uint32_t>(v.size()));
            w.raw(v.data(), v.size());
        } else {
            w.f64(v.x());
            w.f64(v.y());
            if (v.has_z) w.f64(v.z());
        }
    }, value);
}

void write_instants(ByteWriter& w, std::span<const TInstant> instants) {
    for (const auto& i : instants) {
        write_value(w, i.value());
        w.i64(i.timestamp().time_since_epoch().count());
    }
}

/// has_z / has_srid flags of a value domain, taken from a sample value.
std::uint8_t point_flags(const Value& sample, std::int32_t& srid) noexcept {
    std::uint8_t flags = 0;
    srid = NO_SRID;
    if (const auto* p = std::get_if<Point>(&sample)) {
        if (p->has_z) flags |= WKB_FLAG_HAS_Z;
        if (p->srid != NO_SRID) {
            flags |= WKB_FLAG_HAS_SRID;
            srid = p->srid;
        }
    }
    return flags;
}

template <typename T>
void write_bound(ByteWriter& w, T value) {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        w.i64(value);
    } else if constexpr (std::is_same_v<T, double>) {
        w.f64(value);
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        w.i64(value.time_since_epoch().count());
    } else {
        w.i32(static_cast<std::int32_t>(value.time_since_epoch().count()));
    }
}

// ─── Decoding helpers ─────────────────────────────────────────────────────────

Error wkb_error(const ByteReader& r, std::string reason) {
    return Error::parse_error(Format::Wkb, r.position(), std::move(reason));
}

struct Header {
    WkbType       type;
    std::uint8_t  interp;
    std::uint8_t  domain;
    std::uint8_t  flags;
    std::uint32_t count;
    std::int32_t  srid = NO_SRID;
};

Result<Header> read_header(ByteReader& r) {
    auto first = r.u8();
    if (!first) return wkb_error(r, "empty input");
    std::uint8_t type_byte = *first;
    if (type_byte & WKB_EXTENDED_MARKER) {
        const std::uint8_t version = type_byte & ~WKB_EXTENDED_MARKER;
        if (version != WKB_VERSION) {
            return wkb_error(r, fmt::format("unsupported WKB version {}", version));
        }
        auto t = r.u8();
        if (!t) return wkb_error(r, "truncated header");
        type_byte = *t;
    }
    if (type_byte < 1 || type_byte > 5) {
        return wkb_error(r, fmt::format("unknown type tag {}", type_byte));
    }
    const auto interp = r.u8();
    const auto domain = r.u8();
    const auto flags  = r.u8();
    const auto count  = r.u32();
    if (!interp || !domain || !flags || !count) return wkb_error(r, "truncated header");
    if (*flags & ~KNOWN_FLAGS) {
        return wkb_error(r, fmt::format("unknown flag bits {:#04x}", *flags));
    }
    Header h{static_cast<WkbType>(type_byte), *interp, *domain, *flags, *count};
    if (h.flags & WKB_FLAG_HAS_SRID) {
        const auto srid = r.i32();
        if (!srid) return wkb_error(r, "truncated SRID");
        h.srid = *srid;
    }
    return h;
}

/// Domain facts every instant of one value shares.
struct ValueLayout {
    ValueType    type;
    bool         has_z;
    std::int32_t srid;
};

Result<Value> read_value(ByteReader& r, const ValueLayout& layout) {
    switch (layout.type) {
        case ValueType::Bool: {
            const auto b = r.u8();
            if (!b) return wkb_error(r, "truncated boolean");
            if (*b > 1) return wkb_error(r, "boolean byte is not 0 or 1");
            return *b == 1;
        }
        case ValueType::Int: {
            const auto v = r.i64();
            if (!v) return wkb_error(r, "truncated integer");
            return *v;
        }
        case ValueType::Float: {
            const auto v = r.f64();
            if (!v) return wkb_error(r, "truncated float");
            return *v;
        }
        case ValueType::Text: {
            const auto len = r.u32();
            if (!len) return wkb_error(r, "truncated text length");
            const auto bytes = r.raw(*len);
            if (!bytes) return wkb_error(r, "text length exceeds payload");
            return std::string(bytes->begin(), bytes->end());
        }
        case ValueType::GeomPoint:
        case ValueType::GeogPoint: {
            const auto x = r.f64();
            const auto y = r.f64();
            if (!x || !y) return wkb_error(r, "truncated point");
            Point p = Point::xy(*x, *y, layout.srid);
            if (layout.has_z) {
                const auto z = r.f64();
                if (!z) return wkb_error(r, "truncated point");
                p = Point::xyz(*x, *y, *z, layout.srid);
            }
            p.geodetic = layout.type == ValueType::GeogPoint;
            return p;
        }
    }
    return wkb_error(r, "unknown value domain");
}

Result<std::vector<TInstant>>
read_instants(ByteReader& r, const ValueLayout& layout, std::uint32_t count) {
    if (count > r.remaining() / MIN_INSTANT_SIZE) {
        return wkb_error(r, "instant count exceeds payload");
    }
    std::vector<TInstant> out;
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        auto value = read_value(r, layout);
        if (!value) return std::move(value).error();
        const auto t = r.i64();
        if (!t) return wkb_error(r, "truncated timestamp");
        const Timestamp ts{Duration{*t}};
        if (!in_text_range(ts)) return wkb_error(r, "timestamp outside years 0000-9999");
        out.emplace_back(std::move(*value), ts);
    }
    return out;
}

Result<Interpolation> sequence_interp(const ByteReader& r, std::uint8_t tag) {
    if (tag < 1 || tag > 3) {
        return wkb_error(r, fmt::format("invalid sequence interpolation tag {}", tag));
    }
    return static_cast<Interpolation>(tag);
}

template <typename T>
std::optional<T> read_bound(ByteReader& r) {
    if constexpr (std::is_same_v<T, std::int64_t>) {
        return r.i64();
    } else if constexpr (std::is_same_v<T, double>) {
        return r.f64();
    } else if constexpr (std::is_same_v<T, Timestamp>) {
        const auto v = r.i64();
        if (!v) return std::nullopt;
        return Timestamp{Duration{*v}};
    } else {
        const auto v = r.i32();
        if (!v) return std::nullopt;
        return Date{std::chrono::days{*v}};
    }
}

template <typename T>
Result<Span<T>> read_span_body(ByteReader& r, std::uint8_t flags) {
    const auto lower = read_bound<T>(r);
    const auto upper = read_bound<T>(r);
    if (!lower || !upper) return wkb_error(r, "truncated span bounds");
    if constexpr (std::is_same_v<T, Timestamp> || std::is_same_v<T, Date>) {
        if (!in_text_range(*lower) || !in_text_range(*upper)) {
            return wkb_error(r, "span bound outside years 0000-9999");
        }
    }
    return Span<T>::make(*lower, *upper, (flags & WKB_FLAG_LOWER_INC) != 0,
                         (flags & WKB_FLAG_UPPER_INC) != 0);
}

/// Common checks of a span or span-set header.
template <typename T>
Result<Header> read_span_header(ByteReader& r, WkbType expected) {
    auto h = read_header(r);
    if (!h) return h;
    if (h->type != expected) {
        return wkb_error(r, fmt::format("expected type tag {}, found {}",
                                        static_cast<int>(expected), static_cast<int>(h->type)));
    }
    if (h->interp != 0) return wkb_error(r, "span carries an interpolation tag");
    if (h->domain != SpanDomain<T>::wkb_tag) {
        return wkb_error(r, fmt::format("span domain tag {} does not match {}",
                                        h->domain, SpanDomain<T>::wkb_tag));
    }
    if (h->flags & ~BOUND_FLAGS) return wkb_error(r, "spatial flags on a span");
    return h;
}

Result<Temporal> finish(ByteReader& r, Result<Temporal> value) {
    if (value && r.remaining() != 0) {
        return wkb_error(r, fmt::format("{} trailing bytes", r.remaining()));
    }
    return value;
}

}  // namespace

// ─── Temporal values ──────────────────────────────────────────────────────────

Bytes to_wkb(const Temporal& temporal, const CodecConfig& config) {
    ByteWriter w;
    const auto domain = static_cast<std::uint8_t>(value_type_of(temporal));
    std::int32_t srid = NO_SRID;

    if (const auto* i = std::get_if<TInstant>(&temporal)) {
        const std::uint8_t flags = point_flags(i->value(), srid);
        write_header(w, config, WkbType::Instant, 0, domain, flags, 1, srid);
        write_instants(w, std::span<const TInstant>(i, 1));
    } else if (const auto* s = std::get_if<TSequence>(&temporal)) {
        const std::uint8_t flags = point_flags(s->start_instant().value(), srid) |
                                   bound_flags(s->lower_inc(), s->upper_inc());
        write_header(w, config, WkbType::Sequence,
                     static_cast<std::uint8_t>(s->interpolation()), domain, flags,
                     static_cast<std::uint32_t>(s->num_instants()), srid);
        write_instants(w, s->instants());
    } else {
        const auto& set = std::get<TSequenceSet>(temporal);
        const std::uint8_t flags = set.is_empty()
            ? std::uint8_t{0}
            : point_flags(set.sequences().front().start_instant().value(), srid);
        write_header(w, config, WkbType::SequenceSet,
                     static_cast<std::uint8_t>(set.interpolation()), domain, flags,
                     static_cast<std::uint32_t>(set.num_sequences()), srid);
        for (const auto& member : set.sequences()) {
            w.u8(bound_flags(member.lower_inc(), member.upper_inc()));
            w.u32(static_cast<std::uint32_t>(member.num_instants()));
            write_instants(w, member.instants());
        }
    }
    return std::move(w).take();
}

Result<Temporal> temporal_from_wkb(std::span<const std::uint8_t> bytes) {
    ByteReader r(bytes);
    auto header = read_header(r);
    if (!header) return std::move(header).error();
    const Header& h = *header;

    if (h.type == WkbType::Span || h.type == WkbType::SpanSet) {
        return wkb_error(r, "span payload where a temporal value was expected");
    }
    if (h.domain < 1 || h.domain > 6) {
        return wkb_error(r, fmt::format("unknown value domain tag {}", h.domain));
    }
    const ValueLayout layout{static_cast<ValueType>(h.domain),
                             (h.flags & WKB_FLAG_HAS_Z) != 0, h.srid};
    if (!is_spatial(layout.type) && (h.flags & (WKB_FLAG_HAS_Z | WKB_FLAG_HAS_SRID))) {
        return wkb_error(r, "spatial flags on a non-spatial value");
    }

    switch (h.type) {
        case WkbType::Instant: {
            if (h.interp != 0 || h.count != 1 || (h.flags & BOUND_FLAGS)) {
                return wkb_error(r, "malformed instant header");
            }
            auto instants = read_instants(r, layout, 1);
            if (!instants) return std::move(instants).error();
            return finish(r, Temporal(std::move(instants->front())));
        }
        case WkbType::Sequence: {
            auto interp = sequence_interp(r, h.interp);
            if (!interp) return std::move(interp).error();
            auto instants = read_instants(r, layout, h.count);
            if (!instants) return std::move(instants).error();
            auto seq = TSequence::make(std::move(*instants), *interp,
                                       (h.flags & WKB_FLAG_LOWER_INC) != 0,
                                       (h.flags & WKB_FLAG_UPPER_INC) != 0);
            if (!seq) return std::move(seq).error();
            return finish(r, Temporal(std::move(*seq)));
        }
        case WkbType::SequenceSet: {
            auto interp = sequence_interp(r, h.interp);
            if (!interp) return std::move(interp).error();
            if (h.flags & BOUND_FLAGS) return wkb_error(r, "bound flags on a sequence set");
            if (h.count == 0) {
                return finish(r, Temporal(TSequenceSet::empty(layout.type, *interp)));
            }
            if (h.count > r.remaining() / (5 + MIN_INSTANT_SIZE)) {
                return wkb_error(r, "sequence count exceeds payload");
            }
            std::vector<TSequence> members;
            members.reserve(h.count);
            for (std::uint32_t m = 0; m < h.count; ++m) {
                const auto flags = r.u8();
                const auto n     = r.u32();
                if (!flags || !n) return wkb_error(r, "truncated sequence header");
                if (*flags & ~BOUND_FLAGS) return wkb_error(r, "unknown sequence flag bits");
                auto instants = read_instants(r, layout, *n);
                if (!instants) return std::move(instants).error();
                auto seq = TSequence::make(std::move(*instants), *interp,
                                           (*flags & WKB_FLAG_LOWER_INC) != 0,
                                           (*flags & WKB_FLAG_UPPER_INC) != 0);
                if (!seq) return std::move(seq).error();
                members.push_back(std::move(*seq));
            }
            auto set = TSequenceSet::make(std::move(members));
            if (!set) return std::move(set).error();
            return finish(r, Temporal(std::move(*set)));
        }
        case WkbType::Span:
        case WkbType::SpanSet:
            break;
    }
    return wkb_error(r, "unexpected type tag");
}

// ─── Spans ────────────────────────────────────────────────────────────────────

template <typename T>
Bytes to_wkb(const Span<T>& span, const CodecConfig& config) {
    ByteWriter w;
    write_header(w, config, WkbType::Span, 0, SpanDomain<T>::wkb_tag,
                 bound_flags(span.lower_inc(), span.upper_inc()), 1, NO_SRID);
    write_bound(w, span.lower());
    write_bound(w, span.upper());
    return std::move(w).take();
}

template <typename T>
Bytes to_wkb(const SpanSet<T>& set, const CodecConfig& config) {
    ByteWriter w;
    write_header(w, config, WkbType::SpanSet, 0, SpanDomain<T>::wkb_tag, 0,
                 static_cast<std::uint32_t>(set.num_spans()), NO_SRID);
    for (const auto& s : set.spans()) {
        w.u8(bound_flags(s.lower_inc(), s.upper_inc()));
        write_bound(w, s.lower());
        write_bound(w, s.upper());
    }
    return std::move(w).take();
}

template <typename T>
Result<Span<T>> span_from_wkb(std::span<const std::uint8_t> bytes) {
    ByteReader r(bytes);
    auto h = read_span_header<T>(r, WkbType::Span);
    if (!h) return std::move(h).error();
    if (h->count != 1) return wkb_error(r, "span count must be 1");
    auto span = read_span_body<T>(r, h->flags);
    if (!span) return span;
    if (r.remaining() != 0) return wkb_error(r, fmt::format("{} trailing bytes", r.remaining()));
    return span;
}

template <typename T>
Result<SpanSet<T>> span_set_from_wkb(std::span<const std::uint8_t> bytes) {
    ByteReader r(bytes);
    auto h = read_span_header<T>(r, WkbType::SpanSet);
    if (!h) return std::move(h).error();
    if (h->flags != 0) return wkb_error(r, "bound flags on a span set header");
    if (h->count > r.remaining() / 9) return wkb_error(r, "span count exceeds payload");
    std::vector<Span<T>> spans;
    spans.reserve(h->count);
    for (std::uint32_t i = 0; i < h->count; ++i) {
        const auto flags = r.u8();
        if (!flags) return wkb_error(r, "truncated span flags");
        if (*flags & ~BOUND_FLAGS) return wkb_error(r, "unknown span flag bits");
        auto span = read_span_body<T>(r, *flags);
        if (!span) return std::move(span).error();
        spans.push_back(*span);
    }
    if (r.remaining() != 0) return wkb_error(r, fmt::format("{} trailing bytes", r.remaining()));
    return SpanSet<T>::make(std::move(spans));
}

template Bytes to_wkb<std::int64_t>(const Span<std::int64_t>&, const CodecConfig&);
template Bytes to_wkb<double>(const Span<double>&, const CodecConfig&);
template Bytes to_wkb<Timestamp>(const Span<Timestamp>&, const CodecConfig&);
template Bytes to_wkb<Date>(const Span<Date>&, const CodecConfig&);

template Bytes to_wkb<std::int64_t>(const SpanSet<std::int64_t>&, const CodecConfig&);
template Bytes to_wkb<double>(const SpanSet<double>&, const CodecConfig&);
template Bytes to_wkb<Timestamp>(const SpanSet<Timestamp>&, const CodecConfig&);
template Bytes to_wkb<Date>(const SpanSet<Date>&, const CodecConfig&);

template Result<Span<std::int64_t>> span_from_wkb<std::int64_t>(std::span<const std::uint8_t>);
template Result<Span<double>>       span_from_wkb<double>(std::span<const std::uint8_t>);
template Result<Span<Timestamp>>    span_from_wkb<Timestamp>(std::span<const std::uint8_t>);
template Result<Span<Date>>         span_from_wkb<Date>(std::span<const std::uint8_t>);

template Result<SpanSet<std::int64_t>> span_set_from_wkb<std::int64_t>(std::span<const std::uint8_t>);
template Result<SpanSet<double>>       span_set_from_wkb<double>(std::span<const std::uint8_t>);
template Result<SpanSet<Timestamp>>    span_set_from_wkb<Timestamp>(std::span<const std::uint8_t>);
template Result<SpanSet<Date>>         span_set_from_wkb<Date>(std::span<const std::uint8_t>);

// ─── Hex ──────────────────────────────────────────────────────────────────────

std::string to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char DIGITS[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const std::uint8_t b : bytes) {
        out += DIGITS[b >> 4];
        out += DIGITS[b & 0x0F];
    }
    return out;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Error::parse_error(Format::Wkb, hex.size(), "odd number of hex digits");
    }
    const auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error::parse_error(Format::Wkb, hi < 0 ? i : i + 1, "invalid hex digit");
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace tempus::codec
