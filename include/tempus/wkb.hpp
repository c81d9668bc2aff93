#pragma once

/// @file include/tempus/wkb.hpp
/// @brief Well-known binary for spans, span sets and temporal values.
///
/// # Module: WKB Codec
///
/// ## Layout (all multi-byte fields little-endian)
/// ```
/// [0x80|version]?                      extended variant only
/// [type:u8][interp:u8][domain:u8][flags:u8][count:u32][srid:i32]?
/// ```
/// type:   1 Instant, 2 Sequence, 3 SequenceSet, 4 Span, 5 SpanSet
/// domain: 1 bool, 2 int, 3 float, 4 text, 5 geom point, 6 geog point,
///         7 timestamptz, 8 date
/// flags:  bit0 lower_inc, bit1 upper_inc, bit2 has_z, bit3 has_srid
///
/// Elements after the header:
/// - Instant / Sequence: `count` × (value, timestamp:i64 µs since epoch)
/// - SequenceSet: `count` × ([flags:u8][n:u32] n × (value, timestamp))
/// - Span: (lower, upper), `count` = 1
/// - SpanSet: `count` × ([flags:u8][lower][upper])
///
/// Values: bool u8, int i64, float f64, text u32 length + bytes, point 2 or 3
/// f64. Dates are i32 days since 1970-01-01.
///
/// ## Guarantees
/// - from_wkb(to_wkb(x)) == x, byte-exact re-encoding
/// - Every length, tag, count and trailing byte is checked on decode

#include "tempus/codec_config.hpp"
#include "tempus/error.hpp"
#include "tempus/span.hpp"
#include "tempus/span_set.hpp"
#include "tempus/temporal.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tempus::codec {

using Bytes = std::vector<std::uint8_t>;

/// Object kind stored in the first header byte.
enum class WkbType : std::uint8_t {
    Instant     = 1,
    Sequence    = 2,
    SequenceSet = 3,
    Span        = 4,
    SpanSet     = 5,
};

// ─── Encoding ─────────────────────────────────────────────────────────────────

[[nodiscard]] Bytes to_wkb(const Temporal& temporal, const CodecConfig& config = {});

template <typename T>
[[nodiscard]] Bytes to_wkb(const Span<T>& span, const CodecConfig& config = {});

template <typename T>
[[nodiscard]] Bytes to_wkb(const SpanSet<T>& set, const CodecConfig& config = {});

// ─── Decoding ─────────────────────────────────────────────────────────────────

[[nodiscard]] Result<Temporal> temporal_from_wkb(std::span<const std::uint8_t> bytes);

template <typename T>
[[nodiscard]] Result<Span<T>> span_from_wkb(std::span<const std::uint8_t> bytes);

template <typename T>
[[nodiscard]] Result<SpanSet<T>> span_set_from_wkb(std::span<const std::uint8_t> bytes);

// ─── Hex ──────────────────────────────────────────────────────────────────────

/// Upper-case hexadecimal rendering, two digits per byte.
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/// Inverse of to_hex; accepts either case.
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

}  // namespace tempus::codec
