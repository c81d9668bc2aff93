#pragma once

/// @file include/tempus/wkt.hpp
/// @brief Well-known text for spans, span sets and temporal values.
///
/// # Module: WKT Codec
///
/// ## Grammar
/// ```
/// temporal  := [ 'SRID=' int ';' ] [ 'Interp=Step;' ] body
/// body      := instant | discrete | sequence | seqset
/// instant   := value '@' timestamp
/// discrete  := '{' instant (',' instant)* '}'
/// sequence  := ('[' | '(') instant (',' instant)* (']' | ')')
/// seqset    := '{' sequence (',' sequence)* '}'
/// value     := 't' | 'f' | 'true' | 'false' | number | text | point
/// point     := 'POINT' [ 'Z' ] '(' number number [ number ] ')'
/// text      := '"' ( char | '\"' | '\\' )* '"'
/// span      := ('[' | '(') bound ',' bound (']' | ')')
/// spanset   := '{' span (',' span)* '}'
/// ```
/// Whitespace between tokens is insignificant; keywords are case-insensitive.
///
/// ## Guarantees
/// - from_wkt(to_wkt(x)) == x for every value this library can build
/// - Malformed input yields a ParseError with the byte offset of the failure

#include "tempus/error.hpp"
#include "tempus/span.hpp"
#include "tempus/span_set.hpp"
#include "tempus/temporal.hpp"
#include "tempus/types.hpp"

#include <string>
#include <string_view>

namespace tempus::codec {

// ─── Writing ──────────────────────────────────────────────────────────────────

/// Render a base value (floats use the shortest round-trip form).
[[nodiscard]] std::string value_to_wkt(const Value& value);

[[nodiscard]] std::string to_wkt(const TInstant& instant);
[[nodiscard]] std::string to_wkt(const TSequence& sequence);
[[nodiscard]] std::string to_wkt(const TSequenceSet& set);
[[nodiscard]] std::string to_wkt(const Temporal& temporal);

template <typename T>
[[nodiscard]] std::string to_wkt(const Span<T>& span);

template <typename T>
[[nodiscard]] std::string to_wkt(const SpanSet<T>& set);

// ─── Reading ──────────────────────────────────────────────────────────────────

/// Parse a single base value of the given domain.
[[nodiscard]] Result<Value> value_from_wkt(std::string_view text, ValueType type);

/// Parse a temporal value whose base values belong to `type`.
[[nodiscard]] Result<Temporal> temporal_from_wkt(std::string_view text, ValueType type);

/// Parse a span of the domain T (IntSpan, FloatSpan, TsTzSpan, DateSpan).
template <typename T>
[[nodiscard]] Result<Span<T>> span_from_wkt(std::string_view text);

template <typename T>
[[nodiscard]] Result<SpanSet<T>> span_set_from_wkt(std::string_view text);

}  // namespace tempus::codec
