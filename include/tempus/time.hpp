#pragma once

/// @file include/tempus/time.hpp
/// @brief Timestamp and date parsing/rendering shared by all codecs.
///
/// # Module: Time
///
/// ## Accepted Timestamp Syntax
/// ```
/// YYYY-MM-DD[( |T)HH:MM[:SS[.ffffff]]][Z|(+|-)HH[[:]MM]]
/// ```
/// A missing time of day means midnight; a missing offset means UTC. The
/// offset is applied so the result is always a UTC instant.
///
/// ## Rendering
/// `YYYY-MM-DD HH:MM:SS[.ffffff]+00` with trailing zeros of the fraction
/// trimmed. The date/time separator is configurable (' ' for WKT, 'T' for
/// MF-JSON).

#include "tempus/error.hpp"
#include "tempus/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tempus {

/// Build a UTC timestamp from calendar fields.
/// Returns nullopt for an invalid calendar date or out-of-range time fields.
[[nodiscard]] std::optional<Timestamp>
make_timestamp(int year, unsigned month, unsigned day,
               unsigned hour = 0, unsigned minute = 0, unsigned second = 0,
               std::int64_t microsecond = 0) noexcept;

/// Parse the longest timestamp prefix of `text`.
///
/// # Returns
/// The timestamp and sets `consumed` to the number of bytes read, or nullopt
/// (with `consumed` pointing at the offending byte) when the prefix is not a
/// valid timestamp.
[[nodiscard]] std::optional<Timestamp>
scan_timestamp(std::string_view text, std::size_t& consumed) noexcept;

/// Parse a complete timestamp string (surrounding whitespace allowed).
[[nodiscard]] Result<Timestamp> parse_timestamp(std::string_view text);

/// True when the UTC calendar year of `t` lies in [MIN_YEAR, MAX_YEAR], so
/// `format_timestamp` renders text that `parse_timestamp` reads back.
[[nodiscard]] bool in_text_range(Timestamp t) noexcept;
[[nodiscard]] bool in_text_range(Date d) noexcept;

/// Render a timestamp in UTC.
[[nodiscard]] std::string format_timestamp(Timestamp t, char separator = ' ');

/// Parse the longest `YYYY-MM-DD` prefix of `text`.
[[nodiscard]] std::optional<Date>
scan_date(std::string_view text, std::size_t& consumed) noexcept;

[[nodiscard]] Result<Date> parse_date(std::string_view text);

[[nodiscard]] std::string format_date(Date d);

}  // namespace tempus
