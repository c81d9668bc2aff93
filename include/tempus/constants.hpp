#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/tempus/constants.hpp
/// @brief Numeric constants, codec tags and defaults for the tempus library.

namespace tempus::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Tolerance used when deciding whether a point lies on a linear segment.
static constexpr double COORD_EPSILON = 1e-12;

/// Microseconds per second (timestamp resolution is one microsecond).
static constexpr std::int64_t USECS_PER_SEC = 1'000'000;

/// Calendar years expressible by the four-digit `YYYY` text form.
static constexpr int MIN_YEAR = 0;
static constexpr int MAX_YEAR = 9999;

// ─── Codec Defaults ───────────────────────────────────────────────────────────

/// Largest precision honoured by the MF-JSON writer.
static constexpr int MAX_PRECISION = 17;

/// SRID of points that carry no spatial reference.
static constexpr std::int32_t NO_SRID = 0;

/// Maximum nesting depth accepted by the MF-JSON reader.
static constexpr std::size_t MAX_JSON_DEPTH = 64;

// ─── WKB Layout ───────────────────────────────────────────────────────────────

/// Marker bit on the leading byte of an extended WKB payload.
static constexpr std::uint8_t WKB_EXTENDED_MARKER = 0x80;

/// Version written in the extended prefix byte.
static constexpr std::uint8_t WKB_VERSION = 1;

/// Size of the fixed header: type, interpolation, domain, flags.
static constexpr std::size_t WKB_HEADER_SIZE = 4;

/// Flag bits of the header `flags` byte.
static constexpr std::uint8_t WKB_FLAG_LOWER_INC = 0x01;
static constexpr std::uint8_t WKB_FLAG_UPPER_INC = 0x02;
static constexpr std::uint8_t WKB_FLAG_HAS_Z     = 0x04;
static constexpr std::uint8_t WKB_FLAG_HAS_SRID  = 0x08;

}  // namespace tempus::constants
