#pragma once

/// @file include/tempus/temporal.hpp
/// @brief Temporal: any of the three temporal subtypes.
///
/// Codecs produce and consume `Temporal`; callers dispatch with std::visit.

#include "tempus/tinstant.hpp"
#include "tempus/tsequence.hpp"
#include "tempus/tsequence_set.hpp"
#include "tempus/types.hpp"

#include <optional>
#include <variant>

namespace tempus {

using Temporal = std::variant<TInstant, TSequence, TSequenceSet>;

/// Subtype tag, also the WKB type tag of temporal values.
enum class TemporalSubtype : std::uint8_t {
    Instant     = 1,
    Sequence    = 2,
    SequenceSet = 3,
};

[[nodiscard]] const char* to_string(TemporalSubtype subtype) noexcept;

[[nodiscard]] TemporalSubtype subtype_of(const Temporal& temporal) noexcept;

/// None for instants.
[[nodiscard]] Interpolation interpolation_of(const Temporal& temporal) noexcept;

[[nodiscard]] ValueType value_type_of(const Temporal& temporal) noexcept;

/// Time extent; nullopt for an empty sequence set.
[[nodiscard]] std::optional<TsTzSpan> bounding_box_of(const Temporal& temporal);

/// Value at `t` for any subtype.
[[nodiscard]] Result<Value> value_at(const Temporal& temporal, Timestamp t);

}  // namespace tempus
