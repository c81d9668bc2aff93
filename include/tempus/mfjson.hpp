#pragma once

/// @file include/tempus/mfjson.hpp
/// @brief OGC Moving Features JSON for temporal values.
///
/// # Module: MF-JSON Codec
///
/// ## Shape
/// ```json
/// {"type":"MovingFloat","values":[1.5,2.5],
///  "datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],
///  "lower_inc":true,"upper_inc":true,"interpolation":"Linear"}
/// ```
/// Points use `coordinates` instead of `values`. Sequence sets carry a
/// `sequences` array of `{values|coordinates, datetimes, lower_inc, upper_inc}`
/// objects. Instants use `interpolation: "None"` and one-element arrays.
/// Optional members: `crs` (`{"type":"Name","properties":{"name":"EPSG:4326"}}`),
/// `period` and `bbox`.
///
/// ## Guarantees
/// - Compact and pretty renderings parse to the same value
/// - Malformed JSON, missing keys, wrong member types and array length
///   mismatches are ParseErrors

#include "tempus/codec_config.hpp"
#include "tempus/error.hpp"
#include "tempus/temporal.hpp"

#include <string>
#include <string_view>

namespace tempus::codec {

[[nodiscard]] std::string to_mfjson(const Temporal& temporal, const CodecConfig& config = {});

[[nodiscard]] Result<Temporal> temporal_from_mfjson(std::string_view json);

}  // namespace tempus::codec
