#pragma once

/// @file include/tempus/codec_config.hpp
/// @brief Runtime options shared by the WKB and MF-JSON encoders.

#include "tempus/constants.hpp"

#include <optional>
#include <string>

namespace tempus::codec {

enum class WkbVariant {
    Basic,     ///< Header starts with the type tag
    Extended,  ///< Header prefixed by `WKB_EXTENDED_MARKER | WKB_VERSION`
};

enum class JsonStyle {
    Compact,
    Pretty,  ///< Two-space indentation, one member per line
};

/// Encoder options. Decoders accept every variant and style.
///
/// Usage:
/// ```cpp
/// tempus::codec::CodecConfig cfg{.precision = 6, .json_style = JsonStyle::Pretty};
/// std::string json = tempus::codec::to_mfjson(seq, cfg);
/// ```
struct CodecConfig {
    /// Decimal digits after the point for MF-JSON numbers; clamped to
    /// MAX_PRECISION. Trailing zeros are dropped. When unset, numbers are
    /// written in the shortest form that reads back to the same double.
    std::optional<int> precision;

    WkbVariant wkb_variant = WkbVariant::Basic;

    JsonStyle json_style = JsonStyle::Compact;

    /// Spatial reference written in the MF-JSON `crs` member. When empty,
    /// `EPSG:<srid>` of the value is used, and no `crs` is written for SRID 0.
    std::string srs;

    /// Emit `period` and `bbox` members in MF-JSON.
    bool with_bbox = false;
};

}  // namespace tempus::codec
