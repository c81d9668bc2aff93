#pragma once

/// @file src/codec/mfjson_common.hpp
/// @brief MF-JSON type and interpolation names shared by reader and writer.

#include "tempus/types.hpp"

#include <optional>
#include <string_view>

namespace tempus::codec::detail {

[[nodiscard]] inline const char* moving_type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Bool:      return "MovingBoolean";
        case ValueType::Int:       return "MovingInteger";
        case ValueType::Float:     return "MovingFloat";
        case ValueType::Text:      return "MovingText";
        case ValueType::GeomPoint: return "MovingPoint";
        case ValueType::GeogPoint: return "MovingGeogPoint";
    }
    return "Moving";
}

[[nodiscard]] inline std::optional<ValueType> moving_type(std::string_view name) noexcept {
    if (name == "MovingBoolean")   return ValueType::Bool;
    if (name == "MovingInteger")   return ValueType::Int;
    if (name == "MovingFloat")     return ValueType::Float;
    if (name == "MovingText")      return ValueType::Text;
    if (name == "MovingPoint")     return ValueType::GeomPoint;
    if (name == "MovingGeomPoint") return ValueType::GeomPoint;
    if (name == "MovingGeogPoint") return ValueType::GeogPoint;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<Interpolation> interpolation_named(std::string_view name) noexcept {
    if (name == "None")     return Interpolation::None;
    if (name == "Discrete") return Interpolation::Discrete;
    if (name == "Step")     return Interpolation::Step;
    if (name == "Linear")   return Interpolation::Linear;
    return std::nullopt;
}

}  // namespace tempus::codec::detail
