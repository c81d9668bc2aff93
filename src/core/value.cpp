/// @file src/core/value.cpp
/// @brief Value domain helpers and point comparison.

#include "tempus/types.hpp"

#include <tuple>
#include <type_traits>

namespace tempus {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Interpolation interp) noexcept {
    switch (interp) {
        case Interpolation::None:     return "None";
        case Interpolation::Discrete: return "Discrete";
        case Interpolation::Step:     return "Step";
        case Interpolation::Linear:   return "Linear";
    }
    return "Unknown";
}

const char* to_string(ValueType type) noexcept {
    switch (type) {
        case ValueType::Bool:      return "Bool";
        case ValueType::Int:       return "Int";
        case ValueType::Float:     return "Float";
        case ValueType::Text:      return "Text";
        case ValueType::GeomPoint: return "GeomPoint";
        case ValueType::GeogPoint: return "GeogPoint";
    }
    return "Unknown";
}

// ─── Point ────────────────────────────────────────────────────────────────────

bool operator==(const Point& a, const Point& b) noexcept {
    return a.coords == b.coords && a.compatible_with(b);
}

bool operator<(const Point& a, const Point& b) noexcept {
    return std::make_tuple(a.x(), a.y(), a.z(), a.srid) <
           std::make_tuple(b.x(), b.y(), b.z(), b.srid);
}

// ─── Value ────────────────────────────────────────────────────────────────────

ValueType value_type(const Value& value) noexcept {
    return std::visit([](const auto& v) -> ValueType {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>)              return ValueType::Bool;
        else if constexpr (std::is_same_v<V, std::int64_t>) return ValueType::Int;
        else if constexpr (std::is_same_v<V, double>)       return ValueType::Float;
        else if constexpr (std::is_same_v<V, std::string>)  return ValueType::Text;
        else return v.geodetic ? ValueType::GeogPoint : ValueType::GeomPoint;
    }, value);
}

bool is_linear_interpolable(ValueType type) noexcept {
    return type == ValueType::Float || is_spatial(type);
}

bool is_numeric(ValueType type) noexcept {
    return type == ValueType::Int || type == ValueType::Float;
}

bool is_spatial(ValueType type) noexcept {
    return type == ValueType::GeomPoint || type == ValueType::GeogPoint;
}

double as_double(const Value& value) noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return 0.0;
}

bool value_less(const Value& a, const Value& b) noexcept {
    if (a.index() != b.index()) {
        return value_type(a) < value_type(b);
    }
    return std::visit([&](const auto& lhs) -> bool {
        using V = std::decay_t<decltype(lhs)>;
        return lhs < std::get<V>(b);
    }, a);
}

}  // namespace tempus
