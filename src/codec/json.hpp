#pragma once

/// @file src/codec/json.hpp
/// @brief Minimal JSON document model for the MF-JSON codec.
///
/// Objects keep member order so rendering is deterministic. Numbers keep their
/// source text; callers convert with the precision they need.

#include "tempus/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tempus::codec::detail {

struct JsonValue {
    enum class Kind { Null, Bool, Number, String, Array, Object };

    Kind        kind    = Kind::Null;
    bool        boolean = false;
    std::string text;  ///< Number text or string contents
    std::vector<JsonValue>                         items;
    std::vector<std::pair<std::string, JsonValue>> members;
    std::size_t position = 0;  ///< Byte offset in the parsed input

    [[nodiscard]] static JsonValue number(std::string text) {
        JsonValue v;
        v.kind = Kind::Number;
        v.text = std::move(text);
        return v;
    }

    [[nodiscard]] static JsonValue string(std::string text) {
        JsonValue v;
        v.kind = Kind::String;
        v.text = std::move(text);
        return v;
    }

    [[nodiscard]] static JsonValue boolean_value(bool b) {
        JsonValue v;
        v.kind    = Kind::Bool;
        v.boolean = b;
        return v;
    }

    [[nodiscard]] static JsonValue array() {
        JsonValue v;
        v.kind = Kind::Array;
        return v;
    }

    [[nodiscard]] static JsonValue object() {
        JsonValue v;
        v.kind = Kind::Object;
        return v;
    }

    void add(std::string key, JsonValue value) {
        members.emplace_back(std::move(key), std::move(value));
    }

    /// Member by key, nullptr when absent or when this is not an object.
    [[nodiscard]] const JsonValue* find(std::string_view key) const noexcept;
};

/// Parse a complete JSON document; errors are MF-JSON ParseErrors.
[[nodiscard]] Result<JsonValue> parse_json(std::string_view text);

/// Render compactly, or with two-space indentation when `pretty`.
[[nodiscard]] std::string render_json(const JsonValue& value, bool pretty);

}  // namespace tempus::codec::detail
