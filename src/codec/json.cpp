/// @file src/codec/json.cpp
/// @brief Recursive-descent JSON reader and renderer.

#include "json.hpp"

#include "tempus/constants.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdint>

namespace tempus::codec::detail {

const JsonValue* JsonValue::find(std::string_view key) const noexcept {
    if (kind != Kind::Object) return nullptr;
    for (const auto& [k, v] : members) {
        if (k == key) return &v;
    }
    return nullptr;
}

// ─── Reader ───────────────────────────────────────────────────────────────────

namespace {

class JsonReader {
public:
    explicit JsonReader(std::string_view text) noexcept : text_(text) {}

    Result<JsonValue> document() {
        auto v = value(0);
        if (!v) return v;
        skip_ws();
        if (pos_ != text_.size()) return error("unexpected trailing characters");
        return v;
    }

private:
    Error error(std::string reason) const {
        return Error::parse_error(Format::MfJson, pos_, std::move(reason));
    }

    void skip_ws() noexcept {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool literal(std::string_view word) noexcept {
        if (text_.substr(pos_, word.size()) != word) return false;
        pos_ += word.size();
        return true;
    }

    Result<JsonValue> value(std::size_t depth) {
        if (depth > constants::MAX_JSON_DEPTH) return error("nesting too deep");
        skip_ws();
        if (pos_ == text_.size()) return error("unexpected end of input");

        const std::size_t start = pos_;
        Result<JsonValue> out = JsonValue{};
        const char c = text_[pos_];
        if (c == '{') {
            out = object(depth);
        } else if (c == '[') {
            out = array(depth);
        } else if (c == '"') {
            auto s = string();
            if (!s) return std::move(s).error();
            out = JsonValue::string(std::move(*s));
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            out = number();
        } else if (literal("true")) {
            out = JsonValue::boolean_value(true);
        } else if (literal("false")) {
            out = JsonValue::boolean_value(false);
        } else if (literal("null")) {
            out = JsonValue{};
        } else {
            return error(fmt::format("unexpected character '{}'", c));
        }
        if (out) out->position = start;
        return out;
    }

    Result<JsonValue> object(std::size_t depth) {
        JsonValue obj = JsonValue::object();
        ++pos_;  // '{'
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return obj;
        }
        while (true) {
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != '"') return error("expected member name");
            auto key = string();
            if (!key) return std::move(key).error();
            skip_ws();
            if (pos_ >= text_.size() || text_[pos_] != ':') return error("expected ':'");
            ++pos_;
            auto member = value(depth + 1);
            if (!member) return member;
            obj.add(std::move(*key), std::move(*member));
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (pos_ < text_.size() && text_[pos_] == '}') {
                ++pos_;
                return obj;
            }
            return error("expected ',' or '}'");
        }
    }

    Result<JsonValue> array(std::size_t depth) {
        JsonValue arr = JsonValue::array();
        ++pos_;  // '['
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return arr;
        }
        while (true) {
            auto item = value(depth + 1);
            if (!item) return item;
            arr.items.push_back(std::move(*item));
            skip_ws();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (pos_ < text_.size() && text_[pos_] == ']') {
                ++pos_;
                return arr;
            }
            return error("expected ',' or ']'");
        }
    }

    /// Number grammar of RFC 8259; the text is kept verbatim.
    Result<JsonValue> number() {
        const std::size_t start = pos_;
        const auto digits = [&] {
            const std::size_t from = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            return pos_ - from;
        };
        if (text_[pos_] == '-') ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '0') {
            ++pos_;
        } else if (digits() == 0) {
            return error("invalid number");
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            if (digits() == 0) return error("invalid number fraction");
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (digits() == 0) return error("invalid number exponent");
        }
        return JsonValue::number(std::string(text_.substr(start, pos_ - start)));
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    Result<std::uint32_t> hex4() {
        if (text_.size() - pos_ < 4) return error("truncated \\u escape");
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = text_[pos_++];
            v <<= 4;
            if (c >= '0' && c <= '9')      v |= static_cast<std::uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<std::uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') v |= static_cast<std::uint32_t>(c - 'A' + 10);
            else return error("invalid \\u escape");
        }
        return v;
    }

    Result<std::string> string() {
        ++pos_;  // opening quote
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                return error("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ == text_.size()) break;
            const char e = text_[pos_++];
            switch (e) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    auto cp = hex4();
                    if (!cp) return std::move(cp).error();
                    std::uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (text_.substr(pos_, 2) != "\\u") return error("unpaired surrogate");
                        pos_ += 2;
                        auto low = hex4();
                        if (!low) return std::move(low).error();
                        if (*low < 0xDC00 || *low > 0xDFFF) return error("unpaired surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return error("unpaired surrogate");
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    --pos_;
                    return error("invalid escape");
            }
        }
        return error("unterminated string");
    }

    std::string_view text_;
    std::size_t      pos_ = 0;
};

// ─── Renderer ─────────────────────────────────────────────────────────────────

void render_string(std::string& out, const std::string& s) {
    out += '"';
    for (const char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

/// Arrays of scalars stay on one line in pretty mode.
bool is_flat(const JsonValue& v) noexcept {
    for (const auto& item : v.items) {
        if (item.kind == JsonValue::Kind::Object) return false;
        if (item.kind == JsonValue::Kind::Array && !is_flat(item)) return false;
    }
    return true;
}

void render(std::string& out, const JsonValue& v, bool pretty, int indent) {
    const auto newline = [&](int level) {
        if (!pretty) return;
        out += '\n';
        out.append(static_cast<std::size_t>(level) * 2, ' ');
    };
    switch (v.kind) {
        case JsonValue::Kind::Null:   out += "null"; break;
        case JsonValue::Kind::Bool:   out += v.boolean ? "true" : "false"; break;
        case JsonValue::Kind::Number: out += v.text; break;
        case JsonValue::Kind::String: render_string(out, v.text); break;
        case JsonValue::Kind::Array: {
            const bool multiline = pretty && !is_flat(v);
            out += '[';
            for (std::size_t i = 0; i < v.items.size(); ++i) {
                if (i > 0) out += pretty && !multiline ? ", " : ",";
                if (multiline) newline(indent + 1);
                render(out, v.items[i], pretty, indent + 1);
            }
            if (multiline && !v.items.empty()) newline(indent);
            out += ']';
            break;
        }
        case JsonValue::Kind::Object: {
            out += '{';
            for (std::size_t i = 0; i < v.members.size(); ++i) {
                if (i > 0) out += ',';
                newline(indent + 1);
                render_string(out, v.members[i].first);
                out += pretty ? ": " : ":";
                render(out, v.members[i].second, pretty, indent + 1);
            }
            if (!v.members.empty()) newline(indent);
            out += '}';
            break;
        }
    }
}

}  // namespace

Result<JsonValue> parse_json(std::string_view text) {
    return JsonReader(text).document();
}

std::string render_json(const JsonValue& value, bool pretty) {
    std::string out;
    render(out, value, pretty, 0);
    return out;
}

}  // namespace tempus::codec::detail
