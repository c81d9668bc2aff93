/// @file src/codec/text_scanner.cpp
/// @brief TextScanner: tokenising reads for the WKT reader.

#include "text_scanner.hpp"

#include "tempus/time.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>

namespace tempus::codec::detail {

void TextScanner::skip_ws() noexcept {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
        ++pos_;
    }
}

bool TextScanner::at_end() noexcept {
    skip_ws();
    return pos_ == text_.size();
}

char TextScanner::peek() noexcept {
    skip_ws();
    return pos_ < text_.size() ? text_[pos_] : '\0';
}

bool TextScanner::consume(char c) noexcept {
    if (peek() != c || c == '\0') return false;
    ++pos_;
    return true;
}

bool TextScanner::consume_keyword(std::string_view keyword) noexcept {
    skip_ws();
    if (text_.size() - pos_ < keyword.size()) return false;
    for (std::size_t i = 0; i < keyword.size(); ++i) {
        const auto a = std::tolower(static_cast<unsigned char>(text_[pos_ + i]));
        const auto b = std::tolower(static_cast<unsigned char>(keyword[i]));
        if (a != b) return false;
    }
    pos_ += keyword.size();
    return true;
}

Result<char> TextScanner::expect(char c, std::string_view what) {
    if (!consume(c)) {
        return error(fmt::format("expected '{}' {}", c, what));
    }
    return c;
}

Result<double> TextScanner::read_double() {
    skip_ws();
    double v = 0.0;
    const char* first = text_.data() + pos_;
    const char* last  = text_.data() + text_.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{}) {
        return error("expected a number");
    }
    // from_chars also accepts "nan" and "inf".
    if (!std::isfinite(v)) {
        return error("expected a finite number");
    }
    pos_ += static_cast<std::size_t>(ptr - first);
    return v;
}

Result<std::int64_t> TextScanner::read_int() {
    skip_ws();
    std::int64_t v = 0;
    const char* first = text_.data() + pos_;
    const char* last  = text_.data() + text_.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{}) {
        return error("expected an integer");
    }
    // "1.5" is not an integer.
    if (ptr != last && (*ptr == '.' || *ptr == 'e' || *ptr == 'E')) {
        pos_ += static_cast<std::size_t>(ptr - first);
        return error("expected an integer");
    }
    pos_ += static_cast<std::size_t>(ptr - first);
    return v;
}

Result<std::string> TextScanner::read_quoted() {
    if (!consume('"')) {
        return error("expected '\"' opening a text value");
    }
    std::string out;
    while (pos_ < text_.size()) {
        const char c = text_[pos_++];
        if (c == '"') return out;
        if (c == '\\') {
            if (pos_ == text_.size()) break;
            const char e = text_[pos_];
            if (e != '"' && e != '\\') {
                return error("invalid escape in text value");
            }
            out += e;
            ++pos_;
            continue;
        }
        out += c;
    }
    return error("unterminated text value");
}

Result<Timestamp> TextScanner::read_timestamp() {
    skip_ws();
    std::size_t consumed = 0;
    const auto t = scan_timestamp(text_.substr(pos_), consumed);
    if (!t) {
        pos_ += consumed;
        return error("invalid timestamp");
    }
    pos_ += consumed;
    return *t;
}

Result<Date> TextScanner::read_date() {
    skip_ws();
    std::size_t consumed = 0;
    const auto d = scan_date(text_.substr(pos_), consumed);
    if (!d) {
        pos_ += consumed;
        return error("invalid date");
    }
    pos_ += consumed;
    return *d;
}

Error TextScanner::error(std::string reason) const {
    return Error::parse_error(format_, pos_, std::move(reason));
}

}  // namespace tempus::codec::detail
