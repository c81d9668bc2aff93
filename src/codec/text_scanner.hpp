#pragma once

/// @file src/codec/text_scanner.hpp
/// @brief Cursor over WKT input with whitespace skipping and typed reads.
///
/// Every read skips leading whitespace first. Failed reads leave the cursor
/// at the offending byte so `error()` reports a useful offset.

#include "tempus/error.hpp"
#include "tempus/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tempus::codec::detail {

class TextScanner {
public:
    TextScanner(std::string_view text, Format format) noexcept
        : text_(text), format_(format) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    void skip_ws() noexcept;

    /// True when only whitespace remains.
    [[nodiscard]] bool at_end() noexcept;

    /// Next non-blank byte, '\0' at the end of input.
    [[nodiscard]] char peek() noexcept;

    /// Consume `c` if it is the next non-blank byte.
    bool consume(char c) noexcept;

    /// Consume a case-insensitive keyword if it comes next.
    bool consume_keyword(std::string_view keyword) noexcept;

    /// Require `c` next; a parse error naming `what` otherwise.
    [[nodiscard]] Result<char> expect(char c, std::string_view what);

    [[nodiscard]] Result<double>       read_double();
    [[nodiscard]] Result<std::int64_t> read_int();
    [[nodiscard]] Result<std::string>  read_quoted();
    [[nodiscard]] Result<Timestamp>    read_timestamp();
    [[nodiscard]] Result<Date>         read_date();

    /// Parse error at the current position.
    [[nodiscard]] Error error(std::string reason) const;

private:
    std::string_view text_;
    Format           format_;
    std::size_t      pos_ = 0;
};

}  // namespace tempus::codec::detail
