/// @file src/time/timestamp.cpp
/// @brief Timestamp and date scanning/rendering.

#include "tempus/time.hpp"

#include <fmt/format.h>

#include <cctype>
#include <chrono>

namespace tempus {

using namespace std::chrono;

namespace {

bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Read exactly `n` digits at `pos`. Advances `pos` on success.
std::optional<int> read_fixed(std::string_view text, std::size_t& pos, std::size_t n) noexcept {
    if (pos + n > text.size()) return std::nullopt;
    int v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const char c = text[pos + i];
        if (!is_digit(c)) return std::nullopt;
        v = v * 10 + (c - '0');
    }
    pos += n;
    return v;
}

bool skip_char(std::string_view text, std::size_t& pos, char c) noexcept {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

/// `YYYY-MM-DD`
std::optional<year_month_day> scan_ymd(std::string_view text, std::size_t& pos) noexcept {
    const auto y = read_fixed(text, pos, 4);
    if (!y || !skip_char(text, pos, '-')) return std::nullopt;
    const auto m = read_fixed(text, pos, 2);
    if (!m || !skip_char(text, pos, '-')) return std::nullopt;
    const auto d = read_fixed(text, pos, 2);
    if (!d) return std::nullopt;
    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*m)},
                             day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

}  // namespace

// ─── make_timestamp ───────────────────────────────────────────────────────────

std::optional<Timestamp>
make_timestamp(int y, unsigned m, unsigned d,
               unsigned hh, unsigned mm, unsigned ss,
               std::int64_t us) noexcept {
    const year_month_day ymd{year{y}, month{m}, day{d}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 59 ||
        us < 0 || us >= constants::USECS_PER_SEC) {
        return std::nullopt;
    }
    return Timestamp{sys_days{ymd}} + hours{hh} + minutes{mm} + seconds{ss} +
           microseconds{us};
}

// ─── scan_timestamp ───────────────────────────────────────────────────────────

std::optional<Timestamp>
scan_timestamp(std::string_view text, std::size_t& consumed) noexcept {
    std::size_t pos = 0;
    const auto ymd = scan_ymd(text, pos);
    if (!ymd) {
        consumed = pos;
        return std::nullopt;
    }
    Timestamp t{sys_days{*ymd}};

    // Time of day: only when the separator is followed by "HH:".
    if (pos + 3 < text.size() && (text[pos] == ' ' || text[pos] == 'T') &&
        is_digit(text[pos + 1]) && is_digit(text[pos + 2]) && text[pos + 3] == ':') {
        ++pos;
        const auto hh = read_fixed(text, pos, 2);
        skip_char(text, pos, ':');
        const auto mi = read_fixed(text, pos, 2);
        if (!hh || !mi || *hh > 23 || *mi > 59) {
            consumed = pos;
            return std::nullopt;
        }
        int ss = 0;
        std::int64_t us = 0;
        if (skip_char(text, pos, ':')) {
            const auto s = read_fixed(text, pos, 2);
            if (!s || *s > 59) {
                consumed = pos;
                return std::nullopt;
            }
            ss = *s;
            if (skip_char(text, pos, '.')) {
                int digits = 0;
                while (pos < text.size() && is_digit(text[pos]) && digits < 6) {
                    us = us * 10 + (text[pos] - '0');
                    ++pos;
                    ++digits;
                }
                if (digits == 0 || (pos < text.size() && is_digit(text[pos]))) {
                    consumed = pos;
                    return std::nullopt;
                }
                for (; digits < 6; ++digits) us *= 10;
            }
        }
        t += hours{*hh} + minutes{*mi} + seconds{ss} + microseconds{us};
    }

    // UTC offset.
    if (skip_char(text, pos, 'Z')) {
        consumed = pos;
        return t;
    }
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const bool negative = text[pos] == '-';
        ++pos;
        const auto oh = read_fixed(text, pos, 2);
        if (!oh || *oh > 15) {
            consumed = pos;
            return std::nullopt;
        }
        int om = 0;
        const std::size_t before_minutes = pos;
        skip_char(text, pos, ':');
        if (const auto m = read_fixed(text, pos, 2)) {
            om = *m;
        } else {
            pos = before_minutes;
        }
        if (om > 59) {
            consumed = pos;
            return std::nullopt;
        }
        const minutes offset = hours{*oh} + minutes{om};
        t -= negative ? -offset : offset;
        // An offset can move the first or last day across a year boundary.
        if (!in_text_range(t)) {
            consumed = pos;
            return std::nullopt;
        }
    }
    consumed = pos;
    return t;
}

Result<Timestamp> parse_timestamp(std::string_view text) {
    const std::string_view body = trim(text);
    std::size_t consumed = 0;
    const auto t = scan_timestamp(body, consumed);
    if (!t || consumed != body.size()) {
        return Error::make(ErrorKind::InvalidArgument,
                           fmt::format("invalid timestamp '{}'", body));
    }
    return *t;
}

// ─── Text range ───────────────────────────────────────────────────────────────

bool in_text_range(Date d) noexcept {
    constexpr Date first = sys_days{year{constants::MIN_YEAR} / January / 1};
    constexpr Date past  = sys_days{year{constants::MAX_YEAR + 1} / January / 1};
    return first <= d && d < past;
}

bool in_text_range(Timestamp t) noexcept {
    return in_text_range(floor<days>(t));
}

// ─── format_timestamp ─────────────────────────────────────────────────────────

std::string format_timestamp(Timestamp t, char separator) {
    const auto day_point = floor<days>(t);
    const year_month_day ymd{day_point};
    const hh_mm_ss<microseconds> hms{t - day_point};

    std::string out = fmt::format("{:04}-{:02}-{:02}{}{:02}:{:02}:{:02}",
                                  static_cast<int>(ymd.year()),
                                  static_cast<unsigned>(ymd.month()),
                                  static_cast<unsigned>(ymd.day()),
                                  separator,
                                  hms.hours().count(),
                                  hms.minutes().count(),
                                  hms.seconds().count());
    const auto us = hms.subseconds().count();
    if (us != 0) {
        std::string frac = fmt::format("{:06}", us);
        while (frac.back() == '0') frac.pop_back();
        out += '.';
        out += frac;
    }
    out += "+00";
    return out;
}

// ─── Dates ────────────────────────────────────────────────────────────────────

std::optional<Date> scan_date(std::string_view text, std::size_t& consumed) noexcept {
    std::size_t pos = 0;
    const auto ymd = scan_ymd(text, pos);
    consumed = pos;
    if (!ymd) return std::nullopt;
    return sys_days{*ymd};
}

Result<Date> parse_date(std::string_view text) {
    const std::string_view body = trim(text);
    std::size_t consumed = 0;
    const auto d = scan_date(body, consumed);
    if (!d || consumed != body.size()) {
        return Error::make(ErrorKind::InvalidArgument,
                           fmt::format("invalid date '{}'", body));
    }
    return *d;
}

std::string format_date(Date d) {
    const year_month_day ymd{d};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

}  // namespace tempus
