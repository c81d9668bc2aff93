#pragma once

/// @file include/tempus/tinstant.hpp
/// @brief TInstant: a single (value, timestamp) sample.

#include "tempus/span.hpp"
#include "tempus/types.hpp"

#include <utility>

namespace tempus {

class TInstant {
public:
    TInstant(Value value, Timestamp t) : value_(std::move(value)), t_(t) {}

    [[nodiscard]] static TInstant make(Value value, Timestamp t) {
        return TInstant(std::move(value), t);
    }

    [[nodiscard]] const Value& value() const noexcept { return value_; }
    [[nodiscard]] Timestamp    timestamp() const noexcept { return t_; }
    [[nodiscard]] ValueType    value_type() const noexcept { return tempus::value_type(value_); }

    /// `[t, t]`
    [[nodiscard]] TsTzSpan bounding_box() const { return TsTzSpan::singleton(t_); }

    [[nodiscard]] TInstant shift_time(Duration delta) const { return TInstant(value_, t_ + delta); }

    friend bool operator==(const TInstant& a, const TInstant& b) noexcept {
        return a.t_ == b.t_ && a.value_ == b.value_;
    }

    friend bool operator!=(const TInstant& a, const TInstant& b) noexcept { return !(a == b); }

    /// By value first, then timestamp.
    friend bool operator<(const TInstant& a, const TInstant& b) noexcept {
        if (value_less(a.value_, b.value_)) return true;
        if (value_less(b.value_, a.value_)) return false;
        return a.t_ < b.t_;
    }

private:
    Value     value_;
    Timestamp t_;
};

}  // namespace tempus
