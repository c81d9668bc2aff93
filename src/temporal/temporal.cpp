/// @file src/temporal/temporal.cpp
/// @brief Dispatch helpers over the Temporal variant.

#include "tempus/temporal.hpp"

namespace tempus {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

const char* to_string(TemporalSubtype subtype) noexcept {
    switch (subtype) {
        case TemporalSubtype::Instant:     return "Instant";
        case TemporalSubtype::Sequence:    return "Sequence";
        case TemporalSubtype::SequenceSet: return "SequenceSet";
    }
    return "Unknown";
}

TemporalSubtype subtype_of(const Temporal& temporal) noexcept {
    return std::visit(overloaded{
        [](const TInstant&)     { return TemporalSubtype::Instant; },
        [](const TSequence&)    { return TemporalSubtype::Sequence; },
        [](const TSequenceSet&) { return TemporalSubtype::SequenceSet; },
    }, temporal);
}

Interpolation interpolation_of(const Temporal& temporal) noexcept {
    return std::visit(overloaded{
        [](const TInstant&)       { return Interpolation::None; },
        [](const TSequence& s)    { return s.interpolation(); },
        [](const TSequenceSet& s) { return s.interpolation(); },
    }, temporal);
}

ValueType value_type_of(const Temporal& temporal) noexcept {
    return std::visit([](const auto& t) { return t.value_type(); }, temporal);
}

std::optional<TsTzSpan> bounding_box_of(const Temporal& temporal) {
    return std::visit(overloaded{
        [](const TInstant& i) -> std::optional<TsTzSpan> { return i.bounding_box(); },
        [](const TSequence& s) -> std::optional<TsTzSpan> { return s.bounding_box(); },
        [](const TSequenceSet& s) { return s.bounding_box(); },
    }, temporal);
}

Result<Value> value_at(const Temporal& temporal, Timestamp t) {
    return std::visit(overloaded{
        [&](const TInstant& i) -> Result<Value> {
            if (i.timestamp() == t) return i.value();
            return Error::make(ErrorKind::NoValueAtTimestamp,
                               "timestamp differs from the instant");
        },
        [&](const TSequence& s) { return s.value_at(t); },
        [&](const TSequenceSet& s) { return s.value_at(t); },
    }, temporal);
}

}  // namespace tempus
