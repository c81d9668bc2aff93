/// @file src/core/error.cpp
/// @brief Names and rendering of error kinds.

#include "tempus/error.hpp"

#include <fmt/format.h>

namespace tempus {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Parse:                     return "ParseError";
        case ErrorKind::InvalidSpan:               return "InvalidSpan";
        case ErrorKind::UnorderedInstants:         return "UnorderedInstants";
        case ErrorKind::DuplicateTimestamp:        return "DuplicateTimestamp";
        case ErrorKind::IncompatibleInterpolation: return "IncompatibleInterpolation";
        case ErrorKind::NoValueAtTimestamp:        return "NoValueAtTimestamp";
        case ErrorKind::UndefinedForDiscrete:      return "UndefinedForDiscrete";
        case ErrorKind::TypeMismatch:              return "TypeMismatch";
        case ErrorKind::InvalidArgument:           return "InvalidArgument";
    }
    return "Unknown";
}

const char* to_string(Format format) noexcept {
    switch (format) {
        case Format::Wkt:    return "WKT";
        case Format::Wkb:    return "WKB";
        case Format::MfJson: return "MF-JSON";
    }
    return "Unknown";
}

std::string to_string(const Error& error) {
    if (error.parse) {
        return fmt::format("{}: {} [{} @ {}]", to_string(error.kind), error.message,
                           to_string(error.parse->format), error.parse->position);
    }
    return fmt::format("{}: {}", to_string(error.kind), error.message);
}

}  // namespace tempus
