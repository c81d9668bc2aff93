#pragma once

/// @file include/tempus/error.hpp
/// @brief Error kinds and the `Result<T>` return type used by fallible
///        tempus operations.
///
/// # Module: Errors
///
/// ## Responsibility
/// Operations that may legitimately produce nothing (the intersection of two
/// disjoint spans) return `std::optional` or an empty container. Operations
/// that fail for a reason (malformed text, unordered instants) return a
/// `Result<T>` carrying either the value or an `Error`.
///
/// ## Guarantees
/// - No tempus function aborts or lets an exception escape a codec path
/// - Construction failures never expose a partially built value

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tempus {

// ─── ErrorKind ────────────────────────────────────────────────────────────────

/// Category of a failure.
enum class ErrorKind {
    Parse,                      ///< Malformed text or binary input
    InvalidSpan,                ///< lower > upper, or empty bounds
    UnorderedInstants,          ///< Instants or sequences out of time order
    DuplicateTimestamp,         ///< Two instants share a timestamp
    IncompatibleInterpolation,  ///< Interpolation not valid for the value domain
    NoValueAtTimestamp,         ///< Query outside the domain or in a discrete gap
    UndefinedForDiscrete,       ///< Operation has no meaning for discrete values
    TypeMismatch,               ///< Wrong or mixed value domain
    InvalidArgument,            ///< Any other rejected argument
};

/// Input format a parse error refers to.
enum class Format {
    Wkt,
    Wkb,
    MfJson,
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;
[[nodiscard]] const char* to_string(Format format) noexcept;

// ─── ParseError ───────────────────────────────────────────────────────────────

/// Location of a codec failure.
struct ParseError {
    Format      format;    ///< Codec that rejected the input
    std::size_t position;  ///< Byte offset of the offending token
    std::string reason;    ///< What was expected or found
};

// ─── Error ────────────────────────────────────────────────────────────────────

struct Error {
    ErrorKind                 kind;
    std::string               message;
    std::optional<ParseError> parse;  ///< Set only when kind == Parse

    [[nodiscard]] static Error make(ErrorKind kind, std::string message) {
        return Error{kind, std::move(message), std::nullopt};
    }

    [[nodiscard]] static Error parse_error(Format format,
                                           std::size_t position,
                                           std::string reason) {
        std::string message = reason;
        return Error{ErrorKind::Parse, std::move(message),
                     ParseError{format, position, std::move(reason)}};
    }
};

/// Render `kind: message` plus the parse location when present.
[[nodiscard]] std::string to_string(const Error& error);

// ─── Result ───────────────────────────────────────────────────────────────────

/// Either a value of type T or the Error explaining why there is none.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    /// Anything T is built from (a double or a Point for `Result<Value>`).
    template <typename U,
              typename = std::enable_if_t<
                  std::is_constructible_v<T, U&&> &&
                  !std::is_same_v<std::decay_t<U>, T> &&
                  !std::is_same_v<std::decay_t<U>, Error> &&
                  !std::is_same_v<std::decay_t<U>, Result>>>
    Result(U&& value) : data_(std::in_place_index<0>, T(std::forward<U>(value))) {}

    [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    /// Precondition: has_value().
    [[nodiscard]] T&       value() &       { return std::get<0>(data_); }
    [[nodiscard]] const T& value() const&  { return std::get<0>(data_); }
    [[nodiscard]] T&&      value() &&      { return std::get<0>(std::move(data_)); }

    [[nodiscard]] T&       operator*() &       { return value(); }
    [[nodiscard]] const T& operator*() const&  { return value(); }
    [[nodiscard]] T&&      operator*() &&      { return std::move(*this).value(); }

    [[nodiscard]] T*       operator->()       { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Precondition: !has_value().
    [[nodiscard]] const Error& error() const& { return std::get<1>(data_); }
    [[nodiscard]] Error&&      error() &&     { return std::get<1>(std::move(data_)); }

    /// Error kind, or nullopt when a value is held.
    [[nodiscard]] std::optional<ErrorKind> error_kind() const noexcept {
        if (has_value()) return std::nullopt;
        return std::get<1>(data_).kind;
    }

private:
    std::variant<T, Error> data_;
};

}  // namespace tempus
