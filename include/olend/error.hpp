#pragma once

/// @file include/olend/error.hpp
/// @brief Error taxonomy and the `Result<T>` return type.
///
/// # Module: Errors
///
/// ## Responsibility
/// Every fallible operation in the core returns `Result<T>`: either a value
/// or exactly one `ErrorCode` naming the offending reason. Nothing throws.
///
/// ## Propagation
/// Arithmetic and validation failures abort the enclosing operation: the
/// caller returns `r.error()` before committing any staged state.
/// `ErrorCode::CircuitOpen` is an ordinary decision the caller may route to
/// a fallback.

#include <cstdint>
#include <optional>
#include <utility>

namespace olend {

enum class ErrorCode : std::uint8_t {
    Ok = 0,
    StalePrice,
    LowConfidence,
    ManipulationDetected,
    CircuitOpen,
    ArithmeticOverflow,
    ArithmeticUnderflow,
    DivisionByZero,
    InvalidConfig,
    Unauthorized,
    UnknownAsset,
    InvalidPrice,
    LtvExceeded,
};

/// Stable identifier for logs and events, e.g. "StalePrice".
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

/// Value-or-error. Construct from a `T` on success or from an `ErrorCode`
/// on failure.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(const T& value) : value_(value), error_(ErrorCode::Ok) {}
    Result(T&& value) : value_(std::move(value)), error_(ErrorCode::Ok) {}
    Result(ErrorCode error) : value_(std::nullopt), error_(error) {}

    [[nodiscard]] bool has_value() const noexcept { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    T& value() & { return value_.value(); }
    const T& value() const& { return value_.value(); }
    T&& value() && { return std::move(value_).value(); }

    T& operator*() & { return *value_; }
    const T& operator*() const& { return *value_; }
    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }

    [[nodiscard]] ErrorCode error() const noexcept { return error_; }

private:
    std::optional<T> value_;
    ErrorCode error_;
};

/// Empty success payload for operations with nothing to return.
struct Unit {};

using Status = Result<Unit>;

[[nodiscard]] inline Status ok() { return Unit{}; }

} // namespace olend
