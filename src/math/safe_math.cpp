/// @file src/math/safe_math.cpp
/// @brief Arithmetic Safety Layer.

#include "olend/safe_math.hpp"

#include <limits>

namespace olend::math {

namespace {

constexpr Wide U64_MAX = std::numeric_limits<std::uint64_t>::max();

} // anonymous namespace

// ─── add / sub / mul ──────────────────────────────────────────────────────────

Result<std::uint64_t> safe_add(std::uint64_t a, std::uint64_t b) noexcept {
    std::uint64_t out = 0;
    if (__builtin_add_overflow(a, b, &out)) {
        return ErrorCode::ArithmeticOverflow;
    }
    return out;
}

Result<std::uint64_t> safe_sub(std::uint64_t a, std::uint64_t b) noexcept {
    if (a < b) {
        return ErrorCode::ArithmeticUnderflow;
    }
    return a - b;
}

Result<std::uint64_t> safe_mul(std::uint64_t a, std::uint64_t b) noexcept {
    std::uint64_t out = 0;
    if (__builtin_mul_overflow(a, b, &out)) {
        return ErrorCode::ArithmeticOverflow;
    }
    return out;
}

// ─── mul_div ──────────────────────────────────────────────────────────────────

Result<std::uint64_t>
safe_mul_div(std::uint64_t a, std::uint64_t b, std::uint64_t c) noexcept {
    if (c == 0) {
        return ErrorCode::DivisionByZero;
    }
    // A 64x64 product always fits in 128 bits; only the quotient can overflow.
    const Wide quotient = (static_cast<Wide>(a) * static_cast<Wide>(b)) / c;
    if (quotient > U64_MAX) {
        return ErrorCode::ArithmeticOverflow;
    }
    return static_cast<std::uint64_t>(quotient);
}

Result<Wide> safe_mul_div_wide(Wide a, Wide b, Wide c) noexcept {
    if (c == 0) {
        return ErrorCode::DivisionByZero;
    }
    Wide product = 0;
    if (__builtin_mul_overflow(a, b, &product)) {
        return ErrorCode::ArithmeticOverflow;
    }
    return product / c;
}

// ─── percentage ───────────────────────────────────────────────────────────────

Result<std::uint64_t> safe_percentage(std::uint64_t amount,
                                      BasisPoints rate_bps,
                                      BasisPoints denominator) noexcept {
    return safe_mul_div(amount, rate_bps, denominator);
}

// ─── pow10 ────────────────────────────────────────────────────────────────────

Result<std::uint64_t> safe_pow10(unsigned exponent) noexcept {
    std::uint64_t out = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        auto next = safe_mul(out, 10);
        if (!next) {
            return next.error();
        }
        out = *next;
    }
    return out;
}

} // namespace olend::math
