#pragma once

/// @file include/olend/safe_math.hpp
/// @brief Arithmetic Safety Layer: checked unsigned integer operations.
///
/// # Module: Safe Math
///
/// ## Responsibility
/// Every monetary computation in the core (prices, values, LTV ratios,
/// penalty shares) goes through these functions. Each returns the exact
/// result or an error; none clamps or saturates.
///
/// ## Contract
/// - `safe_sub(a, b)` fails with ArithmeticUnderflow if a < b
/// - `safe_mul_div(a, b, c)` = ⌊a·b/c⌋ computed through a 128-bit product;
///   DivisionByZero if c = 0, ArithmeticOverflow if the quotient does not
///   fit in 64 bits
/// - `safe_mul_div_wide(a, b, c)` is the same on 128-bit operands and fails
///   with ArithmeticOverflow as soon as a·b leaves the 128-bit range, before
///   any division
/// - `safe_percentage(amount, rate_bps)` = ⌊amount·rate/10 000⌋
///
/// ## Guarantees
/// - Pure functions, noexcept, thread-safe
/// - Truncating division (floor for unsigned operands)

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/types.hpp"

#include <cstdint>

namespace olend::math {

[[nodiscard]] Result<std::uint64_t> safe_add(std::uint64_t a, std::uint64_t b) noexcept;

[[nodiscard]] Result<std::uint64_t> safe_sub(std::uint64_t a, std::uint64_t b) noexcept;

[[nodiscard]] Result<std::uint64_t> safe_mul(std::uint64_t a, std::uint64_t b) noexcept;

/// ⌊a·b/c⌋ with a widened intermediate.
[[nodiscard]] Result<std::uint64_t>
safe_mul_div(std::uint64_t a, std::uint64_t b, std::uint64_t c) noexcept;

/// ⌊a·b/c⌋ on 128-bit operands; the product itself is overflow-checked.
[[nodiscard]] Result<Wide> safe_mul_div_wide(Wide a, Wide b, Wide c) noexcept;

/// ⌊amount·rate_bps/denominator⌋. The denominator defaults to 10 000 bps.
[[nodiscard]] Result<std::uint64_t>
safe_percentage(std::uint64_t amount,
                BasisPoints rate_bps,
                BasisPoints denominator = constants::BPS_DENOMINATOR) noexcept;

/// 10^exponent, failing with ArithmeticOverflow above 10^19.
[[nodiscard]] Result<std::uint64_t> safe_pow10(unsigned exponent) noexcept;

/// |a − b| (never fails).
[[nodiscard]] constexpr std::uint64_t abs_diff(std::uint64_t a, std::uint64_t b) noexcept {
    return a > b ? a - b : b - a;
}

} // namespace olend::math
