#pragma once

/// @file include/olend/price.hpp
/// @brief Price value types and the bounded per-asset price history.
///
/// # Module: Price Types
///
/// ## PriceHistory
/// A fixed-capacity, append-only sequence of PricePoint. Appending at
/// capacity evicts the oldest point. Timestamps are nondecreasing: an
/// append older than the newest point is refused.
///
/// ## Guarantees
/// - size() ≤ capacity() at all times
/// - points are stored oldest → newest

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace olend {

// ─── PricePoint ───────────────────────────────────────────────────────────────

/// One normalized observation: price and confidence half-width, both with
/// PRICE_DECIMALS decimals.
struct PricePoint {
    Price     price;
    Price     confidence;
    Timestamp timestamp;

    friend bool operator==(const PricePoint&, const PricePoint&) = default;
};

// ─── ManipulationRisk ─────────────────────────────────────────────────────────

/// Severity 0–3 of a suspected adversarial price update.
enum class ManipulationRisk : std::uint8_t {
    None     = 0,
    Low      = 1,
    High     = 2,
    Critical = 3,
};

[[nodiscard]] const char* to_string(ManipulationRisk risk) noexcept;

// ─── ValidatedPriceInfo ───────────────────────────────────────────────────────

/// Result of validating one quote. Recomputed on every request; the latest
/// one per asset lives in the validator's cache slot.
struct ValidatedPriceInfo {
    Price            price;
    Price            confidence;
    Timestamp        timestamp;
    std::uint8_t     validation_score;   ///< 0–100
    ManipulationRisk manipulation_risk;
    bool             is_valid;           ///< false when manipulation is flagged

    /// price − confidence, floored at zero. Used to value collateral.
    [[nodiscard]] Price lower_bound() const noexcept {
        return confidence >= price ? 0 : price - confidence;
    }

    /// price + confidence. Used to value debt.
    [[nodiscard]] Result<Price> upper_bound() const noexcept;
};

// ─── PriceHistory ─────────────────────────────────────────────────────────────

class PriceHistory {
public:
    explicit PriceHistory(std::size_t capacity = constants::PRICE_HISTORY_CAPACITY) noexcept;

    /// Append a point, evicting the oldest at capacity.
    /// Fails with StalePrice if `point` is older than the newest point.
    Status push(const PricePoint& point);

    [[nodiscard]] std::optional<PricePoint> latest() const noexcept;

    /// All stored points, oldest first.
    [[nodiscard]] const std::deque<PricePoint>& points() const noexcept { return points_; }

    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return points_.empty(); }

    void clear() noexcept { points_.clear(); }

private:
    std::size_t            capacity_;
    std::deque<PricePoint> points_;
};

} // namespace olend
