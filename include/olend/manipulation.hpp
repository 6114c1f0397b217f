#pragma once

/// @file include/olend/manipulation.hpp
/// @brief ManipulationDetector: adversarial pattern checks on price history.
///
/// # Module: Manipulation Detector
///
/// ## Responsibility
/// Score an incoming PricePoint against the asset's history. Four
/// independent checks each propose a severity; the assessment takes the
/// maximum.
///
/// | Check               | Signature                                              | Level     |
/// |---------------------|--------------------------------------------------------|-----------|
/// | Spike               | \|new − prev\| / prev above the feed deviation limit   | 1 / 2 / 3 |
/// | Cumulative drift    | Σ signed step returns over the last N steps too large  | 2         |
/// | Confidence mismatch | monotone move while the confidence ratio keeps shrinking | 1 / 2   |
/// | Oscillation         | rise then reversal past the pre-rise level in a window | 2         |
///
/// Spike levels: above half the threshold → 1, above the threshold → 2,
/// above twice the threshold → 3.
///
/// `is_manipulation` holds iff the level is 2 or more.
///
/// ## Guarantees
/// - Stateless: the history is owned by the caller and never modified
/// - The spike check uses exact integer basis-point arithmetic; the series
///   checks run on Eigen arrays of returns

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/price.hpp"
#include "olend/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace olend::manipulation {

// ─── DetectorConfig ───────────────────────────────────────────────────────────

/// Thresholds of the series checks. The spike threshold is per feed
/// (PriceFeedConfig::max_deviation_bps) and is passed to assess().
struct DetectorConfig {
    std::size_t drift_window             = constants::DEFAULT_DRIFT_WINDOW;
    BasisPoints drift_threshold_bps      = constants::DEFAULT_DRIFT_THRESHOLD_BPS;
    std::size_t mismatch_window          = constants::DEFAULT_MISMATCH_WINDOW;
    BasisPoints mismatch_move_bps        = constants::DEFAULT_MISMATCH_MOVE_BPS;
    Timestamp   oscillation_window_ms    = constants::DEFAULT_OSCILLATION_WINDOW_MS;
    BasisPoints oscillation_min_rise_bps = constants::DEFAULT_OSCILLATION_MIN_RISE_BPS;

    /// Windows in [1, PRICE_HISTORY_CAPACITY], thresholds in (0, 10 000].
    [[nodiscard]] Status validate() const;
};

// ─── Assessment ───────────────────────────────────────────────────────────────

/// Bit flags naming the checks that raised the level above None.
enum ManipulationCheck : std::uint8_t {
    CHECK_SPIKE               = 1 << 0,
    CHECK_CUMULATIVE_DRIFT    = 1 << 1,
    CHECK_CONFIDENCE_MISMATCH = 1 << 2,
    CHECK_OSCILLATION         = 1 << 3,
};

struct ManipulationAssessment {
    bool             is_manipulation = false;
    ManipulationRisk risk_level      = ManipulationRisk::None;
    std::uint8_t     triggered       = 0;   ///< OR of ManipulationCheck flags
    BasisPoints      step_change_bps = 0;   ///< |new − prev| / prev

    /// Comma-separated names of the triggered checks, e.g. "spike,drift".
    [[nodiscard]] std::string describe() const;
};

// ─── ManipulationDetector ─────────────────────────────────────────────────────

class ManipulationDetector {
public:
    explicit ManipulationDetector(DetectorConfig config = DetectorConfig{}) noexcept;

    /// Assess `incoming` against `history` (which must not yet contain it).
    ///
    /// # Arguments
    /// * `history`             - prior points for the asset, oldest first
    /// * `incoming`            - the freshly validated point
    /// * `spike_threshold_bps` - the feed's maximum single-step deviation
    ///
    /// # Returns
    /// The assessment, or ArithmeticOverflow if the spike ratio cannot be
    /// represented.
    [[nodiscard]] Result<ManipulationAssessment>
    assess(const PriceHistory& history,
           const PricePoint& incoming,
           BasisPoints spike_threshold_bps) const;

    [[nodiscard]] const DetectorConfig& config() const noexcept { return config_; }

    Status set_config(const DetectorConfig& config);

private:
    [[nodiscard]] Result<ManipulationRisk>
    spike_level(const PricePoint& prev, const PricePoint& incoming,
                BasisPoints threshold_bps, BasisPoints& change_bps) const;

    [[nodiscard]] ManipulationRisk
    drift_level(const PriceHistory& history, const PricePoint& incoming) const;

    [[nodiscard]] ManipulationRisk
    mismatch_level(const PriceHistory& history, const PricePoint& incoming,
                   BasisPoints spike_threshold_bps) const;

    [[nodiscard]] ManipulationRisk
    oscillation_level(const PriceHistory& history, const PricePoint& incoming) const;

    DetectorConfig config_;
};

} // namespace olend::manipulation
