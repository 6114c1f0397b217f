#pragma once

#include "olend/types.hpp"

#include <cstddef>
#include <cstdint>

/// @file include/olend/constants.hpp
/// @brief Fixed-point scales and documented configuration defaults.

namespace olend::constants {

// ─── Fixed-Point Scales ───────────────────────────────────────────────────────

/// 10 000 bps = 100%.
static constexpr BasisPoints BPS_DENOMINATOR = 10'000;

/// Decimals carried by every normalized price and value.
static constexpr int PRICE_DECIMALS = 8;

/// 10^PRICE_DECIMALS.
static constexpr Price PRICE_SCALE = 100'000'000;

// ─── Price Validation ─────────────────────────────────────────────────────────

/// Capacity of the per-asset price history ring.
static constexpr std::size_t PRICE_HISTORY_CAPACITY = 100;

/// Default heartbeat: a quote older than this is stale.
static constexpr Timestamp DEFAULT_HEARTBEAT_MS = 60'000;

/// Default single-step deviation threshold (10%).
static constexpr BasisPoints DEFAULT_MAX_DEVIATION_BPS = 1'000;

/// Default minimum confidence ratio: confidence may be at most 5% of price.
static constexpr BasisPoints DEFAULT_MIN_CONFIDENCE_BPS = 9'500;

/// Feed exponents outside [-MAX_FEED_EXPONENT, MAX_FEED_EXPONENT] are rejected.
static constexpr int MAX_FEED_EXPONENT = 18;

/// Score deducted per manipulation risk level.
static constexpr std::uint8_t SCORE_PENALTY_PER_RISK_LEVEL = 25;

/// Maximum score deducted for quote age and for confidence width, each.
static constexpr std::uint8_t SCORE_PENALTY_FRESHNESS_MAX  = 10;
static constexpr std::uint8_t SCORE_PENALTY_CONFIDENCE_MAX = 10;

// ─── Manipulation Detection Defaults ──────────────────────────────────────────

static constexpr std::size_t DEFAULT_DRIFT_WINDOW             = 10;
static constexpr BasisPoints DEFAULT_DRIFT_THRESHOLD_BPS      = 2'000;
static constexpr std::size_t DEFAULT_MISMATCH_WINDOW          = 3;
static constexpr BasisPoints DEFAULT_MISMATCH_MOVE_BPS        = 500;
static constexpr Timestamp   DEFAULT_OSCILLATION_WINDOW_MS    = 300'000;
static constexpr BasisPoints DEFAULT_OSCILLATION_MIN_RISE_BPS = 500;

// ─── Circuit Breaker Defaults ─────────────────────────────────────────────────

static constexpr std::uint32_t DEFAULT_FAILURE_THRESHOLD   = 5;
static constexpr Timestamp     DEFAULT_TIME_WINDOW_MS      = 60'000;
static constexpr Timestamp     DEFAULT_RECOVERY_TIMEOUT_MS = 300'000;

/// Upper bounds accepted for a ThresholdConfig.
static constexpr std::uint32_t MAX_FAILURE_THRESHOLD = 10'000;
static constexpr Timestamp     MAX_BREAKER_PERIOD_MS = 7ULL * 24 * 3'600'000;

// ─── Risk Engine Defaults ─────────────────────────────────────────────────────

/// Global ceiling on any maximum LTV, tier bonus included.
static constexpr BasisPoints DEFAULT_GLOBAL_LTV_CAP_BPS = 9'900;

/// Largest tier bonus a CollateralPolicy may grant.
static constexpr BasisPoints MAX_TIER_BONUS_BPS = 2'000;

static constexpr BasisPoints DEFAULT_BASE_PENALTY_RATE_BPS = 500;
static constexpr BasisPoints DEFAULT_MIN_PENALTY_RATE_BPS  = 200;
static constexpr BasisPoints DEFAULT_MAX_PENALTY_RATE_BPS  = 2'000;

/// Step-ups applied to the penalty rate under stressed markets.
static constexpr BasisPoints VOLATILITY_ADJ_HIGH_BPS = 5'000;
static constexpr BasisPoints VOLATILITY_ADJ_MID_BPS  = 2'500;
static constexpr BasisPoints LIQUIDITY_ADJ_LOW_BPS   = 2'500;
static constexpr BasisPoints LIQUIDITY_ADJ_MID_BPS   = 1'000;

static constexpr std::uint8_t VOLATILITY_HIGH_LEVEL = 70;
static constexpr std::uint8_t VOLATILITY_MID_LEVEL  = 40;
static constexpr std::uint8_t LIQUIDITY_LOW_LEVEL   = 30;
static constexpr std::uint8_t LIQUIDITY_MID_LEVEL   = 50;

// ─── Penalty Distribution Defaults ────────────────────────────────────────────

static constexpr BasisPoints DEFAULT_LIQUIDATOR_SHARE_BPS = 5'000;
static constexpr BasisPoints DEFAULT_PLATFORM_SHARE_BPS   = 2'000;
static constexpr BasisPoints DEFAULT_INSURANCE_SHARE_BPS  = 2'000;

} // namespace olend::constants
