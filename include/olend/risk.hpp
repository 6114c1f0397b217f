#pragma once

/// @file include/olend/risk.hpp
/// @brief RiskEngine: loan-to-value, risk tiers and dynamic liquidation penalty.
///
/// # Module: Risk Engine
///
/// ## Responsibility
/// Derive a borrowing position's risk from validated prices. The engine
/// never mutates a position; it only reads it.
///
/// ## Valuation
/// Collateral is valued at the lower edge of each price's confidence
/// interval and debt at the upper edge, so both errors overstate risk:
///
///   collateral_value = Σ_a  amount_a · (price_a − conf_a) / 10^decimals_a
///   debt_value       =      amount   · (price   + conf  ) / 10^decimals
///   ltv_bps          = ⌊debt_value · 10 000 / collateral_value⌋
///
/// With several collateral assets this is a value-weighted composite, not
/// an average of per-asset ratios. Thresholds of a multi-asset position are
/// the value-weighted average of each asset class's thresholds.
///
/// ## Tiers
///   ltv < warning                  → Healthy
///   warning ≤ ltv < liquidation    → Warning
///   ltv ≥ liquidation              → Liquidatable
///
/// ## Penalty Rate
///   rate = base · asset_multiplier · (1 + vol_adj) · (1 + liq_adj)
/// clipped to [min_penalty_rate, max_penalty_rate].
///
/// ## Edge Cases
/// - No debt: LTV 0, Healthy
/// - Debt against zero collateral value, or a ratio past 64 bits:
///   LTV = UINT64_MAX, Liquidatable
/// - Missing price or unconfigured asset: UnknownAsset
/// - Price flagged by the manipulation detector: ManipulationDetected

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/price.hpp"
#include "olend/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace olend::risk {

// ─── Classification enums ─────────────────────────────────────────────────────

enum class AssetClass : std::uint8_t {
    Stablecoin,
    BlueChip,
    Major,
    LongTail,
};

static constexpr std::size_t ASSET_CLASS_COUNT = 4;

enum class BorrowerTier : std::uint8_t {
    Basic,
    Silver,
    Gold,
    Platinum,
    Diamond,
};

static constexpr std::size_t BORROWER_TIER_COUNT = 5;

enum class RiskTier : std::uint8_t {
    Healthy,
    Warning,
    Liquidatable,
};

[[nodiscard]] const char* to_string(AssetClass c) noexcept;
[[nodiscard]] const char* to_string(BorrowerTier t) noexcept;
[[nodiscard]] const char* to_string(RiskTier t) noexcept;

// ─── Position ─────────────────────────────────────────────────────────────────

/// A borrowing position as held by the borrowing layer.
struct BorrowPosition {
    std::uint64_t            id = 0;
    std::string              borrower;
    std::map<AssetId, Amount> collateral;        ///< asset → amount (smallest unit)
    AssetId                  borrowed_asset{};
    Amount                   borrowed_amount = 0;
    Timestamp                created_at = 0;
    Timestamp                updated_at = 0;
};

/// Validated prices by asset, as consumed by the engine.
using PriceBook = std::unordered_map<AssetId, ValidatedPriceInfo, AssetIdHash>;

// ─── Policy ───────────────────────────────────────────────────────────────────

struct ClassLimits {
    BasisPoints max_ltv_bps;
    BasisPoints warning_threshold_bps;
    BasisPoints liquidation_threshold_bps;
};

struct AssetRiskParams {
    AssetClass   asset_class = AssetClass::LongTail;
    std::uint8_t decimals    = 8;   ///< Decimals of the asset's amounts
};

struct CollateralPolicy {
    /// Indexed by AssetClass.
    std::array<ClassLimits, ASSET_CLASS_COUNT> class_limits{{
        {9'000, 9'300, 9'500},   // Stablecoin
        {8'000, 8'500, 8'800},   // BlueChip
        {7'000, 7'500, 8'000},   // Major
        {5'000, 5'500, 6'500},   // LongTail
    }};

    /// LTV bonus per borrower tier, indexed by BorrowerTier.
    std::array<BasisPoints, BORROWER_TIER_COUNT> tier_bonus_bps{{0, 100, 200, 300, 500}};

    BasisPoints global_hard_cap_bps = constants::DEFAULT_GLOBAL_LTV_CAP_BPS;

    std::unordered_map<AssetId, AssetRiskParams, AssetIdHash> assets;

    /// Every limit ≤ 10 000, warning ≤ liquidation, hard cap ≤ 10 000,
    /// tier bonus ≤ MAX_TIER_BONUS_BPS, decimals ≤ 18.
    [[nodiscard]] Status validate() const;
};

struct MarketConditionFactors {
    std::uint8_t volatility_level = 0;     ///< 0–100, higher is more volatile
    std::uint8_t liquidity_factor = 100;   ///< 0–100, higher is more liquid
    std::uint8_t price_stability  = 100;   ///< 0–100, higher is more stable
    Timestamp    last_updated     = 0;

    [[nodiscard]] Status validate() const;
};

struct PenaltyRateConfig {
    BasisPoints base_rate_bps        = constants::DEFAULT_BASE_PENALTY_RATE_BPS;
    BasisPoints min_penalty_rate_bps = constants::DEFAULT_MIN_PENALTY_RATE_BPS;
    BasisPoints max_penalty_rate_bps = constants::DEFAULT_MAX_PENALTY_RATE_BPS;

    /// Per-asset multiplier; assets not listed use 10 000 bps (100%).
    std::unordered_map<AssetId, BasisPoints, AssetIdHash> asset_multiplier_bps;

    /// min ≤ max ≤ 10 000, every multiplier in (0, 50 000].
    [[nodiscard]] Status validate() const;
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct LtvBreakdown {
    BasisPoints ltv_bps;
    Amount      collateral_value;            ///< PRICE_DECIMALS fixed point
    Amount      debt_value;                  ///< PRICE_DECIMALS fixed point
    BasisPoints max_ltv_bps;                 ///< Value-weighted class cap, before tier bonus
    BasisPoints warning_threshold_bps;
    BasisPoints liquidation_threshold_bps;
    RiskTier    tier;
};

enum class LiquidationAction : std::uint8_t {
    None,
    Warn,
    Liquidatable,
};

struct LiquidationDecision {
    LiquidationAction action;
    BasisPoints       ltv_bps;
    BasisPoints       penalty_rate_bps;   ///< 0 unless Liquidatable
};

struct LiquidationPlan {
    BasisPoints penalty_rate_bps;
    Amount      repay_value;
    Amount      penalty_value;    ///< repay_value · rate / 10 000
    Amount      seize_value;      ///< repay_value + penalty_value, capped by collateral value
};

// ─── RiskEngine ───────────────────────────────────────────────────────────────

class RiskEngine {
public:
    explicit RiskEngine(CollateralPolicy policy = CollateralPolicy{},
                        PenaltyRateConfig penalty = PenaltyRateConfig{},
                        MarketConditionFactors market = MarketConditionFactors{});

    // ── Configuration (validated before being applied) ────────────────────────

    Status set_policy(const CollateralPolicy& policy);
    Status set_penalty_config(const PenaltyRateConfig& config);
    Status set_market_conditions(const MarketConditionFactors& factors);

    [[nodiscard]] const CollateralPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] const PenaltyRateConfig& penalty_config() const noexcept { return penalty_; }
    [[nodiscard]] const MarketConditionFactors& market_conditions() const noexcept { return market_; }

    // ── Valuation ─────────────────────────────────────────────────────────────

    /// amount · price / 10^decimals, in PRICE_DECIMALS fixed point.
    [[nodiscard]] Result<Amount> value_of(AssetId asset, Amount amount, Price price) const;

    [[nodiscard]] Result<LtvBreakdown>
    compute_ltv(const BorrowPosition& position, const PriceBook& prices) const;

    // ── Limits and tiers ──────────────────────────────────────────────────────

    /// min(base_cap[asset_class] + tier_bonus[tier], global_hard_cap).
    [[nodiscard]] BasisPoints max_allowed_ltv(AssetClass asset_class, BorrowerTier tier) const noexcept;

    [[nodiscard]] static RiskTier classify(BasisPoints ltv_bps,
                                           BasisPoints warning_threshold_bps,
                                           BasisPoints liquidation_threshold_bps) noexcept;

    // ── Decisions ─────────────────────────────────────────────────────────────

    /// LTV of a position about to be opened or enlarged, or LtvExceeded if
    /// it is above min(weighted cap + tier bonus, hard cap) or already
    /// liquidatable.
    [[nodiscard]] Result<LtvBreakdown>
    check_origination(const BorrowPosition& position, const PriceBook& prices,
                      BorrowerTier tier) const;

    [[nodiscard]] Result<LiquidationDecision>
    check_liquidation(const BorrowPosition& position, const PriceBook& prices) const;

    /// Dynamic penalty rate for seizing collateral of the given asset.
    [[nodiscard]] Result<BasisPoints> penalty_rate(AssetId collateral_asset) const;

    /// Penalty rate of a position: value-weighted over its collateral.
    [[nodiscard]] Result<BasisPoints>
    position_penalty_rate(const BorrowPosition& position, const PriceBook& prices) const;

    /// Amounts for liquidating `repay_value` of debt. Fails with
    /// LtvExceeded if the position is not liquidatable.
    [[nodiscard]] Result<LiquidationPlan>
    plan_liquidation(const BorrowPosition& position, const PriceBook& prices,
                     Amount repay_value) const;

private:
    struct CollateralPart {
        AssetId asset;
        Amount  value;
    };

    [[nodiscard]] Result<const AssetRiskParams*> params_of(AssetId asset) const;

    [[nodiscard]] static Result<const ValidatedPriceInfo*>
    price_of(AssetId asset, const PriceBook& prices);

    /// Conservatively valued collateral, one part per asset.
    [[nodiscard]] Result<std::vector<CollateralPart>>
    collateral_parts(const BorrowPosition& position, const PriceBook& prices) const;

    [[nodiscard]] BasisPoints volatility_adjustment_bps() const noexcept;
    [[nodiscard]] BasisPoints liquidity_adjustment_bps() const noexcept;

    CollateralPolicy       policy_;
    PenaltyRateConfig      penalty_;
    MarketConditionFactors market_;
};

} // namespace olend::risk
