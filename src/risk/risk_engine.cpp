/// @file src/risk/risk_engine.cpp
/// @brief RiskEngine: conservative valuation, tiers and penalty rates.

#include "olend/risk.hpp"
#include "olend/safe_math.hpp"

#include <algorithm>
#include <limits>

namespace olend::risk {

namespace {

constexpr BasisPoints BPS = constants::BPS_DENOMINATOR;
constexpr std::uint8_t MAX_ASSET_DECIMALS = 18;
constexpr BasisPoints MAX_ASSET_MULTIPLIER_BPS = 5 * BPS;

[[nodiscard]] bool within_bps(BasisPoints v) noexcept { return v <= BPS; }

[[nodiscard]] bool within_percent(std::uint8_t v) noexcept { return v <= 100; }

} // anonymous namespace

// ─── Names ────────────────────────────────────────────────────────────────────

const char* to_string(AssetClass c) noexcept {
    switch (c) {
        case AssetClass::Stablecoin: return "stablecoin";
        case AssetClass::BlueChip:   return "blue_chip";
        case AssetClass::Major:      return "major";
        case AssetClass::LongTail:   return "long_tail";
    }
    return "unknown";
}

const char* to_string(BorrowerTier t) noexcept {
    switch (t) {
        case BorrowerTier::Basic:    return "basic";
        case BorrowerTier::Silver:   return "silver";
        case BorrowerTier::Gold:     return "gold";
        case BorrowerTier::Platinum: return "platinum";
        case BorrowerTier::Diamond:  return "diamond";
    }
    return "unknown";
}

const char* to_string(RiskTier t) noexcept {
    switch (t) {
        case RiskTier::Healthy:      return "healthy";
        case RiskTier::Warning:      return "warning";
        case RiskTier::Liquidatable: return "liquidatable";
    }
    return "unknown";
}

// ─── Config validation ────────────────────────────────────────────────────────

Status CollateralPolicy::validate() const {
    for (const ClassLimits& limits : class_limits) {
        if (!within_bps(limits.max_ltv_bps) ||
            !within_bps(limits.warning_threshold_bps) ||
            !within_bps(limits.liquidation_threshold_bps)) {
            return ErrorCode::InvalidConfig;
        }
        if (limits.warning_threshold_bps > limits.liquidation_threshold_bps) {
            return ErrorCode::InvalidConfig;
        }
    }
    for (BasisPoints bonus : tier_bonus_bps) {
        if (bonus > constants::MAX_TIER_BONUS_BPS) {
            return ErrorCode::InvalidConfig;
        }
    }
    if (global_hard_cap_bps == 0 || !within_bps(global_hard_cap_bps)) {
        return ErrorCode::InvalidConfig;
    }
    for (const auto& [asset, params] : assets) {
        if (params.decimals > MAX_ASSET_DECIMALS) {
            return ErrorCode::InvalidConfig;
        }
    }
    return ok();
}

Status MarketConditionFactors::validate() const {
    if (!within_percent(volatility_level) || !within_percent(liquidity_factor) ||
        !within_percent(price_stability)) {
        return ErrorCode::InvalidConfig;
    }
    return ok();
}

Status PenaltyRateConfig::validate() const {
    if (!within_bps(base_rate_bps) || !within_bps(max_penalty_rate_bps)) {
        return ErrorCode::InvalidConfig;
    }
    if (min_penalty_rate_bps > max_penalty_rate_bps) {
        return ErrorCode::InvalidConfig;
    }
    for (const auto& [asset, multiplier] : asset_multiplier_bps) {
        if (multiplier == 0 || multiplier > MAX_ASSET_MULTIPLIER_BPS) {
            return ErrorCode::InvalidConfig;
        }
    }
    return ok();
}

// ─── Construction / configuration ─────────────────────────────────────────────

RiskEngine::RiskEngine(CollateralPolicy policy, PenaltyRateConfig penalty,
                       MarketConditionFactors market)
    : policy_(std::move(policy))
    , penalty_(std::move(penalty))
    , market_(market) {}

Status RiskEngine::set_policy(const CollateralPolicy& policy) {
    auto valid = policy.validate();
    if (!valid) {
        return valid.error();
    }
    policy_ = policy;
    return ok();
}

Status RiskEngine::set_penalty_config(const PenaltyRateConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }
    penalty_ = config;
    return ok();
}

Status RiskEngine::set_market_conditions(const MarketConditionFactors& factors) {
    auto valid = factors.validate();
    if (!valid) {
        return valid.error();
    }
    market_ = factors;
    return ok();
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

Result<const AssetRiskParams*> RiskEngine::params_of(AssetId asset) const {
    auto it = policy_.assets.find(asset);
    if (it == policy_.assets.end()) {
        return ErrorCode::UnknownAsset;
    }
    return &it->second;
}

Result<const ValidatedPriceInfo*> RiskEngine::price_of(AssetId asset, const PriceBook& prices) {
    auto it = prices.find(asset);
    if (it == prices.end()) {
        return ErrorCode::UnknownAsset;
    }
    if (!it->second.is_valid) {
        return ErrorCode::ManipulationDetected;
    }
    return &it->second;
}

// ─── Valuation ────────────────────────────────────────────────────────────────

Result<Amount> RiskEngine::value_of(AssetId asset, Amount amount, Price price) const {
    auto params = params_of(asset);
    if (!params) {
        return params.error();
    }
    auto scale = math::safe_pow10((*params)->decimals);
    if (!scale) {
        return scale.error();
    }
    return math::safe_mul_div(amount, price, *scale);
}

Result<std::vector<RiskEngine::CollateralPart>>
RiskEngine::collateral_parts(const BorrowPosition& position, const PriceBook& prices) const {
    std::vector<CollateralPart> parts;
    parts.reserve(position.collateral.size());
    for (const auto& [asset, amount] : position.collateral) {
        if (amount == 0) {
            continue;
        }
        auto info = price_of(asset, prices);
        if (!info) {
            return info.error();
        }
        auto value = value_of(asset, amount, (*info)->lower_bound());
        if (!value) {
            return value.error();
        }
        parts.push_back(CollateralPart{asset, *value});
    }
    return parts;
}

Result<LtvBreakdown>
RiskEngine::compute_ltv(const BorrowPosition& position, const PriceBook& prices) const {
    auto parts = collateral_parts(position, prices);
    if (!parts) {
        return parts.error();
    }

    // ── Collateral total and value-weighted class thresholds ──────────────────
    Amount collateral_value = 0;
    Wide weighted_max = 0;
    Wide weighted_warning = 0;
    Wide weighted_liquidation = 0;
    ClassLimits strictest = policy_.class_limits[static_cast<std::size_t>(AssetClass::LongTail)];

    for (const CollateralPart& part : *parts) {
        auto sum = math::safe_add(collateral_value, part.value);
        if (!sum) {
            return sum.error();
        }
        collateral_value = *sum;

        auto params = params_of(part.asset);
        if (!params) {
            return params.error();
        }
        const ClassLimits& limits =
            policy_.class_limits[static_cast<std::size_t>((*params)->asset_class)];
        weighted_max         += static_cast<Wide>(part.value) * limits.max_ltv_bps;
        weighted_warning     += static_cast<Wide>(part.value) * limits.warning_threshold_bps;
        weighted_liquidation += static_cast<Wide>(part.value) * limits.liquidation_threshold_bps;
        strictest.max_ltv_bps = std::min(strictest.max_ltv_bps, limits.max_ltv_bps);
        strictest.warning_threshold_bps =
            std::min(strictest.warning_threshold_bps, limits.warning_threshold_bps);
        strictest.liquidation_threshold_bps =
            std::min(strictest.liquidation_threshold_bps, limits.liquidation_threshold_bps);
    }

    ClassLimits effective = strictest;
    if (collateral_value > 0) {
        effective.max_ltv_bps           = static_cast<BasisPoints>(weighted_max / collateral_value);
        effective.warning_threshold_bps = static_cast<BasisPoints>(weighted_warning / collateral_value);
        effective.liquidation_threshold_bps =
            static_cast<BasisPoints>(weighted_liquidation / collateral_value);
    }

    // ── Debt at the upper confidence bound ────────────────────────────────────
    Amount debt_value = 0;
    if (position.borrowed_amount > 0) {
        auto info = price_of(position.borrowed_asset, prices);
        if (!info) {
            return info.error();
        }
        auto upper = (*info)->upper_bound();
        if (!upper) {
            return upper.error();
        }
        auto value = value_of(position.borrowed_asset, position.borrowed_amount, *upper);
        if (!value) {
            return value.error();
        }
        debt_value = *value;
    }

    // ── Ratio ─────────────────────────────────────────────────────────────────
    // Exact floor in 128 bits, so ltv ≥ t iff debt · 10 000 ≥ t · collateral.
    // A ratio past 64 bits saturates to the zero-collateral sentinel.
    constexpr BasisPoints LTV_SATURATED = std::numeric_limits<BasisPoints>::max();
    BasisPoints ltv = 0;
    if (debt_value > 0 && collateral_value == 0) {
        ltv = LTV_SATURATED;
    } else if (debt_value > 0) {
        const Wide ratio = static_cast<Wide>(debt_value) * BPS / collateral_value;
        ltv = ratio > LTV_SATURATED ? LTV_SATURATED : static_cast<BasisPoints>(ratio);
    }

    return LtvBreakdown{
        .ltv_bps                   = ltv,
        .collateral_value          = collateral_value,
        .debt_value                = debt_value,
        .max_ltv_bps               = effective.max_ltv_bps,
        .warning_threshold_bps     = effective.warning_threshold_bps,
        .liquidation_threshold_bps = effective.liquidation_threshold_bps,
        .tier = classify(ltv, effective.warning_threshold_bps, effective.liquidation_threshold_bps),
    };
}

// ─── Limits and tiers ─────────────────────────────────────────────────────────

BasisPoints RiskEngine::max_allowed_ltv(AssetClass asset_class, BorrowerTier tier) const noexcept {
    const BasisPoints base  = policy_.class_limits[static_cast<std::size_t>(asset_class)].max_ltv_bps;
    const BasisPoints bonus = policy_.tier_bonus_bps[static_cast<std::size_t>(tier)];
    return std::min(base + bonus, policy_.global_hard_cap_bps);
}

RiskTier RiskEngine::classify(BasisPoints ltv_bps,
                              BasisPoints warning_threshold_bps,
                              BasisPoints liquidation_threshold_bps) noexcept {
    if (ltv_bps >= liquidation_threshold_bps) return RiskTier::Liquidatable;
    if (ltv_bps >= warning_threshold_bps)     return RiskTier::Warning;
    return RiskTier::Healthy;
}

// ─── Decisions ────────────────────────────────────────────────────────────────

Result<LtvBreakdown>
RiskEngine::check_origination(const BorrowPosition& position, const PriceBook& prices,
                              BorrowerTier tier) const {
    auto breakdown = compute_ltv(position, prices);
    if (!breakdown) {
        return breakdown.error();
    }
    const BasisPoints bonus   = policy_.tier_bonus_bps[static_cast<std::size_t>(tier)];
    const BasisPoints allowed = std::min(breakdown->max_ltv_bps + bonus, policy_.global_hard_cap_bps);
    if (breakdown->ltv_bps > allowed || breakdown->tier == RiskTier::Liquidatable) {
        return ErrorCode::LtvExceeded;
    }
    return breakdown;
}

Result<LiquidationDecision>
RiskEngine::check_liquidation(const BorrowPosition& position, const PriceBook& prices) const {
    auto breakdown = compute_ltv(position, prices);
    if (!breakdown) {
        return breakdown.error();
    }
    switch (breakdown->tier) {
        case RiskTier::Healthy:
            return LiquidationDecision{LiquidationAction::None, breakdown->ltv_bps, 0};
        case RiskTier::Warning:
            return LiquidationDecision{LiquidationAction::Warn, breakdown->ltv_bps, 0};
        case RiskTier::Liquidatable:
            break;
    }
    auto rate = position_penalty_rate(position, prices);
    if (!rate) {
        return rate.error();
    }
    return LiquidationDecision{LiquidationAction::Liquidatable, breakdown->ltv_bps, *rate};
}

// ─── Penalty rate ─────────────────────────────────────────────────────────────

BasisPoints RiskEngine::volatility_adjustment_bps() const noexcept {
    const int instability = 100 - static_cast<int>(market_.price_stability);
    const int score = std::max(static_cast<int>(market_.volatility_level), instability);
    if (score > constants::VOLATILITY_HIGH_LEVEL) return constants::VOLATILITY_ADJ_HIGH_BPS;
    if (score > constants::VOLATILITY_MID_LEVEL)  return constants::VOLATILITY_ADJ_MID_BPS;
    return 0;
}

BasisPoints RiskEngine::liquidity_adjustment_bps() const noexcept {
    const std::uint8_t liquidity = market_.liquidity_factor;
    if (liquidity < constants::LIQUIDITY_LOW_LEVEL) return constants::LIQUIDITY_ADJ_LOW_BPS;
    if (liquidity < constants::LIQUIDITY_MID_LEVEL) return constants::LIQUIDITY_ADJ_MID_BPS;
    return 0;
}

Result<BasisPoints> RiskEngine::penalty_rate(AssetId collateral_asset) const {
    BasisPoints multiplier = BPS;
    if (auto it = penalty_.asset_multiplier_bps.find(collateral_asset);
        it != penalty_.asset_multiplier_bps.end()) {
        multiplier = it->second;
    }

    auto rate = math::safe_mul_div(penalty_.base_rate_bps, multiplier, BPS);
    if (!rate) {
        return rate.error();
    }
    rate = math::safe_mul_div(*rate, BPS + volatility_adjustment_bps(), BPS);
    if (!rate) {
        return rate.error();
    }
    rate = math::safe_mul_div(*rate, BPS + liquidity_adjustment_bps(), BPS);
    if (!rate) {
        return rate.error();
    }
    return std::clamp(*rate, penalty_.min_penalty_rate_bps, penalty_.max_penalty_rate_bps);
}

Result<BasisPoints>
RiskEngine::position_penalty_rate(const BorrowPosition& position, const PriceBook& prices) const {
    auto parts = collateral_parts(position, prices);
    if (!parts) {
        return parts.error();
    }

    Wide weighted = 0;
    Wide total = 0;
    BasisPoints highest = 0;
    for (const CollateralPart& part : *parts) {
        auto rate = penalty_rate(part.asset);
        if (!rate) {
            return rate.error();
        }
        weighted += static_cast<Wide>(part.value) * *rate;
        total    += part.value;
        highest   = std::max(highest, *rate);
    }
    if (parts->empty()) {
        return penalty_rate(position.borrowed_asset);
    }
    if (total == 0) {
        return highest;
    }
    return static_cast<BasisPoints>(weighted / total);
}

Result<LiquidationPlan>
RiskEngine::plan_liquidation(const BorrowPosition& position, const PriceBook& prices,
                             Amount repay_value) const {
    auto breakdown = compute_ltv(position, prices);
    if (!breakdown) {
        return breakdown.error();
    }
    if (breakdown->tier != RiskTier::Liquidatable) {
        return ErrorCode::LtvExceeded;
    }
    auto rate = position_penalty_rate(position, prices);
    if (!rate) {
        return rate.error();
    }

    // Repaying more than the outstanding debt value is not possible.
    const Amount repay = std::min(repay_value, breakdown->debt_value);
    auto penalty = math::safe_percentage(repay, *rate);
    if (!penalty) {
        return penalty.error();
    }
    auto seize = math::safe_add(repay, *penalty);
    if (!seize) {
        return seize.error();
    }
    return LiquidationPlan{
        .penalty_rate_bps = *rate,
        .repay_value      = repay,
        .penalty_value    = *penalty,
        .seize_value      = std::min(*seize, breakdown->collateral_value),
    };
}

} // namespace olend::risk
