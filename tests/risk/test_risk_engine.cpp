#include <gtest/gtest.h>
#include "olend/risk.hpp"

#include <limits>

using namespace olend;
using namespace olend::risk;

namespace {

constexpr Price  E8 = 100'000'000;
constexpr Amount BTC_UNIT  = 100'000'000;   // 8 decimals
constexpr Amount USDC_UNIT = 1'000'000;     // 6 decimals

const AssetId BTC  = AssetId::from_symbol("BTC");
const AssetId USDC = AssetId::from_symbol("USDC");
const AssetId PEPE = AssetId::from_symbol("PEPE");

ValidatedPriceInfo priced(Price price, Price confidence = 0, bool valid = true) {
    return ValidatedPriceInfo{
        .price             = price,
        .confidence        = confidence,
        .timestamp         = 0,
        .validation_score  = 100,
        .manipulation_risk = valid ? ManipulationRisk::None : ManipulationRisk::High,
        .is_valid          = valid,
    };
}

CollateralPolicy base_policy() {
    CollateralPolicy p;
    p.assets[BTC]  = AssetRiskParams{AssetClass::BlueChip, 8};
    p.assets[USDC] = AssetRiskParams{AssetClass::Stablecoin, 6};
    return p;
}

BorrowPosition position(Amount btc, Amount usdc_collateral, Amount usdc_debt) {
    BorrowPosition pos;
    pos.id       = 7;
    pos.borrower = "alice";
    if (btc > 0)             pos.collateral[BTC]  = btc;
    if (usdc_collateral > 0) pos.collateral[USDC] = usdc_collateral;
    pos.borrowed_asset  = USDC;
    pos.borrowed_amount = usdc_debt;
    return pos;
}

PriceBook book(Price btc_price) {
    return PriceBook{{BTC, priced(btc_price)}, {USDC, priced(E8)}};
}

/// BTC limits used by the tier walkthrough: max 9700, warning 9550,
/// liquidation 9750.
RiskEngine walkthrough_engine() {
    CollateralPolicy p = base_policy();
    p.class_limits[static_cast<std::size_t>(AssetClass::BlueChip)] = {9'700, 9'550, 9'750};
    return RiskEngine(p);
}

} // namespace

// ─── Valuation ────────────────────────────────────────────────────────────────

TEST(RiskEngine_Ltv, MultiAssetCollateral_ValueWeighted) {
    RiskEngine engine(base_policy());
    auto r = engine.compute_ltv(position(2 * BTC_UNIT, 10'000 * USDC_UNIT, 55'000 * USDC_UNIT),
                                book(50'000 * E8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->collateral_value, 110'000 * E8);
    EXPECT_EQ(r->debt_value, 55'000 * E8);
    EXPECT_EQ(r->ltv_bps, 5'000u);
    EXPECT_EQ(r->tier, RiskTier::Healthy);
    // (100 000·8000 + 10 000·9000) / 110 000
    EXPECT_EQ(r->max_ltv_bps, 8'090u);
    EXPECT_EQ(r->warning_threshold_bps, 8'572u);
    EXPECT_EQ(r->liquidation_threshold_bps, 8'863u);
}

TEST(RiskEngine_Ltv, ConfidenceBounds_AreConservative) {
    RiskEngine engine(base_policy());
    const PriceBook prices{{BTC, priced(100 * E8, 10 * E8)}, {USDC, priced(E8, E8 / 100)}};
    auto r = engine.compute_ltv(position(BTC_UNIT, 0, 45 * USDC_UNIT), prices);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->collateral_value, 90 * E8);     // 100 − 10
    EXPECT_EQ(r->debt_value, 4'545'000'000u);    // 45 · 1.01
    EXPECT_EQ(r->ltv_bps, 5'050u);
}

TEST(RiskEngine_Ltv, NoDebt_ZeroAndHealthy) {
    RiskEngine engine(base_policy());
    const PriceBook prices{{BTC, priced(50'000 * E8)}};
    auto r = engine.compute_ltv(position(BTC_UNIT, 0, 0), prices);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->ltv_bps, 0u);
    EXPECT_EQ(r->tier, RiskTier::Healthy);
}

TEST(RiskEngine_Ltv, DebtWithoutCollateral_MaxAndLiquidatable) {
    RiskEngine engine(base_policy());
    auto r = engine.compute_ltv(position(0, 0, 10 * USDC_UNIT), book(50'000 * E8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->ltv_bps, std::numeric_limits<BasisPoints>::max());
    EXPECT_EQ(r->tier, RiskTier::Liquidatable);
}

TEST(RiskEngine_Ltv, CollapsedCollateral_SaturatesLikeZeroCollateral) {
    RiskEngine engine(base_policy());
    // 1 BTC at 1e-8 USD is worth one fixed-point unit; 2e15 units of debt
    // put debt · 10 000 / collateral past 64 bits.
    const PriceBook prices{{BTC, priced(1)}, {USDC, priced(E8)}};
    const BorrowPosition pos = position(BTC_UNIT, 0, 20'000'000 * USDC_UNIT);

    auto r = engine.compute_ltv(pos, prices);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->collateral_value, 1u);
    EXPECT_EQ(r->debt_value, 2'000'000'000'000'000u);
    EXPECT_EQ(r->ltv_bps, std::numeric_limits<BasisPoints>::max());
    EXPECT_EQ(r->tier, RiskTier::Liquidatable);

    auto decision = engine.check_liquidation(pos, prices);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->action, LiquidationAction::Liquidatable);
    EXPECT_EQ(decision->ltv_bps, std::numeric_limits<BasisPoints>::max());

    auto plan = engine.plan_liquidation(pos, prices, 1'000 * E8);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->repay_value, 1'000 * E8);
    EXPECT_EQ(plan->seize_value, 1u);
}

TEST(RiskEngine_Ltv, LargeRatioBelowSaturation_Exact) {
    RiskEngine engine(base_policy());
    const PriceBook prices{{BTC, priced(1)}, {USDC, priced(E8)}};
    // debt_value 1e15 → ratio 1e19, still inside 64 bits.
    auto r = engine.compute_ltv(position(BTC_UNIT, 0, 10'000'000 * USDC_UNIT), prices);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->ltv_bps, 10'000'000'000'000'000'000u);
    EXPECT_EQ(r->tier, RiskTier::Liquidatable);
}

TEST(RiskEngine_Ltv, MissingPrice_UnknownAsset) {
    RiskEngine engine(base_policy());
    const PriceBook prices{{USDC, priced(E8)}};
    EXPECT_EQ(engine.compute_ltv(position(BTC_UNIT, 0, USDC_UNIT), prices).error(),
              ErrorCode::UnknownAsset);
}

TEST(RiskEngine_Ltv, UnconfiguredAsset_UnknownAsset) {
    RiskEngine engine(base_policy());
    BorrowPosition pos = position(0, 0, USDC_UNIT);
    pos.collateral[PEPE] = 1'000;
    PriceBook prices = book(E8);
    prices.emplace(PEPE, priced(E8));
    EXPECT_EQ(engine.compute_ltv(pos, prices).error(), ErrorCode::UnknownAsset);
}

TEST(RiskEngine_Ltv, ManipulatedPrice_ManipulationDetected) {
    RiskEngine engine(base_policy());
    const PriceBook prices{{BTC, priced(50'000 * E8, 0, false)}, {USDC, priced(E8)}};
    EXPECT_EQ(engine.compute_ltv(position(BTC_UNIT, 0, USDC_UNIT), prices).error(),
              ErrorCode::ManipulationDetected);
}

TEST(RiskEngine_Ltv, ValueOf_UsesAssetDecimals) {
    RiskEngine engine(base_policy());
    EXPECT_EQ(*engine.value_of(USDC, 2'500'000, 2 * E8), 5 * E8);
    EXPECT_EQ(engine.value_of(PEPE, 1, E8).error(), ErrorCode::UnknownAsset);
}

// ─── Tiers (walkthrough: 100 000 of BTC collateral) ───────────────────────────

TEST(RiskEngine_Tiers, Borrow95000_Healthy) {
    auto engine = walkthrough_engine();
    auto r = engine.compute_ltv(position(2 * BTC_UNIT, 0, 95'000 * USDC_UNIT), book(50'000 * E8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->ltv_bps, 9'500u);
    EXPECT_EQ(r->tier, RiskTier::Healthy);
}

TEST(RiskEngine_Tiers, Borrow96000_Warning) {
    auto engine = walkthrough_engine();
    auto r = engine.compute_ltv(position(2 * BTC_UNIT, 0, 96'000 * USDC_UNIT), book(50'000 * E8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->tier, RiskTier::Warning);
    EXPECT_TRUE(engine.check_origination(position(2 * BTC_UNIT, 0, 96'000 * USDC_UNIT),
                                         book(50'000 * E8), BorrowerTier::Basic).has_value());
}

TEST(RiskEngine_Tiers, Borrow98000_RejectedAtOriginationLiquidatableIfOpen) {
    auto engine = walkthrough_engine();
    const auto pos = position(2 * BTC_UNIT, 0, 98'000 * USDC_UNIT);
    EXPECT_EQ(engine.check_origination(pos, book(50'000 * E8), BorrowerTier::Basic).error(),
              ErrorCode::LtvExceeded);

    auto decision = engine.check_liquidation(pos, book(50'000 * E8));
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->action, LiquidationAction::Liquidatable);
    EXPECT_EQ(decision->ltv_bps, 9'800u);
}

TEST(RiskEngine_Tiers, WarningAtNinetyPercent_95000IsWarning) {
    CollateralPolicy p = base_policy();
    p.class_limits[static_cast<std::size_t>(AssetClass::BlueChip)] = {9'700, 9'000, 9'750};
    RiskEngine engine(p);
    auto r = engine.compute_ltv(position(2 * BTC_UNIT, 0, 95'000 * USDC_UNIT), book(50'000 * E8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->tier, RiskTier::Warning);
}

TEST(RiskEngine_Tiers, ClassifyBoundaries) {
    EXPECT_EQ(RiskEngine::classify(8'499, 8'500, 8'800), RiskTier::Healthy);
    EXPECT_EQ(RiskEngine::classify(8'500, 8'500, 8'800), RiskTier::Warning);
    EXPECT_EQ(RiskEngine::classify(8'800, 8'500, 8'800), RiskTier::Liquidatable);
}

// ─── Limits ───────────────────────────────────────────────────────────────────

TEST(RiskEngine_Limits, MaxAllowedLtv_BonusAndHardCap) {
    CollateralPolicy p = base_policy();
    p.global_hard_cap_bps = 9'400;
    RiskEngine engine(p);
    EXPECT_EQ(engine.max_allowed_ltv(AssetClass::BlueChip, BorrowerTier::Basic), 8'000u);
    EXPECT_EQ(engine.max_allowed_ltv(AssetClass::BlueChip, BorrowerTier::Diamond), 8'500u);
    EXPECT_EQ(engine.max_allowed_ltv(AssetClass::Stablecoin, BorrowerTier::Gold), 9'200u);
    EXPECT_EQ(engine.max_allowed_ltv(AssetClass::Stablecoin, BorrowerTier::Diamond), 9'400u);
}

TEST(RiskEngine_Limits, TierBonusAdmitsOrigination) {
    RiskEngine engine(base_policy());
    const auto pos = position(BTC_UNIT, 0, 82'000 * USDC_UNIT);
    const auto prices = book(100'000 * E8);
    EXPECT_EQ(engine.check_origination(pos, prices, BorrowerTier::Basic).error(),
              ErrorCode::LtvExceeded);
    auto gold = engine.check_origination(pos, prices, BorrowerTier::Gold);
    ASSERT_TRUE(gold.has_value());
    EXPECT_EQ(gold->ltv_bps, 8'200u);
}

// ─── Penalty rate ─────────────────────────────────────────────────────────────

TEST(RiskEngine_Penalty, NeutralMarket_BaseRate) {
    RiskEngine engine(base_policy());
    EXPECT_EQ(*engine.penalty_rate(BTC), 500u);
}

TEST(RiskEngine_Penalty, MarketAdjustments) {
    RiskEngine engine(base_policy());
    struct Case { std::uint8_t vol, liq, stability; BasisPoints expected; };
    const Case cases[] = {
        {75, 100, 100, 750},   // +50%
        {50, 100, 100, 625},   // +25%
        {40, 100, 100, 500},   // not above 40
        { 0,  20, 100, 625},   // +25%
        { 0,  40, 100, 550},   // +10%
        { 0,  50, 100, 500},
        {80,  20, 100, 937},   // 500 · 1.5 · 1.25
        { 0, 100,  20, 750},   // instability 80
    };
    for (const Case& c : cases) {
        ASSERT_TRUE(engine.set_market_conditions({c.vol, c.liq, c.stability, 0}).has_value());
        EXPECT_EQ(*engine.penalty_rate(BTC), c.expected)
            << "vol=" << int(c.vol) << " liq=" << int(c.liq) << " stab=" << int(c.stability);
    }
}

TEST(RiskEngine_Penalty, ClippedToBounds) {
    PenaltyRateConfig cfg;
    cfg.asset_multiplier_bps[BTC] = 30'000;
    RiskEngine engine(base_policy(), cfg, MarketConditionFactors{75, 100, 100, 0});
    EXPECT_EQ(*engine.penalty_rate(BTC), 2'000u);

    cfg = PenaltyRateConfig{};
    cfg.base_rate_bps = 100;
    ASSERT_TRUE(engine.set_penalty_config(cfg).has_value());
    ASSERT_TRUE(engine.set_market_conditions(MarketConditionFactors{}).has_value());
    EXPECT_EQ(*engine.penalty_rate(BTC), 200u);
}

TEST(RiskEngine_Penalty, PositionRate_ValueWeighted) {
    PenaltyRateConfig cfg;
    cfg.asset_multiplier_bps[USDC] = 20'000;
    RiskEngine engine(base_policy(), cfg);
    // BTC 100 000 at 500 bps, USDC 10 000 at 1 000 bps.
    auto r = engine.position_penalty_rate(position(2 * BTC_UNIT, 10'000 * USDC_UNIT, 0),
                                          book(50'000 * E8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 545u);
}

// ─── Liquidation ──────────────────────────────────────────────────────────────

TEST(RiskEngine_Liquidation, ActionsByTier) {
    RiskEngine engine(base_policy());
    const auto prices = book(100'000 * E8);

    auto healthy = engine.check_liquidation(position(BTC_UNIT, 0, 50'000 * USDC_UNIT), prices);
    EXPECT_EQ(healthy->action, LiquidationAction::None);
    EXPECT_EQ(healthy->penalty_rate_bps, 0u);

    auto warn = engine.check_liquidation(position(BTC_UNIT, 0, 86'000 * USDC_UNIT), prices);
    EXPECT_EQ(warn->action, LiquidationAction::Warn);

    auto liq = engine.check_liquidation(position(BTC_UNIT, 0, 90'000 * USDC_UNIT), prices);
    EXPECT_EQ(liq->action, LiquidationAction::Liquidatable);
    EXPECT_EQ(liq->penalty_rate_bps, 500u);
}

TEST(RiskEngine_Liquidation, PlanAmounts) {
    auto engine = walkthrough_engine();
    auto plan = engine.plan_liquidation(position(2 * BTC_UNIT, 0, 98'000 * USDC_UNIT),
                                        book(50'000 * E8), 1'000 * E8);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->penalty_rate_bps, 500u);
    EXPECT_EQ(plan->repay_value, 1'000 * E8);
    EXPECT_EQ(plan->penalty_value, 50 * E8);
    EXPECT_EQ(plan->seize_value, 1'050 * E8);
}

TEST(RiskEngine_Liquidation, PlanRepayCappedAtDebtSeizeAtCollateral) {
    RiskEngine engine(base_policy());
    auto plan = engine.plan_liquidation(position(BTC_UNIT, 0, 150 * USDC_UNIT),
                                        book(100 * E8), 1'000 * E8);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->repay_value, 150 * E8);
    EXPECT_EQ(plan->seize_value, 100 * E8);
}

TEST(RiskEngine_Liquidation, PlanOnHealthyPosition_LtvExceeded) {
    RiskEngine engine(base_policy());
    EXPECT_EQ(engine.plan_liquidation(position(BTC_UNIT, 0, USDC_UNIT), book(100 * E8), E8).error(),
              ErrorCode::LtvExceeded);
}

// ─── Configuration ────────────────────────────────────────────────────────────

TEST(RiskEngine_Config, InvalidUpdatesRejectedAndNotApplied) {
    RiskEngine engine(base_policy());

    CollateralPolicy bad = base_policy();
    bad.class_limits[0] = {9'000, 9'600, 9'500};   // warning above liquidation
    EXPECT_EQ(engine.set_policy(bad).error(), ErrorCode::InvalidConfig);
    EXPECT_EQ(engine.policy().class_limits[0].warning_threshold_bps, 9'300u);

    EXPECT_EQ(engine.set_market_conditions({101, 100, 100, 0}).error(), ErrorCode::InvalidConfig);

    PenaltyRateConfig rates;
    rates.min_penalty_rate_bps = 3'000;
    EXPECT_EQ(engine.set_penalty_config(rates).error(), ErrorCode::InvalidConfig);

    rates = PenaltyRateConfig{};
    rates.asset_multiplier_bps[BTC] = 0;
    EXPECT_EQ(rates.validate().error(), ErrorCode::InvalidConfig);

    bad = base_policy();
    bad.tier_bonus_bps[4] = constants::MAX_TIER_BONUS_BPS + 1;
    EXPECT_EQ(bad.validate().error(), ErrorCode::InvalidConfig);
}
