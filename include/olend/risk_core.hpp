#pragma once

/// @file include/olend/risk_core.hpp
/// @brief RiskCore: the registry object handed to borrowing and liquidation callers.
///
/// # Module: Risk Core
///
/// ## Responsibility
/// Own the price validator, breaker registry, risk engine and penalty
/// distributor; connect them to the host's clock, price feed, tier provider
/// and event sink; gate every configuration change behind the AdminCap the
/// core was created with.
///
/// ## Data flow
/// ```
///   PriceFeed ──► PriceValidator ──► ManipulationDetector
///                      │ failure / manipulation
///                      ▼
///            CircuitBreakerRegistry ──gate──► RiskEngine ──► PenaltyDistributor
/// ```
///
/// ## Guarantees
/// - No method throws; every failure is an `ErrorCode`
/// - A failed price request changes no price slot; its breaker records the
///   failure
/// - A manipulated price is returned with `is_valid == false` and trips the
///   breakers of every operation depending on the asset
/// - Read paths (`check_liquidation`, `check_origination`) gate on the
///   breaker but do not report outcomes; callers report the outcome of the
///   operation they actually performed through `record_operation_outcome`

#include "olend/circuit_breaker.hpp"
#include "olend/clock.hpp"
#include "olend/error.hpp"
#include "olend/events.hpp"
#include "olend/manipulation.hpp"
#include "olend/oracle.hpp"
#include "olend/penalty.hpp"
#include "olend/risk.hpp"
#include "olend/types.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace olend {

// ─── Collaborators ────────────────────────────────────────────────────────────

/// Source of raw quotes, e.g. an oracle network adapter.
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    /// Latest raw quote for the asset, or an error if none is available.
    [[nodiscard]] virtual Result<oracle::RawQuote> latest(AssetId asset) = 0;
};

/// Borrower tier lookup, owned by the account layer.
class TierProvider {
public:
    virtual ~TierProvider() = default;
    [[nodiscard]] virtual risk::BorrowerTier tier_of(std::string_view borrower) const = 0;
};

/// Fixed borrower → tier table with a fallback tier.
class StaticTierProvider final : public TierProvider {
public:
    explicit StaticTierProvider(risk::BorrowerTier fallback = risk::BorrowerTier::Basic)
        : fallback_(fallback) {}

    void set(std::string borrower, risk::BorrowerTier tier) {
        tiers_[std::move(borrower)] = tier;
    }

    [[nodiscard]] risk::BorrowerTier tier_of(std::string_view borrower) const override {
        auto it = tiers_.find(std::string(borrower));
        return it == tiers_.end() ? fallback_ : it->second;
    }

private:
    risk::BorrowerTier                                   fallback_;
    std::unordered_map<std::string, risk::BorrowerTier> tiers_;
};

// ─── AdminCap ─────────────────────────────────────────────────────────────────

/// Unforgeable administrative capability. Only `mint()` creates one; it can
/// be moved but not copied, and a RiskCore accepts only the cap it was
/// created with.
class AdminCap {
public:
    [[nodiscard]] static AdminCap mint();

    AdminCap(AdminCap&&) noexcept = default;
    AdminCap& operator=(AdminCap&&) noexcept = default;
    AdminCap(const AdminCap&) = delete;
    AdminCap& operator=(const AdminCap&) = delete;

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

private:
    explicit AdminCap(std::uint64_t id) noexcept : id_(id) {}

    std::uint64_t id_;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct RiskCoreConfig {
    manipulation::DetectorConfig       detector{};
    breaker::ThresholdConfig           default_threshold{};
    risk::CollateralPolicy             policy{};
    risk::PenaltyRateConfig            penalty_rates{};
    risk::MarketConditionFactors       market{};
    penalty::PenaltyDistributionConfig distribution{};
    std::size_t                        history_capacity = constants::PRICE_HISTORY_CAPACITY;

    [[nodiscard]] Status validate() const;
};

struct PositionRisk {
    BasisPoints    ltv_bps;
    risk::RiskTier tier;
};

// ─── RiskCore ─────────────────────────────────────────────────────────────────

class RiskCore {
    /// Only `create` can name this, so only `create` can construct a core.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// Build a core bound to `cap`. InvalidConfig if any part of `config`
    /// fails validation. The collaborators must outlive the core.
    [[nodiscard]] static Result<std::unique_ptr<RiskCore>>
    create(const AdminCap& cap, const RiskCoreConfig& config,
           Clock& clock, PriceFeed& feed, TierProvider& tiers, EventSink& events);

    RiskCore(ConstructionKey, const AdminCap& cap, const RiskCoreConfig& config,
             penalty::PenaltyDistributor distributor,
             Clock& clock, PriceFeed& feed, TierProvider& tiers, EventSink& events);

    RiskCore(const RiskCore&) = delete;
    RiskCore& operator=(const RiskCore&) = delete;

    // ── Prices ────────────────────────────────────────────────────────────────

    /// Fetch, validate and cache the asset's price. CircuitOpen when the
    /// asset's PriceQuery breaker is open.
    [[nodiscard]] Result<ValidatedPriceInfo> get_validated_price(AssetId asset);

    // ── Breakers ──────────────────────────────────────────────────────────────

    /// True when the operation is blocked.
    [[nodiscard]] bool is_operation_open(const breaker::OperationKey& key);

    [[nodiscard]] breaker::GateDecision gate(const breaker::OperationKey& key);

    void record_operation_outcome(const breaker::OperationKey& key, bool success,
                                  std::string_view reason = {});

    Status record_volume(const breaker::OperationKey& key, Amount amount);

    // ── Positions ─────────────────────────────────────────────────────────────

    [[nodiscard]] Result<PositionRisk> compute_position_ltv(const risk::BorrowPosition& position);

    [[nodiscard]] Result<risk::LtvBreakdown> position_breakdown(const risk::BorrowPosition& position);

    /// Gated by the protocol-wide Liquidate breaker.
    [[nodiscard]] Result<risk::LiquidationDecision>
    check_liquidation(const risk::BorrowPosition& position);

    /// Gated by the Borrow breaker of the borrowed asset.
    [[nodiscard]] Result<risk::LtvBreakdown>
    check_origination(const risk::BorrowPosition& position);

    [[nodiscard]] Result<risk::LiquidationPlan>
    plan_liquidation(const risk::BorrowPosition& position, Amount repay_value);

    [[nodiscard]] Result<penalty::PenaltySplit> distribute_penalty(Amount total);

    // ── Administration (each fails with Unauthorized on a foreign cap) ─────────

    Status set_feed(const AdminCap& cap, AssetId asset, const oracle::PriceFeedConfig& config);
    Status set_threshold(const AdminCap& cap, const breaker::OperationKey& key,
                         const breaker::ThresholdConfig& config);
    Status set_default_threshold(const AdminCap& cap, const breaker::ThresholdConfig& config);
    Status set_collateral_policy(const AdminCap& cap, const risk::CollateralPolicy& policy);
    Status set_distribution(const AdminCap& cap, const penalty::PenaltyDistributionConfig& config);
    Status set_market_conditions(const AdminCap& cap, const risk::MarketConditionFactors& factors);
    Status set_penalty_rates(const AdminCap& cap, const risk::PenaltyRateConfig& config);
    Status set_detector_config(const AdminCap& cap, const manipulation::DetectorConfig& config);
    Status set_global_emergency(const AdminCap& cap, bool active);
    Status force_open(const AdminCap& cap, const breaker::OperationKey& key);
    Status reset_breaker(const AdminCap& cap, const breaker::OperationKey& key);

    // ── Inspection ────────────────────────────────────────────────────────────

    [[nodiscard]] const oracle::PriceValidator& prices() const noexcept { return validator_; }
    [[nodiscard]] const breaker::CircuitBreakerRegistry& breakers() const noexcept { return breakers_; }
    [[nodiscard]] risk::CollateralPolicy collateral_policy() const;
    [[nodiscard]] penalty::PenaltyDistributionConfig distribution() const;
    [[nodiscard]] risk::MarketConditionFactors market_conditions() const;

private:
    [[nodiscard]] Status authorize(const AdminCap& cap, std::string_view action) const;

    void config_updated(std::string_view subject, std::string detail);

    /// Validated prices of every asset the position references.
    [[nodiscard]] Result<risk::PriceBook> price_book(const risk::BorrowPosition& position);

    [[nodiscard]] std::string symbol_of(AssetId asset) const;

    std::uint64_t                    admin_id_;
    Clock&                           clock_;
    PriceFeed&                       feed_;
    TierProvider&                    tiers_;
    EventSink&                       events_;

    oracle::PriceValidator           validator_;
    breaker::CircuitBreakerRegistry  breakers_;

    mutable std::shared_mutex        config_mutex_;   ///< Guards engine_ and distributor_
    risk::RiskEngine                 engine_;
    penalty::PenaltyDistributor      distributor_;
};

} // namespace olend
