/// @file src/core/risk_core.cpp
/// @brief RiskCore: wiring, capability checks and event reporting.

#include "olend/risk_core.hpp"
#include "olend/log.hpp"

#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <random>
#include <utility>

namespace olend {

using breaker::GateDecision;
using breaker::OperationKey;
using breaker::OperationType;

namespace {

const OperationKey LIQUIDATE_KEY{OperationType::Liquidate, std::nullopt};

} // anonymous namespace

// ─── AdminCap ─────────────────────────────────────────────────────────────────

AdminCap AdminCap::mint() {
    std::random_device device;
    std::mt19937_64 engine((static_cast<std::uint64_t>(device()) << 32) | device());
    std::uint64_t id = 0;
    while (id == 0) {
        id = engine();
    }
    return AdminCap(id);
}

// ─── RiskCoreConfig ───────────────────────────────────────────────────────────

Status RiskCoreConfig::validate() const {
    if (history_capacity == 0) {
        return ErrorCode::InvalidConfig;
    }
    for (const Status& part : {detector.validate(), default_threshold.validate(),
                               policy.validate(), penalty_rates.validate(),
                               market.validate(), distribution.validate()}) {
        if (!part) {
            return part.error();
        }
    }
    return ok();
}

// ─── Construction ─────────────────────────────────────────────────────────────

Result<std::unique_ptr<RiskCore>>
RiskCore::create(const AdminCap& cap, const RiskCoreConfig& config,
                 Clock& clock, PriceFeed& feed, TierProvider& tiers, EventSink& events) {
    auto valid = config.validate();
    if (!valid) {
        log::error("risk_core", "refusing to start: {}", to_string(valid.error()));
        return valid.error();
    }
    auto distributor = penalty::PenaltyDistributor::create(config.distribution);
    if (!distributor) {
        return distributor.error();
    }
    return std::make_unique<RiskCore>(ConstructionKey{}, cap, config, std::move(*distributor),
                                      clock, feed, tiers, events);
}

RiskCore::RiskCore(ConstructionKey, const AdminCap& cap, const RiskCoreConfig& config,
                   penalty::PenaltyDistributor distributor,
                   Clock& clock, PriceFeed& feed, TierProvider& tiers, EventSink& events)
    : admin_id_(cap.id())
    , clock_(clock)
    , feed_(feed)
    , tiers_(tiers)
    , events_(events)
    , validator_(events, config.detector, config.history_capacity)
    , breakers_(events, config.default_threshold)
    , engine_(config.policy, config.penalty_rates, config.market)
    , distributor_(std::move(distributor)) {}

// ─── Prices ───────────────────────────────────────────────────────────────────

Result<ValidatedPriceInfo> RiskCore::get_validated_price(AssetId asset) {
    const Timestamp now = clock_.now();
    const OperationKey key{OperationType::PriceQuery, asset};

    if (breakers_.gate(key, now) == GateDecision::CircuitOpen) {
        log::debug("risk_core", "price query for {} blocked by breaker", symbol_of(asset));
        return ErrorCode::CircuitOpen;
    }

    auto quote = feed_.latest(asset);
    if (!quote) {
        events_.emit(Event{EventKind::ValidationFailed, Severity::Warning, symbol_of(asset),
                           0, 0, now, to_string(quote.error())});
        breakers_.record_failure(key, now, to_string(quote.error()));
        return quote.error();
    }

    auto info = validator_.validate(asset, *quote, now);
    if (!info) {
        breakers_.record_failure(key, now, to_string(info.error()));
        return info.error();
    }

    if (info->manipulation_risk >= ManipulationRisk::High) {
        breakers_.report_manipulation(asset, info->manipulation_risk, now, symbol_of(asset));
    } else {
        breakers_.record_success(key, now);
    }
    return info;
}

Result<risk::PriceBook> RiskCore::price_book(const risk::BorrowPosition& position) {
    risk::PriceBook book;
    auto add = [&](AssetId asset) -> Status {
        if (book.count(asset) != 0) {
            return ok();
        }
        auto info = get_validated_price(asset);
        if (!info) {
            return info.error();
        }
        book.emplace(asset, *info);
        return ok();
    };

    for (const auto& [asset, amount] : position.collateral) {
        if (amount == 0) {
            continue;
        }
        auto added = add(asset);
        if (!added) {
            return added.error();
        }
    }
    if (position.borrowed_amount > 0) {
        auto added = add(position.borrowed_asset);
        if (!added) {
            return added.error();
        }
    }
    return book;
}

// ─── Breakers ─────────────────────────────────────────────────────────────────

bool RiskCore::is_operation_open(const OperationKey& key) {
    return breakers_.is_open(key, clock_.now());
}

GateDecision RiskCore::gate(const OperationKey& key) {
    return breakers_.gate(key, clock_.now());
}

void RiskCore::record_operation_outcome(const OperationKey& key, bool success,
                                        std::string_view reason) {
    const Timestamp now = clock_.now();
    if (success) {
        breakers_.record_success(key, now);
    } else {
        breakers_.record_failure(key, now, reason);
    }
}

Status RiskCore::record_volume(const OperationKey& key, Amount amount) {
    return breakers_.record_volume(key, amount, clock_.now());
}

// ─── Positions ────────────────────────────────────────────────────────────────

Result<risk::LtvBreakdown> RiskCore::position_breakdown(const risk::BorrowPosition& position) {
    auto book = price_book(position);
    if (!book) {
        return book.error();
    }
    std::shared_lock lock(config_mutex_);
    return engine_.compute_ltv(position, *book);
}

Result<PositionRisk> RiskCore::compute_position_ltv(const risk::BorrowPosition& position) {
    auto breakdown = position_breakdown(position);
    if (!breakdown) {
        return breakdown.error();
    }
    return PositionRisk{breakdown->ltv_bps, breakdown->tier};
}

Result<risk::LiquidationDecision>
RiskCore::check_liquidation(const risk::BorrowPosition& position) {
    if (gate(LIQUIDATE_KEY) == GateDecision::CircuitOpen) {
        return ErrorCode::CircuitOpen;
    }
    auto book = price_book(position);
    if (!book) {
        return book.error();
    }

    auto decision = [&] {
        std::shared_lock lock(config_mutex_);
        return engine_.check_liquidation(position, *book);
    }();
    if (!decision) {
        return decision.error();
    }

    const Timestamp now = clock_.now();
    const std::string subject = fmt::format("position#{}", position.id);
    switch (decision->action) {
        case risk::LiquidationAction::None:
            break;
        case risk::LiquidationAction::Warn:
            events_.emit(Event{EventKind::LiquidationWarning, Severity::Warning, subject,
                               0, decision->ltv_bps, now,
                               fmt::format("borrower={}", position.borrower)});
            break;
        case risk::LiquidationAction::Liquidatable:
            events_.emit(Event{EventKind::LiquidationTriggered, Severity::Critical, subject,
                               decision->ltv_bps, decision->penalty_rate_bps, now,
                               fmt::format("borrower={}", position.borrower)});
            log::info("risk_core", "{} liquidatable at {} bps, penalty {} bps",
                      subject, decision->ltv_bps, decision->penalty_rate_bps);
            break;
    }
    return decision;
}

Result<risk::LtvBreakdown>
RiskCore::check_origination(const risk::BorrowPosition& position) {
    if (gate(OperationKey{OperationType::Borrow, position.borrowed_asset}) ==
        GateDecision::CircuitOpen) {
        return ErrorCode::CircuitOpen;
    }
    auto book = price_book(position);
    if (!book) {
        return book.error();
    }

    const risk::BorrowerTier tier = tiers_.tier_of(position.borrower);
    auto breakdown = [&] {
        std::shared_lock lock(config_mutex_);
        return engine_.check_origination(position, *book, tier);
    }();
    if (!breakdown && breakdown.error() == ErrorCode::LtvExceeded) {
        events_.emit(Event{EventKind::OriginationRejected, Severity::Info,
                           fmt::format("position#{}", position.id),
                           0, 0, clock_.now(),
                           fmt::format("borrower={} tier={}", position.borrower,
                                       risk::to_string(tier))});
    }
    return breakdown;
}

Result<risk::LiquidationPlan>
RiskCore::plan_liquidation(const risk::BorrowPosition& position, Amount repay_value) {
    if (gate(LIQUIDATE_KEY) == GateDecision::CircuitOpen) {
        return ErrorCode::CircuitOpen;
    }
    auto book = price_book(position);
    if (!book) {
        return book.error();
    }
    std::shared_lock lock(config_mutex_);
    return engine_.plan_liquidation(position, *book, repay_value);
}

Result<penalty::PenaltySplit> RiskCore::distribute_penalty(Amount total) {
    auto split = [&] {
        std::shared_lock lock(config_mutex_);
        return distributor_.distribute(total);
    }();
    if (!split) {
        return split.error();
    }
    events_.emit(Event{EventKind::PenaltyDistributed, Severity::Info, "penalty",
                       total, split->liquidator, clock_.now(),
                       fmt::format("liquidator={} platform={} insurance={} protection={}",
                                   split->liquidator, split->platform,
                                   split->insurance, split->borrower_protection)});
    return split;
}

// ─── Administration ───────────────────────────────────────────────────────────

Status RiskCore::authorize(const AdminCap& cap, std::string_view action) const {
    if (cap.id() != admin_id_) {
        log::warn("risk_core", "unauthorized {} rejected", action);
        return ErrorCode::Unauthorized;
    }
    return ok();
}

void RiskCore::config_updated(std::string_view subject, std::string detail) {
    events_.emit(Event{EventKind::ConfigUpdated, Severity::Info, std::string(subject),
                       0, 0, clock_.now(), std::move(detail)});
}

Status RiskCore::set_feed(const AdminCap& cap, AssetId asset,
                          const oracle::PriceFeedConfig& config) {
    auto allowed = authorize(cap, "set_feed");
    if (!allowed) {
        return allowed;
    }
    auto applied = validator_.set_feed(asset, config);
    if (!applied) {
        return applied;
    }
    config_updated(config.symbol,
                   fmt::format("feed {} exponent={} heartbeat={}ms deviation={}bps confidence={}bps",
                               config.feed_id, config.exponent, config.heartbeat_ms,
                               config.max_deviation_bps, config.min_confidence_bps));
    return ok();
}

Status RiskCore::set_threshold(const AdminCap& cap, const OperationKey& key,
                               const breaker::ThresholdConfig& config) {
    auto allowed = authorize(cap, "set_threshold");
    if (!allowed) {
        return allowed;
    }
    auto applied = breakers_.set_threshold(key, config);
    if (!applied) {
        return applied;
    }
    config_updated(key.to_string(),
                   fmt::format("threshold failures={} window={}ms recovery={}ms volume={}",
                               config.failure_threshold, config.time_window_ms,
                               config.recovery_timeout_ms, config.volume_threshold));
    return ok();
}

Status RiskCore::set_default_threshold(const AdminCap& cap, const breaker::ThresholdConfig& config) {
    auto allowed = authorize(cap, "set_default_threshold");
    if (!allowed) {
        return allowed;
    }
    auto applied = breakers_.set_default_threshold(config);
    if (!applied) {
        return applied;
    }
    config_updated("breaker_defaults",
                   fmt::format("failures={} window={}ms recovery={}ms",
                               config.failure_threshold, config.time_window_ms,
                               config.recovery_timeout_ms));
    return ok();
}

Status RiskCore::set_collateral_policy(const AdminCap& cap, const risk::CollateralPolicy& policy) {
    auto allowed = authorize(cap, "set_collateral_policy");
    if (!allowed) {
        return allowed;
    }
    {
        std::unique_lock lock(config_mutex_);
        auto applied = engine_.set_policy(policy);
        if (!applied) {
            return applied;
        }
    }
    config_updated("collateral_policy",
                   fmt::format("hard_cap={}bps assets={}", policy.global_hard_cap_bps,
                               policy.assets.size()));
    return ok();
}

Status RiskCore::set_distribution(const AdminCap& cap,
                                  const penalty::PenaltyDistributionConfig& config) {
    auto allowed = authorize(cap, "set_distribution");
    if (!allowed) {
        return allowed;
    }
    {
        std::unique_lock lock(config_mutex_);
        auto applied = distributor_.set_config(config);
        if (!applied) {
            return applied;
        }
    }
    config_updated("penalty_distribution",
                   fmt::format("liquidator={} platform={} insurance={} protection={}",
                               config.liquidator_share_bps, config.platform_share_bps,
                               config.insurance_share_bps, config.borrower_protection_bps()));
    return ok();
}

Status RiskCore::set_market_conditions(const AdminCap& cap,
                                       const risk::MarketConditionFactors& factors) {
    auto allowed = authorize(cap, "set_market_conditions");
    if (!allowed) {
        return allowed;
    }
    {
        std::unique_lock lock(config_mutex_);
        auto applied = engine_.set_market_conditions(factors);
        if (!applied) {
            return applied;
        }
    }
    config_updated("market_conditions",
                   fmt::format("volatility={} liquidity={} stability={}",
                               factors.volatility_level, factors.liquidity_factor,
                               factors.price_stability));
    return ok();
}

Status RiskCore::set_penalty_rates(const AdminCap& cap, const risk::PenaltyRateConfig& config) {
    auto allowed = authorize(cap, "set_penalty_rates");
    if (!allowed) {
        return allowed;
    }
    {
        std::unique_lock lock(config_mutex_);
        auto applied = engine_.set_penalty_config(config);
        if (!applied) {
            return applied;
        }
    }
    config_updated("penalty_rates",
                   fmt::format("base={} min={} max={}", config.base_rate_bps,
                               config.min_penalty_rate_bps, config.max_penalty_rate_bps));
    return ok();
}

Status RiskCore::set_detector_config(const AdminCap& cap, const manipulation::DetectorConfig& config) {
    auto allowed = authorize(cap, "set_detector_config");
    if (!allowed) {
        return allowed;
    }
    auto applied = validator_.set_detector_config(config);
    if (!applied) {
        return applied;
    }
    config_updated("detector",
                   fmt::format("drift={}x{}bps mismatch={}x{}bps oscillation={}ms/{}bps",
                               config.drift_window, config.drift_threshold_bps,
                               config.mismatch_window, config.mismatch_move_bps,
                               config.oscillation_window_ms, config.oscillation_min_rise_bps));
    return ok();
}

Status RiskCore::set_global_emergency(const AdminCap& cap, bool active) {
    auto allowed = authorize(cap, "set_global_emergency");
    if (!allowed) {
        return allowed;
    }
    breakers_.set_global_emergency(active, clock_.now());
    return ok();
}

Status RiskCore::force_open(const AdminCap& cap, const OperationKey& key) {
    auto allowed = authorize(cap, "force_open");
    if (!allowed) {
        return allowed;
    }
    breakers_.force_open(key, clock_.now());
    return ok();
}

Status RiskCore::reset_breaker(const AdminCap& cap, const OperationKey& key) {
    auto allowed = authorize(cap, "reset_breaker");
    if (!allowed) {
        return allowed;
    }
    breakers_.reset(key, clock_.now());
    return ok();
}

// ─── Inspection ───────────────────────────────────────────────────────────────

risk::CollateralPolicy RiskCore::collateral_policy() const {
    std::shared_lock lock(config_mutex_);
    return engine_.policy();
}

penalty::PenaltyDistributionConfig RiskCore::distribution() const {
    std::shared_lock lock(config_mutex_);
    return distributor_.config();
}

risk::MarketConditionFactors RiskCore::market_conditions() const {
    std::shared_lock lock(config_mutex_);
    return engine_.market_conditions();
}

std::string RiskCore::symbol_of(AssetId asset) const {
    if (auto feed = validator_.feed(asset)) {
        return feed->symbol;
    }
    return fmt::format("asset#{:016x}", asset.fingerprint);
}

} // namespace olend
