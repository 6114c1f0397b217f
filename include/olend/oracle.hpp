#pragma once

/// @file include/olend/oracle.hpp
/// @brief PriceValidator: staleness and confidence checks per asset.
///
/// # Module: Price Validator
///
/// ## Responsibility
/// Turn a raw upstream quote into a ValidatedPriceInfo, or reject it with a
/// typed reason. Owns, per configured asset: the feed configuration, the
/// bounded price history and the single cached ValidatedPriceInfo.
///
/// ## Pipeline (in order)
/// 1. Asset must be configured and enabled         → UnknownAsset
/// 2. observed_at ≤ now                             → InvalidPrice
/// 3. now − observed_at ≤ heartbeat                 → StalePrice
/// 4. raw price > 0, normalized to 8 decimals       → InvalidPrice / ArithmeticOverflow
/// 5. confidence / price ≤ (10 000 − min_confidence_bps) / 10 000 → LowConfidence
/// 6. not older than the newest history point       → StalePrice
/// 7. ManipulationDetector scores the point against the history
/// 8. point appended (oldest evicted), cache slot replaced
///
/// Steps 1–7 run on a staged copy: a failing quote leaves history and
/// cache untouched.
///
/// ## Validation Score
///   score = 100 − 25·risk_level − ⌊10·age/heartbeat⌋ − ⌊10·conf_ratio/max_conf_ratio⌋
/// floored at 0.
///
/// ## Thread Safety
/// Each asset slot has its own mutex; validations of different assets run
/// concurrently. Feed configuration changes take the table lock exclusively.
/// Events are emitted after the slot and table locks are released.

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/events.hpp"
#include "olend/manipulation.hpp"
#include "olend/price.hpp"
#include "olend/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace olend::oracle {

// ─── PriceFeedConfig ──────────────────────────────────────────────────────────

struct PriceFeedConfig {
    std::string  symbol;                  ///< Display name, e.g. "BTC"
    std::string  feed_id;                 ///< Upstream feed identifier
    std::int32_t exponent           = -constants::PRICE_DECIMALS;
    Timestamp    heartbeat_ms       = constants::DEFAULT_HEARTBEAT_MS;  ///< Max price delay
    BasisPoints  max_deviation_bps  = constants::DEFAULT_MAX_DEVIATION_BPS;
    BasisPoints  min_confidence_bps = constants::DEFAULT_MIN_CONFIDENCE_BPS;
    bool         enabled            = true;

    /// Largest confidence/price ratio accepted, in bps.
    [[nodiscard]] BasisPoints max_confidence_ratio_bps() const noexcept {
        return constants::BPS_DENOMINATOR - min_confidence_bps;
    }

    /// Exponent in [−18, 18], heartbeat > 0, deviation in (0, 10 000],
    /// min confidence in [0, 10 000], non-empty symbol.
    [[nodiscard]] Status validate() const;
};

// ─── RawQuote ─────────────────────────────────────────────────────────────────

/// One upstream observation: value = price · 10^exponent.
struct RawQuote {
    std::int64_t  price;
    std::uint64_t confidence;
    std::int32_t  exponent;
    Timestamp     observed_at;
};

// ─── PriceValidator ───────────────────────────────────────────────────────────

class PriceValidator {
public:
    PriceValidator(EventSink& events,
                   manipulation::DetectorConfig detector = manipulation::DetectorConfig{},
                   std::size_t history_capacity = constants::PRICE_HISTORY_CAPACITY);

    PriceValidator(const PriceValidator&) = delete;
    PriceValidator& operator=(const PriceValidator&) = delete;

    /// Add or replace an asset's feed configuration. History and cache are
    /// kept when an existing feed is updated.
    Status set_feed(AssetId asset, const PriceFeedConfig& config);

    [[nodiscard]] std::optional<PriceFeedConfig> feed(AssetId asset) const;

    [[nodiscard]] std::vector<AssetId> assets() const;

    /// Validate a quote expressed with its own exponent.
    [[nodiscard]] Result<ValidatedPriceInfo>
    validate(AssetId asset, const RawQuote& quote, Timestamp now);

    /// Validate a quote expressed with the feed's configured exponent.
    [[nodiscard]] Result<ValidatedPriceInfo>
    validate(AssetId asset, std::int64_t raw_price, std::uint64_t confidence,
             Timestamp observed_at, Timestamp now);

    /// Latest validated record for the asset, if any.
    [[nodiscard]] std::optional<ValidatedPriceInfo> cached(AssetId asset) const;

    /// Copy of the asset's history, oldest first.
    [[nodiscard]] std::vector<PricePoint> history(AssetId asset) const;

    /// Scale a raw value with the given exponent to PRICE_DECIMALS decimals.
    [[nodiscard]] static Result<Price> normalize(std::uint64_t raw, std::int32_t exponent) noexcept;

    [[nodiscard]] manipulation::DetectorConfig detector_config() const;

    Status set_detector_config(const manipulation::DetectorConfig& config);

private:
    struct Slot {
        PriceFeedConfig                   config;
        PriceHistory                      history;
        std::optional<ValidatedPriceInfo> cache;
        std::mutex                        mutex;

        Slot(PriceFeedConfig cfg, std::size_t capacity)
            : config(std::move(cfg)), history(capacity) {}
    };

    [[nodiscard]] Slot* find_slot(AssetId asset) const;

    /// Runs with the slot locked; events are staged in `pending`.
    [[nodiscard]] Result<ValidatedPriceInfo>
    validate_locked(Slot& slot, const RawQuote& quote, Timestamp now,
                    std::vector<Event>& pending);

    void report_failure(const Slot& slot, const RawQuote& quote,
                        Timestamp now, ErrorCode reason, std::vector<Event>& pending);

    [[nodiscard]] static std::uint8_t score(const PriceFeedConfig& config,
                                            Timestamp age,
                                            const PricePoint& point,
                                            ManipulationRisk risk) noexcept;

    EventSink&                          events_;
    std::size_t                         history_capacity_;
    manipulation::ManipulationDetector  detector_;
    mutable std::shared_mutex           table_mutex_;
    std::unordered_map<AssetId, std::unique_ptr<Slot>, AssetIdHash> slots_;
};

} // namespace olend::oracle
