/// @file src/oracle/price_validator.cpp
/// @brief PriceValidator: staged validation and per-asset slot bookkeeping.
///
/// Events raised while a slot is locked are collected and emitted once the
/// slot and table locks are released.

#include "olend/oracle.hpp"
#include "olend/log.hpp"
#include "olend/safe_math.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace olend::oracle {

namespace {

[[nodiscard]] std::string subject_of(AssetId asset) {
    return fmt::format("asset#{:016x}", asset.fingerprint);
}

[[nodiscard]] Event unknown_asset_event(AssetId asset, Timestamp now) {
    return Event{EventKind::ValidationFailed, Severity::Warning, subject_of(asset), 0, 0, now,
                 to_string(ErrorCode::UnknownAsset)};
}

} // anonymous namespace

// ─── PriceFeedConfig ──────────────────────────────────────────────────────────

Status PriceFeedConfig::validate() const {
    if (symbol.empty()) {
        return ErrorCode::InvalidConfig;
    }
    if (exponent < -constants::MAX_FEED_EXPONENT || exponent > constants::MAX_FEED_EXPONENT) {
        return ErrorCode::InvalidConfig;
    }
    if (heartbeat_ms == 0) {
        return ErrorCode::InvalidConfig;
    }
    if (max_deviation_bps == 0 || max_deviation_bps > constants::BPS_DENOMINATOR) {
        return ErrorCode::InvalidConfig;
    }
    if (min_confidence_bps > constants::BPS_DENOMINATOR) {
        return ErrorCode::InvalidConfig;
    }
    return ok();
}

// ─── Construction / configuration ─────────────────────────────────────────────

PriceValidator::PriceValidator(EventSink& events,
                               manipulation::DetectorConfig detector,
                               std::size_t history_capacity)
    : events_(events)
    , history_capacity_(history_capacity)
    , detector_(detector) {}

Status PriceValidator::set_feed(AssetId asset, const PriceFeedConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }

    std::unique_lock table(table_mutex_);
    auto it = slots_.find(asset);
    if (it == slots_.end()) {
        slots_.emplace(asset, std::make_unique<Slot>(config, history_capacity_));
        return ok();
    }
    std::lock_guard slot_lock(it->second->mutex);
    it->second->config = config;
    return ok();
}

std::optional<PriceFeedConfig> PriceValidator::feed(AssetId asset) const {
    std::shared_lock table(table_mutex_);
    Slot* slot = find_slot(asset);
    if (slot == nullptr) {
        return std::nullopt;
    }
    std::lock_guard slot_lock(slot->mutex);
    return slot->config;
}

std::vector<AssetId> PriceValidator::assets() const {
    std::shared_lock table(table_mutex_);
    std::vector<AssetId> out;
    out.reserve(slots_.size());
    for (const auto& [asset, slot] : slots_) {
        out.push_back(asset);
    }
    return out;
}

manipulation::DetectorConfig PriceValidator::detector_config() const {
    std::shared_lock table(table_mutex_);
    return detector_.config();
}

Status PriceValidator::set_detector_config(const manipulation::DetectorConfig& config) {
    std::unique_lock table(table_mutex_);
    return detector_.set_config(config);
}

PriceValidator::Slot* PriceValidator::find_slot(AssetId asset) const {
    auto it = slots_.find(asset);
    return it == slots_.end() ? nullptr : it->second.get();
}

// ─── normalize ────────────────────────────────────────────────────────────────

Result<Price> PriceValidator::normalize(std::uint64_t raw, std::int32_t exponent) noexcept {
    if (exponent < -constants::MAX_FEED_EXPONENT || exponent > constants::MAX_FEED_EXPONENT) {
        return ErrorCode::InvalidPrice;
    }
    const int shift = exponent + constants::PRICE_DECIMALS;
    if (shift >= 0) {
        auto scale = math::safe_pow10(static_cast<unsigned>(shift));
        if (!scale) {
            return scale.error();
        }
        return math::safe_mul(raw, *scale);
    }
    auto scale = math::safe_pow10(static_cast<unsigned>(-shift));
    if (!scale) {
        // 10^20 and above exceed any 64-bit raw value.
        return Price{0};
    }
    return math::safe_mul_div(raw, 1, *scale);
}

// ─── validate ─────────────────────────────────────────────────────────────────

Result<ValidatedPriceInfo>
PriceValidator::validate(AssetId asset, std::int64_t raw_price, std::uint64_t confidence,
                         Timestamp observed_at, Timestamp now) {
    std::optional<std::int32_t> exponent;
    {
        std::shared_lock table(table_mutex_);
        if (Slot* slot = find_slot(asset)) {
            std::lock_guard slot_lock(slot->mutex);
            exponent = slot->config.exponent;
        }
    }
    if (!exponent) {
        events_.emit(unknown_asset_event(asset, now));
        return ErrorCode::UnknownAsset;
    }
    return validate(asset, RawQuote{raw_price, confidence, *exponent, observed_at}, now);
}

Result<ValidatedPriceInfo>
PriceValidator::validate(AssetId asset, const RawQuote& quote, Timestamp now) {
    std::vector<Event> pending;
    Result<ValidatedPriceInfo> result = ErrorCode::UnknownAsset;
    {
        std::shared_lock table(table_mutex_);
        Slot* slot = find_slot(asset);
        if (slot == nullptr) {
            pending.push_back(unknown_asset_event(asset, now));
        } else {
            std::lock_guard slot_lock(slot->mutex);
            result = validate_locked(*slot, quote, now, pending);
            if (!result) {
                report_failure(*slot, quote, now, result.error(), pending);
            }
        }
    }
    for (const Event& event : pending) {
        events_.emit(event);
    }
    return result;
}

Result<ValidatedPriceInfo>
PriceValidator::validate_locked(Slot& slot, const RawQuote& quote, Timestamp now,
                                std::vector<Event>& pending) {
    const PriceFeedConfig& config = slot.config;
    if (!config.enabled) {
        return ErrorCode::UnknownAsset;
    }

    // ── Staleness ─────────────────────────────────────────────────────────────
    if (quote.observed_at > now) {
        return ErrorCode::InvalidPrice;
    }
    const Timestamp age = now - quote.observed_at;
    if (age > config.heartbeat_ms) {
        return ErrorCode::StalePrice;
    }

    // ── Normalization ─────────────────────────────────────────────────────────
    if (quote.price <= 0) {
        return ErrorCode::InvalidPrice;
    }
    auto price = normalize(static_cast<std::uint64_t>(quote.price), quote.exponent);
    if (!price) {
        return price.error();
    }
    if (*price == 0) {
        return ErrorCode::InvalidPrice;
    }
    auto confidence = normalize(quote.confidence, quote.exponent);
    if (!confidence) {
        return confidence.error();
    }

    // ── Confidence: conf · 10 000 ≤ max_ratio · price, exact in 128 bits ──────
    const Wide lhs = static_cast<Wide>(*confidence) * constants::BPS_DENOMINATOR;
    const Wide rhs = static_cast<Wide>(config.max_confidence_ratio_bps()) * *price;
    if (lhs > rhs) {
        return ErrorCode::LowConfidence;
    }

    const PricePoint point{*price, *confidence, quote.observed_at};

    // Re-delivery of the quote already at the head of the history.
    const auto latest = slot.history.latest();
    if (slot.cache && latest && *latest == point) {
        return *slot.cache;
    }
    if (latest && point.timestamp < latest->timestamp) {
        return ErrorCode::StalePrice;
    }

    // ── Manipulation scoring against the pre-append history ───────────────────
    auto assessment = detector_.assess(slot.history, point, config.max_deviation_bps);
    if (!assessment) {
        return assessment.error();
    }

    const ValidatedPriceInfo info{
        .price             = point.price,
        .confidence        = point.confidence,
        .timestamp         = point.timestamp,
        .validation_score  = score(config, age, point, assessment->risk_level),
        .manipulation_risk = assessment->risk_level,
        .is_valid          = !assessment->is_manipulation,
    };

    // ── Commit ────────────────────────────────────────────────────────────────
    auto pushed = slot.history.push(point);
    if (!pushed) {
        return pushed.error();
    }
    slot.cache = info;

    if (assessment->risk_level != ManipulationRisk::None) {
        pending.push_back(Event{
            EventKind::ManipulationFlagged,
            assessment->is_manipulation ? Severity::Critical : Severity::Warning,
            config.symbol,
            latest ? latest->price : 0,
            point.price,
            now,
            fmt::format("risk={} checks={} step_bps={}",
                        to_string(assessment->risk_level),
                        assessment->describe(),
                        assessment->step_change_bps)});
    }
    return info;
}

void PriceValidator::report_failure(const Slot& slot, const RawQuote& quote,
                                    Timestamp now, ErrorCode reason,
                                    std::vector<Event>& pending) {
    const auto latest = slot.history.latest();
    pending.push_back(Event{
        EventKind::ValidationFailed,
        Severity::Warning,
        slot.config.symbol,
        latest ? latest->price : 0,
        quote.price > 0 ? static_cast<std::uint64_t>(quote.price) : 0,
        now,
        to_string(reason)});
    log::debug("price_validator", "{} rejected: {} (observed_at={}, now={})",
               slot.config.symbol, to_string(reason), quote.observed_at, now);
}

// ─── Accessors ────────────────────────────────────────────────────────────────

std::optional<ValidatedPriceInfo> PriceValidator::cached(AssetId asset) const {
    std::shared_lock table(table_mutex_);
    Slot* slot = find_slot(asset);
    if (slot == nullptr) {
        return std::nullopt;
    }
    std::lock_guard slot_lock(slot->mutex);
    return slot->cache;
}

std::vector<PricePoint> PriceValidator::history(AssetId asset) const {
    std::shared_lock table(table_mutex_);
    Slot* slot = find_slot(asset);
    if (slot == nullptr) {
        return {};
    }
    std::lock_guard slot_lock(slot->mutex);
    const auto& points = slot->history.points();
    return {points.begin(), points.end()};
}

// ─── score ────────────────────────────────────────────────────────────────────

std::uint8_t PriceValidator::score(const PriceFeedConfig& config,
                                   Timestamp age,
                                   const PricePoint& point,
                                   ManipulationRisk risk) noexcept {
    const auto risk_penalty = static_cast<std::uint64_t>(risk) *
                              constants::SCORE_PENALTY_PER_RISK_LEVEL;

    const std::uint64_t freshness_penalty = std::min<std::uint64_t>(
        constants::SCORE_PENALTY_FRESHNESS_MAX,
        static_cast<std::uint64_t>(static_cast<Wide>(age) *
                                   constants::SCORE_PENALTY_FRESHNESS_MAX /
                                   config.heartbeat_ms));

    std::uint64_t confidence_penalty = 0;
    const BasisPoints max_ratio = config.max_confidence_ratio_bps();
    if (max_ratio > 0 && point.price > 0) {
        // conf·10 000·10 / (price · max_ratio), in 128 bits.
        const Wide num = static_cast<Wide>(point.confidence) * constants::BPS_DENOMINATOR *
                         constants::SCORE_PENALTY_CONFIDENCE_MAX;
        const Wide den = static_cast<Wide>(point.price) * max_ratio;
        confidence_penalty = std::min<std::uint64_t>(
            constants::SCORE_PENALTY_CONFIDENCE_MAX, static_cast<std::uint64_t>(num / den));
    }

    const std::uint64_t total = risk_penalty + freshness_penalty + confidence_penalty;
    return total >= 100 ? 0 : static_cast<std::uint8_t>(100 - total);
}

} // namespace olend::oracle
