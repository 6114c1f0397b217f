/// @file src/breaker/circuit_breaker_registry.cpp
/// @brief CircuitBreakerRegistry: rolling-window failure and volume trips.
///
/// A failure or volume sample is inside the window while
/// now − sample_time < time_window.
///
/// Transition events are staged while the entry mutex is held and handed
/// to the sink only after it is released.

#include "olend/circuit_breaker.hpp"
#include "olend/log.hpp"
#include "olend/safe_math.hpp"

#include <fmt/format.h>

namespace olend::breaker {

// ─── Names and hashing ────────────────────────────────────────────────────────

const char* to_string(OperationType op) noexcept {
    switch (op) {
        case OperationType::PriceQuery: return "price_query";
        case OperationType::Borrow:     return "borrow";
        case OperationType::Repay:      return "repay";
        case OperationType::Deposit:    return "deposit";
        case OperationType::Withdraw:   return "withdraw";
        case OperationType::Liquidate:  return "liquidate";
    }
    return "unknown";
}

const char* to_string(BreakerPhase phase) noexcept {
    switch (phase) {
        case BreakerPhase::Closed:   return "closed";
        case BreakerPhase::Open:     return "open";
        case BreakerPhase::HalfOpen: return "half_open";
    }
    return "unknown";
}

std::string OperationKey::to_string() const {
    if (!asset) {
        return breaker::to_string(operation);
    }
    return fmt::format("{}/asset#{:016x}", breaker::to_string(operation), asset->fingerprint);
}

std::size_t OperationKeyHash::operator()(const OperationKey& key) const noexcept {
    std::uint64_t h = static_cast<std::uint64_t>(key.operation) + 1;
    if (key.asset) {
        h ^= key.asset->fingerprint + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return static_cast<std::size_t>(h);
}

// ─── ThresholdConfig ──────────────────────────────────────────────────────────

Status ThresholdConfig::validate() const {
    if (failure_threshold == 0 || failure_threshold > constants::MAX_FAILURE_THRESHOLD) {
        return ErrorCode::InvalidConfig;
    }
    if (time_window_ms == 0 || time_window_ms > constants::MAX_BREAKER_PERIOD_MS) {
        return ErrorCode::InvalidConfig;
    }
    if (recovery_timeout_ms == 0 || recovery_timeout_ms > constants::MAX_BREAKER_PERIOD_MS) {
        return ErrorCode::InvalidConfig;
    }
    return ok();
}

// ─── Construction / configuration ─────────────────────────────────────────────

CircuitBreakerRegistry::CircuitBreakerRegistry(EventSink& events, ThresholdConfig defaults)
    : events_(events)
    , defaults_(defaults) {}

Status CircuitBreakerRegistry::set_threshold(const OperationKey& key,
                                             const ThresholdConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }
    Entry& e = entry(key);
    std::lock_guard lock(e.mutex);
    e.override_config = config;
    return ok();
}

Status CircuitBreakerRegistry::set_default_threshold(const ThresholdConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }
    std::lock_guard lock(defaults_mutex_);
    defaults_ = config;
    return ok();
}

ThresholdConfig CircuitBreakerRegistry::threshold(const OperationKey& key) const {
    {
        std::shared_lock table(table_mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            std::lock_guard lock(it->second->mutex);
            return config_of(*it->second);
        }
    }
    std::lock_guard lock(defaults_mutex_);
    return defaults_;
}

CircuitBreakerRegistry::Entry& CircuitBreakerRegistry::entry(const OperationKey& key) {
    {
        std::shared_lock table(table_mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return *it->second;
        }
    }
    std::unique_lock table(table_mutex_);
    auto [it, inserted] = entries_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_unique<Entry>();
    }
    return *it->second;
}

ThresholdConfig CircuitBreakerRegistry::config_of(const Entry& e) const {
    if (e.override_config) {
        return *e.override_config;
    }
    std::lock_guard lock(defaults_mutex_);
    return defaults_;
}

// ─── Window maintenance and transitions ───────────────────────────────────────

void CircuitBreakerRegistry::prune(Entry& e, const ThresholdConfig& config, Timestamp now) {
    const auto expired = [&](Timestamp t) { return now - t >= config.time_window_ms; };

    while (!e.failures.empty() && expired(e.failures.front())) {
        e.failures.pop_front();
    }
    while (!e.volume.empty() && expired(e.volume.front().first)) {
        e.state.window_volume -= e.volume.front().second;
        e.volume.pop_front();
    }
    e.state.failure_count = static_cast<std::uint32_t>(e.failures.size());
}

void CircuitBreakerRegistry::refresh(Entry& e, const OperationKey& key,
                                     const ThresholdConfig& config, Timestamp now,
                                     std::vector<Event>& pending) {
    prune(e, config, now);
    if (e.state.phase == BreakerPhase::Open &&
        now - e.state.phase_change_time >= config.recovery_timeout_ms) {
        transition(e, key, BreakerPhase::HalfOpen, now, "recovery timeout elapsed", pending);
    }
}

void CircuitBreakerRegistry::transition(Entry& e, const OperationKey& key, BreakerPhase to,
                                        Timestamp now, std::string_view reason,
                                        std::vector<Event>& pending) {
    const BreakerPhase from = e.state.phase;
    e.state.phase = to;
    e.state.phase_change_time = now;
    if (to == BreakerPhase::Open) {
        ++e.state.trip_count;
    }
    if (to == BreakerPhase::Closed) {
        e.failures.clear();
        e.volume.clear();
        e.state.failure_count = 0;
        e.state.window_volume = 0;
    }

    const Severity severity = to == BreakerPhase::Open   ? Severity::Critical
                            : to == BreakerPhase::Closed ? Severity::Info
                                                         : Severity::Warning;
    pending.push_back(Event{EventKind::BreakerTransition, severity, key.to_string(),
                            static_cast<std::uint64_t>(from), static_cast<std::uint64_t>(to),
                            now,
                            fmt::format("{} -> {}: {}", to_string(from), to_string(to), reason)});
}

void CircuitBreakerRegistry::publish(const std::vector<Event>& pending) {
    for (const Event& event : pending) {
        events_.emit(event);
    }
}

// ─── Gating ───────────────────────────────────────────────────────────────────

GateDecision CircuitBreakerRegistry::gate(const OperationKey& key, Timestamp now) {
    std::vector<Event> pending;
    BreakerPhase phase = BreakerPhase::Open;
    {
        Entry& e = entry(key);
        std::lock_guard lock(e.mutex);
        refresh(e, key, config_of(e), now, pending);
        phase = e.state.phase;
    }
    publish(pending);

    if (global_emergency()) {
        return GateDecision::CircuitOpen;
    }
    switch (phase) {
        case BreakerPhase::Closed:   return GateDecision::Allowed;
        case BreakerPhase::HalfOpen: return GateDecision::Probe;
        case BreakerPhase::Open:     return GateDecision::CircuitOpen;
    }
    return GateDecision::CircuitOpen;
}

bool CircuitBreakerRegistry::is_open(const OperationKey& key, Timestamp now) {
    return gate(key, now) == GateDecision::CircuitOpen;
}

// ─── Outcome reporting ────────────────────────────────────────────────────────

void CircuitBreakerRegistry::record_success(const OperationKey& key, Timestamp now) {
    std::vector<Event> pending;
    {
        Entry& e = entry(key);
        std::lock_guard lock(e.mutex);
        refresh(e, key, config_of(e), now, pending);

        e.state.last_success_time = now;
        if (e.state.phase == BreakerPhase::HalfOpen) {
            transition(e, key, BreakerPhase::Closed, now, "probe succeeded", pending);
        }
    }
    publish(pending);
}

void CircuitBreakerRegistry::record_failure(const OperationKey& key, Timestamp now,
                                            std::string_view reason) {
    std::vector<Event> pending;
    {
        Entry& e = entry(key);
        std::lock_guard lock(e.mutex);
        const ThresholdConfig config = config_of(e);
        refresh(e, key, config, now, pending);

        e.state.last_failure_time = now;
        switch (e.state.phase) {
            case BreakerPhase::HalfOpen:
                transition(e, key, BreakerPhase::Open, now,
                           fmt::format("probe failed ({})", reason), pending);
                break;
            case BreakerPhase::Closed:
                e.failures.push_back(now);
                e.state.failure_count = static_cast<std::uint32_t>(e.failures.size());
                if (e.state.failure_count > config.failure_threshold) {
                    transition(e, key, BreakerPhase::Open, now,
                               fmt::format("{} failures in window ({})",
                                           e.state.failure_count, reason),
                               pending);
                }
                break;
            case BreakerPhase::Open:
                break;
        }
    }
    publish(pending);
}

Status CircuitBreakerRegistry::record_volume(const OperationKey& key, Amount amount,
                                             Timestamp now) {
    std::vector<Event> pending;
    Status status = ok();
    {
        Entry& e = entry(key);
        std::lock_guard lock(e.mutex);
        const ThresholdConfig config = config_of(e);
        refresh(e, key, config, now, pending);

        auto total = math::safe_add(e.state.window_volume, amount);
        if (!total) {
            status = total.error();
        } else {
            e.volume.emplace_back(now, amount);
            e.state.window_volume = *total;

            if (config.volume_threshold > 0 && e.state.window_volume > config.volume_threshold &&
                e.state.phase != BreakerPhase::Open) {
                transition(e, key, BreakerPhase::Open, now,
                           fmt::format("volume {} over threshold {}",
                                       e.state.window_volume, config.volume_threshold),
                           pending);
            }
        }
    }
    publish(pending);
    return status;
}

void CircuitBreakerRegistry::report_manipulation(AssetId asset, ManipulationRisk risk,
                                                 Timestamp now, std::string_view symbol) {
    if (risk < ManipulationRisk::High) {
        return;
    }
    (void)entry(OperationKey{OperationType::PriceQuery, asset});

    std::vector<std::pair<OperationKey, Entry*>> dependents;
    {
        std::shared_lock table(table_mutex_);
        for (const auto& [key, e] : entries_) {
            if (key.asset == asset) {
                dependents.emplace_back(key, e.get());
            }
        }
    }

    const std::string reason = fmt::format("manipulation risk {} on {}", to_string(risk), symbol);
    std::vector<Event> pending;
    for (auto& [key, e] : dependents) {
        std::lock_guard lock(e->mutex);
        refresh(*e, key, config_of(*e), now, pending);
        if (e->state.phase != BreakerPhase::Open) {
            transition(*e, key, BreakerPhase::Open, now, reason, pending);
        } else {
            // Already open: restart the recovery timer.
            e->state.phase_change_time = now;
        }
    }
    publish(pending);
}

// ─── Administrative overrides ─────────────────────────────────────────────────

void CircuitBreakerRegistry::force_open(const OperationKey& key, Timestamp now) {
    std::vector<Event> pending;
    {
        Entry& e = entry(key);
        std::lock_guard lock(e.mutex);
        if (e.state.phase == BreakerPhase::Open) {
            e.state.phase_change_time = now;
        } else {
            transition(e, key, BreakerPhase::Open, now, "forced open by admin", pending);
        }
    }
    publish(pending);
}

void CircuitBreakerRegistry::reset(const OperationKey& key, Timestamp now) {
    std::vector<Event> pending;
    {
        Entry& e = entry(key);
        std::lock_guard lock(e.mutex);
        transition(e, key, BreakerPhase::Closed, now, "reset by admin", pending);
    }
    publish(pending);
}

void CircuitBreakerRegistry::set_global_emergency(bool active, Timestamp now) {
    const bool before = global_emergency_.exchange(active, std::memory_order_acq_rel);
    if (before == active) {
        return;
    }
    events_.emit(Event{EventKind::GlobalEmergency,
                       active ? Severity::Critical : Severity::Info,
                       "global", before ? 1u : 0u, active ? 1u : 0u, now,
                       active ? "global emergency raised" : "global emergency cleared"});
    log::warn("circuit_breaker", "global emergency {}", active ? "raised" : "cleared");
}

// ─── Inspection ───────────────────────────────────────────────────────────────

std::optional<CircuitBreakerState> CircuitBreakerRegistry::state(const OperationKey& key) const {
    std::shared_lock table(table_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    std::lock_guard lock(it->second->mutex);
    return it->second->state;
}

std::vector<OperationKey> CircuitBreakerRegistry::keys() const {
    std::shared_lock table(table_mutex_);
    std::vector<OperationKey> out;
    out.reserve(entries_.size());
    for (const auto& [key, e] : entries_) {
        out.push_back(key);
    }
    return out;
}

} // namespace olend::breaker
