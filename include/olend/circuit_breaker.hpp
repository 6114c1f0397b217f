#pragma once

/// @file include/olend/circuit_breaker.hpp
/// @brief CircuitBreakerRegistry: keyed protective state machines.
///
/// # Module: Circuit Breaker Registry
///
/// ## Responsibility
/// Keep one breaker per OperationKey (operation type, optionally crossed
/// with an asset) and decide whether that operation may proceed.
///
/// ## State Machine
/// ```
///            failures in window > threshold
///            volume in window  > threshold
///            manipulation report (risk ≥ 2)
///   Closed ───────────────────────────────────▶ Open
///     ▲                                          │
///     │ probe succeeds          now − phase_change_time ≥ recovery_timeout
///     │                                          ▼
///     └──────────────────────────────────── HalfOpen
///                         probe fails ──▶ Open (phase_change_time reset)
/// ```
/// Open → HalfOpen is evaluated lazily whenever the key is consulted.
///
/// ## Global Emergency
/// While set, every key reports Open regardless of its own phase. Only an
/// explicit clear lifts it; there is no timed recovery.
///
/// ## Thread Safety
/// Each key has its own mutex. The key table is guarded by a shared mutex
/// taken exclusively only to insert a new key. Lock order is table → key →
/// defaults; the defaults mutex is a leaf. The event sink is called only
/// after every lock is released, so a sink may query the registry.

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/events.hpp"
#include "olend/price.hpp"
#include "olend/types.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace olend::breaker {

// ─── Keys ─────────────────────────────────────────────────────────────────────

enum class OperationType : std::uint8_t {
    PriceQuery,
    Borrow,
    Repay,
    Deposit,
    Withdraw,
    Liquidate,
};

[[nodiscard]] const char* to_string(OperationType op) noexcept;

struct OperationKey {
    OperationType          operation;
    std::optional<AssetId> asset;   ///< nullopt: protocol-wide key

    friend bool operator==(const OperationKey&, const OperationKey&) = default;

    /// "borrow" or "borrow/asset#<fingerprint>".
    [[nodiscard]] std::string to_string() const;
};

struct OperationKeyHash {
    [[nodiscard]] std::size_t operator()(const OperationKey& key) const noexcept;
};

// ─── Configuration and state ──────────────────────────────────────────────────

struct ThresholdConfig {
    std::uint32_t failure_threshold   = constants::DEFAULT_FAILURE_THRESHOLD;
    Timestamp     time_window_ms      = constants::DEFAULT_TIME_WINDOW_MS;
    Timestamp     recovery_timeout_ms = constants::DEFAULT_RECOVERY_TIMEOUT_MS;
    Amount        volume_threshold    = 0;   ///< 0 disables the volume trip

    /// failure_threshold in [1, 10 000]; window and timeout in (0, 7 days].
    [[nodiscard]] Status validate() const;
};

enum class BreakerPhase : std::uint8_t {
    Closed,
    Open,
    HalfOpen,
};

[[nodiscard]] const char* to_string(BreakerPhase phase) noexcept;

struct CircuitBreakerState {
    BreakerPhase  phase             = BreakerPhase::Closed;
    std::uint32_t failure_count     = 0;   ///< Failures inside the rolling window
    Timestamp     last_failure_time = 0;
    Timestamp     last_success_time = 0;
    Timestamp     phase_change_time = 0;
    Amount        window_volume     = 0;   ///< Volume inside the rolling window
    std::uint32_t trip_count        = 0;   ///< Closed/HalfOpen → Open transitions
};

/// Outcome of consulting a breaker before an operation.
enum class GateDecision : std::uint8_t {
    Allowed,      ///< Closed: proceed
    Probe,        ///< HalfOpen: proceed and report the outcome
    CircuitOpen,  ///< Open or global emergency: do not proceed
};

// ─── CircuitBreakerRegistry ───────────────────────────────────────────────────

class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(EventSink& events,
                                    ThresholdConfig defaults = ThresholdConfig{});

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // ── Configuration ─────────────────────────────────────────────────────────

    /// Threshold override for one key. Counters are kept.
    Status set_threshold(const OperationKey& key, const ThresholdConfig& config);

    /// Thresholds used by keys without an override.
    Status set_default_threshold(const ThresholdConfig& config);

    [[nodiscard]] ThresholdConfig threshold(const OperationKey& key) const;

    // ── Gating ────────────────────────────────────────────────────────────────

    /// Decide whether an operation under `key` may run at `now`.
    /// Performs the Open → HalfOpen transition when the timeout has elapsed.
    [[nodiscard]] GateDecision gate(const OperationKey& key, Timestamp now);

    /// True when the key is Open (after timeout evaluation) or the global
    /// emergency is set.
    [[nodiscard]] bool is_open(const OperationKey& key, Timestamp now);

    // ── Outcome reporting ─────────────────────────────────────────────────────

    void record_success(const OperationKey& key, Timestamp now);

    void record_failure(const OperationKey& key, Timestamp now, std::string_view reason = {});

    /// Add `amount` to the key's rolling volume. Trips the key when the
    /// in-window total exceeds the volume threshold.
    Status record_volume(const OperationKey& key, Amount amount, Timestamp now);

    /// Trip every key depending on `asset` when `risk` is High or Critical.
    /// The asset's PriceQuery key is created if it does not exist yet.
    void report_manipulation(AssetId asset, ManipulationRisk risk, Timestamp now,
                             std::string_view symbol);

    // ── Administrative overrides ──────────────────────────────────────────────

    void force_open(const OperationKey& key, Timestamp now);

    /// Return the key to Closed and clear its counters.
    void reset(const OperationKey& key, Timestamp now);

    void set_global_emergency(bool active, Timestamp now);

    [[nodiscard]] bool global_emergency() const noexcept {
        return global_emergency_.load(std::memory_order_acquire);
    }

    // ── Inspection ────────────────────────────────────────────────────────────

    /// Snapshot of a key's state; nullopt if the key was never used.
    [[nodiscard]] std::optional<CircuitBreakerState> state(const OperationKey& key) const;

    [[nodiscard]] std::vector<OperationKey> keys() const;

private:
    struct Entry {
        CircuitBreakerState                    state;
        std::optional<ThresholdConfig>         override_config;
        std::deque<Timestamp>                  failures;
        std::deque<std::pair<Timestamp, Amount>> volume;
        std::mutex                             mutex;
    };

    /// Existing entry or a freshly inserted one.
    [[nodiscard]] Entry& entry(const OperationKey& key);

    [[nodiscard]] ThresholdConfig config_of(const Entry& entry) const;

    /// Drop failures and volume older than the window; refresh counters.
    static void prune(Entry& entry, const ThresholdConfig& config, Timestamp now);

    /// Open → HalfOpen when the recovery timeout has elapsed.
    void refresh(Entry& entry, const OperationKey& key, const ThresholdConfig& config,
                 Timestamp now, std::vector<Event>& pending);

    /// Apply a phase change and stage its BreakerTransition event.
    void transition(Entry& entry, const OperationKey& key, BreakerPhase to,
                    Timestamp now, std::string_view reason, std::vector<Event>& pending);

    /// Hand staged events to the sink. Called with no lock held.
    void publish(const std::vector<Event>& pending);

    EventSink&                  events_;
    mutable std::mutex          defaults_mutex_;
    ThresholdConfig             defaults_;
    std::atomic<bool>           global_emergency_{false};
    mutable std::shared_mutex   table_mutex_;
    std::unordered_map<OperationKey, std::unique_ptr<Entry>, OperationKeyHash> entries_;
};

} // namespace olend::breaker
