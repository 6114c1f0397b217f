#pragma once

/// @file include/olend/events.hpp
/// @brief Structured risk events and the sinks that receive them.
///
/// # Module: Event Sink
///
/// ## Responsibility
/// Every validation failure, breaker transition, manipulation flag,
/// liquidation decision and penalty distribution is emitted as an `Event`
/// carrying the subject (asset symbol or operation key), before/after
/// values, a severity and the logical timestamp.
///
/// ## Sinks
/// - `LogEventSink`    - renders each event as one stderr line via fmt
/// - `MemoryEventSink` - buffers events for the host to drain
/// - `NullEventSink`   - discards
///
/// Sinks must be safe to call from several threads at once. The core
/// never holds one of its own locks while calling a sink, so a sink may
/// query or update the core that emitted the event.

#include "olend/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace olend {

enum class EventKind : std::uint8_t {
    ValidationFailed,
    ManipulationFlagged,
    BreakerTransition,
    GlobalEmergency,
    ConfigUpdated,
    LiquidationWarning,
    LiquidationTriggered,
    OriginationRejected,
    PenaltyDistributed,
};

enum class Severity : std::uint8_t {
    Info,
    Warning,
    Critical,
};

[[nodiscard]] const char* to_string(EventKind kind) noexcept;
[[nodiscard]] const char* to_string(Severity severity) noexcept;

struct Event {
    EventKind     kind;
    Severity      severity;
    std::string   subject;    ///< Asset symbol or operation key
    std::uint64_t before;     ///< Value before the event (kind-specific)
    std::uint64_t after;      ///< Value after the event (kind-specific)
    Timestamp     timestamp;
    std::string   detail;     ///< Free-form reason, e.g. an ErrorCode name
};

/// Receiver of structured events. Implemented by the host.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;
};

class NullEventSink final : public EventSink {
public:
    void emit(const Event&) override {}
};

/// Writes one line per event to stderr through `olend::log`.
class LogEventSink final : public EventSink {
public:
    void emit(const Event& event) override;
};

/// Thread-safe in-memory buffer of emitted events.
class MemoryEventSink final : public EventSink {
public:
    void emit(const Event& event) override;

    /// Snapshot of all buffered events, in emission order.
    [[nodiscard]] std::vector<Event> events() const;

    /// Number of buffered events of the given kind.
    [[nodiscard]] std::size_t count(EventKind kind) const;

    /// Remove and return all buffered events.
    std::vector<Event> drain();

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

} // namespace olend
