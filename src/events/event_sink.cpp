/// @file src/events/event_sink.cpp
/// @brief LogEventSink and MemoryEventSink.

#include "olend/events.hpp"
#include "olend/log.hpp"

#include <algorithm>
#include <utility>

namespace olend {

// ─── Names ────────────────────────────────────────────────────────────────────

const char* to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::ValidationFailed:     return "ValidationFailed";
        case EventKind::ManipulationFlagged:  return "ManipulationFlagged";
        case EventKind::BreakerTransition:    return "BreakerTransition";
        case EventKind::GlobalEmergency:      return "GlobalEmergency";
        case EventKind::ConfigUpdated:        return "ConfigUpdated";
        case EventKind::LiquidationWarning:   return "LiquidationWarning";
        case EventKind::LiquidationTriggered: return "LiquidationTriggered";
        case EventKind::OriginationRejected:  return "OriginationRejected";
        case EventKind::PenaltyDistributed:   return "PenaltyDistributed";
    }
    return "Unknown";
}

const char* to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

// ─── LogEventSink ─────────────────────────────────────────────────────────────

void LogEventSink::emit(const Event& event) {
    const log::Level level = event.severity == Severity::Critical ? log::Level::Error
                           : event.severity == Severity::Warning  ? log::Level::Warn
                                                                  : log::Level::Info;
    log::write(level, "event",
               "{} subject={} before={} after={} severity={} t={} {}",
               to_string(event.kind), event.subject, event.before, event.after,
               to_string(event.severity), event.timestamp, event.detail);
}

// ─── MemoryEventSink ──────────────────────────────────────────────────────────

void MemoryEventSink::emit(const Event& event) {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
}

std::vector<Event> MemoryEventSink::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::size_t MemoryEventSink::count(EventKind kind) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [kind](const Event& e) { return e.kind == kind; }));
}

std::vector<Event> MemoryEventSink::drain() {
    std::lock_guard lock(mutex_);
    return std::exchange(events_, {});
}

void MemoryEventSink::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

} // namespace olend
