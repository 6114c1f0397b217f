/// @file src/oracle/price_history.cpp
/// @brief PriceHistory ring and ValidatedPriceInfo helpers.

#include "olend/price.hpp"
#include "olend/safe_math.hpp"

namespace olend {

const char* to_string(ManipulationRisk risk) noexcept {
    switch (risk) {
        case ManipulationRisk::None:     return "none";
        case ManipulationRisk::Low:      return "low";
        case ManipulationRisk::High:     return "high";
        case ManipulationRisk::Critical: return "critical";
    }
    return "unknown";
}

Result<Price> ValidatedPriceInfo::upper_bound() const noexcept {
    return math::safe_add(price, confidence);
}

// ─── PriceHistory ─────────────────────────────────────────────────────────────

PriceHistory::PriceHistory(std::size_t capacity) noexcept
    : capacity_(capacity < 1 ? 1 : capacity) {}

Status PriceHistory::push(const PricePoint& point) {
    if (!points_.empty() && point.timestamp < points_.back().timestamp) {
        return ErrorCode::StalePrice;
    }
    points_.push_back(point);
    if (points_.size() > capacity_) {
        points_.pop_front();
    }
    return ok();
}

std::optional<PricePoint> PriceHistory::latest() const noexcept {
    if (points_.empty()) {
        return std::nullopt;
    }
    return points_.back();
}

} // namespace olend
