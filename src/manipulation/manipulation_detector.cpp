/// @file src/manipulation/manipulation_detector.cpp
/// @brief ManipulationDetector: spike, drift, mismatch and oscillation checks.
///
/// The spike check is exact integer math on the last two prices. The three
/// series checks copy a short tail of the history into Eigen arrays and
/// work on step returns r_i = p_i / p_{i−1} − 1.

#include "olend/manipulation.hpp"
#include "olend/safe_math.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace olend::manipulation {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

constexpr double BPS = static_cast<double>(constants::BPS_DENOMINATOR);

/// Prices (and confidences) of the last `count` history points followed by
/// the incoming point.
struct Tail {
    Eigen::ArrayXd price;
    Eigen::ArrayXd confidence;
};

[[nodiscard]] Tail collect_tail(const PriceHistory& history,
                                const PricePoint& incoming,
                                std::size_t count) {
    const auto& points = history.points();
    count = std::min(count, points.size());
    const std::size_t first = points.size() - count;

    Tail tail{Eigen::ArrayXd(static_cast<Eigen::Index>(count + 1)),
              Eigen::ArrayXd(static_cast<Eigen::Index>(count + 1))};
    for (std::size_t i = 0; i < count; ++i) {
        const auto idx = static_cast<Eigen::Index>(i);
        tail.price(idx)      = static_cast<double>(points[first + i].price);
        tail.confidence(idx) = static_cast<double>(points[first + i].confidence);
    }
    const auto last = static_cast<Eigen::Index>(count);
    tail.price(last)      = static_cast<double>(incoming.price);
    tail.confidence(last) = static_cast<double>(incoming.confidence);
    return tail;
}

/// Step returns of a price array of length n ≥ 2 (length n − 1).
[[nodiscard]] Eigen::ArrayXd step_returns(const Eigen::ArrayXd& p) {
    const Eigen::Index n = p.size();
    return p.tail(n - 1) / p.head(n - 1) - 1.0;
}

[[nodiscard]] bool above_bps(double ratio, BasisPoints threshold_bps) noexcept {
    return std::abs(ratio) * BPS > static_cast<double>(threshold_bps);
}

} // anonymous namespace

// ─── DetectorConfig ───────────────────────────────────────────────────────────

Status DetectorConfig::validate() const {
    const auto window_ok = [](std::size_t w) {
        return w >= 1 && w <= constants::PRICE_HISTORY_CAPACITY;
    };
    const auto bps_ok = [](BasisPoints b) {
        return b > 0 && b <= constants::BPS_DENOMINATOR;
    };
    if (!window_ok(drift_window) || !window_ok(mismatch_window)) {
        return ErrorCode::InvalidConfig;
    }
    if (!bps_ok(drift_threshold_bps) || !bps_ok(mismatch_move_bps) ||
        !bps_ok(oscillation_min_rise_bps)) {
        return ErrorCode::InvalidConfig;
    }
    if (oscillation_window_ms == 0) {
        return ErrorCode::InvalidConfig;
    }
    return ok();
}

// ─── ManipulationAssessment ───────────────────────────────────────────────────

std::string ManipulationAssessment::describe() const {
    std::string out;
    const auto add = [&out](const char* name) {
        if (!out.empty()) out += ',';
        out += name;
    };
    if (triggered & CHECK_SPIKE)               add("spike");
    if (triggered & CHECK_CUMULATIVE_DRIFT)    add("drift");
    if (triggered & CHECK_CONFIDENCE_MISMATCH) add("confidence_mismatch");
    if (triggered & CHECK_OSCILLATION)         add("oscillation");
    return out.empty() ? std::string("none") : out;
}

// ─── ManipulationDetector ─────────────────────────────────────────────────────

ManipulationDetector::ManipulationDetector(DetectorConfig config) noexcept
    : config_(config) {}

Status ManipulationDetector::set_config(const DetectorConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }
    config_ = config;
    return ok();
}

Result<ManipulationAssessment>
ManipulationDetector::assess(const PriceHistory& history,
                             const PricePoint& incoming,
                             BasisPoints spike_threshold_bps) const {
    ManipulationAssessment out;
    const auto latest = history.latest();
    if (!latest) {
        // First observation for the asset: nothing to compare against.
        return out;
    }

    const auto raise = [&out](ManipulationRisk level, ManipulationCheck check) {
        if (level == ManipulationRisk::None) return;
        out.triggered |= check;
        out.risk_level = std::max(out.risk_level, level);
    };

    auto spike = spike_level(*latest, incoming, spike_threshold_bps, out.step_change_bps);
    if (!spike) {
        return spike.error();
    }
    raise(*spike, CHECK_SPIKE);
    raise(drift_level(history, incoming), CHECK_CUMULATIVE_DRIFT);
    raise(mismatch_level(history, incoming, spike_threshold_bps), CHECK_CONFIDENCE_MISMATCH);
    raise(oscillation_level(history, incoming), CHECK_OSCILLATION);

    out.is_manipulation = out.risk_level >= ManipulationRisk::High;
    return out;
}

// ─── Check 1: single-step spike ───────────────────────────────────────────────

Result<ManipulationRisk>
ManipulationDetector::spike_level(const PricePoint& prev,
                                  const PricePoint& incoming,
                                  BasisPoints threshold_bps,
                                  BasisPoints& change_bps) const {
    if (prev.price == 0) {
        return ManipulationRisk::None;
    }
    auto change = math::safe_mul_div(math::abs_diff(incoming.price, prev.price),
                                     constants::BPS_DENOMINATOR, prev.price);
    if (!change) {
        return change.error();
    }
    change_bps = *change;

    // threshold·2 cannot overflow: thresholds are bounded by 10 000 bps.
    if (change_bps > threshold_bps * 2) return ManipulationRisk::Critical;
    if (change_bps > threshold_bps)     return ManipulationRisk::High;
    if (change_bps > threshold_bps / 2) return ManipulationRisk::Low;
    return ManipulationRisk::None;
}

// ─── Check 2: cumulative drift ────────────────────────────────────────────────

ManipulationRisk
ManipulationDetector::drift_level(const PriceHistory& history,
                                  const PricePoint& incoming) const {
    const Tail tail = collect_tail(history, incoming, config_.drift_window);
    if (tail.price.size() < 2 || (tail.price <= 0.0).any()) {
        return ManipulationRisk::None;
    }
    const double drift = step_returns(tail.price).sum();
    return above_bps(drift, config_.drift_threshold_bps) ? ManipulationRisk::High
                                                         : ManipulationRisk::None;
}

// ─── Check 3: confidence / price mismatch ─────────────────────────────────────

ManipulationRisk
ManipulationDetector::mismatch_level(const PriceHistory& history,
                                     const PricePoint& incoming,
                                     BasisPoints spike_threshold_bps) const {
    if (history.size() < config_.mismatch_window) {
        return ManipulationRisk::None;
    }
    const Tail tail = collect_tail(history, incoming, config_.mismatch_window);
    if ((tail.price <= 0.0).any()) {
        return ManipulationRisk::None;
    }

    const Eigen::Index n = tail.price.size();
    const Eigen::ArrayXd steps = tail.price.tail(n - 1) - tail.price.head(n - 1);
    const bool one_direction = (steps > 0.0).all() || (steps < 0.0).all();
    if (!one_direction) {
        return ManipulationRisk::None;
    }

    const Eigen::ArrayXd ratio = tail.confidence / tail.price;
    const bool tightening = (ratio.tail(n - 1) < ratio.head(n - 1)).all();
    if (!tightening) {
        return ManipulationRisk::None;
    }

    const double move = (tail.price(n - 1) - tail.price(0)) / tail.price(0);
    if (std::abs(move) * BPS < static_cast<double>(config_.mismatch_move_bps)) {
        return ManipulationRisk::None;
    }
    return above_bps(move, spike_threshold_bps) ? ManipulationRisk::High
                                                : ManipulationRisk::Low;
}

// ─── Check 4: pump/dump oscillation ───────────────────────────────────────────

ManipulationRisk
ManipulationDetector::oscillation_level(const PriceHistory& history,
                                        const PricePoint& incoming) const {
    const auto& points = history.points();
    const Timestamp horizon = incoming.timestamp > config_.oscillation_window_ms
                                  ? incoming.timestamp - config_.oscillation_window_ms
                                  : 0;
    const auto in_window = static_cast<std::size_t>(
        std::count_if(points.begin(), points.end(),
                      [horizon](const PricePoint& p) { return p.timestamp >= horizon; }));
    // Need a base point plus at least one later point before the incoming one.
    if (in_window < 2) {
        return ManipulationRisk::None;
    }

    const Tail tail = collect_tail(history, incoming, in_window);
    const Eigen::Index n = tail.price.size();
    const double base = tail.price(0);
    if (base <= 0.0) {
        return ManipulationRisk::None;
    }
    const Eigen::ArrayXd between = tail.price.segment(1, n - 2);
    const double now_price = tail.price(n - 1);
    const double min_move = static_cast<double>(config_.oscillation_min_rise_bps) / BPS;

    const double rise = between.maxCoeff() / base - 1.0;
    if (rise >= min_move && now_price < base) {
        return ManipulationRisk::High;
    }
    const double drop = 1.0 - between.minCoeff() / base;
    if (drop >= min_move && now_price > base) {
        return ManipulationRisk::High;
    }
    return ManipulationRisk::None;
}

} // namespace olend::manipulation
