/// @file src/penalty/penalty_distributor.cpp
/// @brief PenaltyDistributor implementation.

#include "olend/penalty.hpp"
#include "olend/log.hpp"
#include "olend/safe_math.hpp"

namespace olend::penalty {

namespace {

[[nodiscard]] Wide share_sum(const PenaltyDistributionConfig& c) noexcept {
    return static_cast<Wide>(c.liquidator_share_bps) + c.platform_share_bps + c.insurance_share_bps;
}

} // anonymous namespace

BasisPoints PenaltyDistributionConfig::borrower_protection_bps() const noexcept {
    const Wide sum = share_sum(*this);
    if (!borrower_protection || sum >= constants::BPS_DENOMINATOR) {
        return 0;
    }
    return constants::BPS_DENOMINATOR - static_cast<BasisPoints>(sum);
}

Status PenaltyDistributionConfig::validate() const {
    if (share_sum(*this) > constants::BPS_DENOMINATOR) {
        return ErrorCode::InvalidConfig;
    }
    return ok();
}

Result<PenaltyDistributor> PenaltyDistributor::create(const PenaltyDistributionConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        log::warn("penalty", "rejected distribution config (shares {}+{}+{} bps)",
                  config.liquidator_share_bps, config.platform_share_bps,
                  config.insurance_share_bps);
        return valid.error();
    }
    return PenaltyDistributor(config);
}

Status PenaltyDistributor::set_config(const PenaltyDistributionConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        log::warn("penalty", "rejected distribution config (shares {}+{}+{} bps)",
                  config.liquidator_share_bps, config.platform_share_bps,
                  config.insurance_share_bps);
        return valid.error();
    }
    config_ = config;
    return ok();
}

Result<PenaltySplit> PenaltyDistributor::distribute(Amount total) const {
    auto liquidator = math::safe_percentage(total, config_.liquidator_share_bps);
    if (!liquidator) {
        return liquidator.error();
    }
    auto insurance = math::safe_percentage(total, config_.insurance_share_bps);
    if (!insurance) {
        return insurance.error();
    }
    auto protection = math::safe_percentage(total, config_.borrower_protection_bps());
    if (!protection) {
        return protection.error();
    }

    // ── Platform absorbs every truncation remainder ───────────────────────────
    auto platform = math::safe_sub(total, *liquidator);
    if (!platform) {
        return platform.error();
    }
    platform = math::safe_sub(*platform, *insurance);
    if (!platform) {
        return platform.error();
    }
    platform = math::safe_sub(*platform, *protection);
    if (!platform) {
        return platform.error();
    }

    return PenaltySplit{
        .liquidator          = *liquidator,
        .platform            = *platform,
        .insurance           = *insurance,
        .borrower_protection = *protection,
    };
}

} // namespace olend::penalty
