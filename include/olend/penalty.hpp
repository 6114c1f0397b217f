#pragma once

/// @file include/olend/penalty.hpp
/// @brief PenaltyDistributor: four-way split of a liquidation penalty.
///
/// # Module: Penalty Distributor
///
/// ## Responsibility
/// Allocate a liquidation penalty between the liquidator, the platform, the
/// insurance fund and a borrower-protection bucket.
///
/// ## Guarantees
/// - liquidator, insurance and protection shares are ⌊total · rate / 10 000⌋
/// - the platform takes what is left, so the four shares sum to `total`
/// - with borrower protection disabled its share is folded into platform
/// - rates are validated when the config is set, never at distribution time

#include "olend/constants.hpp"
#include "olend/error.hpp"
#include "olend/types.hpp"

namespace olend::penalty {

struct PenaltyDistributionConfig {
    BasisPoints liquidator_share_bps = constants::DEFAULT_LIQUIDATOR_SHARE_BPS;
    BasisPoints platform_share_bps   = constants::DEFAULT_PLATFORM_SHARE_BPS;
    BasisPoints insurance_share_bps  = constants::DEFAULT_INSURANCE_SHARE_BPS;
    bool        borrower_protection  = true;

    /// 10 000 − (liquidator + platform + insurance); 0 when disabled.
    [[nodiscard]] BasisPoints borrower_protection_bps() const noexcept;

    /// InvalidConfig unless the three shares sum to at most 10 000.
    [[nodiscard]] Status validate() const;
};

struct PenaltySplit {
    Amount liquidator          = 0;
    Amount platform            = 0;
    Amount insurance           = 0;
    Amount borrower_protection = 0;

    [[nodiscard]] Amount total() const noexcept {
        return liquidator + platform + insurance + borrower_protection;
    }

    friend bool operator==(const PenaltySplit&, const PenaltySplit&) = default;
};

class PenaltyDistributor {
public:
    /// Distributor with the default shares.
    PenaltyDistributor() = default;

    /// Distributor with `config`; InvalidConfig if its shares exceed 10 000.
    [[nodiscard]] static Result<PenaltyDistributor> create(const PenaltyDistributionConfig& config);

    Status set_config(const PenaltyDistributionConfig& config);
    [[nodiscard]] const PenaltyDistributionConfig& config() const noexcept { return config_; }

    [[nodiscard]] Result<PenaltySplit> distribute(Amount total) const;

private:
    explicit PenaltyDistributor(const PenaltyDistributionConfig& config) : config_(config) {}

    PenaltyDistributionConfig config_;
};

} // namespace olend::penalty
