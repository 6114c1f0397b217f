/**
 * @file  prop_penalty_split.cpp
 * @brief Property: ∀ total, ∀ valid shares: the split sums to the total exactly
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_penalty_split
 *
 * Each non-platform recipient receives ⌊total·share/10 000⌋ and the platform
 * receives whatever remains, so truncation dust is never lost or created:
 *
 *   liquidator + platform + insurance + borrower_protection = total
 */

#include <rapidcheck.h>

#include <cstdint>

#include "olend/constants.hpp"
#include "olend/penalty.hpp"

using namespace olend;
using namespace olend::penalty;

namespace {

/// Three shares with a sum of at most 10 000 bps.
PenaltyDistributionConfig arbitrary_config() {
    PenaltyDistributionConfig c;
    c.liquidator_share_bps = *rc::gen::inRange<BasisPoints>(0, constants::BPS_DENOMINATOR + 1);
    c.platform_share_bps   = *rc::gen::inRange<BasisPoints>(
        0, constants::BPS_DENOMINATOR - c.liquidator_share_bps + 1);
    c.insurance_share_bps  = *rc::gen::inRange<BasisPoints>(
        0, constants::BPS_DENOMINATOR - c.liquidator_share_bps - c.platform_share_bps + 1);
    c.borrower_protection  = *rc::gen::arbitrary<bool>();
    return c;
}

} // namespace

int main() {
    // ── Property 1: conservation ─────────────────────────────────────────────
    rc::check(
        "penalty_split: parts sum to the distributed total",
        [](std::uint64_t total) {
            const auto config = arbitrary_config();
            RC_ASSERT(config.validate().has_value());

            const auto distributor = PenaltyDistributor::create(config);
            RC_ASSERT(distributor.has_value());
            const auto split = distributor->distribute(total);
            RC_ASSERT(split.has_value());
            RC_ASSERT(split->total() == total);
        }
    );

    // ── Property 2: shares are floors, the platform takes the remainder ──────
    rc::check(
        "penalty_split: liquidator and insurance are truncated percentages",
        [](std::uint32_t total) {
            const auto config = arbitrary_config();
            const auto distributor = PenaltyDistributor::create(config);
            RC_ASSERT(distributor.has_value());
            const auto split = distributor->distribute(total);
            RC_ASSERT(split.has_value());

            const std::uint64_t t = total;
            RC_ASSERT(split->liquidator == t * config.liquidator_share_bps / constants::BPS_DENOMINATOR);
            RC_ASSERT(split->insurance  == t * config.insurance_share_bps  / constants::BPS_DENOMINATOR);
            RC_ASSERT(split->platform >= t * config.platform_share_bps / constants::BPS_DENOMINATOR);
            if (!config.borrower_protection) {
                RC_ASSERT(split->borrower_protection == 0u);
            }
        }
    );

    return 0;
}
