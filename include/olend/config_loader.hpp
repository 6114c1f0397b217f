#pragma once

/// @file include/olend/config_loader.hpp
/// @brief CSV loader for price-feed and collateral-asset tables.
///
/// # Module: ConfigLoader
///
/// ## Responsibility
/// Parse the tables a host keeps its risk configuration in. Rows that do
/// not parse, or that fail their config's `validate()`, are skipped with a
/// warning; the loader never fails the whole table for one bad row.
///
/// ## Feed table
/// ```
/// symbol,feed_id,exponent,heartbeat_ms,max_deviation_bps,min_confidence_bps[,enabled]
/// BTC,pyth:btc-usd,-8,60000,1000,9500
/// USDC,pyth:usdc-usd,-8,60000,200,9900,1
/// ```
///
/// ## Asset table
/// ```
/// symbol,asset_class,decimals[,penalty_multiplier_bps]
/// BTC,blue_chip,8,10000
/// PEPE,long_tail,18,15000
/// ```
/// `asset_class` is one of stablecoin, blue_chip, major, long_tail.
///
/// The first non-empty, non-comment line of each table is its header.
/// Lines starting with '#' are comments.

#include "olend/error.hpp"
#include "olend/oracle.hpp"
#include "olend/risk.hpp"
#include "olend/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace olend::config {

struct FeedEntry {
    AssetId                 asset;
    oracle::PriceFeedConfig config;
};

struct AssetEntry {
    AssetId                    asset;
    std::string                symbol;
    risk::AssetRiskParams      params;
    std::optional<BasisPoints> penalty_multiplier_bps;
};

class ConfigLoader {
public:
    /// Parse a feed table. Never fails; bad rows are skipped.
    [[nodiscard]] static std::vector<FeedEntry> parse_feeds(std::string_view csv);

    /// Parse an asset table. Never fails; bad rows are skipped.
    [[nodiscard]] static std::vector<AssetEntry> parse_assets(std::string_view csv);

    /// Read and parse a feed table file; InvalidConfig if it cannot be opened.
    [[nodiscard]] static Result<std::vector<FeedEntry>> load_feeds(const std::string& path);

    /// Read and parse an asset table file; InvalidConfig if it cannot be opened.
    [[nodiscard]] static Result<std::vector<AssetEntry>> load_assets(const std::string& path);

    /// Register parsed assets in a collateral policy and penalty-rate config.
    static void apply_assets(const std::vector<AssetEntry>& entries,
                             risk::CollateralPolicy& policy,
                             risk::PenaltyRateConfig& penalty);

    /// Parse an asset class name; nullopt if it is not one of the four.
    [[nodiscard]] static std::optional<risk::AssetClass> parse_asset_class(std::string_view name);

private:
    [[nodiscard]] static std::optional<FeedEntry> parse_feed_row(std::string_view line);
    [[nodiscard]] static std::optional<AssetEntry> parse_asset_row(std::string_view line);
};

} // namespace olend::config
