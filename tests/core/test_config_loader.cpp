#include <gtest/gtest.h>
#include "olend/config_loader.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace olend;
using namespace olend::config;

namespace {

const char* FEEDS =
    "# oracle feeds\n"
    "symbol,feed_id,exponent,heartbeat_ms,max_deviation_bps,min_confidence_bps,enabled\n"
    "BTC,pyth:btc-usd,-8,60000,1000,9500,1\n"
    "USDC,pyth:usdc-usd,-6,30000,200,9900\n"
    "ETH,pyth:eth-usd,-8,not_a_number,1000,9500\n"
    "SOL,pyth:sol-usd,-8,0,1000,9500\n"
    "\n"
    "ARB,pyth:arb-usd,-8,60000,1000,9500,maybe\n";

const char* ASSETS =
    "symbol,asset_class,decimals,penalty_multiplier_bps\r\n"
    "BTC,blue_chip,8,10000\r\n"
    "USDC,stablecoin,6\r\n"
    "PEPE,long_tail,18,15000\r\n"
    "DOGE,meme,8\r\n"
    "WBTC,major,40\r\n";

} // namespace

TEST(ConfigLoader_Feeds, ParsesValidRowsSkipsBadOnes) {
    const auto feeds = ConfigLoader::parse_feeds(FEEDS);
    ASSERT_EQ(feeds.size(), 2u);

    EXPECT_EQ(feeds[0].asset, AssetId::from_symbol("BTC"));
    EXPECT_EQ(feeds[0].config.feed_id, "pyth:btc-usd");
    EXPECT_EQ(feeds[0].config.exponent, -8);
    EXPECT_EQ(feeds[0].config.heartbeat_ms, 60'000u);
    EXPECT_TRUE(feeds[0].config.enabled);

    EXPECT_EQ(feeds[1].config.symbol, "USDC");
    EXPECT_EQ(feeds[1].config.exponent, -6);
    EXPECT_EQ(feeds[1].config.min_confidence_bps, 9'900u);
}

TEST(ConfigLoader_Feeds, DisabledFlag) {
    const auto feeds = ConfigLoader::parse_feeds(
        "symbol,feed_id,exponent,heartbeat_ms,max_deviation_bps,min_confidence_bps,enabled\n"
        "BTC,f,-8,60000,1000,9500,false\n");
    ASSERT_EQ(feeds.size(), 1u);
    EXPECT_FALSE(feeds[0].config.enabled);
}

TEST(ConfigLoader_Feeds, HeaderOnlyOrEmpty_NoRows) {
    EXPECT_TRUE(ConfigLoader::parse_feeds("").empty());
    EXPECT_TRUE(ConfigLoader::parse_feeds("symbol,feed_id\n").empty());
}

TEST(ConfigLoader_Assets, ParsesClassesDecimalsAndMultipliers) {
    const auto assets = ConfigLoader::parse_assets(ASSETS);
    ASSERT_EQ(assets.size(), 3u);

    EXPECT_EQ(assets[0].symbol, "BTC");
    EXPECT_EQ(assets[0].params.asset_class, risk::AssetClass::BlueChip);
    EXPECT_EQ(assets[0].params.decimals, 8);
    EXPECT_EQ(assets[0].penalty_multiplier_bps, 10'000u);

    EXPECT_EQ(assets[1].params.asset_class, risk::AssetClass::Stablecoin);
    EXPECT_FALSE(assets[1].penalty_multiplier_bps.has_value());

    EXPECT_EQ(assets[2].params.decimals, 18);
}

TEST(ConfigLoader_Assets, ApplyRegistersInPolicyAndRates) {
    risk::CollateralPolicy policy;
    risk::PenaltyRateConfig rates;
    ConfigLoader::apply_assets(ConfigLoader::parse_assets(ASSETS), policy, rates);

    EXPECT_EQ(policy.assets.size(), 3u);
    EXPECT_EQ(policy.assets.at(AssetId::from_symbol("USDC")).decimals, 6);
    EXPECT_EQ(rates.asset_multiplier_bps.size(), 2u);
    EXPECT_EQ(rates.asset_multiplier_bps.at(AssetId::from_symbol("PEPE")), 15'000u);
    EXPECT_TRUE(policy.validate().has_value());
    EXPECT_TRUE(rates.validate().has_value());
}

TEST(ConfigLoader_Assets, AssetClassNames) {
    EXPECT_EQ(ConfigLoader::parse_asset_class("major"), risk::AssetClass::Major);
    EXPECT_FALSE(ConfigLoader::parse_asset_class("Major").has_value());
}

TEST(ConfigLoader_Files, MissingFile_InvalidConfig) {
    auto r = ConfigLoader::load_feeds("/nonexistent/olend/feeds.csv");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ErrorCode::InvalidConfig);
}

TEST(ConfigLoader_Files, RoundTripThroughDisk) {
    const std::string path = ::testing::TempDir() + "olend_assets.csv";
    {
        std::ofstream out(path);
        out << ASSETS;
    }
    auto r = ConfigLoader::load_assets(path);
    std::remove(path.c_str());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->size(), 3u);
}
