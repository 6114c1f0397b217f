#include <gtest/gtest.h>
#include "olend/oracle.hpp"
#include "olend/events.hpp"

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

using namespace olend;
using namespace olend::oracle;

namespace {

constexpr std::int64_t E8 = 100'000'000;

const AssetId BTC = AssetId::from_symbol("BTC");

PriceFeedConfig btc_feed() {
    return PriceFeedConfig{
        .symbol             = "BTC",
        .feed_id            = "pyth:btc-usd",
        .exponent           = -8,
        .heartbeat_ms       = 60'000,
        .max_deviation_bps  = 1'000,
        .min_confidence_bps = 9'500,
        .enabled            = true,
    };
}

class PriceValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(validator.set_feed(BTC, btc_feed()).has_value());
    }

    Result<ValidatedPriceInfo> quote(std::int64_t price, std::int64_t conf,
                                     Timestamp observed_at, Timestamp now) {
        return validator.validate(BTC, RawQuote{price, static_cast<std::uint64_t>(conf),
                                                -8, observed_at}, now);
    }

    MemoryEventSink events;
    PriceValidator  validator{events};
};

/// Reads and reconfigures the validator from inside every event.
class ReconfiguringSink final : public EventSink {
public:
    void emit(const Event& event) override {
        if (validator == nullptr) {
            return;
        }
        history_sizes.push_back(validator->history(BTC).size());
        if (event.kind == EventKind::ValidationFailed) {
            reconfigured = validator->set_feed(BTC, btc_feed()).has_value();
        }
    }

    PriceValidator*          validator = nullptr;
    std::vector<std::size_t> history_sizes;
    bool                     reconfigured = false;
};

} // namespace

// ─── Happy path ───────────────────────────────────────────────────────────────

TEST_F(PriceValidatorTest, FreshTightQuote_ValidWithFullScore) {
    auto r = quote(50'000 * E8, 10 * E8, 1'000, 1'000);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_valid);
    EXPECT_EQ(r->price, static_cast<Price>(50'000 * E8));
    EXPECT_EQ(r->manipulation_risk, ManipulationRisk::None);
    EXPECT_EQ(r->validation_score, 100);
    EXPECT_EQ(validator.history(BTC).size(), 1u);
    ASSERT_TRUE(validator.cached(BTC).has_value());
    EXPECT_EQ(validator.cached(BTC)->timestamp, 1'000u);
}

TEST_F(PriceValidatorTest, HalfHeartbeatOld_LosesFreshnessPoints) {
    auto r = quote(50'000 * E8, 0, 0, 30'000);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->validation_score, 95);
}

TEST_F(PriceValidatorTest, ConfidenceAtLimit_LosesConfidencePoints) {
    // 5% of price is exactly the accepted maximum.
    auto r = quote(100 * E8, 5 * E8, 0, 0);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->validation_score, 90);
}

TEST_F(PriceValidatorTest, FeedExponentOverload_UsesConfiguredExponent) {
    auto r = validator.validate(BTC, 42 * E8, 0, 5, 5);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->price, static_cast<Price>(42 * E8));
}

// ─── Rejections ───────────────────────────────────────────────────────────────

TEST_F(PriceValidatorTest, AgeAtHeartbeat_Accepted) {
    EXPECT_TRUE(quote(100 * E8, 0, 0, 60'000).has_value());
}

TEST_F(PriceValidatorTest, AgeBeyondHeartbeat_StalePrice) {
    auto r = quote(100 * E8, 0, 0, 60'001);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ErrorCode::StalePrice);
}

TEST_F(PriceValidatorTest, FutureTimestamp_InvalidPrice) {
    EXPECT_EQ(quote(100 * E8, 0, 2'000, 1'000).error(), ErrorCode::InvalidPrice);
}

TEST_F(PriceValidatorTest, WideConfidence_LowConfidence) {
    EXPECT_EQ(quote(100 * E8, 6 * E8, 0, 0).error(), ErrorCode::LowConfidence);
}

TEST_F(PriceValidatorTest, NonPositivePrice_InvalidPrice) {
    EXPECT_EQ(quote(0, 0, 0, 0).error(), ErrorCode::InvalidPrice);
    EXPECT_EQ(quote(-5, 0, 0, 0).error(), ErrorCode::InvalidPrice);
}

TEST_F(PriceValidatorTest, UnknownAsset_Rejected) {
    auto r = validator.validate(AssetId::from_symbol("DOGE"), RawQuote{E8, 0, -8, 0}, 0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), ErrorCode::UnknownAsset);
}

TEST_F(PriceValidatorTest, DisabledFeed_UnknownAsset) {
    auto cfg = btc_feed();
    cfg.enabled = false;
    ASSERT_TRUE(validator.set_feed(BTC, cfg).has_value());
    EXPECT_EQ(quote(100 * E8, 0, 0, 0).error(), ErrorCode::UnknownAsset);
}

TEST_F(PriceValidatorTest, Failure_LeavesSlotUntouchedAndEmitsEvent) {
    ASSERT_TRUE(quote(100 * E8, 0, 1'000, 1'000).has_value());
    events.clear();

    ASSERT_FALSE(quote(100 * E8, 0, 0, 100'000).has_value());
    EXPECT_EQ(validator.history(BTC).size(), 1u);
    EXPECT_EQ(validator.cached(BTC)->timestamp, 1'000u);
    EXPECT_EQ(events.count(EventKind::ValidationFailed), 1u);
    EXPECT_EQ(events.events().front().detail, "StalePrice");
}

TEST_F(PriceValidatorTest, OlderThanHistory_StalePrice) {
    ASSERT_TRUE(quote(100 * E8, 0, 5'000, 5'000).has_value());
    EXPECT_EQ(quote(100 * E8, 0, 4'000, 5'000).error(), ErrorCode::StalePrice);
}

TEST_F(PriceValidatorTest, RedeliveredQuote_ReturnsCacheWithoutAppending) {
    auto first = quote(100 * E8, E8, 1'000, 1'000);
    ASSERT_TRUE(first.has_value());
    auto again = quote(100 * E8, E8, 1'000, 2'000);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->validation_score, first->validation_score);
    EXPECT_EQ(validator.history(BTC).size(), 1u);
}

TEST_F(PriceValidatorTest, RedeliveredQuote_StillSubjectToStaleness) {
    ASSERT_TRUE(quote(100 * E8, 0, 1'000, 1'000).has_value());
    EXPECT_EQ(quote(100 * E8, 0, 1'000, 70'000).error(), ErrorCode::StalePrice);
}

// ─── Manipulation ─────────────────────────────────────────────────────────────

TEST_F(PriceValidatorTest, ThirtyPercentJump_FlaggedButRecorded) {
    ASSERT_TRUE(quote(100 * E8, 0, 1'000, 1'000).has_value());
    auto r = quote(130 * E8, 0, 2'000, 2'000);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->is_valid);
    EXPECT_EQ(r->manipulation_risk, ManipulationRisk::Critical);
    EXPECT_EQ(r->validation_score, 25);
    EXPECT_EQ(validator.history(BTC).size(), 2u);
    EXPECT_EQ(events.count(EventKind::ManipulationFlagged), 1u);
}

// ─── Sink re-entry ────────────────────────────────────────────────────────────

TEST(PriceValidator_Sink, SinkMayCallBackIntoValidator) {
    ReconfiguringSink sink;
    PriceValidator validator(sink);
    sink.validator = &validator;
    ASSERT_TRUE(validator.set_feed(BTC, btc_feed()).has_value());

    ASSERT_TRUE(validator.validate(BTC, RawQuote{100 * E8, 0, -8, 1'000}, 1'000).has_value());
    // Manipulation flag: emitted after the point is committed.
    ASSERT_TRUE(validator.validate(BTC, RawQuote{130 * E8, 0, -8, 2'000}, 2'000).has_value());
    // Stale quote: the sink replaces the feed while handling the failure.
    EXPECT_EQ(validator.validate(BTC, RawQuote{130 * E8, 0, -8, 0}, 100'000).error(),
              ErrorCode::StalePrice);
    // Unknown asset goes through the same path.
    EXPECT_EQ(validator.validate(AssetId::from_symbol("DOGE"), 1, 0, 0, 0).error(),
              ErrorCode::UnknownAsset);

    EXPECT_TRUE(sink.reconfigured);
    EXPECT_EQ(sink.history_sizes, (std::vector<std::size_t>{2, 2, 2}));
}

// ─── Concurrency ──────────────────────────────────────────────────────────────

TEST(PriceValidator_Concurrency, OneAssetManyThreads_HistoryStaysOrdered) {
    constexpr std::size_t CAPACITY = 16;
    constexpr int THREADS = 8;
    constexpr int QUOTES_PER_THREAD = 200;

    MemoryEventSink events;
    PriceValidator validator(events, manipulation::DetectorConfig{}, CAPACITY);
    ASSERT_TRUE(validator.set_feed(BTC, btc_feed()).has_value());

    std::atomic<int> accepted{0};
    std::atomic<int> rejected_other{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < QUOTES_PER_THREAD; ++i) {
                const Timestamp observed = static_cast<Timestamp>(i * THREADS + t);
                auto r = validator.validate(BTC, RawQuote{100 * E8, 0, -8, observed}, 10'000);
                if (r) {
                    accepted.fetch_add(1);
                } else if (r.error() != ErrorCode::StalePrice) {
                    rejected_other.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_GT(accepted.load(), 0);
    EXPECT_EQ(rejected_other.load(), 0);

    const auto h = validator.history(BTC);
    ASSERT_FALSE(h.empty());
    EXPECT_LE(h.size(), CAPACITY);
    for (std::size_t i = 1; i < h.size(); ++i) {
        EXPECT_LE(h[i - 1].timestamp, h[i].timestamp);
    }
    ASSERT_TRUE(validator.cached(BTC).has_value());
    EXPECT_EQ(validator.cached(BTC)->timestamp, h.back().timestamp);
    EXPECT_EQ(events.count(EventKind::ManipulationFlagged), 0u);
}

// ─── History capacity ─────────────────────────────────────────────────────────

TEST(PriceValidator_Capacity, KeepsNewestPoints) {
    NullEventSink sink;
    PriceValidator small(sink, manipulation::DetectorConfig{}, 3);
    ASSERT_TRUE(small.set_feed(BTC, btc_feed()).has_value());
    for (Timestamp t = 1; t <= 5; ++t) {
        ASSERT_TRUE(small.validate(BTC, RawQuote{100 * E8, 0, -8, t}, t).has_value());
    }
    const auto h = small.history(BTC);
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.front().timestamp, 3u);
}

// ─── Configuration ────────────────────────────────────────────────────────────

TEST(PriceFeedConfig, Validate) {
    EXPECT_TRUE(btc_feed().validate().has_value());

    auto cfg = btc_feed();
    cfg.heartbeat_ms = 0;
    EXPECT_EQ(cfg.validate().error(), ErrorCode::InvalidConfig);

    cfg = btc_feed();
    cfg.exponent = -19;
    EXPECT_EQ(cfg.validate().error(), ErrorCode::InvalidConfig);

    cfg = btc_feed();
    cfg.max_deviation_bps = 0;
    EXPECT_EQ(cfg.validate().error(), ErrorCode::InvalidConfig);

    cfg = btc_feed();
    cfg.min_confidence_bps = 10'001;
    EXPECT_EQ(cfg.validate().error(), ErrorCode::InvalidConfig);
}

TEST(PriceValidator_Normalize, ScalesToEightDecimals) {
    EXPECT_EQ(*PriceValidator::normalize(1'000'000, -6), 100'000'000u);
    EXPECT_EQ(*PriceValidator::normalize(12'345, -10), 123u);
    EXPECT_EQ(*PriceValidator::normalize(5, 2), 50'000'000'000u);
    EXPECT_EQ(PriceValidator::normalize(1, 19).error(), ErrorCode::InvalidPrice);
    EXPECT_EQ(PriceValidator::normalize(1'000'000'000'000, 10).error(),
              ErrorCode::ArithmeticOverflow);
}
