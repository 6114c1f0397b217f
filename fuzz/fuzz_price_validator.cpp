/**
 * @file  fuzz_price_validator.cpp
 * @brief libFuzzer target for PriceValidator::validate
 *
 * Build:
 *   cmake -DOLEND_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_price_validator
 *
 * Run for 60 seconds:
 *   ./fuzz_price_validator -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. An accepted quote has price > 0 and validation_score ≤ 100.
 *   3. is_valid is false iff the detector reported High or Critical risk.
 *   4. History never exceeds its capacity and its timestamps never decrease.
 *   5. A rejected quote leaves the cached record unchanged.
 *
 * Fuzzer strategy:
 *   The input is consumed as 24-byte records: raw price (i64),
 *   confidence (u64), a signed exponent byte, and a timestamp delta (u16)
 *   plus the clock advance (u16) relative to the previous record.
 *   Exponents outside [−18, 18], negative prices, zero-width intervals and
 *   out-of-order timestamps are all reachable.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "olend/events.hpp"
#include "olend/oracle.hpp"

using namespace olend;
using namespace olend::oracle;

namespace {

constexpr std::size_t RECORD_SIZE = 24;
constexpr std::size_t CAPACITY    = 16;

struct Record {
    std::int64_t  price;
    std::uint64_t confidence;
    std::int8_t   exponent;
    std::uint16_t back_ms;
    std::uint16_t advance_ms;
};

Record decode(const uint8_t* p) {
    Record r{};
    std::memcpy(&r.price, p, 8);
    std::memcpy(&r.confidence, p + 8, 8);
    std::memcpy(&r.exponent, p + 16, 1);
    std::memcpy(&r.back_ms, p + 17, 2);
    std::memcpy(&r.advance_ms, p + 19, 2);
    return r;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    NullEventSink events;
    PriceValidator validator(events, manipulation::DetectorConfig{}, CAPACITY);

    const AssetId asset = AssetId::from_symbol("FUZZ");
    PriceFeedConfig feed;
    feed.symbol       = "FUZZ";
    feed.feed_id      = "fuzz:feed";
    feed.heartbeat_ms = 30'000;
    if (!validator.set_feed(asset, feed)) {
        return 0;
    }

    Timestamp now = 1'000'000;
    for (std::size_t off = 0; off + RECORD_SIZE <= size; off += RECORD_SIZE) {
        const Record rec = decode(data + off);
        now += rec.advance_ms;

        const auto before = validator.cached(asset);
        const RawQuote quote{rec.price, rec.confidence, rec.exponent, now - rec.back_ms};
        const auto result = validator.validate(asset, quote, now);

        if (result) {
            // Invariant 2
            assert(result->price > 0);
            assert(result->validation_score <= 100);
            // Invariant 3
            assert(result->is_valid == (result->manipulation_risk < ManipulationRisk::High));
        } else {
            // Invariant 5
            const auto after = validator.cached(asset);
            assert(before.has_value() == after.has_value());
            assert(!before || before->timestamp == after->timestamp);
        }

        // Invariant 4
        const auto history = validator.history(asset);
        assert(history.size() <= CAPACITY);
        for (std::size_t i = 1; i < history.size(); ++i) {
            assert(history[i - 1].timestamp <= history[i].timestamp);
        }
    }

    return 0;
}
