/**
 * @file  fuzz_config_loader.cpp
 * @brief libFuzzer target for ConfigLoader::parse_feeds / parse_assets
 *
 * Build:
 *   cmake -DOLEND_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_config_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_config_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort on arbitrary bytes.
 *   2. Every returned feed row passes PriceFeedConfig::validate().
 *   3. Every returned asset row has decimals ≤ 18 and a positive multiplier.
 *   4. Rows returned never outnumber the input's lines.
 *
 * Fuzzer strategy:
 *   The same bytes are parsed as both tables, so the corpus explores
 *   separators, CR/LF handling, comment lines, sign characters and
 *   integer overflow in every column.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "olend/config_loader.hpp"

using namespace olend;
using namespace olend::config;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);

    std::size_t lines = 1;
    for (const char c : text) {
        if (c == '\n') {
            ++lines;
        }
    }

    // Invariant 2: accepted feeds are valid configurations
    const auto feeds = ConfigLoader::parse_feeds(text);
    assert(feeds.size() <= lines);
    for (const auto& f : feeds) {
        assert(f.config.validate().has_value());
        assert(f.asset == AssetId::from_symbol(f.config.symbol));
    }

    // Invariant 3: accepted assets respect the decimals and multiplier bounds
    const auto assets = ConfigLoader::parse_assets(text);
    assert(assets.size() <= lines);
    for (const auto& a : assets) {
        assert(a.params.decimals <= 18);
        assert(!a.penalty_multiplier_bps || *a.penalty_multiplier_bps > 0);
        assert(!a.symbol.empty());
    }

    return 0;
}
