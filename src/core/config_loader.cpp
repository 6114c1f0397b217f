/// @file src/core/config_loader.cpp
/// @brief ConfigLoader: CSV feed and asset tables.

#include "olend/config_loader.hpp"
#include "olend/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace olend::config {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

/// Whole-token integer parse; nullopt on empty input, trailing garbage or
/// out-of-range values.
template <typename T>
[[nodiscard]] std::optional<T> parse_int(std::string_view token) noexcept {
    if (token.empty()) {
        return std::nullopt;
    }
    T value{};
    const auto* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<bool> parse_flag(std::string_view token) noexcept {
    if (token == "1" || token == "true")  return true;
    if (token == "0" || token == "false") return false;
    return std::nullopt;
}

/// Calls `row(line, line_number)` for every data line after the header.
template <typename RowFn>
void for_each_row(std::string_view csv, RowFn&& row) {
    bool header_skipped = false;
    std::size_t line_number = 0;
    std::size_t start = 0;
    while (start <= csv.size()) {
        auto newline = csv.find('\n', start);
        if (newline == std::string_view::npos) {
            newline = csv.size();
        }
        const std::string_view line = trim(csv.substr(start, newline - start));
        start = newline + 1;
        ++line_number;

        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        row(line, line_number);
    }
}

[[nodiscard]] std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // anonymous namespace

// ─── Asset classes ────────────────────────────────────────────────────────────

std::optional<risk::AssetClass> ConfigLoader::parse_asset_class(std::string_view name) {
    if (name == "stablecoin") return risk::AssetClass::Stablecoin;
    if (name == "blue_chip")  return risk::AssetClass::BlueChip;
    if (name == "major")      return risk::AssetClass::Major;
    if (name == "long_tail")  return risk::AssetClass::LongTail;
    return std::nullopt;
}

// ─── Row parsers ──────────────────────────────────────────────────────────────

std::optional<FeedEntry> ConfigLoader::parse_feed_row(std::string_view line) {
    const auto fields = split(line);
    if (fields.size() != 6 && fields.size() != 7) {
        return std::nullopt;
    }

    const auto exponent      = parse_int<std::int32_t>(fields[2]);
    const auto heartbeat     = parse_int<Timestamp>(fields[3]);
    const auto deviation     = parse_int<BasisPoints>(fields[4]);
    const auto min_conf      = parse_int<BasisPoints>(fields[5]);
    const auto enabled       = fields.size() == 7 ? parse_flag(fields[6]) : std::optional<bool>{true};
    if (!exponent || !heartbeat || !deviation || !min_conf || !enabled) {
        return std::nullopt;
    }

    oracle::PriceFeedConfig config{
        .symbol             = std::string(fields[0]),
        .feed_id            = std::string(fields[1]),
        .exponent           = *exponent,
        .heartbeat_ms       = *heartbeat,
        .max_deviation_bps  = *deviation,
        .min_confidence_bps = *min_conf,
        .enabled            = *enabled,
    };
    if (!config.validate()) {
        return std::nullopt;
    }
    return FeedEntry{AssetId::from_symbol(config.symbol), std::move(config)};
}

std::optional<AssetEntry> ConfigLoader::parse_asset_row(std::string_view line) {
    const auto fields = split(line);
    if (fields.size() != 3 && fields.size() != 4) {
        return std::nullopt;
    }
    if (fields[0].empty()) {
        return std::nullopt;
    }

    const auto asset_class = parse_asset_class(fields[1]);
    const auto decimals    = parse_int<unsigned>(fields[2]);
    if (!asset_class || !decimals || *decimals > 18) {
        return std::nullopt;
    }

    std::optional<BasisPoints> multiplier;
    if (fields.size() == 4) {
        multiplier = parse_int<BasisPoints>(fields[3]);
        if (!multiplier || *multiplier == 0) {
            return std::nullopt;
        }
    }

    return AssetEntry{
        .asset  = AssetId::from_symbol(fields[0]),
        .symbol = std::string(fields[0]),
        .params = risk::AssetRiskParams{*asset_class, static_cast<std::uint8_t>(*decimals)},
        .penalty_multiplier_bps = multiplier,
    };
}

// ─── Tables ───────────────────────────────────────────────────────────────────

std::vector<FeedEntry> ConfigLoader::parse_feeds(std::string_view csv) {
    std::vector<FeedEntry> entries;
    std::size_t skipped = 0;
    for_each_row(csv, [&](std::string_view line, std::size_t line_number) {
        auto entry = parse_feed_row(line);
        if (!entry) {
            log::warn("config_loader", "feed table line {}: skipped malformed row", line_number);
            ++skipped;
            return;
        }
        entries.push_back(std::move(*entry));
    });
    if (skipped > 0) {
        log::info("config_loader", "loaded {} feeds, skipped {}", entries.size(), skipped);
    }
    return entries;
}

std::vector<AssetEntry> ConfigLoader::parse_assets(std::string_view csv) {
    std::vector<AssetEntry> entries;
    std::size_t skipped = 0;
    for_each_row(csv, [&](std::string_view line, std::size_t line_number) {
        auto entry = parse_asset_row(line);
        if (!entry) {
            log::warn("config_loader", "asset table line {}: skipped malformed row", line_number);
            ++skipped;
            return;
        }
        entries.push_back(std::move(*entry));
    });
    if (skipped > 0) {
        log::info("config_loader", "loaded {} assets, skipped {}", entries.size(), skipped);
    }
    return entries;
}

Result<std::vector<FeedEntry>> ConfigLoader::load_feeds(const std::string& path) {
    auto contents = read_file(path);
    if (!contents) {
        log::error("config_loader", "cannot open feed table '{}'", path);
        return ErrorCode::InvalidConfig;
    }
    return parse_feeds(*contents);
}

Result<std::vector<AssetEntry>> ConfigLoader::load_assets(const std::string& path) {
    auto contents = read_file(path);
    if (!contents) {
        log::error("config_loader", "cannot open asset table '{}'", path);
        return ErrorCode::InvalidConfig;
    }
    return parse_assets(*contents);
}

void ConfigLoader::apply_assets(const std::vector<AssetEntry>& entries,
                                risk::CollateralPolicy& policy,
                                risk::PenaltyRateConfig& penalty) {
    for (const AssetEntry& entry : entries) {
        policy.assets[entry.asset] = entry.params;
        if (entry.penalty_multiplier_bps) {
            penalty.asset_multiplier_bps[entry.asset] = *entry.penalty_multiplier_bps;
        }
    }
}

} // namespace olend::config
