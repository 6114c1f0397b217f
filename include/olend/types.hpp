#pragma once

/// @file include/olend/types.hpp
/// @brief Shared primitive types for the olend risk core.
///
/// Every module includes this file. It defines the fixed-point scalar
/// aliases, the logical timestamp, and the stable asset key used to index
/// per-asset tables.

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace olend {

// ─── Scalar Aliases ───────────────────────────────────────────────────────────

/// Logical clock reading in milliseconds. Supplied by the host, never read
/// from a wall clock inside the core.
using Timestamp = std::uint64_t;

/// Token amount in the asset's smallest unit.
using Amount = std::uint64_t;

/// Price or value with `constants::PRICE_DECIMALS` implied decimals.
using Price = std::uint64_t;

/// Ratio in basis points (10 000 bps = 100%).
using BasisPoints = std::uint64_t;

/// 128-bit intermediate for checked multiply-then-divide.
using Wide = unsigned __int128;

// ─── AssetId ──────────────────────────────────────────────────────────────────

/// Stable 64-bit asset fingerprint (FNV-1a of the asset symbol).
///
/// Used as an O(1) key into per-asset tables: feed configs, price slots,
/// collateral parameters. Two symbols that hash to the same fingerprint
/// are the same asset as far as the core is concerned.
struct AssetId {
    std::uint64_t fingerprint = 0;

    /// Fingerprint a symbol such as "BTC" or "USDC".
    [[nodiscard]] static constexpr AssetId from_symbol(std::string_view symbol) noexcept {
        std::uint64_t hash = 0xcbf29ce484222325ULL;
        for (const char c : symbol) {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= 0x100000001b3ULL;
        }
        return AssetId{hash};
    }

    friend constexpr auto operator<=>(const AssetId&, const AssetId&) = default;
};

/// Hasher for unordered containers keyed by AssetId.
struct AssetIdHash {
    [[nodiscard]] std::size_t operator()(const AssetId& id) const noexcept {
        return static_cast<std::size_t>(id.fingerprint);
    }
};

} // namespace olend
