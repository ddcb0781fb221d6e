#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <string_view>

namespace warden::execution {

inline constexpr std::size_t kVenueWhitelistSize = 5;

/// Base58 identities of the trading venues an agent may route through.
inline constexpr auto kVenueWhitelistText =
    std::array<std::string_view, kVenueWhitelistSize>{
        "JUP6LkbZbjS1jKKwapdHNy74zcZ3tLUZoi5QNyVTaV4",   // aggregator v6
        "675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8",  // AMM
        "CAMMCzo5YL8w4VFF8KVHrK22GGUsp5VTaW7grrKgrWqK",  // concentrated liquidity
        "whirLbMiicVdio4qvUfM5KAg6Ct8VwpYzGff3uctyCc",   // whirlpool
        "pAMMBay6oceH9fJKBRHGP5D4bD4sWpmSwMn52FMfXEA",   // pump AMM
    };

/// Decoded whitelist, built once on first use and immutable afterwards.
const std::array<warden::schema::identity_t, kVenueWhitelistSize>&
venue_whitelist();

bool is_whitelisted_venue(const warden::schema::identity_t& venue);

}  // namespace warden::execution
