#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: vault status.
// Escrow workflow: session lifecycle. Pending until funded, then active or
// paused until it is expired or withdrawn.
namespace warden::schema {

enum class vault_status_t : uint8_t {
  pending = 0,
  active = 1,
  paused = 2,
  expired = 3,
  withdrawn = 4
};

inline constexpr auto kVaultStatusMappings =
    std::array{std::pair<std::string_view, vault_status_t>{
                   "pending", vault_status_t::pending},
               std::pair<std::string_view, vault_status_t>{
                   "active", vault_status_t::active},
               std::pair<std::string_view, vault_status_t>{
                   "paused", vault_status_t::paused},
               std::pair<std::string_view, vault_status_t>{
                   "expired", vault_status_t::expired},
               std::pair<std::string_view, vault_status_t>{
                   "withdrawn", vault_status_t::withdrawn}};

template <>
inline std::optional<vault_status_t> try_from_string<vault_status_t>(
    const std::string_view value) {
  return from_string(value, kVaultStatusMappings);
}

inline constexpr std::string_view to_string(const vault_status_t value) {
  return to_string(value, kVaultStatusMappings).value_or("unknown");
}

/// Map a persisted status tag back to the enum; unknown tags are rejected.
inline constexpr std::optional<vault_status_t> try_make_vault_status(
    const uint8_t tag) {
  if (tag > static_cast<uint8_t>(vault_status_t::withdrawn)) {
    return std::nullopt;
  }
  return static_cast<vault_status_t>(tag);
}

}  // namespace warden::schema
