#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Ed25519 public key naming an owner, agent, fee recipient or venue.
using identity_t = hash32_t;
/// Ledger account: an identity or a vault address.
using account_id_t = hash32_t;
using vault_address_t = hash32_t;
using session_id_t = std::array<uint8_t, 16>;
using ed25519_signature_t = std::array<uint8_t, 64>;

/// Smallest value unit.
using amount_t = uint64_t;
/// Seconds since the unix epoch, signed like the block clock.
using timestamp_seconds_t = int64_t;

/// Widened intermediates for checked fee arithmetic.
using wide_amount_t = boost::multiprecision::uint128_t;
using wide_timestamp_t = boost::multiprecision::int128_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::optional<session_id_t> try_make_session_id(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

/// Bitcoin-alphabet base58, the textual form of identities.
std::string to_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

/// Parse an identity written either as base58 or as 64 hex digits.
std::optional<identity_t> try_parse_identity(std::string_view text);
std::string identity_to_string(const identity_t& identity);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
