#pragma once

#include <warden/schema/primitives.hpp>

#include <optional>

namespace warden::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

bool available();

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::identity_t& signer,
                      const warden::schema::ed25519_signature_t& signature);

/// Sign with a raw 32-byte ed25519 seed. Used by tooling and tests; the
/// node itself never holds keys.
std::optional<warden::schema::ed25519_signature_t> sign(
    const warden::schema::bytes_view_t& message,
    const ed25519_seed_t& seed);

std::optional<warden::schema::identity_t> public_key_from_seed(
    const ed25519_seed_t& seed);

}  // namespace warden::crypto
