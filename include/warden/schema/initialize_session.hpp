#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: initialize_session.
// Escrow workflow: owner (the signer) opens a pending session for an agent.
namespace warden::schema {

template <uint16_t Version>
struct initialize_session;

template <>
struct initialize_session<1> final {
  uint16_t version{1};
  session_id_t session_id{};
  uint16_t duration_days{};
  identity_t agent{};
  identity_t fee_recipient{};
};

using initialize_session_t = initialize_session<1>;

}  // namespace warden::schema
