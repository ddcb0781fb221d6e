#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: expire_session.
// Escrow workflow: permissionless crank closing an elapsed session.
namespace warden::schema {

template <uint16_t Version>
struct expire_session;

template <>
struct expire_session<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
};

using expire_session_t = expire_session<1>;

}  // namespace warden::schema
