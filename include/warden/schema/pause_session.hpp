#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: pause_session.
// Escrow workflow: owner halts agent trading.
namespace warden::schema {

template <uint16_t Version>
struct pause_session;

template <>
struct pause_session<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
};

using pause_session_t = pause_session<1>;

}  // namespace warden::schema
