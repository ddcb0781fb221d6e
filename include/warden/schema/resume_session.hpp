#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: resume_session.
// Escrow workflow: owner re-enables agent trading before expiry.
namespace warden::schema {

template <uint16_t Version>
struct resume_session;

template <>
struct resume_session<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
};

using resume_session_t = resume_session<1>;

}  // namespace warden::schema
