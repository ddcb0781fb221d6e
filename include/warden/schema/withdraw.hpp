#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: withdraw.
// Escrow workflow: owner drains the full vault balance.
namespace warden::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
};

using withdraw_t = withdraw<1>;

}  // namespace warden::schema
