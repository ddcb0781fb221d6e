#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: deposit.
// Escrow workflow: single funding of a pending vault; the setup fee is skimmed.
namespace warden::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
  amount_t amount{};
  identity_t fee_recipient{};
};

using deposit_t = deposit<1>;

}  // namespace warden::schema
