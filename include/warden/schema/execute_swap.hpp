#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: execute_swap.
// Escrow workflow: agent-triggered trade routed to a whitelisted venue.
namespace warden::schema {

template <uint16_t Version>
struct execute_swap;

template <>
struct execute_swap<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
  amount_t amount_in{};
  amount_t minimum_amount_out{};
  identity_t venue{};
};

using execute_swap_t = execute_swap<1>;

}  // namespace warden::schema
