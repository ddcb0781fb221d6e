#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

// Schema type: deduct_compute_fee.
// Escrow workflow: permissionless crank debiting the daily compute fee.
namespace warden::schema {

template <uint16_t Version>
struct deduct_compute_fee;

template <>
struct deduct_compute_fee<1> final {
  uint16_t version{1};
  identity_t owner{};
  session_id_t session_id{};
  identity_t fee_recipient{};
};

using deduct_compute_fee_t = deduct_compute_fee<1>;

}  // namespace warden::schema
