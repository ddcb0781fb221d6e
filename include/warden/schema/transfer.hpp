#pragma once

#include <warden/schema/primitives.hpp>

// Schema type: transfer.
// A value movement requested by a vault transition and applied by the ledger.
namespace warden::schema {

struct transfer_t final {
  account_id_t from{};
  account_id_t to{};
  amount_t amount{};

  bool operator==(const transfer_t&) const = default;
};

}  // namespace warden::schema
