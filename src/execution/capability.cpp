#include <warden/execution/capability.hpp>

namespace warden::execution {

capability_t resolve_capability(
    const warden::schema::transaction_payload_t& payload,
    const warden::schema::identity_t& signer) {
  return std::visit(
      overloaded{
          [&](const warden::schema::execute_swap_t&) -> capability_t {
            return agent_capability{.signer = signer};
          },
          [&](const warden::schema::deduct_compute_fee_t&) -> capability_t {
            return crank_capability{.signer = signer};
          },
          [&](const warden::schema::expire_session_t&) -> capability_t {
            return crank_capability{.signer = signer};
          },
          [&](const auto&) -> capability_t {
            return owner_capability{.signer = signer};
          }},
      payload);
}

}  // namespace warden::execution
