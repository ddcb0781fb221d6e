#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction.hpp>

#include <variant>

namespace warden::execution {

/// Caller acting as the vault owner.
struct owner_capability final {
  warden::schema::identity_t signer{};
};

/// Caller acting as the delegated trading agent.
struct agent_capability final {
  warden::schema::identity_t signer{};
};

/// Anonymous maintenance caller. Carries the signer for attribution only;
/// it is never matched against the record.
struct crank_capability final {
  warden::schema::identity_t signer{};
};

using capability_t =
    std::variant<owner_capability, agent_capability, crank_capability>;

/// The role a payload is executed under, decided by the payload kind alone.
capability_t resolve_capability(
    const warden::schema::transaction_payload_t& payload,
    const warden::schema::identity_t& signer);

/// Shared identity guard: the capability's signer equals the recorded role.
template <typename Capability>
bool holds_role(const Capability& capability,
                const warden::schema::identity_t& recorded) {
  return capability.signer == recorded;
}

}  // namespace warden::execution
