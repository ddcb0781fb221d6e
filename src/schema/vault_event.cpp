#include <warden/schema/vault_event.hpp>

#include <string>
#include <utility>

namespace warden::schema {

namespace {

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_attribute_t session_attribute(const session_id_t& id) {
  return make_attribute("session_id",
                        to_hex(bytes_view_t{id.data(), id.size()}), true);
}

transaction_event_attribute_t identity_attribute(std::string key,
                                                 const identity_t& identity) {
  return make_attribute(std::move(key), identity_to_string(identity));
}

template <typename Number>
transaction_event_attribute_t number_attribute(std::string key,
                                               const Number value) {
  return make_attribute(std::move(key), std::to_string(value));
}

}  // namespace

std::string_view event_type(const vault_event_t& event) {
  return std::visit(
      overloaded{
          [](const session_created_t&) -> std::string_view {
            return "warden.session_created";
          },
          [](const deposited_t&) -> std::string_view {
            return "warden.deposited";
          },
          [](const swap_executed_t&) -> std::string_view {
            return "warden.swap_executed";
          },
          [](const compute_fee_deducted_t&) -> std::string_view {
            return "warden.compute_fee_deducted";
          },
          [](const session_paused_t&) -> std::string_view {
            return "warden.session_paused";
          },
          [](const session_resumed_t&) -> std::string_view {
            return "warden.session_resumed";
          },
          [](const withdrawn_t&) -> std::string_view {
            return "warden.withdrawn";
          },
          [](const session_expired_t&) -> std::string_view {
            return "warden.session_expired";
          }},
      event);
}

transaction_event_t make_transaction_event(const vault_event_t& event) {
  auto out = transaction_event_t{};
  out.type = std::string{event_type(event)};
  std::visit(
      overloaded{
          [&](const session_created_t& e) {
            out.attributes = {session_attribute(e.session_id),
                              identity_attribute("owner", e.owner),
                              identity_attribute("agent", e.agent),
                              number_attribute("duration_days",
                                               e.duration_days)};
          },
          [&](const deposited_t& e) {
            out.attributes = {
                session_attribute(e.session_id),
                number_attribute("amount", e.amount),
                number_attribute("fee", e.fee),
                number_attribute("trading_balance", e.trading_balance),
                number_attribute("expires_at", e.expires_at)};
          },
          [&](const swap_executed_t& e) {
            out.attributes = {
                session_attribute(e.session_id),
                identity_attribute("agent", e.agent),
                identity_attribute("venue", e.venue),
                number_attribute("amount_in", e.amount_in),
                number_attribute("minimum_amount_out", e.minimum_amount_out),
                number_attribute("timestamp", e.timestamp)};
          },
          [&](const compute_fee_deducted_t& e) {
            out.attributes = {
                session_attribute(e.session_id), number_attribute("fee", e.fee),
                number_attribute("remaining_balance", e.remaining_balance)};
          },
          [&](const session_paused_t& e) {
            out.attributes = {session_attribute(e.session_id)};
          },
          [&](const session_resumed_t& e) {
            out.attributes = {session_attribute(e.session_id)};
          },
          [&](const withdrawn_t& e) {
            out.attributes = {session_attribute(e.session_id),
                              number_attribute("amount", e.amount),
                              identity_attribute("owner", e.owner)};
          },
          [&](const session_expired_t& e) {
            out.attributes = {
                session_attribute(e.session_id),
                number_attribute("remaining_balance", e.remaining_balance)};
          }},
      event);
  return out;
}

}  // namespace warden::schema
