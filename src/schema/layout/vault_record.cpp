#include <warden/schema/layout/vault_record.hpp>

#include <boost/endian/buffers.hpp>

#include <cstring>
#include <type_traits>

namespace warden::schema::layout {

namespace {

namespace endian = boost::endian;

struct vault_record_layout final {
  identity_t owner;
  identity_t agent;
  identity_t fee_recipient;
  session_id_t session_id;
  endian::little_uint64_buf_t balance;
  endian::little_uint64_buf_t fee_collected;
  endian::little_uint64_buf_t compute_fees_paid;
  endian::little_uint16_buf_t duration_days;
  uint8_t status;
  uint8_t layout_tag;
  endian::little_int64_buf_t created_at;
  endian::little_int64_buf_t funded_at;
  endian::little_int64_buf_t expires_at;
  endian::little_int64_buf_t last_fee_deduction;
};

static_assert(sizeof(vault_record_layout) == kVaultRecordSize);
static_assert(std::is_trivially_copyable_v<vault_record_layout>);

}  // namespace

bytes_t encode_vault_record(const vault_state_t& vault) {
  auto record = vault_record_layout{};
  record.owner = vault.owner;
  record.agent = vault.agent;
  record.fee_recipient = vault.fee_recipient;
  record.session_id = vault.session_id;
  record.balance = vault.balance;
  record.fee_collected = vault.fee_collected;
  record.compute_fees_paid = vault.compute_fees_paid;
  record.duration_days = vault.duration_days;
  record.status = static_cast<uint8_t>(vault.status);
  record.layout_tag = vault.layout_tag;
  record.created_at = vault.created_at;
  record.funded_at = vault.funded_at;
  record.expires_at = vault.expires_at;
  record.last_fee_deduction = vault.last_fee_deduction;

  auto out = bytes_t(kVaultRecordSize);
  std::memcpy(out.data(), &record, kVaultRecordSize);
  return out;
}

std::optional<vault_state_t> decode_vault_record(const bytes_view_t& bytes) {
  if (bytes.size() != kVaultRecordSize) {
    return std::nullopt;
  }
  auto record = vault_record_layout{};
  std::memcpy(&record, bytes.data(), kVaultRecordSize);

  auto status = try_make_vault_status(record.status);
  if (!status || record.layout_tag != kVaultLayoutTag) {
    return std::nullopt;
  }

  auto vault = vault_state_t{};
  vault.owner = record.owner;
  vault.agent = record.agent;
  vault.fee_recipient = record.fee_recipient;
  vault.session_id = record.session_id;
  vault.balance = record.balance.value();
  vault.fee_collected = record.fee_collected.value();
  vault.compute_fees_paid = record.compute_fees_paid.value();
  vault.duration_days = record.duration_days.value();
  vault.status = *status;
  vault.layout_tag = record.layout_tag;
  vault.created_at = record.created_at.value();
  vault.funded_at = record.funded_at.value();
  vault.expires_at = record.expires_at.value();
  vault.last_fee_deduction = record.last_fee_deduction.value();
  return vault;
}

}  // namespace warden::schema::layout
