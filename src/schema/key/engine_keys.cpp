#include <warden/schema/key/engine_keys.hpp>

#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/builder.hpp>

namespace warden::schema::key {

namespace {

using key_encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

warden::schema::bytes_t make_id_bytes(const warden::schema::hash32_t& id) {
  return warden::schema::bytes_t{std::begin(id), std::end(id)};
}

}  // namespace

const std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
const std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
const std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
const std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ"};
const std::string_view kEventPrefix{"SYS|EVENT|"};

warden::schema::vault_address_t make_vault_address(
    const warden::schema::identity_t& owner,
    const warden::schema::session_id_t& session_id) {
  auto b = builder{};
  b.write("vault");
  b.write(std::span{session_id.data(), session_id.size()});
  b.write(std::span{owner.data(), owner.size()});
  auto hashed = builder{};
  hashed.hash(std::span<const uint8_t>{b.data.data(), b.data.size()});
  return warden::schema::make_hash32(hashed.data);
}

warden::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const warden::schema::bytes_t& id) {
  auto key = warden::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

warden::schema::bytes_t make_vault_key(
    const warden::schema::vault_address_t& address) {
  return make_prefixed_key(kVaultKeyPrefix, make_id_bytes(address));
}

warden::schema::bytes_t make_account_key(
    const warden::schema::account_id_t& account) {
  return make_prefixed_key(kAccountKeyPrefix, make_id_bytes(account));
}

warden::schema::bytes_t make_nonce_key(
    const warden::schema::identity_t& signer) {
  return make_prefixed_key(kNonceKeyPrefix, make_id_bytes(signer));
}

warden::schema::bytes_t make_event_key(const uint64_t event_id) {
  return make_prefixed_key(kEventPrefix, key_encoder_t{}.encode(event_id));
}

}  // namespace warden::schema::key
