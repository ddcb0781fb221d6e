#include <boost/program_options.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/execution/engine.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

warden::schema::identity_t get_identity(const po::variables_map& vm,
                                        const std::string& name) {
  auto identity = warden::schema::try_parse_identity(require(vm, name));
  if (!identity) {
    warden::common::critical("--{} must be base58 or 64 hex digits", name);
  }
  return *identity;
}

warden::schema::session_id_t get_session_id(const po::variables_map& vm) {
  auto session_id = warden::schema::try_make_session_id(require(vm, "session-id"));
  if (!session_id) {
    warden::common::critical("--session-id must be 32 hex digits");
  }
  return *session_id;
}

warden::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (!vm.contains("chain-id")) {
    return warden::blake3::hash(std::string_view{"warden-devnet"});
  }
  auto chain_id =
      warden::schema::try_make_hash32(vm["chain-id"].as<std::string>());
  if (!chain_id) {
    warden::common::critical("--chain-id must be 64 hex digits");
  }
  return *chain_id;
}

std::optional<warden::crypto::ed25519_seed_t> get_secret_key(
    const po::variables_map& vm) {
  if (!vm.contains("secret-key-hex")) {
    return std::nullopt;
  }
  auto bytes =
      warden::schema::try_from_hex(vm["secret-key-hex"].as<std::string>());
  auto seed = warden::crypto::ed25519_seed_t{};
  if (!bytes || bytes->size() != seed.size()) {
    warden::common::critical("--secret-key-hex must be a 32-byte seed");
  }
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(seed));
  return seed;
}

warden::schema::identity_t get_signer(
    const po::variables_map& vm,
    const std::optional<warden::crypto::ed25519_seed_t>& seed) {
  if (vm.contains("signer")) {
    return get_identity(vm, "signer");
  }
  if (!seed) {
    warden::common::critical("--signer or --secret-key-hex is required");
  }
  auto public_key = warden::crypto::public_key_from_seed(*seed);
  if (!public_key) {
    warden::common::critical("failed to derive public key from seed");
  }
  return *public_key;
}

// The session owner defaults to the signer for owner-signed payloads.
warden::schema::identity_t get_owner(const po::variables_map& vm,
                                     const warden::schema::identity_t& signer) {
  return vm.contains("owner") ? get_identity(vm, "owner") : signer;
}

warden::schema::transaction_payload_t build_payload(
    const po::variables_map& vm,
    const warden::schema::identity_t& signer) {
  auto payload = require(vm, "payload");
  if (payload == "initialize_session") {
    auto duration_days = vm["duration-days"].as<uint32_t>();
    if (duration_days > 0xFFFFu) {
      warden::common::critical("--duration-days must fit in 16 bits");
    }
    return warden::schema::initialize_session_t{
        .session_id = get_session_id(vm),
        .duration_days = static_cast<uint16_t>(duration_days),
        .agent = get_identity(vm, "agent"),
        .fee_recipient = get_identity(vm, "fee-recipient")};
  }
  if (payload == "deposit") {
    return warden::schema::deposit_t{
        .owner = get_owner(vm, signer),
        .session_id = get_session_id(vm),
        .amount = vm["amount"].as<uint64_t>(),
        .fee_recipient = get_identity(vm, "fee-recipient")};
  }
  if (payload == "execute_swap") {
    return warden::schema::execute_swap_t{
        .owner = get_identity(vm, "owner"),
        .session_id = get_session_id(vm),
        .amount_in = vm["amount"].as<uint64_t>(),
        .minimum_amount_out = vm["minimum-amount-out"].as<uint64_t>(),
        .venue = get_identity(vm, "venue")};
  }
  if (payload == "deduct_compute_fee") {
    return warden::schema::deduct_compute_fee_t{
        .owner = get_identity(vm, "owner"),
        .session_id = get_session_id(vm),
        .fee_recipient = get_identity(vm, "fee-recipient")};
  }
  if (payload == "pause_session") {
    return warden::schema::pause_session_t{.owner = get_owner(vm, signer),
                                           .session_id = get_session_id(vm)};
  }
  if (payload == "resume_session") {
    return warden::schema::resume_session_t{.owner = get_owner(vm, signer),
                                            .session_id = get_session_id(vm)};
  }
  if (payload == "withdraw") {
    return warden::schema::withdraw_t{.owner = get_owner(vm, signer),
                                      .session_id = get_session_id(vm)};
  }
  if (payload == "expire_session") {
    return warden::schema::expire_session_t{
        .owner = get_identity(vm, "owner"), .session_id = get_session_id(vm)};
  }
  warden::common::critical("unsupported --payload '{}'", payload);
}

warden::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto path = require(vm, "path");
  auto encoder = encoder_t{};
  if (path == "/engine/info" || path == "/engine/whitelist") {
    return {};
  }
  if (path == "/state/vault") {
    return encoder.encode(
        std::tuple{get_identity(vm, "owner"), get_session_id(vm)});
  }
  if (path == "/state/account" || path == "/state/nonce") {
    return encoder.encode(get_identity(vm, "account"));
  }
  if (path == "/events/range") {
    return encoder.encode(std::tuple{vm["from-id"].as<uint64_t>(),
                                     vm["to-id"].as<uint64_t>()});
  }
  warden::common::critical("unsupported --path '{}'", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  warden_tx transaction [options]\n"
            << "  warden_tx query-key [options]\n"
            << "  warden_tx vault-address --owner <id> --session-id <hex>\n"
            << "  warden_tx public-key --secret-key-hex <hex>\n"
            << "  warden_tx chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"warden_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|vault-address|public-key|chain-id")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "node query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer identity")(
      "secret-key-hex", po::value<std::string>(),
      "32-byte ed25519 seed used to sign")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "precomputed 64-byte signature hex")(
      "session-id", po::value<std::string>(), "16-byte session id hex")(
      "duration-days", po::value<uint32_t>()->default_value(1),
      "session duration in days")("owner", po::value<std::string>(),
                                  "session owner identity")(
      "agent", po::value<std::string>(), "agent identity")(
      "fee-recipient", po::value<std::string>(), "fee recipient identity")(
      "venue", po::value<std::string>(), "swap venue identity")(
      "amount", po::value<uint64_t>()->default_value(0),
      "deposit amount or swap amount in")(
      "minimum-amount-out", po::value<uint64_t>()->default_value(0),
      "swap slippage floor")("account", po::value<std::string>(),
                             "account or signer identity for queries")(
      "from-id", po::value<uint64_t>()->default_value(1), "first event id")(
      "to-id", po::value<uint64_t>()->default_value(1), "last event id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto seed = get_secret_key(vm);
    auto signer = get_signer(vm, seed);
    auto transaction =
        warden::schema::transaction_t{.version = 1,
                                      .chain_id = get_chain_id(vm),
                                      .nonce = vm["nonce"].as<uint64_t>(),
                                      .signer = signer,
                                      .payload = build_payload(vm, signer),
                                      .signature = {}};
    auto signature_hex = vm["signature-hex"].as<std::string>();
    if (seed) {
      auto message = warden::execution::make_signing_bytes(transaction);
      auto signature = warden::crypto::sign(
          warden::schema::make_bytes_view(message), *seed);
      if (!signature) {
        warden::common::critical("failed to sign transaction");
      }
      transaction.signature = *signature;
    } else if (!signature_hex.empty()) {
      auto bytes = warden::schema::try_from_hex(signature_hex);
      if (!bytes || bytes->size() != transaction.signature.size()) {
        warden::common::critical("--signature-hex must be 64 bytes");
      }
      std::copy(std::begin(*bytes), std::end(*bytes),
                std::begin(transaction.signature));
    }
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << warden::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << warden::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "vault-address") {
    auto address = warden::schema::key::make_vault_address(
        get_identity(vm, "owner"), get_session_id(vm));
    std::cout << warden::schema::identity_to_string(address) << '\n';
    return 0;
  }

  if (command == "public-key") {
    auto seed = get_secret_key(vm);
    if (!seed) {
      warden::common::critical("public-key requires --secret-key-hex");
    }
    auto public_key = warden::crypto::public_key_from_seed(*seed);
    if (!public_key) {
      warden::common::critical("failed to derive public key from seed");
    }
    std::cout << warden::schema::identity_to_string(*public_key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << warden::schema::to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  warden::common::critical(
      "command must be transaction|query-key|vault-address|public-key|"
      "chain-id");
}
