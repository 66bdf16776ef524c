#include <boost/program_options.hpp>
#include <credo/blake3/hash.hpp>
#include <credo/common/critical.hpp>
#include <credo/crypto/verify.hpp>
#include <credo/execution/signature_verifier.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/genesis.hpp>
#include <credo/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

credo::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    credo::common::critical("missing required argument --" + name);
  }
  return credo::schema::make_hash32(
      std::string_view{vm[name].as<std::string>()});
}

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    credo::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

credo::schema::hash32_t default_chain_id() {
  return credo::blake3::hash(credo::schema::kDefaultChainIdSeed);
}

std::optional<credo::crypto::ed25519_private_key_t> get_private_key(
    const po::variables_map& vm) {
  if (!vm.contains("private-key")) {
    return std::nullopt;
  }
  return credo::schema::make_hash32(
      std::string_view{vm["private-key"].as<std::string>()});
}

credo::schema::principal_t resolve_signer(
    const po::variables_map& vm,
    const std::optional<credo::crypto::ed25519_private_key_t>& private_key) {
  if (vm.contains("signer")) {
    return get_hash32(vm, "signer");
  }
  if (private_key) {
    auto derived = credo::crypto::derive_public_key(*private_key);
    if (!derived) {
      credo::common::critical("failed to derive ed25519 public key");
    }
    return *derived;
  }
  credo::common::critical("transaction mode requires --signer or --private-key");
}

credo::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = get_string(vm, "payload");
  if (payload == "create_identity") {
    return credo::schema::create_identity_t{
        .name = get_string(vm, "name"),
        .email = get_string(vm, "email"),
        .profile_hash = vm["profile-hash"].as<std::string>()};
  }
  if (payload == "update_profile") {
    return credo::schema::update_profile_t{
        .name = get_string(vm, "name"),
        .email = get_string(vm, "email"),
        .profile_hash = vm["profile-hash"].as<std::string>()};
  }
  if (payload == "verify_identity") {
    return credo::schema::verify_identity_t{
        .subject = get_hash32(vm, "subject"),
        .verified = vm["verified"].as<bool>()};
  }
  if (payload == "add_credential") {
    return credo::schema::add_credential_t{
        .subject = get_hash32(vm, "subject"),
        .credential_type = get_string(vm, "credential-type"),
        .credential_hash = get_string(vm, "credential-hash"),
        .expires_at = vm["expires-at"].as<uint64_t>()};
  }
  if (payload == "revoke_credential") {
    return credo::schema::revoke_credential_t{
        .subject = get_hash32(vm, "subject"),
        .index = vm["index"].as<uint64_t>()};
  }
  if (payload == "add_trusted_issuer") {
    return credo::schema::add_trusted_issuer_t{.issuer =
                                                   get_hash32(vm, "issuer")};
  }
  if (payload == "remove_trusted_issuer") {
    return credo::schema::remove_trusted_issuer_t{
        .issuer = get_hash32(vm, "issuer")};
  }
  credo::common::critical("unsupported payload type");
}

credo::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/engine/info" || path == "/registry/stats" ||
      path == "/registry/owner") {
    return {};
  }
  if (path == "/state/identity" || path == "/state/trusted_issuer" ||
      path == "/state/credentials_count") {
    return encoder.encode(get_hash32(vm, "principal"));
  }
  if (path == "/state/credential" || path == "/state/credential_valid") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "principal"), vm["index"].as<uint64_t>()});
  }
  if (path == "/events/range" || path == "/history/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  credo::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  credo_transaction_builder transaction [options]\n"
            << "  credo_transaction_builder query-key [options]\n"
            << "  credo_transaction_builder public-key --private-key <hex>\n"
            << "  credo_transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"credo_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|public-key|chain-id")(
      "payload", po::value<std::string>(),
      "create_identity|update_profile|verify_identity|add_credential|"
      "revoke_credential|add_trusted_issuer|remove_trusted_issuer")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (default: BLAKE3 of the default seed)")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer public key hex")(
      "private-key", po::value<std::string>(),
      "ed25519 private key hex; signs the transaction")(
      "name", po::value<std::string>(), "identity display name")(
      "email", po::value<std::string>(), "identity email")(
      "profile-hash", po::value<std::string>()->default_value(""),
      "profile content hash")("subject", po::value<std::string>(),
                              "subject principal hex")(
      "verified", po::value<bool>()->default_value(true),
      "verification flag")("credential-type", po::value<std::string>(),
                           "credential type")(
      "credential-hash", po::value<std::string>(), "credential content hash")(
      "expires-at", po::value<uint64_t>()->default_value(0),
      "credential expiry ms, 0 for never")(
      "index", po::value<uint64_t>()->default_value(0), "credential index")(
      "issuer", po::value<std::string>(), "issuer principal hex")(
      "principal", po::value<std::string>(), "query principal hex")(
      "from", po::value<uint64_t>()->default_value(1), "range start")(
      "to", po::value<uint64_t>()->default_value(1), "range end");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto private_key = get_private_key(vm);
    auto transaction = credo::schema::transaction_t{
        .version = 1,
        .chain_id = vm.contains("chain-id") ? get_hash32(vm, "chain-id")
                                            : default_chain_id(),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = resolve_signer(vm, private_key),
        .payload = build_payload(vm),
        .signature = credo::schema::ed25519_signature_t{}};
    if (private_key) {
      auto message = credo::execution::make_signing_message(transaction);
      auto signature = credo::crypto::sign(
          credo::schema::bytes_view_t{message.data(), message.size()},
          *private_key);
      if (!signature) {
        credo::common::critical("failed to sign transaction");
      }
      transaction.signature = *signature;
    }
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << credo::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << credo::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "public-key") {
    auto private_key = get_private_key(vm);
    if (!private_key) {
      credo::common::critical("public-key mode requires --private-key");
    }
    auto derived = credo::crypto::derive_public_key(*private_key);
    if (!derived) {
      credo::common::critical("failed to derive ed25519 public key");
    }
    std::cout << credo::schema::to_hex(*derived) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << credo::schema::to_hex(default_chain_id()) << '\n';
    return 0;
  }

  credo::common::critical(
      "command must be transaction|query-key|public-key|chain-id");
}
