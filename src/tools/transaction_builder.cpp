#include <boost/program_options.hpp>
#include <verity/common/critical.hpp>
#include <verity/crypto/verify.hpp>
#include <verity/execution/signing.hpp>
#include <verity/schema/encoding/scale/encoder.hpp>
#include <verity/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

verity::schema::bytes_t decode_hex_bytes(const std::string_view hex) {
  auto bytes = verity::schema::try_from_hex(normalize_hex(hex));
  if (!bytes) {
    verity::common::critical("malformed hex argument");
  }
  return *bytes;
}

verity::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    verity::common::critical("missing required hash argument");
  }
  auto bytes = decode_hex_bytes(vm[name].as<std::string>());
  if (bytes.size() != 32) {
    verity::common::critical("hash argument must be 32 bytes");
  }
  auto hash = verity::schema::hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

// Reads `--<name>` key hex and `--<name>-kind`.
verity::schema::principal_t get_principal(const po::variables_map& vm,
                                          const std::string& name) {
  if (!vm.contains(name)) {
    verity::common::critical("missing required principal argument");
  }
  auto principal = verity::schema::try_make_signer_id(
      vm[name + "-kind"].as<std::string>(),
      normalize_hex(vm[name].as<std::string>()));
  if (!principal) {
    verity::common::critical("malformed principal argument");
  }
  return *principal;
}

verity::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto bytes = vm["signature-hex"].as<std::string>().empty()
                   ? verity::schema::bytes_t{}
                   : decode_hex_bytes(vm["signature-hex"].as<std::string>());
  if (kind == "ed25519") {
    auto signature = verity::schema::ed25519_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        verity::common::critical("ed25519 signature must be 64 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return verity::schema::signature_t{signature};
  }
  if (kind == "secp256k1") {
    auto signature = verity::schema::secp256k1_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        verity::common::critical("secp256k1 signature must be 65 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return verity::schema::signature_t{signature};
  }
  verity::common::critical("unsupported signature-kind");
}

verity::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_identity") {
    if (!vm.contains("name") || !vm.contains("email")) {
      verity::common::critical("create_identity requires --name and --email");
    }
    return verity::schema::create_identity_t{
        .name = vm["name"].as<std::string>(),
        .email = vm["email"].as<std::string>()};
  }
  if (payload == "authorize_verifier") {
    return verity::schema::authorize_verifier_t{
        .target = get_principal(vm, "target")};
  }
  if (payload == "issue_credential") {
    if (!vm.contains("credential-type") || !vm.contains("data")) {
      verity::common::critical(
          "issue_credential requires --credential-type and --data");
    }
    return verity::schema::issue_credential_t{
        .subject = get_principal(vm, "subject"),
        .credential_type = vm["credential-type"].as<std::string>(),
        .data = vm["data"].as<std::string>(),
        .expiration_duration = vm["expiration-duration"].as<uint64_t>()};
  }
  if (payload == "verify_identity") {
    return verity::schema::verify_identity_t{
        .subject = get_principal(vm, "subject"),
        .credential_id = vm["credential-id"].as<uint64_t>()};
  }
  if (payload == "revoke_credential") {
    return verity::schema::revoke_credential_t{
        .credential_id = vm["credential-id"].as<uint64_t>()};
  }
  verity::common::critical("unsupported payload type");
}

verity::schema::transaction_t build_transaction(const po::variables_map& vm) {
  auto transaction = verity::schema::transaction_t{
      .version = 1,
      .chain_id = vm.contains("chain-id")
                      ? get_hash32(vm, "chain-id")
                      : verity::execution::registry_chain_id(),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = {},
      .payload = build_payload(vm),
      .signature = {}};

  if (vm.contains("signing-seed")) {
    auto seed = get_hash32(vm, "signing-seed");
    auto public_key = verity::crypto::ed25519_public_key(seed);
    if (!public_key) {
      verity::common::critical("failed to derive ed25519 public key");
    }
    transaction.signer = *public_key;
    auto message = verity::execution::make_signing_message(transaction);
    auto signature = verity::crypto::sign_ed25519(
        verity::schema::bytes_view_t{message}, seed);
    if (!signature) {
      verity::common::critical("failed to sign transaction");
    }
    transaction.signature = *signature;
    return transaction;
  }

  transaction.signer = get_principal(vm, "signer");
  transaction.signature = make_signature(vm);
  return transaction;
}

verity::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/keyspaces" ||
      path == "/registry/admin" || path == "/registry/verifiers" ||
      path == "/credential/total") {
    return {};
  }
  if (path == "/registry/verifier") {
    return encoder.encode(get_principal(vm, "target"));
  }
  if (path == "/identity" || path == "/identity/credentials") {
    return encoder.encode(get_principal(vm, "subject"));
  }
  if (path == "/credential" || path == "/credential/status") {
    return encoder.encode(vm["credential-id"].as<uint64_t>());
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  if (path == "/events/range") {
    return encoder.encode(std::tuple{vm["from-id"].as<uint64_t>(),
                                     vm["to-id"].as<uint64_t>()});
  }
  verity::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")("payload", po::value<std::string>(),
                                        "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (defaults to the registry chain id)")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer key hex")(
      "signer-kind", po::value<std::string>()->default_value("ed25519"),
      "named|ed25519|secp256k1")("signing-seed", po::value<std::string>(),
                                 "ed25519 private seed hex; signs the tx")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "name", po::value<std::string>(), "identity name")(
      "email", po::value<std::string>(), "identity email")(
      "target", po::value<std::string>(), "verifier key hex")(
      "target-kind", po::value<std::string>()->default_value("ed25519"),
      "named|ed25519|secp256k1")("subject", po::value<std::string>(),
                                 "subject key hex")(
      "subject-kind", po::value<std::string>()->default_value("ed25519"),
      "named|ed25519|secp256k1")("credential-type", po::value<std::string>(),
                                 "credential type label")(
      "data", po::value<std::string>(), "credential data")(
      "expiration-duration", po::value<uint64_t>()->default_value(0),
      "credential lifetime in seconds")(
      "credential-id", po::value<uint64_t>()->default_value(0),
      "credential id (0 selects general verification)")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to")(
      "from-id", po::value<uint64_t>()->default_value(1), "event range from")(
      "to-id", po::value<uint64_t>()->default_value(1), "event range to");

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
    if (!vm.contains("payload")) {
      verity::common::critical("transaction mode requires --payload");
    }
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << verity::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      verity::common::critical("query-key mode requires --path");
    }
    std::cout << verity::schema::to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = verity::execution::registry_chain_id();
    std::cout << verity::schema::to_hex(verity::schema::bytes_view_t{chain_id})
              << '\n';
    return 0;
  }

  verity::common::critical("command must be transaction|query-key|chain-id");
}
