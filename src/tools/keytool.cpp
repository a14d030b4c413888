#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <vouch/crypto/sign.hpp>
#include <vouch/crypto/verify.hpp>
#include <vouch/schema/primitives.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

constexpr int kExitInvalidSignature = 2;

void print_help(const po::options_description& options) {
  std::cout << "usage: vouch_keytool <command> [options]\n"
            << "commands:\n"
            << "  keygen     new ed25519 keypair (or derive from --seed-hex)\n"
            << "  challenge  random challenge of --size bytes\n"
            << "  sign       ed25519 signature of --challenge-hex\n"
            << "  verify     check --signature-hex over --challenge-hex\n"
            << options << std::endl;
}

int fail(const std::string& message) {
  std::cerr << "error: " << message << std::endl;
  return 1;
}

std::optional<vouch::schema::bytes_t> hex_option(const po::variables_map& vm,
                                                 const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vouch::schema::try_from_hex(vm[name].as<std::string>());
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> fixed_hex_option(
    const po::variables_map& vm,
    const std::string& name) {
  auto bytes = hex_option(vm, name);
  if (!bytes || bytes->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(*bytes), N, std::begin(out));
  return out;
}

int print_keypair(const vouch::crypto::ed25519_keypair& keypair) {
  std::cout << "private=" << vouch::schema::to_hex(keypair.private_key) << '\n'
            << "public=" << vouch::schema::to_hex(keypair.public_key.public_key)
            << std::endl;
  return 0;
}

int keygen(const po::variables_map& vm) {
  if (vm.contains("seed-hex")) {
    auto seed = fixed_hex_option<32>(vm, "seed-hex");
    if (!seed) {
      return fail("--seed-hex must be 32 bytes of hex");
    }
    auto keypair = vouch::crypto::ed25519_from_seed(*seed);
    if (!keypair) {
      return fail("cannot derive ed25519 key from seed");
    }
    return print_keypair(*keypair);
  }
  auto keypair = vouch::crypto::generate_ed25519();
  if (!keypair) {
    return fail("ed25519 key generation failed");
  }
  return print_keypair(*keypair);
}

int challenge(const po::variables_map& vm) {
  auto size = vm["size"].as<std::size_t>();
  if (size == 0) {
    return fail("a challenge must not be empty");
  }
  if (size > vouch::crypto::kMaxRandomBytes) {
    return fail("challenge size exceeds " +
                std::to_string(vouch::crypto::kMaxRandomBytes) + " bytes");
  }
  auto bytes = vouch::crypto::random_bytes(size);
  if (!bytes) {
    return fail("random source failed");
  }
  std::cout << vouch::schema::to_hex(*bytes) << std::endl;
  return 0;
}

int sign(const po::variables_map& vm) {
  auto private_key = fixed_hex_option<32>(vm, "private-key-hex");
  if (!private_key) {
    return fail("--private-key-hex must be 32 bytes of hex");
  }
  auto message = hex_option(vm, "challenge-hex");
  if (!message || message->empty()) {
    return fail("--challenge-hex must be non-empty hex");
  }
  auto signature = vouch::crypto::sign_ed25519(*private_key, *message);
  if (!signature) {
    return fail("signing failed");
  }
  std::cout << vouch::schema::to_hex(*signature) << std::endl;
  return 0;
}

std::optional<std::pair<vouch::schema::public_key_t,
                        vouch::schema::signature_t>>
parse_credentials(const po::variables_map& vm) {
  auto scheme = vm["scheme"].as<std::string>();
  if (scheme == "ed25519") {
    auto key = fixed_hex_option<32>(vm, "public-key-hex");
    auto signature = fixed_hex_option<64>(vm, "signature-hex");
    if (!key || !signature) {
      return std::nullopt;
    }
    return std::pair{vouch::schema::public_key_t{vouch::schema::ed25519_public_key{
                         .public_key = *key}},
                     vouch::schema::signature_t{*signature}};
  }
  if (scheme == "secp256k1") {
    auto key = fixed_hex_option<33>(vm, "public-key-hex");
    auto signature = fixed_hex_option<65>(vm, "signature-hex");
    if (!key || !signature) {
      return std::nullopt;
    }
    return std::pair{
        vouch::schema::public_key_t{
            vouch::schema::secp256k1_public_key{.public_key = *key}},
        vouch::schema::signature_t{*signature}};
  }
  return std::nullopt;
}

int verify(const po::variables_map& vm) {
  auto credentials = parse_credentials(vm);
  if (!credentials) {
    return fail("--public-key-hex and --signature-hex do not fit --scheme");
  }
  auto message = hex_option(vm, "challenge-hex");
  if (!message) {
    return fail("--challenge-hex must be hex");
  }
  auto valid = vouch::crypto::verify_signature(
      credentials->first, credentials->second, *message);
  std::cout << (valid ? "valid" : "invalid") << std::endl;
  return valid ? 0 : kExitInvalidSignature;
}

}  // namespace

int main(int argc, const char** argv) {
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto options = po::options_description{"vouch_keytool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|challenge|sign|verify")("seed-hex", po::value<std::string>(),
                                      "ed25519 seed (32 bytes hex)")(
      "size", po::value<std::size_t>()->default_value(32),
      "challenge size in bytes")("private-key-hex", po::value<std::string>(),
                                 "ed25519 private key hex")(
      "public-key-hex", po::value<std::string>(), "public key hex")(
      "challenge-hex", po::value<std::string>(), "challenge bytes hex")(
      "signature-hex", po::value<std::string>(), "signature hex")(
      "scheme", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1");

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
  } catch (const po::error& error) {
    return fail(error.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (command == "keygen") {
    return keygen(vm);
  }
  if (command == "challenge") {
    return challenge(vm);
  }
  if (command == "sign") {
    return sign(vm);
  }
  if (command == "verify") {
    return verify(vm);
  }
  return fail("unknown command " + command);
}
