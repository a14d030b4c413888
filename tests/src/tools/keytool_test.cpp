#include <gtest/gtest.h>
#include <vouch/crypto/sign.hpp>
#include <vouch/crypto/verify.hpp>
#include <vouch/schema/primitives.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef VOUCH_KEYTOOL_PATH
#define VOUCH_KEYTOOL_PATH ""
#endif

namespace {

constexpr auto kSeedHex = std::string_view{
    "5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a"};

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::pair<int, std::string> run_keytool(const std::string_view args) {
  return run_capture(shell_quote(VOUCH_KEYTOOL_PATH) + " " +
                     std::string{args} + " 2>/dev/null");
}

/// `name=value` lines into a map.
std::map<std::string, std::string> parse_fields(const std::string& output) {
  auto fields = std::map<std::string, std::string>{};
  auto stream = std::istringstream{output};
  auto line = std::string{};
  while (std::getline(stream, line)) {
    auto split = line.find('=');
    if (split != std::string::npos) {
      fields[line.substr(0, split)] = trim_ascii_whitespace(line.substr(split + 1));
    }
  }
  return fields;
}

class keytool_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!std::filesystem::exists(VOUCH_KEYTOOL_PATH)) {
      GTEST_SKIP() << "vouch_keytool binary not available";
    }
    if (!vouch::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
  }
};

}  // namespace

TEST_F(keytool_test, keygen_from_seed_matches_library_derivation) {
  auto [exit_code, output] =
      run_keytool("keygen --seed-hex " + std::string{kSeedHex});
  ASSERT_EQ(exit_code, 0) << output;
  auto fields = parse_fields(output);
  EXPECT_EQ(fields["private"], kSeedHex);

  auto seed = vouch::crypto::ed25519_private_key_t{};
  seed.fill(0x5A);
  auto keypair = vouch::crypto::ed25519_from_seed(seed);
  ASSERT_TRUE(keypair.has_value());
  EXPECT_EQ(fields["public"],
            vouch::schema::to_hex(keypair->public_key.public_key));
}

TEST_F(keytool_test, challenge_has_requested_size) {
  auto [exit_code, output] = run_keytool("challenge --size 16");
  ASSERT_EQ(exit_code, 0) << output;
  auto hex = trim_ascii_whitespace(output);
  EXPECT_EQ(hex.size(), 32u);
  EXPECT_TRUE(vouch::schema::try_from_hex(hex).has_value());

  auto [empty_code, empty_output] = run_keytool("challenge --size 0");
  EXPECT_NE(empty_code, 0) << empty_output;
}

TEST_F(keytool_test, challenge_size_is_bounded) {
  auto [huge_code, huge_output] = run_keytool("challenge --size 4294967297");
  EXPECT_EQ(huge_code, 1) << huge_output;
  EXPECT_TRUE(huge_output.empty()) << huge_output;

  auto [over_code, over_output] = run_keytool(
      "challenge --size " + std::to_string(vouch::crypto::kMaxRandomBytes + 1));
  EXPECT_EQ(over_code, 1) << over_output;
}

TEST_F(keytool_test, sign_then_verify_round_trip) {
  auto [keygen_code, keygen_output] =
      run_keytool("keygen --seed-hex " + std::string{kSeedHex});
  ASSERT_EQ(keygen_code, 0);
  auto public_hex = parse_fields(keygen_output)["public"];

  auto [sign_code, sign_output] =
      run_keytool("sign --private-key-hex " + std::string{kSeedHex} +
                  " --challenge-hex 7231");
  ASSERT_EQ(sign_code, 0) << sign_output;
  auto signature_hex = trim_ascii_whitespace(sign_output);
  EXPECT_EQ(signature_hex.size(), 128u);

  auto [ok_code, ok_output] =
      run_keytool("verify --public-key-hex " + public_hex +
                  " --signature-hex " + signature_hex +
                  " --challenge-hex 7231");
  EXPECT_EQ(ok_code, 0);
  EXPECT_EQ(trim_ascii_whitespace(ok_output), "valid");

  auto [bad_code, bad_output] =
      run_keytool("verify --public-key-hex " + public_hex +
                  " --signature-hex " + signature_hex +
                  " --challenge-hex 7232");
  EXPECT_EQ(bad_code, 2);
  EXPECT_EQ(trim_ascii_whitespace(bad_output), "invalid");
}

TEST_F(keytool_test, rejects_malformed_input) {
  EXPECT_EQ(run_keytool("keygen --seed-hex abcd").first, 1);
  EXPECT_EQ(run_keytool("sign --private-key-hex " + std::string{kSeedHex} +
                        " --challenge-hex zz")
                .first,
            1);
  EXPECT_EQ(run_keytool("verify --scheme secp256k1 --public-key-hex 00 "
                        "--signature-hex 00 --challenge-hex 00")
                .first,
            1);
  EXPECT_EQ(run_keytool("frobnicate").first, 1);
}
