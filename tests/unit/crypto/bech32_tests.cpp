#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/bech32.hpp"
#include "crypto/hash.hpp"
#include "util/hex.hpp"

using namespace runeforge;

namespace {

std::vector<std::uint8_t> FromHex(const std::string& hex) {
  std::vector<std::uint8_t> out;
  if (!util::HexDecode(hex, &out)) {
    throw std::runtime_error("bad hex in test vector: " + hex);
  }
  return out;
}

bool ExpectAddress(const std::string& hrp, std::uint8_t version, const std::string& program_hex,
                   const std::string& expected) {
  const auto program = FromHex(program_hex);
  const std::string encoded = crypto::EncodeSegwitAddress(hrp, version, program);
  if (encoded != expected) {
    std::cerr << "encode " << program_hex << ": got " << encoded << "\n";
    return false;
  }
  std::uint8_t decoded_version = 0xFF;
  std::vector<std::uint8_t> decoded;
  if (!crypto::DecodeSegwitAddress(expected, hrp, &decoded_version, &decoded) ||
      decoded_version != version || decoded != program) {
    std::cerr << "decode " << expected << " failed\n";
    return false;
  }
  return true;
}

bool ExpectInvalid(const std::string& address, const std::string& hrp) {
  std::uint8_t version = 0;
  std::vector<std::uint8_t> program;
  if (crypto::DecodeSegwitAddress(address, hrp, &version, &program)) {
    std::cerr << "invalid address accepted: " << address << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    {
      const std::string abc = "abc";
      const auto digest = crypto::Sha256(std::vector<std::uint8_t>(abc.begin(), abc.end()));
      if (util::HexEncode(digest) !=
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        std::cerr << "sha256(abc) mismatch\n";
        return EXIT_FAILURE;
      }
    }

    // BIP173 P2WPKH and BIP350 P2TR vectors.
    if (!ExpectAddress("bc", 0, "751e76e8199196d454941c45d1b3a323f1433bd6",
                       "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4")) {
      return EXIT_FAILURE;
    }
    if (!ExpectAddress("bc", 1,
                       "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798",
                       "bc1p0xlxvlhemja6c4dqv22uapctqupfhlxm9h8z3k2e72q4k9hcz7vqzk5jj0")) {
      return EXIT_FAILURE;
    }
    if (!ExpectAddress("tb", 0, "4f9f569b6c48ddcf9d092b765f2ae52a3f04df7a",
                       "tb1qf704dxmvfrwul8gf9dm972h99glsfhm6lcj9le")) {
      return EXIT_FAILURE;
    }
    if (!ExpectAddress("bcrt", 1,
                       "4ee285e98e620caa755478d368b343ddf79bf44d44d623e182ebb306477c5259",
                       "bcrt1pfm3gt6vwvgx25a250rfk3v6rmhmehazdgntz8cvzawesv3mu2fvslp6l49")) {
      return EXIT_FAILURE;
    }

    // Upper-case addresses decode; mixed case does not.
    {
      std::uint8_t version = 0;
      std::vector<std::uint8_t> program;
      if (!crypto::DecodeSegwitAddress("BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4", "bc",
                                       &version, &program)) {
        std::cerr << "upper-case address rejected\n";
        return EXIT_FAILURE;
      }
    }
    if (!ExpectInvalid("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kV8f3t4", "bc")) return EXIT_FAILURE;
    // Wrong network.
    if (!ExpectInvalid("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", "tb")) return EXIT_FAILURE;
    // Bad checksum.
    if (!ExpectInvalid("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5", "bc")) return EXIT_FAILURE;
    // Taproot program under the bech32 (v0) checksum.
    if (!ExpectInvalid("bc1p0xlxvlhemja6c4dqv22uapctqupfhlxm9h8z3k2e72q4k9hcz7vqh2y7hd", "bc")) {
      return EXIT_FAILURE;
    }
    if (!ExpectInvalid("not-an-address", "bc")) return EXIT_FAILURE;

    {
      bool threw = false;
      try {
        (void)crypto::EncodeSegwitAddress("bc", 0, std::vector<std::uint8_t>(21, 0x00));
      } catch (const std::invalid_argument&) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "v0 program of 21 bytes encoded\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "bech32_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
