#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "runes/rune_name.hpp"

using namespace runeforge;

namespace {

bool ExpectName(const std::string& name, const runes::BigUint& expected) {
  runes::BigUint value;
  runes::CodecError code = runes::CodecError::kNone;
  if (!runes::EncodeRuneName(name, &value, &code)) {
    std::cerr << "encode '" << name << "' failed: " << runes::CodecErrorName(code) << "\n";
    return false;
  }
  if (value != expected) {
    std::cerr << "encode '" << name << "': got " << value.str() << ", expected "
              << expected.str() << "\n";
    return false;
  }
  return true;
}

bool ExpectRejected(const std::string& name) {
  runes::BigUint value;
  runes::CodecError code = runes::CodecError::kNone;
  if (runes::EncodeRuneName(name, &value, &code) ||
      code != runes::CodecError::kInvalidNameCharacter) {
    std::cerr << "name '" << name << "' should be rejected as invalid\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!ExpectName("A", 0)) return EXIT_FAILURE;
    if (!ExpectName("Z", 25)) return EXIT_FAILURE;
    if (!ExpectName("BA", 26)) return EXIT_FAILURE;
    if (!ExpectName("MYRUNE", 153856590)) return EXIT_FAILURE;
    if (!ExpectName("uncommongoods", runes::BigUint("1956654565596070280"))) {
      return EXIT_FAILURE;
    }

    // Spacers are stripped before encoding.
    if (!ExpectName("MY\xE2\x80\xA2RUNE", 153856590)) return EXIT_FAILURE;
    if (runes::ComputeSpacers("MY\xE2\x80\xA2RUNE") != (1u << 2)) {
      std::cerr << "MY\xE2\x80\xA2RUNE should set spacer bit 2\n";
      return EXIT_FAILURE;
    }
    if (runes::ComputeSpacers("A\xE2\x80\xA2" "B\xE2\x80\xA2" "C") != ((1u << 1) | (1u << 3))) {
      std::cerr << "multi-spacer mask wrong\n";
      return EXIT_FAILURE;
    }
    // A spacer in the final position carries no bit.
    if (runes::ComputeSpacers("AB\xE2\x80\xA2") != 0) {
      std::cerr << "trailing spacer set a bit\n";
      return EXIT_FAILURE;
    }

    if (!ExpectRejected("")) return EXIT_FAILURE;
    if (!ExpectRejected("\xE2\x80\xA2")) return EXIT_FAILURE;
    if (!ExpectRejected("MY RUNE")) return EXIT_FAILURE;
    if (!ExpectRejected("RUNE1")) return EXIT_FAILURE;
    if (!ExpectRejected("CAF\xC3\x89")) return EXIT_FAILURE;
    if (!ExpectRejected("BAD\xFF")) return EXIT_FAILURE;

    {
      for (const std::string name : {"B", "Z", "MYRUNE", "UNCOMMONGOODS", "ZZZZZZZZZZZZZZZZZZZZZZZZZZZZ"}) {
        runes::BigUint value;
        if (!runes::EncodeRuneName(name, &value) || runes::DecodeRuneName(value) != name) {
          std::cerr << "round trip failed for " << name << "\n";
          return EXIT_FAILURE;
        }
      }
      if (runes::DecodeRuneName(0) != "A") {
        std::cerr << "0 should decode to A\n";
        return EXIT_FAILURE;
      }
      // Leading A digits only come back when the width is known.
      runes::BigUint value;
      if (!runes::EncodeRuneName("AAB", &value) || runes::DecodeRuneName(value) != "B" ||
          runes::DecodeRuneName(value, 3) != "AAB") {
        std::cerr << "width padding failed\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::string spaced = runes::ApplySpacers("MYRUNE", 1u << 2);
      if (spaced != "MY\xE2\x80\xA2RUNE") {
        std::cerr << "ApplySpacers produced " << spaced << "\n";
        return EXIT_FAILURE;
      }
      const std::string display = "A\xE2\x80\xA2" "B\xE2\x80\xA2" "C";
      if (runes::ApplySpacers("ABC", runes::ComputeSpacers(display)) != display) {
        std::cerr << "ApplySpacers did not restore " << display << "\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "rune_name_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
