#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "runes/varint.hpp"

namespace {

using runeforge::runes::BigUint;

bool ExpectEncoding(const BigUint& value, const std::vector<std::uint8_t>& expected,
                    const char* label) {
  const auto actual = runeforge::runes::EncodeVarInt(value);
  if (actual != expected) {
    std::cerr << label << ": mismatch (size " << actual.size() << " vs " << expected.size()
              << ")\n";
    return false;
  }
  BigUint decoded;
  std::size_t consumed = 0;
  if (!runeforge::runes::DecodeVarInt(actual, &decoded, &consumed) || decoded != value ||
      consumed != actual.size()) {
    std::cerr << label << ": did not decode back to " << value.str() << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace runeforge::runes;
  try {
    if (!ExpectEncoding(0, {0x00}, "encode 0")) return EXIT_FAILURE;
    if (!ExpectEncoding(1, {0x01}, "encode 1")) return EXIT_FAILURE;
    if (!ExpectEncoding(63, {0x3F}, "encode 63")) return EXIT_FAILURE;
    // Bit 6 set on the final group forces one more byte.
    if (!ExpectEncoding(64, {0xC0, 0x00}, "encode 64")) return EXIT_FAILURE;
    if (!ExpectEncoding(127, {0xFF, 0x00}, "encode 127")) return EXIT_FAILURE;
    if (!ExpectEncoding(128, {0x80, 0x01}, "encode 128")) return EXIT_FAILURE;
    if (!ExpectEncoding(300, {0xAC, 0x02}, "encode 300")) return EXIT_FAILURE;

    {
      BigUint two_pow_64 = 1;
      two_pow_64 <<= 64;
      if (!ExpectEncoding(two_pow_64,
                          {0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x02},
                          "encode 2^64")) {
        return EXIT_FAILURE;
      }
    }

    {
      const BigUint u128_max("340282366920938463463374607431768211455");
      std::vector<std::uint8_t> expected(18, 0xFF);
      expected.push_back(0x03);
      if (!ExpectEncoding(u128_max, expected, "encode u128 max")) return EXIT_FAILURE;
    }

    // Reading advances the cursor across consecutive values.
    {
      std::vector<std::uint8_t> buffer;
      WriteVarInt(&buffer, 5);
      WriteVarInt(&buffer, 1000000);
      std::size_t offset = 0;
      BigUint first;
      BigUint second;
      if (!ReadVarInt(buffer, &offset, &first) || !ReadVarInt(buffer, &offset, &second) ||
          first != 5 || second != 1000000 || offset != buffer.size()) {
        std::cerr << "sequential reads failed\n";
        return EXIT_FAILURE;
      }
    }

    // Input ending on a continuation byte is malformed and leaves the cursor.
    {
      const std::vector<std::uint8_t> truncated = {0x81, 0x80};
      std::size_t offset = 0;
      BigUint value;
      CodecError code = CodecError::kNone;
      if (ReadVarInt(truncated, &offset, &value, &code) || offset != 0 ||
          code != CodecError::kMalformedVarInt) {
        std::cerr << "truncated varint accepted\n";
        return EXIT_FAILURE;
      }
      code = CodecError::kNone;
      if (DecodeVarInt(std::vector<std::uint8_t>{}, &value, nullptr, &code) ||
          code != CodecError::kMalformedVarInt) {
        std::cerr << "empty input accepted\n";
        return EXIT_FAILURE;
      }
      // Every byte carries the continuation bit.
      code = CodecError::kNone;
      std::size_t consumed = 99;
      if (DecodeVarInt(std::vector<std::uint8_t>{0xFF, 0xFF, 0xFF}, &value, &consumed, &code) ||
          code != CodecError::kMalformedVarInt || consumed != 99) {
        std::cerr << "unterminated varint not reported as malformed\n";
        return EXIT_FAILURE;
      }
    }

    {
      bool threw = false;
      try {
        (void)EncodeVarInt(BigUint(-1));
      } catch (const std::invalid_argument&) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "negative value encoded\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "varint_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
