#include "runes/varint.hpp"

#include <stdexcept>
#include <utility>

namespace runeforge::runes {

void WriteVarInt(std::vector<std::uint8_t>* out, const BigUint& value) {
  if (value < 0) {
    throw std::invalid_argument("varint value must be non-negative");
  }
  BigUint remaining = value;
  while (true) {
    const BigUint low = remaining & 0x7F;
    const auto group = static_cast<std::uint8_t>(low.convert_to<unsigned>());
    remaining >>= 7;
    // Stop once nothing is left and the group cannot be mistaken for a
    // sign-extended continuation.
    if (remaining == 0 && (group & 0x40) == 0) {
      out->push_back(group);
      return;
    }
    out->push_back(static_cast<std::uint8_t>(group | 0x80));
  }
}

std::vector<std::uint8_t> EncodeVarInt(const BigUint& value) {
  std::vector<std::uint8_t> out;
  WriteVarInt(&out, value);
  return out;
}

bool ReadVarInt(std::span<const std::uint8_t> data, std::size_t* offset, BigUint* value,
                CodecError* code) {
  BigUint result = 0;
  unsigned shift = 0;
  for (std::size_t pos = *offset; pos < data.size(); ++pos) {
    const std::uint8_t byte = data[pos];
    result |= BigUint(byte & 0x7F) << shift;
    shift += 7;
    if ((byte & 0x80) == 0) {
      *value = std::move(result);
      *offset = pos + 1;
      return true;
    }
  }
  if (code) *code = CodecError::kMalformedVarInt;
  return false;
}

bool DecodeVarInt(std::span<const std::uint8_t> data, BigUint* value, std::size_t* consumed,
                  CodecError* code) {
  std::size_t offset = 0;
  if (!ReadVarInt(data, &offset, value, code)) {
    return false;
  }
  if (consumed != nullptr) {
    *consumed = offset;
  }
  return true;
}

}  // namespace runeforge::runes
