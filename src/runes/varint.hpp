#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "runes/codec_error.hpp"

namespace runeforge::runes {

// Rune quantities (premine, amount, cap, mint references) exceed 64 bits.
using BigUint = boost::multiprecision::cpp_int;

// LEB128-style encoding: seven bits per byte, least-significant group first,
// 0x80 set on every byte but the last. Throws std::invalid_argument on a
// negative value.
void WriteVarInt(std::vector<std::uint8_t>* out, const BigUint& value);
std::vector<std::uint8_t> EncodeVarInt(const BigUint& value);

// Reads one varint at |*offset| and advances it. When the input ends before
// a terminating byte it returns false with kMalformedVarInt, leaving
// |*offset| untouched.
bool ReadVarInt(std::span<const std::uint8_t> data, std::size_t* offset, BigUint* value,
                CodecError* code = nullptr);
bool DecodeVarInt(std::span<const std::uint8_t> data, BigUint* value, std::size_t* consumed,
                  CodecError* code = nullptr);

}  // namespace runeforge::runes
