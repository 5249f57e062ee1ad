#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace runeforge::crypto {

// Encode a segwit address. Throws std::invalid_argument on a malformed
// HRP, witness version or program length.
std::string EncodeSegwitAddress(std::string_view hrp, std::uint8_t witness_version,
                                std::span<const std::uint8_t> program);
// Decode a segwit address, enforcing the checksum variant that matches
// the witness version and the BIP141 program length rules.
bool DecodeSegwitAddress(std::string_view address, std::string_view expected_hrp,
                         std::uint8_t* witness_version, std::vector<std::uint8_t>* program);

}  // namespace runeforge::crypto
