#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace runeforge::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;

// FIPS-180-4 SHA-256 and the Bitcoin double-hash used for transaction ids.
Sha256Hash Sha256(std::span<const std::uint8_t> data);
Sha256Hash DoubleSha256(std::span<const std::uint8_t> data);

}  // namespace runeforge::crypto
