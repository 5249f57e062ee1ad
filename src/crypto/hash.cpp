#include "crypto/hash.hpp"

#include <oqs/sha2.h>

namespace runeforge::crypto {

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash DoubleSha256(std::span<const std::uint8_t> data) {
  const auto first = Sha256(data);
  return Sha256(std::span<const std::uint8_t>(first.data(), first.size()));
}

}  // namespace runeforge::crypto
