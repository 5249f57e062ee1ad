#pragma once

#include <array>
#include <cstdint>

namespace runeforge::primitives {

// Stored in internal (little-endian) byte order; displayed reversed.
using Hash256 = std::array<std::uint8_t, 32>;

}  // namespace runeforge::primitives
