#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "runes/codec_error.hpp"
#include "runes/varint.hpp"

namespace runeforge::runes {

// U+2022 BULLET, the separator glyph allowed inside display names.
inline constexpr std::string_view kSpacer = "\xE2\x80\xA2";
inline constexpr std::uint32_t kSpacerCodePoint = 0x2022;
// Letters only; spacers do not count.
inline constexpr std::size_t kMaxNameLength = 28;
// Width of the spacer bitfield: a spacer past this display position has no bit.
inline constexpr std::size_t kMaxSpacerPositions = 32;

// Strips spacers, uppercases a-z and reads the letters as a base-26 number
// (A=0 ... Z=25, most significant first). Anything else, or a name with no
// letters, fails with kInvalidNameCharacter.
bool EncodeRuneName(std::string_view name, BigUint* value, CodecError* error = nullptr);

// Inverse of EncodeRuneName. Leading zero digits are not recoverable from
// the integer alone, so the result is left-padded with 'A' up to
// |min_width| letters. 0 decodes to "A".
std::string DecodeRuneName(const BigUint& value, std::size_t min_width = 0);

// Bit i is set when a spacer occupies character position i of
// |display_name|. The final position never carries a bit.
std::uint32_t ComputeSpacers(std::string_view display_name);

// Re-inserts spacers into |letters| following |spacers|.
std::string ApplySpacers(std::string_view letters, std::uint32_t spacers);

}  // namespace runeforge::runes
