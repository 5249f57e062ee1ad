#include "runes/rune_name.hpp"

#include <algorithm>
#include <utility>

#include "runes/utf8.hpp"

namespace runeforge::runes {

bool EncodeRuneName(std::string_view name, BigUint* value, CodecError* error) {
  BigUint result = 0;
  std::size_t letters = 0;
  std::size_t pos = 0;
  std::uint32_t cp = 0;
  while (pos < name.size()) {
    if (!NextCodePoint(name, &pos, &cp)) {
      if (error) *error = CodecError::kInvalidNameCharacter;
      return false;
    }
    if (cp == kSpacerCodePoint) {
      continue;
    }
    if (cp >= 'a' && cp <= 'z') {
      cp -= 'a' - 'A';
    }
    if (cp < 'A' || cp > 'Z') {
      if (error) *error = CodecError::kInvalidNameCharacter;
      return false;
    }
    result = result * 26 + (cp - 'A');
    ++letters;
  }
  if (letters == 0) {
    if (error) *error = CodecError::kInvalidNameCharacter;
    return false;
  }
  *value = std::move(result);
  return true;
}

std::string DecodeRuneName(const BigUint& value, std::size_t min_width) {
  std::string out;
  BigUint remaining = value;
  do {
    const BigUint digit = remaining % 26;
    out.push_back(static_cast<char>('A' + digit.convert_to<unsigned>()));
    remaining /= 26;
  } while (remaining > 0);
  if (out.size() < min_width) {
    out.append(min_width - out.size(), 'A');
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::uint32_t ComputeSpacers(std::string_view display_name) {
  const std::size_t length = CountCodePoints(display_name);
  if (length == std::string_view::npos) {
    return 0;
  }
  std::uint32_t spacers = 0;
  std::size_t pos = 0;
  std::uint32_t cp = 0;
  for (std::size_t index = 0; index + 1 < length && index < kMaxSpacerPositions; ++index) {
    if (!NextCodePoint(display_name, &pos, &cp)) {
      break;
    }
    if (cp == kSpacerCodePoint) {
      spacers |= 1u << index;
    }
  }
  return spacers;
}

std::string ApplySpacers(std::string_view letters, std::uint32_t spacers) {
  std::string out;
  std::size_t position = 0;
  for (char c : letters) {
    while (position < 32 && (spacers >> position) & 1u) {
      out.append(kSpacer);
      ++position;
    }
    out.push_back(c);
    ++position;
  }
  return out;
}

}  // namespace runeforge::runes
