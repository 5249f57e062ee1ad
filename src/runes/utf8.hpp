#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace runeforge::runes {

// Decodes the code point starting at |*pos| and advances past it. Rejects
// truncated, overlong and surrogate sequences.
bool NextCodePoint(std::string_view text, std::size_t* pos, std::uint32_t* code_point);
void AppendUtf8(std::string* out, std::uint32_t code_point);
// Number of code points, or npos when |text| is not valid UTF-8.
std::size_t CountCodePoints(std::string_view text);

}  // namespace runeforge::runes
