#pragma once

#include <string_view>

namespace runeforge::runes {

enum class CodecError {
  kNone,
  kMalformedVarInt,
  kTruncatedPayload,
  kInvalidNameCharacter,
  kInvalidEtching,
};

inline std::string_view CodecErrorName(CodecError error) {
  switch (error) {
    case CodecError::kNone:
      return "none";
    case CodecError::kMalformedVarInt:
      return "malformed varint";
    case CodecError::kTruncatedPayload:
      return "truncated payload";
    case CodecError::kInvalidNameCharacter:
      return "invalid name character";
    case CodecError::kInvalidEtching:
      return "invalid etching";
  }
  return "unknown";
}

}  // namespace runeforge::runes
