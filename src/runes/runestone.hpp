#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "runes/codec_error.hpp"
#include "runes/varint.hpp"

namespace runeforge::runes {

// Field tags. The numeric values and the order in which the builder emits
// them are part of the wire format.
enum class Tag : std::uint8_t {
  kBody = 0,  // Carries the flags bitfield.
  kDivisibility = 1,
  kSpacers = 2,
  kSymbol = 3,
  kRune = 4,
  kPremine = 5,
  kCap = 6,
  kAmount = 7,
  kHeightStart = 8,
  kHeightEnd = 9,
  kOffsetStart = 10,
  kOffsetEnd = 11,
  kMint = 12,
  kPointer = 13,
  kCenotaph = 127,
};

inline constexpr std::uint32_t kFlagEtching = 0x01;
inline constexpr std::uint32_t kFlagTerms = 0x02;
inline constexpr std::uint32_t kFlagTurbo = 0x04;
inline constexpr std::uint32_t kFlagCenotaph = 0x80;

inline constexpr std::uint8_t kMaxDivisibility = 18;
inline constexpr std::uint32_t kMaxMintVout = 0xFF;

struct MintTerms {
  BigUint amount{0};
  BigUint cap{0};
  std::optional<std::uint64_t> height_start;
  std::optional<std::uint64_t> height_end;
  std::optional<std::uint64_t> offset_start;
  std::optional<std::uint64_t> offset_end;
  bool operator==(const MintTerms& other) const = default;
};

// Outpoint of an existing rune to reference; |txid| is display-order hex.
struct MintReference {
  std::string txid;
  std::uint32_t vout{0};
  bool operator==(const MintReference& other) const = default;
};

struct TaggedField {
  BigUint tag{0};
  BigUint value{0};
  bool operator==(const TaggedField& other) const = default;
};

struct EtchingSpec {
  std::string name;  // Display form; may contain U+2022 spacers.
  std::string symbol;
  std::uint8_t divisibility{0};
  BigUint premine{0};
  std::optional<MintTerms> terms;
  bool turbo{false};
  std::optional<MintReference> mint;
  std::optional<std::uint32_t> pointer;
  // Tags the builder does not interpret. Preserved on decode and appended
  // verbatim on encode.
  std::vector<TaggedField> unrecognized;
  bool operator==(const EtchingSpec& other) const = default;
};

// Lower-case field name for |tag|, or "unknown".
std::string_view TagName(const BigUint& tag);

// Tag -> values in payload order. Duplicate tags keep every value.
using FieldMap = std::map<BigUint, std::vector<BigUint>>;

bool ValidateEtching(const EtchingSpec& spec, CodecError* code, std::string* error);

// Ordered (tag, value) pairs for |spec|: flags, divisibility, spacers,
// symbol, rune, premine, then amount, cap, height and offset bounds, then
// mint and pointer.
bool BuildTaggedFields(const EtchingSpec& spec, std::vector<TaggedField>* fields,
                       CodecError* code, std::string* error);
std::vector<std::uint8_t> SerializeFields(const std::vector<TaggedField>& fields);
bool SerializeEtching(const EtchingSpec& spec, std::vector<std::uint8_t>* payload,
                      CodecError* code, std::string* error);

// Reads varint pairs until |payload| is exhausted. A pair cut short at any
// point fails with kTruncatedPayload.
bool ParseFields(std::span<const std::uint8_t> payload, std::vector<TaggedField>* fields,
                 CodecError* code);
bool ParsePayload(std::span<const std::uint8_t> payload, FieldMap* fields, CodecError* code);

// Rebuilds the etching described by |fields|. The first value of a known
// tag wins; later duplicates and unknown tags land in |unrecognized|.
bool DecodeEtching(const std::vector<TaggedField>& fields, EtchingSpec* spec, CodecError* code,
                   std::string* error);

// Multi-line human summary: name, symbol, divisibility, premine scaled by
// divisibility and the mint terms with the resulting maximum supply.
std::string FormatRuneInfo(const EtchingSpec& spec);

}  // namespace runeforge::runes
