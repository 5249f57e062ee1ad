#include "runes/runestone.hpp"

#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

#include "primitives/txid.hpp"
#include "runes/rune_name.hpp"
#include "runes/utf8.hpp"

namespace runeforge::runes {

namespace {

bool Fail(CodecError* code, std::string* error, CodecError value, std::string message) {
  if (code) *code = value;
  if (error) *error = std::move(message);
  return false;
}

void Push(std::vector<TaggedField>* fields, Tag tag, BigUint value) {
  fields->push_back(TaggedField{BigUint(static_cast<unsigned>(tag)), std::move(value)});
}

template <typename T>
bool FitsIn(const BigUint& value, T* out) {
  if (value < 0 || value > std::numeric_limits<T>::max()) {
    return false;
  }
  *out = value.template convert_to<T>();
  return true;
}

BigUint MintIdentifier(const primitives::Hash256& txid, std::uint32_t vout) {
  BigUint value = 0;
  for (std::uint8_t byte : txid) {
    value = (value << 8) | byte;
  }
  return (value << 8) | vout;
}

std::string ScaleByDivisibility(const BigUint& value, std::uint8_t divisibility) {
  if (divisibility == 0) {
    return value.str();
  }
  BigUint divisor = 1;
  for (std::uint8_t i = 0; i < divisibility; ++i) {
    divisor *= 10;
  }
  const BigUint whole = value / divisor;
  std::string fraction = BigUint(value % divisor).str();
  if (fraction.size() < divisibility) {
    fraction.insert(0, divisibility - fraction.size(), '0');
  }
  return whole.str() + "." + fraction;
}

}  // namespace

std::string_view TagName(const BigUint& tag) {
  static constexpr std::string_view kNames[] = {
      "flags",      "divisibility", "spacers",      "symbol",     "rune",
      "premine",    "cap",          "amount",       "height_start", "height_end",
      "offset_start", "offset_end", "mint",         "pointer"};
  if (tag < std::size(kNames)) {
    return kNames[tag.convert_to<std::size_t>()];
  }
  if (tag == static_cast<unsigned>(Tag::kCenotaph)) {
    return "cenotaph";
  }
  return "unknown";
}

bool ValidateEtching(const EtchingSpec& spec, CodecError* code, std::string* error) {
  if (CountCodePoints(spec.name) == std::string_view::npos) {
    return Fail(code, error, CodecError::kInvalidNameCharacter, "rune name is not valid UTF-8");
  }
  std::size_t letters = 0;
  std::size_t position = 0;
  std::size_t pos = 0;
  std::uint32_t cp = 0;
  while (pos < spec.name.size() && NextCodePoint(spec.name, &pos, &cp)) {
    if (cp != kSpacerCodePoint) {
      ++letters;
    } else if (position >= kMaxSpacerPositions) {
      return Fail(code, error, CodecError::kInvalidEtching,
                  "spacer at position " + std::to_string(position) +
                      " is beyond the spacer bitfield");
    }
    ++position;
  }
  if (letters > kMaxNameLength) {
    return Fail(code, error, CodecError::kInvalidEtching,
                "rune name exceeds " + std::to_string(kMaxNameLength) + " letters");
  }
  BigUint rune = 0;
  if (!EncodeRuneName(spec.name, &rune)) {
    return Fail(code, error, CodecError::kInvalidNameCharacter,
                "rune name must contain only A-Z and spacers: '" + spec.name + "'");
  }
  if (spec.divisibility > kMaxDivisibility) {
    return Fail(code, error, CodecError::kInvalidEtching, "divisibility must be between 0 and 18");
  }
  if (!spec.symbol.empty() && CountCodePoints(spec.symbol) == std::string_view::npos) {
    return Fail(code, error, CodecError::kInvalidEtching, "symbol is not valid UTF-8");
  }
  if (spec.premine < 0) {
    return Fail(code, error, CodecError::kInvalidEtching, "premine must be non-negative");
  }
  if (spec.terms && (spec.terms->amount < 0 || spec.terms->cap < 0)) {
    return Fail(code, error, CodecError::kInvalidEtching, "mint amount and cap must be non-negative");
  }
  if (spec.mint) {
    primitives::Hash256 txid{};
    if (!primitives::TxIdFromHex(spec.mint->txid, &txid)) {
      return Fail(code, error, CodecError::kInvalidEtching, "mint txid must be 64 hex characters");
    }
    if (spec.mint->vout > kMaxMintVout) {
      return Fail(code, error, CodecError::kInvalidEtching, "mint vout must not exceed 255");
    }
  }
  for (const auto& field : spec.unrecognized) {
    if (field.tag < 0 || field.value < 0) {
      return Fail(code, error, CodecError::kInvalidEtching, "field values must be non-negative");
    }
  }
  return true;
}

bool BuildTaggedFields(const EtchingSpec& spec, std::vector<TaggedField>* fields,
                       CodecError* code, std::string* error) {
  if (!ValidateEtching(spec, code, error)) {
    return false;
  }
  std::vector<TaggedField> out;

  std::uint32_t flags = kFlagEtching;
  if (spec.terms) flags |= kFlagTerms;
  if (spec.turbo) flags |= kFlagTurbo;
  Push(&out, Tag::kBody, flags);

  if (spec.divisibility != 0) {
    Push(&out, Tag::kDivisibility, spec.divisibility);
  }
  const std::uint32_t spacers = ComputeSpacers(spec.name);
  if (spacers != 0) {
    Push(&out, Tag::kSpacers, spacers);
  }
  if (!spec.symbol.empty()) {
    std::size_t pos = 0;
    std::uint32_t symbol = 0;
    if (!NextCodePoint(spec.symbol, &pos, &symbol)) {
      return Fail(code, error, CodecError::kInvalidEtching, "symbol is not valid UTF-8");
    }
    Push(&out, Tag::kSymbol, symbol);
  }
  BigUint rune = 0;
  if (!EncodeRuneName(spec.name, &rune, code)) {
    if (error) *error = "invalid rune name";
    return false;
  }
  Push(&out, Tag::kRune, std::move(rune));
  Push(&out, Tag::kPremine, spec.premine);

  if (spec.terms) {
    const MintTerms& terms = *spec.terms;
    Push(&out, Tag::kAmount, terms.amount);
    Push(&out, Tag::kCap, terms.cap);
    if (terms.height_start) Push(&out, Tag::kHeightStart, *terms.height_start);
    if (terms.height_end) Push(&out, Tag::kHeightEnd, *terms.height_end);
    if (terms.offset_start) Push(&out, Tag::kOffsetStart, *terms.offset_start);
    if (terms.offset_end) Push(&out, Tag::kOffsetEnd, *terms.offset_end);
  }

  if (spec.mint) {
    primitives::Hash256 txid{};
    if (!primitives::TxIdFromHex(spec.mint->txid, &txid)) {
      return Fail(code, error, CodecError::kInvalidEtching, "mint txid must be 64 hex characters");
    }
    Push(&out, Tag::kMint, MintIdentifier(txid, spec.mint->vout));
  }
  if (spec.pointer) {
    Push(&out, Tag::kPointer, *spec.pointer);
  }

  out.insert(out.end(), spec.unrecognized.begin(), spec.unrecognized.end());
  *fields = std::move(out);
  return true;
}

std::vector<std::uint8_t> SerializeFields(const std::vector<TaggedField>& fields) {
  std::vector<std::uint8_t> payload;
  for (const auto& field : fields) {
    WriteVarInt(&payload, field.tag);
    WriteVarInt(&payload, field.value);
  }
  return payload;
}

bool SerializeEtching(const EtchingSpec& spec, std::vector<std::uint8_t>* payload,
                      CodecError* code, std::string* error) {
  std::vector<TaggedField> fields;
  if (!BuildTaggedFields(spec, &fields, code, error)) {
    return false;
  }
  *payload = SerializeFields(fields);
  return true;
}

bool ParseFields(std::span<const std::uint8_t> payload, std::vector<TaggedField>* fields,
                 CodecError* code) {
  std::vector<TaggedField> out;
  std::size_t offset = 0;
  while (offset < payload.size()) {
    TaggedField field;
    if (!ReadVarInt(payload, &offset, &field.tag) ||
        !ReadVarInt(payload, &offset, &field.value)) {
      if (code) *code = CodecError::kTruncatedPayload;
      return false;
    }
    out.push_back(std::move(field));
  }
  *fields = std::move(out);
  return true;
}

bool ParsePayload(std::span<const std::uint8_t> payload, FieldMap* fields, CodecError* code) {
  std::vector<TaggedField> ordered;
  if (!ParseFields(payload, &ordered, code)) {
    return false;
  }
  FieldMap out;
  for (auto& field : ordered) {
    out[field.tag].push_back(std::move(field.value));
  }
  *fields = std::move(out);
  return true;
}

bool DecodeEtching(const std::vector<TaggedField>& fields, EtchingSpec* spec, CodecError* code,
                   std::string* error) {
  constexpr unsigned kKnownTagCount = static_cast<unsigned>(Tag::kPointer) + 1;
  std::optional<BigUint> known[kKnownTagCount];
  std::vector<TaggedField> unrecognized;
  for (const auto& field : fields) {
    if (field.tag >= kKnownTagCount) {
      unrecognized.push_back(field);
      continue;
    }
    auto& slot = known[field.tag.convert_to<unsigned>()];
    if (slot) {
      unrecognized.push_back(field);
    } else {
      slot = field.value;
    }
  }
  const auto& value_of = [&known](Tag tag) -> const std::optional<BigUint>& {
    return known[static_cast<unsigned>(tag)];
  };

  EtchingSpec out;
  std::uint32_t flags = 0;
  if (!value_of(Tag::kBody)) {
    return Fail(code, error, CodecError::kInvalidEtching, "payload carries no flags field");
  }
  {
    const BigUint low = *value_of(Tag::kBody) & 0xFFFFFFFFu;
    flags = low.convert_to<std::uint32_t>();
  }
  if ((flags & kFlagCenotaph) != 0) {
    return Fail(code, error, CodecError::kInvalidEtching, "payload is flagged as a cenotaph");
  }
  if ((flags & kFlagEtching) == 0) {
    return Fail(code, error, CodecError::kInvalidEtching, "payload does not describe an etching");
  }
  out.turbo = (flags & kFlagTurbo) != 0;

  if (!value_of(Tag::kRune)) {
    return Fail(code, error, CodecError::kInvalidEtching, "payload carries no rune name");
  }
  std::uint32_t spacers = 0;
  if (value_of(Tag::kSpacers) && !FitsIn(*value_of(Tag::kSpacers), &spacers)) {
    return Fail(code, error, CodecError::kInvalidEtching, "spacers field out of range");
  }
  out.name = ApplySpacers(DecodeRuneName(*value_of(Tag::kRune)), spacers);

  if (value_of(Tag::kDivisibility)) {
    std::uint32_t divisibility = 0;
    if (!FitsIn(*value_of(Tag::kDivisibility), &divisibility) ||
        divisibility > kMaxDivisibility) {
      return Fail(code, error, CodecError::kInvalidEtching, "divisibility out of range");
    }
    out.divisibility = static_cast<std::uint8_t>(divisibility);
  }
  if (value_of(Tag::kSymbol)) {
    std::uint32_t symbol = 0;
    if (!FitsIn(*value_of(Tag::kSymbol), &symbol) || symbol > 0x10FFFF ||
        (symbol >= 0xD800 && symbol <= 0xDFFF)) {
      return Fail(code, error, CodecError::kInvalidEtching, "symbol is not a valid code point");
    }
    AppendUtf8(&out.symbol, symbol);
  }
  if (value_of(Tag::kPremine)) {
    out.premine = *value_of(Tag::kPremine);
  }

  const Tag term_tags[] = {Tag::kAmount,      Tag::kCap,       Tag::kHeightStart,
                           Tag::kHeightEnd,   Tag::kOffsetStart, Tag::kOffsetEnd};
  if ((flags & kFlagTerms) != 0) {
    if (!value_of(Tag::kAmount) || !value_of(Tag::kCap)) {
      return Fail(code, error, CodecError::kInvalidEtching,
                  "mint terms require both amount and cap");
    }
    MintTerms terms;
    terms.amount = *value_of(Tag::kAmount);
    terms.cap = *value_of(Tag::kCap);
    std::optional<std::uint64_t>* bounds[] = {&terms.height_start, &terms.height_end,
                                              &terms.offset_start, &terms.offset_end};
    for (std::size_t i = 0; i < 4; ++i) {
      const auto& raw = value_of(term_tags[i + 2]);
      if (!raw) continue;
      std::uint64_t bound = 0;
      if (!FitsIn(*raw, &bound)) {
        return Fail(code, error, CodecError::kInvalidEtching, "mint term bound out of range");
      }
      *bounds[i] = bound;
    }
    out.terms = std::move(terms);
  } else {
    for (Tag tag : term_tags) {
      if (value_of(tag)) {
        unrecognized.push_back(TaggedField{BigUint(static_cast<unsigned>(tag)), *value_of(tag)});
      }
    }
  }

  if (value_of(Tag::kMint)) {
    const BigUint& identifier = *value_of(Tag::kMint);
    BigUint txid_value = identifier >> 8;
    if (txid_value >> 256 != 0) {
      return Fail(code, error, CodecError::kInvalidEtching, "mint reference out of range");
    }
    primitives::Hash256 txid{};
    for (std::size_t i = 0; i < txid.size(); ++i) {
      const BigUint byte = txid_value & 0xFF;
      txid[txid.size() - 1 - i] = static_cast<std::uint8_t>(byte.convert_to<unsigned>());
      txid_value >>= 8;
    }
    const BigUint vout = identifier & 0xFF;
    out.mint = MintReference{primitives::TxIdToHex(txid), vout.convert_to<std::uint32_t>()};
  }
  if (value_of(Tag::kPointer)) {
    std::uint32_t pointer = 0;
    if (!FitsIn(*value_of(Tag::kPointer), &pointer)) {
      return Fail(code, error, CodecError::kInvalidEtching, "pointer out of range");
    }
    out.pointer = pointer;
  }

  out.unrecognized = std::move(unrecognized);
  *spec = std::move(out);
  return true;
}

std::string FormatRuneInfo(const EtchingSpec& spec) {
  std::ostringstream info;
  info << "Rune Name: " << spec.name << "\n";
  info << "Symbol: " << spec.symbol << "\n";
  info << "Divisibility: " << static_cast<unsigned>(spec.divisibility) << "\n";
  info << "Premine: " << ScaleByDivisibility(spec.premine, spec.divisibility) << " "
       << spec.symbol << "\n";
  if (spec.terms) {
    const BigUint max_supply = spec.terms->amount * spec.terms->cap;
    info << "Mintable: Yes\n";
    info << "Amount Per Mint: " << spec.terms->amount.str() << " " << spec.symbol << "\n";
    info << "Max Mints: " << spec.terms->cap.str() << "\n";
    info << "Maximum Supply: " << max_supply.str() << " " << spec.symbol << "\n";
  } else {
    info << "Mintable: No\n";
  }
  return info.str();
}

}  // namespace runeforge::runes
