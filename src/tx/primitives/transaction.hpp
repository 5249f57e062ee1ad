#pragma once

#include <cstdint>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace runeforge::primitives {

// Sequence value that opts the reveal into replace-by-fee.
inline constexpr std::uint32_t kSequenceRbf = 0xFFFFFFFD;
inline constexpr std::uint32_t kSequenceFinal = 0xFFFFFFFF;

struct COutPoint {
  Hash256 txid{};
  std::uint32_t index{0};
  bool operator==(const COutPoint& other) const = default;
};

struct WitnessStackItem {
  std::vector<std::uint8_t> data;
  bool operator==(const WitnessStackItem& other) const = default;
};

struct CTxIn {
  COutPoint prevout{};
  std::vector<std::uint8_t> script_sig{};  // Empty for segwit spends.
  std::vector<WitnessStackItem> witness_stack{};
  std::uint32_t sequence{kSequenceFinal};
};

struct CTxOut {
  Amount value{0};  // In satoshis.
  std::vector<std::uint8_t> script_pubkey{};
  bool operator==(const CTxOut& other) const = default;
};

struct CTransaction {
  std::uint32_t version{2};
  std::vector<CTxIn> vin{};
  std::vector<CTxOut> vout{};
  std::uint32_t lock_time{0};

  [[nodiscard]] bool HasWitness() const noexcept {
    for (const auto& in : vin) {
      if (!in.witness_stack.empty()) return true;
    }
    return false;
  }
};

}  // namespace runeforge::primitives
