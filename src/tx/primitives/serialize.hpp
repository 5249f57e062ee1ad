#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "primitives/transaction.hpp"

namespace runeforge::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
// Bitcoin CompactSize length prefix (1, 3, 5 or 9 bytes).
void WriteCompactSize(std::vector<std::uint8_t>* out, std::uint64_t value);
std::size_t CompactSizeLength(std::uint64_t value);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
// Rejects non-canonical encodings.
bool ReadCompactSize(const std::vector<std::uint8_t>& data, std::size_t* offset,
                     std::uint64_t* value);

struct TxSerializeSizes {
  std::size_t base_size{0};
  std::size_t witness_size{0};
  std::size_t total_size{0};
};

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness = true);
bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx);
TxSerializeSizes MeasureTransactionSizes(const CTransaction& tx);
// BIP141 weight and virtual size (weight / 4, rounded up).
std::uint64_t TransactionWeight(const CTransaction& tx);
std::uint64_t TransactionVirtualSize(const CTransaction& tx);

}  // namespace runeforge::primitives::serialize
