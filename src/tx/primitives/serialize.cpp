#include "primitives/serialize.hpp"

#include <algorithm>
#include <limits>

namespace runeforge::primitives::serialize {

namespace {

constexpr std::uint64_t kMinInputBytes = 32 + 4 + 1 + 4;
constexpr std::uint64_t kMinOutputBytes = 8 + 1;
constexpr std::uint64_t kMaxWitnessItemsPerInput = 64;

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* out) {
  std::uint64_t size = 0;
  if (!ReadCompactSize(data, offset, &size) ||
      size > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()) ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  const std::size_t len = static_cast<std::size_t>(size);
  out->assign(data.begin() + *offset, data.begin() + *offset + len);
  *offset += len;
  return true;
}

void SerializeInputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  for (const auto& in : tx.vin) {
    out->insert(out->end(), in.prevout.txid.begin(), in.prevout.txid.end());
    WriteUint32(out, in.prevout.index);
    WriteCompactSize(out, in.script_sig.size());
    out->insert(out->end(), in.script_sig.begin(), in.script_sig.end());
    WriteUint32(out, in.sequence);
  }
}

void SerializeOutputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  for (const auto& out_tx : tx.vout) {
    WriteUint64(out, out_tx.value);
    WriteCompactSize(out, out_tx.script_pubkey.size());
    out->insert(out->end(), out_tx.script_pubkey.begin(), out_tx.script_pubkey.end());
  }
}

void SerializeWitness(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  for (const auto& in : tx.vin) {
    WriteCompactSize(out, in.witness_stack.size());
    for (const auto& item : in.witness_stack) {
      WriteCompactSize(out, item.data.size());
      out->insert(out->end(), item.data.begin(), item.data.end());
    }
  }
}

bool DeserializeInputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                       CTransaction* tx) {
  for (auto& in : tx->vin) {
    if (!Require(data, *offset, in.prevout.txid.size())) return false;
    std::copy_n(data.begin() + *offset, in.prevout.txid.size(), in.prevout.txid.begin());
    *offset += in.prevout.txid.size();
    if (!ReadUint32(data, offset, &in.prevout.index)) return false;
    if (!ReadBytes(data, offset, &in.script_sig)) return false;
    if (!ReadUint32(data, offset, &in.sequence)) return false;
  }
  return true;
}

bool DeserializeOutputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        CTransaction* tx) {
  for (auto& out_tx : tx->vout) {
    if (!ReadUint64(data, offset, &out_tx.value)) return false;
    if (!ReadBytes(data, offset, &out_tx.script_pubkey)) return false;
  }
  return true;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteCompactSize(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

std::size_t CompactSizeLength(std::uint64_t value) {
  if (value < 0xFDu) return 1;
  if (value <= 0xFFFFu) return 3;
  if (value <= 0xFFFFFFFFu) return 5;
  return 9;
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(data[*offset]) |
           (static_cast<std::uint32_t>(data[*offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[*offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[*offset + 3]) << 24);
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadCompactSize(const std::vector<std::uint8_t>& data, std::size_t* offset,
                     std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    if (v16 < 0xFD) {
      return false;
    }
    *value = v16;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp)) return false;
    if (tmp <= 0xFFFFu) {
      return false;
    }
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp)) return false;
  if (tmp <= 0xFFFFFFFFULL) {
    return false;
  }
  *value = tmp;
  return true;
}

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness) {
  const bool has_witness = include_witness && tx.HasWitness();
  WriteUint32(out, tx.version);
  if (has_witness) {
    out->push_back(0x00);  // marker
    out->push_back(0x01);  // flag indicating witness is present
  }
  WriteCompactSize(out, tx.vin.size());
  SerializeInputs(tx, out);
  WriteCompactSize(out, tx.vout.size());
  SerializeOutputs(tx, out);
  if (has_witness) {
    SerializeWitness(tx, out);
  }
  WriteUint32(out, tx.lock_time);
}

bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx) {
  std::size_t cursor = *offset;
  CTransaction candidate;
  if (!ReadUint32(data, &cursor, &candidate.version)) return false;
  bool has_witness = false;
  if (Require(data, cursor, 2) && data[cursor] == 0x00) {
    // Witness-flagged encoding: marker=0x00, flag=0x01.
    if (data[cursor + 1] != 0x01) {
      return false;
    }
    has_witness = true;
    cursor += 2;
  }

  std::uint64_t vin_count = 0;
  if (!ReadCompactSize(data, &cursor, &vin_count)) return false;
  if (vin_count == 0) return false;
  const std::size_t remaining_inputs = data.size() - cursor;
  if (vin_count > remaining_inputs / kMinInputBytes) return false;
  candidate.vin.resize(static_cast<std::size_t>(vin_count));
  if (!DeserializeInputs(data, &cursor, &candidate)) return false;

  std::uint64_t vout_count = 0;
  if (!ReadCompactSize(data, &cursor, &vout_count)) return false;
  const std::size_t remaining_outputs = data.size() - cursor;
  if (vout_count > remaining_outputs / kMinOutputBytes) return false;
  candidate.vout.resize(static_cast<std::size_t>(vout_count));
  if (!DeserializeOutputs(data, &cursor, &candidate)) return false;

  if (has_witness) {
    for (auto& in : candidate.vin) {
      std::uint64_t witness_items = 0;
      if (!ReadCompactSize(data, &cursor, &witness_items)) return false;
      if (witness_items > kMaxWitnessItemsPerInput) return false;
      in.witness_stack.resize(static_cast<std::size_t>(witness_items));
      for (auto& item : in.witness_stack) {
        if (!ReadBytes(data, &cursor, &item.data)) return false;
      }
    }
    if (!candidate.HasWitness()) {
      // A marker with no witness data is a non-canonical encoding.
      return false;
    }
  }

  if (!ReadUint32(data, &cursor, &candidate.lock_time)) return false;
  *tx = std::move(candidate);
  *offset = cursor;
  return true;
}

TxSerializeSizes MeasureTransactionSizes(const CTransaction& tx) {
  std::vector<std::uint8_t> base;
  SerializeTransaction(tx, &base, /*include_witness=*/false);
  std::vector<std::uint8_t> full;
  SerializeTransaction(tx, &full, /*include_witness=*/true);
  TxSerializeSizes sizes;
  sizes.base_size = base.size();
  sizes.total_size = full.size();
  sizes.witness_size = (full.size() >= base.size()) ? full.size() - base.size() : 0;
  return sizes;
}

std::uint64_t TransactionWeight(const CTransaction& tx) {
  const auto sizes = MeasureTransactionSizes(tx);
  return static_cast<std::uint64_t>(sizes.base_size) * 3ULL +
         static_cast<std::uint64_t>(sizes.total_size);
}

std::uint64_t TransactionVirtualSize(const CTransaction& tx) {
  return (TransactionWeight(tx) + 3ULL) / 4ULL;
}

}  // namespace runeforge::primitives::serialize
