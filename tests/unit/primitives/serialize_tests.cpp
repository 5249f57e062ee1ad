#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"

using namespace runeforge;

namespace {

constexpr const char* kGenesisCoinbaseHex =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff4d04ff"
    "ff001d0104455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72206f6e2062"
    "72696e6b206f66207365636f6e64206261696c6f757420666f722062616e6b73ffffffff0100f2052a0100"
    "0000434104678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef"
    "38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

bool TestCompactSize() {
  const std::vector<std::pair<std::uint64_t, std::vector<std::uint8_t>>> cases = {
      {0xFC, {0xFC}},
      {0xFD, {0xFD, 0xFD, 0x00}},
      {0x10000, {0xFE, 0x00, 0x00, 0x01, 0x00}},
  };
  for (const auto& [value, expected] : cases) {
    std::vector<std::uint8_t> out;
    primitives::serialize::WriteCompactSize(&out, value);
    if (out != expected || primitives::serialize::CompactSizeLength(value) != expected.size()) {
      std::cerr << "compact size " << value << " encoded wrongly\n";
      return false;
    }
    std::size_t offset = 0;
    std::uint64_t decoded = 0;
    if (!primitives::serialize::ReadCompactSize(out, &offset, &decoded) || decoded != value) {
      std::cerr << "compact size " << value << " did not decode\n";
      return false;
    }
  }
  const std::vector<std::uint8_t> non_canonical = {0xFD, 0xFC, 0x00};
  std::size_t offset = 0;
  std::uint64_t value = 0;
  if (primitives::serialize::ReadCompactSize(non_canonical, &offset, &value)) {
    std::cerr << "non-canonical compact size accepted\n";
    return false;
  }
  return true;
}

bool TestLegacyTransaction() {
  std::vector<std::uint8_t> raw;
  if (!util::HexDecode(kGenesisCoinbaseHex, &raw)) {
    std::cerr << "bad vector hex\n";
    return false;
  }
  primitives::CTransaction tx;
  std::size_t offset = 0;
  if (!primitives::serialize::DeserializeTransaction(raw, &offset, &tx) || offset != raw.size()) {
    std::cerr << "genesis coinbase did not deserialize\n";
    return false;
  }
  if (tx.version != 1 || tx.vin.size() != 1 || tx.vout.size() != 1 ||
      tx.vout[0].value != 50 * primitives::kSatsPerBTC || tx.HasWitness()) {
    std::cerr << "genesis coinbase fields wrong\n";
    return false;
  }
  const std::string txid = primitives::TxIdToHex(primitives::ComputeTxId(tx));
  if (txid != "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b") {
    std::cerr << "genesis coinbase txid " << txid << "\n";
    return false;
  }
  std::vector<std::uint8_t> reserialized;
  primitives::serialize::SerializeTransaction(tx, &reserialized);
  if (reserialized != raw) {
    std::cerr << "genesis coinbase did not reserialize byte-for-byte\n";
    return false;
  }
  // No witness: weight is four times the size.
  if (primitives::serialize::TransactionWeight(tx) != raw.size() * 4 ||
      primitives::serialize::TransactionVirtualSize(tx) != raw.size()) {
    std::cerr << "legacy weight wrong\n";
    return false;
  }
  return true;
}

bool TestWitnessTransaction() {
  primitives::CTransaction tx;
  primitives::CTxIn in;
  in.prevout.txid.fill(0x11);
  in.prevout.index = 1;
  in.sequence = primitives::kSequenceRbf;
  in.witness_stack.push_back(primitives::WitnessStackItem{std::vector<std::uint8_t>(64, 0xAB)});
  tx.vin.push_back(in);
  tx.vout.push_back(primitives::CTxOut{1000, std::vector<std::uint8_t>(22, 0x00)});

  const auto sizes = primitives::serialize::MeasureTransactionSizes(tx);
  // version 4 + vin 1 + input 41 + vout 1 + output 31 + locktime 4
  if (sizes.base_size != 82) {
    std::cerr << "base size " << sizes.base_size << "\n";
    return false;
  }
  // marker/flag 2 + item count 1 + length 1 + 64 bytes
  if (sizes.witness_size != 68 || sizes.total_size != 150) {
    std::cerr << "witness size " << sizes.witness_size << "\n";
    return false;
  }
  if (primitives::serialize::TransactionWeight(tx) != 82 * 3 + 150 ||
      primitives::serialize::TransactionVirtualSize(tx) != 99) {
    std::cerr << "witness weight wrong\n";
    return false;
  }

  std::vector<std::uint8_t> raw;
  primitives::serialize::SerializeTransaction(tx, &raw);
  primitives::CTransaction decoded;
  std::size_t offset = 0;
  if (!primitives::serialize::DeserializeTransaction(raw, &offset, &decoded) ||
      decoded.vin.size() != 1 || !(decoded.vin[0].prevout == tx.vin[0].prevout) ||
      decoded.vin[0].witness_stack != tx.vin[0].witness_stack || decoded.vout != tx.vout ||
      decoded.vin[0].sequence != primitives::kSequenceRbf) {
    std::cerr << "witness transaction did not round trip\n";
    return false;
  }
  // The txid commits to the non-witness serialization only.
  primitives::CTransaction stripped = tx;
  stripped.vin[0].witness_stack.clear();
  if (primitives::ComputeTxId(stripped) != primitives::ComputeTxId(tx) ||
      primitives::ComputeWTxId(stripped) == primitives::ComputeWTxId(tx)) {
    std::cerr << "txid/wtxid witness commitment wrong\n";
    return false;
  }

  // Marker present but every witness stack empty.
  std::vector<std::uint8_t> bogus;
  primitives::serialize::WriteUint32(&bogus, 2);
  bogus.push_back(0x00);
  bogus.push_back(0x01);
  std::vector<std::uint8_t> body;
  primitives::serialize::SerializeTransaction(stripped, &body);
  bogus.insert(bogus.end(), body.begin() + 4, body.end() - 4);
  bogus.push_back(0x00);  // empty witness stack
  primitives::serialize::WriteUint32(&bogus, 0);
  offset = 0;
  if (primitives::serialize::DeserializeTransaction(bogus, &offset, &decoded)) {
    std::cerr << "empty witness with marker accepted\n";
    return false;
  }

  raw.pop_back();
  offset = 0;
  if (primitives::serialize::DeserializeTransaction(raw, &offset, &decoded)) {
    std::cerr << "truncated transaction accepted\n";
    return false;
  }
  return true;
}

bool TestTxIdHex() {
  primitives::Hash256 txid{};
  if (primitives::TxIdFromHex("abcd", &txid) ||
      primitives::TxIdFromHex(std::string(64, 'g'), &txid)) {
    std::cerr << "malformed txid hex accepted\n";
    return false;
  }
  const std::string display = "00000000000000000000000000000000000000000000000000000000000000ff";
  if (!primitives::TxIdFromHex(display, &txid) || txid[0] != 0xFF || txid[31] != 0x00 ||
      primitives::TxIdToHex(txid) != display) {
    std::cerr << "txid byte order wrong\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestCompactSize()) return EXIT_FAILURE;
    if (!TestLegacyTransaction()) return EXIT_FAILURE;
    if (!TestWitnessTransaction()) return EXIT_FAILURE;
    if (!TestTxIdHex()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "serialize_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
