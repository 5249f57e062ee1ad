#include "primitives/txid.hpp"

#include <algorithm>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/hex.hpp"

namespace runeforge::primitives {

Hash256 ComputeTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/false);
  auto hash = crypto::DoubleSha256(buffer);
  Hash256 result{};
  std::copy(hash.begin(), hash.end(), result.begin());
  return result;
}

Hash256 ComputeWTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/true);
  auto hash = crypto::DoubleSha256(buffer);
  Hash256 result{};
  std::copy(hash.begin(), hash.end(), result.begin());
  return result;
}

std::string TxIdToHex(const Hash256& txid) {
  Hash256 display = txid;
  std::reverse(display.begin(), display.end());
  return util::HexEncode(display);
}

bool TxIdFromHex(std::string_view hex, Hash256* txid) {
  if (hex.size() != txid->size() * 2) {
    return false;
  }
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(hex, &bytes)) {
    return false;
  }
  std::reverse_copy(bytes.begin(), bytes.end(), txid->begin());
  return true;
}

}  // namespace runeforge::primitives
