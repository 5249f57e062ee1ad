#pragma once

#include <string>
#include <string_view>

#include "primitives/transaction.hpp"

namespace runeforge::primitives {

Hash256 ComputeTxId(const CTransaction& tx);
Hash256 ComputeWTxId(const CTransaction& tx);

// Transaction ids are displayed in reversed byte order (RPC/explorer form).
std::string TxIdToHex(const Hash256& txid);
bool TxIdFromHex(std::string_view hex, Hash256* txid);

}  // namespace runeforge::primitives
