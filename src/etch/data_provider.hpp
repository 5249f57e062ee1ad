#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "etch/signer.hpp"
#include "primitives/amount.hpp"

namespace runeforge::etch {

// Snapshot of an output reported by the data provider.
struct Utxo {
  std::string txid;  // Display-order hex.
  std::uint32_t vout{0};
  primitives::Amount value{0};
  bool confirmed{false};
};

struct DataProvider {
  using ListUnspentFn = std::function<CallStatus(const std::string& address,
                                                 config::NetworkType network,
                                                 std::chrono::milliseconds timeout,
                                                 std::vector<Utxo>* utxos, std::string* error)>;
  // On success |txid| receives the id reported by the provider. A throw is
  // handled like kTimeout: the transaction may already be out.
  using BroadcastFn = std::function<CallStatus(std::span<const std::uint8_t> raw_tx,
                                               config::NetworkType network,
                                               std::chrono::milliseconds timeout,
                                               std::string* txid, std::string* error)>;

  ListUnspentFn list_unspent;
  BroadcastFn broadcast;
};

}  // namespace runeforge::etch
