#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "primitives/transaction.hpp"

namespace runeforge::etch {

// Outcome of a call into an external collaborator. A timeout leaves the
// remote side in an unknown state; a rejection is definitive.
enum class CallStatus {
  kOk,
  kTimeout,
  kRejected,
  kUnavailable,
};

// Opaque reference to the commit key held by the signing authority. It is
// passed back to the signer untouched and never interpreted here.
using KeyHandle = std::string;

struct CommitKey {
  std::string address;
  KeyHandle handle;
};

struct SigningRequest {
  config::NetworkType network{config::NetworkType::kMainnet};
  KeyHandle key;
  primitives::CTransaction unsigned_tx;
  // Outputs spent by |unsigned_tx|, in input order.
  std::vector<primitives::CTxOut> spent_outputs;
};

// Signing authority hooks. Both must be installed before use; a missing
// hook is reported as an unavailable signer.
struct Signer {
  using RequestKeyFn = std::function<CallStatus(config::NetworkType network,
                                                std::chrono::milliseconds timeout,
                                                CommitKey* key, std::string* error)>;
  // Returns the fully signed transaction in network serialization.
  using SignFn = std::function<CallStatus(const SigningRequest& request,
                                          std::chrono::milliseconds timeout,
                                          std::vector<std::uint8_t>* signed_tx,
                                          std::string* error)>;

  RequestKeyFn request_key;
  SignFn sign;
};

}  // namespace runeforge::etch
