#pragma once

#include <string>

#include "primitives/amount.hpp"
#include "primitives/transaction.hpp"
#include "script/script.hpp"

namespace runeforge::policy {

// Outputs at or below this value are uneconomical to spend.
inline constexpr primitives::Amount kDustThreshold = 546;

enum class ScriptType {
  kNonStandard,
  kNullData,
  kWitnessV0KeyHash,
  kWitnessV0ScriptHash,
  kWitnessV1Taproot,
};

// Classify a ScriptPubKey into one of the known standard forms.
ScriptType ClassifyScriptPubKey(const script::ScriptPubKey& script);

// Relay checks for a Runestone reveal: at least one input, exactly one
// zero-value null-data output carrying the envelope, and every other
// output a standard witness script strictly above |dust_threshold|.
// On failure, |reason| is populated when non-null.
bool IsStandardReveal(const primitives::CTransaction& tx, primitives::Amount dust_threshold,
                      std::string* reason);

}  // namespace runeforge::policy
