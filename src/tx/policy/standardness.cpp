#include "policy/standardness.hpp"

#include <cstddef>
#include <vector>

namespace runeforge::policy {

ScriptType ClassifyScriptPubKey(const script::ScriptPubKey& script) {
  if (script.data.empty()) {
    return ScriptType::kNonStandard;
  }
  if (script::IsNullData(script)) {
    return ScriptType::kNullData;
  }
  std::uint8_t version = 0;
  std::vector<std::uint8_t> program;
  if (!script::ExtractWitnessProgram(script, &version, &program)) {
    return ScriptType::kNonStandard;
  }
  if (version == 0 && program.size() == script::kP2WPKHProgramSize) {
    return ScriptType::kWitnessV0KeyHash;
  }
  if (version == 0 && program.size() == script::kP2WSHProgramSize) {
    return ScriptType::kWitnessV0ScriptHash;
  }
  if (version == 1 && program.size() == script::kP2TRProgramSize) {
    return ScriptType::kWitnessV1Taproot;
  }
  return ScriptType::kNonStandard;
}

bool IsStandardReveal(const primitives::CTransaction& tx, primitives::Amount dust_threshold,
                      std::string* reason) {
  if (tx.vin.empty()) {
    if (reason) *reason = "transaction has no inputs";
    return false;
  }
  if (tx.vout.empty()) {
    if (reason) *reason = "transaction has no outputs";
    return false;
  }

  constexpr std::size_t kMaxScriptSize = 10'000;

  std::size_t null_data_outputs = 0;
  for (const auto& out : tx.vout) {
    if (out.script_pubkey.size() > kMaxScriptSize) {
      if (reason) *reason = "script too large for standard relay";
      return false;
    }
    script::ScriptPubKey script_pub{out.script_pubkey};
    switch (ClassifyScriptPubKey(script_pub)) {
      case ScriptType::kNullData:
        if (out.value != 0) {
          if (reason) *reason = "null-data output must carry zero value";
          return false;
        }
        ++null_data_outputs;
        break;
      case ScriptType::kWitnessV0KeyHash:
      case ScriptType::kWitnessV0ScriptHash:
      case ScriptType::kWitnessV1Taproot:
        if (out.value <= dust_threshold) {
          if (reason) *reason = "output value at or below dust threshold";
          return false;
        }
        break;
      case ScriptType::kNonStandard:
        if (reason) *reason = "non-standard scriptPubKey";
        return false;
    }
  }
  if (null_data_outputs != 1) {
    if (reason) *reason = "reveal must carry exactly one null-data output";
    return false;
  }
  return true;
}

}  // namespace runeforge::policy
