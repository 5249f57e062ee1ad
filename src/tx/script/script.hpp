#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace runeforge::script {

inline constexpr std::uint8_t kOp0 = 0x00;  // Also OP_FALSE.
inline constexpr std::uint8_t kOpPushData1 = 0x4c;
inline constexpr std::uint8_t kOpPushData2 = 0x4d;
inline constexpr std::uint8_t kOpPushData4 = 0x4e;
inline constexpr std::uint8_t kOp1 = 0x51;
inline constexpr std::uint8_t kOp16 = 0x60;
inline constexpr std::uint8_t kOpIf = 0x63;
inline constexpr std::uint8_t kOpEndIf = 0x68;
inline constexpr std::uint8_t kOpReturn = 0x6a;

inline constexpr std::size_t kP2WPKHProgramSize = 20;
inline constexpr std::size_t kP2WSHProgramSize = 32;
inline constexpr std::size_t kP2TRProgramSize = 32;

struct ScriptPubKey {
  std::vector<std::uint8_t> data;
};

// OP_n witness script: <version opcode> <push program>.
ScriptPubKey CreateWitnessScript(std::uint8_t witness_version,
                                 std::span<const std::uint8_t> program);
bool ExtractWitnessProgram(const ScriptPubKey& script, std::uint8_t* witness_version,
                           std::vector<std::uint8_t>* program);

// Map a bech32/bech32m address for |hrp| onto its locking script.
bool ScriptForAddress(std::string_view address, std::string_view hrp, ScriptPubKey* out);

// Append |data| using the smallest push opcode; an empty push is OP_0.
void PushData(std::vector<std::uint8_t>* script, std::span<const std::uint8_t> data);

// Read the next opcode at |*pc|. For push opcodes the pushed bytes are
// returned in |data|; for anything else |data| is cleared. Returns false
// on a truncated push or when |*pc| is at the end of the script.
bool GetScriptOp(const std::vector<std::uint8_t>& script, std::size_t* pc,
                 std::uint8_t* opcode, std::vector<std::uint8_t>* data);

[[nodiscard]] inline bool IsNullData(const ScriptPubKey& script) noexcept {
  return !script.data.empty() && script.data.front() == kOpReturn;
}

}  // namespace runeforge::script
