#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "script/script.hpp"

namespace runeforge::runes {

// Opcode chunks are emitted as raw opcodes; data chunks as pushes.
struct EnvelopeChunk {
  bool opcode{false};
  std::vector<std::uint8_t> bytes;
  bool operator==(const EnvelopeChunk& other) const = default;
};

inline constexpr std::uint8_t kEnvelopeVersion = 0x01;

// OP_FALSE OP_IF "ord" <version> <payload> <empty> OP_ENDIF. The payload is
// not inspected.
std::vector<EnvelopeChunk> FrameRunestone(std::span<const std::uint8_t> payload);
std::vector<std::uint8_t> CompileEnvelope(const std::vector<EnvelopeChunk>& chunks);

// OP_RETURN followed by the compiled envelope; the zero-value reveal output.
script::ScriptPubKey CreateRunestoneOutputScript(std::span<const std::uint8_t> payload);

// Inverse of CreateRunestoneOutputScript (the leading OP_RETURN is
// optional). Returns false when the script does not follow the envelope
// layout.
bool ParseEnvelopeScript(const std::vector<std::uint8_t>& script,
                         std::vector<std::uint8_t>* payload);

}  // namespace runeforge::runes
