#include "runes/envelope.hpp"

#include <iterator>
#include <utility>

namespace runeforge::runes {

namespace {

constexpr std::uint8_t kProtocolTag[] = {'o', 'r', 'd'};

}  // namespace

std::vector<EnvelopeChunk> FrameRunestone(std::span<const std::uint8_t> payload) {
  std::vector<EnvelopeChunk> chunks;
  chunks.reserve(7);
  chunks.push_back({true, {script::kOp0}});
  chunks.push_back({true, {script::kOpIf}});
  chunks.push_back({false, {std::begin(kProtocolTag), std::end(kProtocolTag)}});
  chunks.push_back({false, {kEnvelopeVersion}});
  chunks.push_back({false, {payload.begin(), payload.end()}});
  chunks.push_back({false, {}});
  chunks.push_back({true, {script::kOpEndIf}});
  return chunks;
}

std::vector<std::uint8_t> CompileEnvelope(const std::vector<EnvelopeChunk>& chunks) {
  std::vector<std::uint8_t> out;
  for (const auto& chunk : chunks) {
    if (chunk.opcode) {
      out.insert(out.end(), chunk.bytes.begin(), chunk.bytes.end());
    } else {
      script::PushData(&out, chunk.bytes);
    }
  }
  return out;
}

script::ScriptPubKey CreateRunestoneOutputScript(std::span<const std::uint8_t> payload) {
  script::ScriptPubKey script{};
  script.data.push_back(script::kOpReturn);
  const auto envelope = CompileEnvelope(FrameRunestone(payload));
  script.data.insert(script.data.end(), envelope.begin(), envelope.end());
  return script;
}

bool ParseEnvelopeScript(const std::vector<std::uint8_t>& script,
                         std::vector<std::uint8_t>* payload) {
  std::size_t pc = 0;
  if (!script.empty() && script.front() == script::kOpReturn) {
    pc = 1;
  }
  std::uint8_t opcode = 0;
  std::vector<std::uint8_t> data;
  std::vector<std::uint8_t> body;

  // OP_FALSE is a zero-length push, so it reads back as data-less opcode 0.
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode != script::kOp0) return false;
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode != script::kOpIf) return false;
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode > script::kOpPushData4 ||
      data != std::vector<std::uint8_t>(std::begin(kProtocolTag), std::end(kProtocolTag))) {
    return false;
  }
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode > script::kOpPushData4 ||
      data != std::vector<std::uint8_t>{kEnvelopeVersion}) {
    return false;
  }
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode > script::kOpPushData4) {
    return false;
  }
  body = std::move(data);
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode != script::kOp0) return false;
  if (!script::GetScriptOp(script, &pc, &opcode, &data) || opcode != script::kOpEndIf) {
    return false;
  }
  if (pc != script.size()) {
    return false;
  }
  *payload = std::move(body);
  return true;
}

}  // namespace runeforge::runes
