#include "script/script.hpp"

#include <algorithm>

#include "crypto/bech32.hpp"

namespace runeforge::script {

namespace {

std::uint8_t VersionOpcode(std::uint8_t witness_version) {
  return witness_version == 0 ? kOp0 : static_cast<std::uint8_t>(kOp1 + witness_version - 1);
}

}  // namespace

ScriptPubKey CreateWitnessScript(std::uint8_t witness_version,
                                 std::span<const std::uint8_t> program) {
  ScriptPubKey script{};
  script.data.reserve(2 + program.size());
  script.data.push_back(VersionOpcode(witness_version));
  script.data.push_back(static_cast<std::uint8_t>(program.size()));
  script.data.insert(script.data.end(), program.begin(), program.end());
  return script;
}

bool ExtractWitnessProgram(const ScriptPubKey& script, std::uint8_t* witness_version,
                           std::vector<std::uint8_t>* program) {
  if (script.data.size() < 4 || script.data.size() > 42) {
    return false;
  }
  const std::uint8_t version_op = script.data[0];
  if (version_op != kOp0 && (version_op < kOp1 || version_op > kOp16)) {
    return false;
  }
  if (static_cast<std::size_t>(script.data[1]) + 2 != script.data.size()) {
    return false;
  }
  if (witness_version != nullptr) {
    *witness_version = version_op == kOp0 ? 0 : static_cast<std::uint8_t>(version_op - kOp1 + 1);
  }
  if (program != nullptr) {
    program->assign(script.data.begin() + 2, script.data.end());
  }
  return true;
}

bool ScriptForAddress(std::string_view address, std::string_view hrp, ScriptPubKey* out) {
  std::uint8_t version = 0;
  std::vector<std::uint8_t> program;
  if (!crypto::DecodeSegwitAddress(address, hrp, &version, &program)) {
    return false;
  }
  *out = CreateWitnessScript(version, program);
  return true;
}

void PushData(std::vector<std::uint8_t>* script, std::span<const std::uint8_t> data) {
  const std::size_t size = data.size();
  if (size < kOpPushData1) {
    script->push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 0xFF) {
    script->push_back(kOpPushData1);
    script->push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 0xFFFF) {
    script->push_back(kOpPushData2);
    script->push_back(static_cast<std::uint8_t>(size & 0xFF));
    script->push_back(static_cast<std::uint8_t>((size >> 8) & 0xFF));
  } else {
    script->push_back(kOpPushData4);
    for (int i = 0; i < 4; ++i) {
      script->push_back(static_cast<std::uint8_t>((size >> (8 * i)) & 0xFF));
    }
  }
  script->insert(script->end(), data.begin(), data.end());
}

bool GetScriptOp(const std::vector<std::uint8_t>& script, std::size_t* pc,
                 std::uint8_t* opcode, std::vector<std::uint8_t>* data) {
  data->clear();
  if (*pc >= script.size()) {
    return false;
  }
  const std::uint8_t op = script[(*pc)++];
  *opcode = op;
  if (op > kOpPushData4) {
    return true;
  }
  std::size_t size = 0;
  std::size_t width = 0;
  if (op < kOpPushData1) {
    size = op;
  } else if (op == kOpPushData1) {
    width = 1;
  } else if (op == kOpPushData2) {
    width = 2;
  } else {
    width = 4;
  }
  if (width > 0) {
    if (script.size() - *pc < width) {
      return false;
    }
    for (std::size_t i = 0; i < width; ++i) {
      size |= static_cast<std::size_t>(script[*pc + i]) << (8 * i);
    }
    *pc += width;
  }
  if (script.size() - *pc < size) {
    return false;
  }
  data->assign(script.begin() + *pc, script.begin() + *pc + size);
  *pc += size;
  return true;
}

}  // namespace runeforge::script
