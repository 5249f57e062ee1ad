#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

#include "script/script.hpp"
#include "util/hex.hpp"

using namespace runeforge;

namespace {

bool TestWitnessScripts() {
  const std::vector<std::uint8_t> keyhash(20, 0x11);
  const auto p2wpkh = script::CreateWitnessScript(0, keyhash);
  if (p2wpkh.data.size() != 22 || p2wpkh.data[0] != script::kOp0 || p2wpkh.data[1] != 20) {
    std::cerr << "unexpected P2WPKH layout\n";
    return false;
  }
  const std::vector<std::uint8_t> key(32, 0x22);
  const auto p2tr = script::CreateWitnessScript(1, key);
  if (p2tr.data[0] != script::kOp1 || p2tr.data.size() != 34) {
    std::cerr << "unexpected P2TR layout\n";
    return false;
  }
  std::uint8_t version = 0;
  std::vector<std::uint8_t> program;
  if (!script::ExtractWitnessProgram(p2tr, &version, &program) || version != 1 || program != key) {
    std::cerr << "P2TR program not extracted\n";
    return false;
  }
  // Push length must cover the rest of the script exactly.
  script::ScriptPubKey truncated = p2wpkh;
  truncated.data.pop_back();
  if (script::ExtractWitnessProgram(truncated, nullptr, nullptr)) {
    std::cerr << "truncated witness script accepted\n";
    return false;
  }
  script::ScriptPubKey not_witness{{script::kOpReturn, 0x02, 0xAA, 0xBB}};
  if (script::ExtractWitnessProgram(not_witness, nullptr, nullptr)) {
    std::cerr << "OP_RETURN accepted as witness program\n";
    return false;
  }
  return true;
}

bool TestScriptForAddress() {
  script::ScriptPubKey out;
  if (!script::ScriptForAddress("tb1q5pc66z8dyw7eqqddnem2vtg763myghdgljvzse", "tb", &out)) {
    std::cerr << "testnet recipient address rejected\n";
    return false;
  }
  if (util::HexEncode(out.data) != "0014a071ad08ed23bd9001ad9e76a62d1ed476445da8") {
    std::cerr << "unexpected recipient script " << util::HexEncode(out.data) << "\n";
    return false;
  }
  if (script::ScriptForAddress("tb1q5pc66z8dyw7eqqddnem2vtg763myghdgljvzse", "bc", &out)) {
    std::cerr << "testnet address accepted for mainnet\n";
    return false;
  }
  return true;
}

bool TestPushAndIterate() {
  std::vector<std::uint8_t> script_bytes;
  script::PushData(&script_bytes, {});
  script::PushData(&script_bytes, std::vector<std::uint8_t>(75, 0x01));
  script::PushData(&script_bytes, std::vector<std::uint8_t>(76, 0x02));
  script::PushData(&script_bytes, std::vector<std::uint8_t>(256, 0x03));
  script_bytes.push_back(script::kOpEndIf);

  const std::vector<std::pair<std::uint8_t, std::size_t>> expected = {
      {script::kOp0, 0},
      {75, 75},
      {script::kOpPushData1, 76},
      {script::kOpPushData2, 256},
      {script::kOpEndIf, 0},
  };
  std::size_t pc = 0;
  for (const auto& [op, size] : expected) {
    std::uint8_t opcode = 0;
    std::vector<std::uint8_t> data;
    if (!script::GetScriptOp(script_bytes, &pc, &opcode, &data) || opcode != op ||
        data.size() != size) {
      std::cerr << "unexpected op at offset " << pc << "\n";
      return false;
    }
  }
  if (pc != script_bytes.size()) {
    std::cerr << "iteration did not consume the script\n";
    return false;
  }
  std::uint8_t opcode = 0;
  std::vector<std::uint8_t> data;
  if (script::GetScriptOp(script_bytes, &pc, &opcode, &data)) {
    std::cerr << "read past the end\n";
    return false;
  }

  const std::vector<std::uint8_t> short_push{script::kOpPushData1, 0x05, 0x00, 0x00};
  pc = 0;
  if (script::GetScriptOp(short_push, &pc, &opcode, &data)) {
    std::cerr << "truncated push accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestWitnessScripts()) return EXIT_FAILURE;
    if (!TestScriptForAddress()) return EXIT_FAILURE;
    if (!TestPushAndIterate()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "script_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
