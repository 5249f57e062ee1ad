#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "config/network.hpp"
#include "etch/etch_json.hpp"
#include "nlohmann/json.hpp"
#include "policy/reveal_fees.hpp"
#include "runes/envelope.hpp"
#include "runes/rune_name.hpp"
#include "runes/runestone.hpp"
#include "util/hex.hpp"

namespace {

struct CliOptions {
  std::string network{"mainnet"};
  bool raw{false};
  std::vector<std::string> args;
};

void PrintUsage() {
  std::cout << "Usage: runeforge-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  encode <etching.json|->       Serialize an etching into a runestone payload\n"
            << "  decode <hex>                  Decode a payload or an envelope output script\n"
            << "  name <NAME>                   Show the rune integer and spacer mask\n"
            << "  fees <funding> <vsize> <fee_rate>\n"
            << "                                Split a commit output into reveal fees\n"
            << "Options:\n"
            << "  --network=<mainnet|testnet|regtest>\n"
            << "  --raw                         Print bare hex instead of JSON\n"
            << "  --help\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--network") {
      if (++i >= argc) throw std::runtime_error("missing value for --network");
      opts.network = argv[i];
    } else if (arg.rfind("--network=", 0) == 0) {
      opts.network = arg.substr(std::string_view("--network=").size());
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

const std::string& RequireArg(const CliOptions& opts, std::size_t index, std::string_view what) {
  if (opts.args.size() <= index) {
    throw std::runtime_error("missing " + std::string(what));
  }
  return opts.args[index];
}

std::string ReadInput(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(path, std::ios::in);
  if (!in) {
    throw std::runtime_error("unable to read etching file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::uint64_t ParseUnsigned(const std::string& text, std::string_view what) {
  std::size_t consumed = 0;
  const unsigned long long value = std::stoull(text, &consumed);
  if (consumed != text.size()) {
    throw std::runtime_error("invalid " + std::string(what) + ": " + text);
  }
  return value;
}

int HandleEncode(const CliOptions& opts) {
  const auto json = nlohmann::json::parse(ReadInput(RequireArg(opts, 1, "etching file")));
  runeforge::runes::EtchingSpec spec;
  std::string error;
  if (!runeforge::etch::EtchingFromJson(json, &spec, &error)) {
    throw std::runtime_error(error);
  }
  std::vector<runeforge::runes::TaggedField> fields;
  runeforge::runes::CodecError code = runeforge::runes::CodecError::kNone;
  if (!runeforge::runes::BuildTaggedFields(spec, &fields, &code, &error)) {
    throw std::runtime_error(std::string(runeforge::runes::CodecErrorName(code)) + ": " + error);
  }
  const auto payload = runeforge::runes::SerializeFields(fields);
  const auto script = runeforge::runes::CreateRunestoneOutputScript(payload);
  if (opts.raw) {
    std::cout << runeforge::util::HexEncode(payload) << "\n";
    return 0;
  }
  nlohmann::json out = {
      {"payload", runeforge::util::HexEncode(payload)},
      {"script", runeforge::util::HexEncode(script.data)},
      {"fields", runeforge::etch::FieldsToJson(fields)},
  };
  std::cout << out.dump(2) << "\n";
  std::cout << runeforge::runes::FormatRuneInfo(spec);
  return 0;
}

int HandleDecode(const CliOptions& opts) {
  std::vector<std::uint8_t> bytes;
  if (!runeforge::util::HexDecode(RequireArg(opts, 1, "hex"), &bytes)) {
    throw std::runtime_error("input is not valid hex");
  }
  std::vector<std::uint8_t> payload;
  const bool framed = runeforge::runes::ParseEnvelopeScript(bytes, &payload);
  if (!framed) {
    payload = bytes;
  }
  std::vector<runeforge::runes::TaggedField> fields;
  runeforge::runes::CodecError code = runeforge::runes::CodecError::kNone;
  if (!runeforge::runes::ParseFields(payload, &fields, &code)) {
    throw std::runtime_error(std::string(runeforge::runes::CodecErrorName(code)));
  }
  nlohmann::json out = {
      {"framed", framed},
      {"payload", runeforge::util::HexEncode(payload)},
      {"fields", runeforge::etch::FieldsToJson(fields)},
  };
  runeforge::runes::EtchingSpec spec;
  std::string error;
  if (runeforge::runes::DecodeEtching(fields, &spec, &code, &error)) {
    out["etching"] = runeforge::etch::EtchingToJson(spec);
  } else {
    out["etching_error"] = error;
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

int HandleName(const CliOptions& opts) {
  const auto& name = RequireArg(opts, 1, "rune name");
  runeforge::runes::BigUint value;
  runeforge::runes::CodecError code = runeforge::runes::CodecError::kNone;
  if (!runeforge::runes::EncodeRuneName(name, &value, &code)) {
    throw std::runtime_error(std::string(runeforge::runes::CodecErrorName(code)) + ": " + name);
  }
  const nlohmann::json out = {
      {"name", name},
      {"rune", value.str()},
      {"spacers", runeforge::runes::ComputeSpacers(name)},
      {"varint", runeforge::util::HexEncode(runeforge::runes::EncodeVarInt(value))},
  };
  std::cout << out.dump(2) << "\n";
  return 0;
}

int HandleFees(const CliOptions& opts) {
  const auto funding = ParseUnsigned(RequireArg(opts, 1, "funding value"), "funding value");
  const auto vsize = ParseUnsigned(RequireArg(opts, 2, "virtual size"), "virtual size");
  const double fee_rate = std::stod(RequireArg(opts, 3, "fee rate"));
  runeforge::policy::FeeSplit split;
  std::string error;
  if (!runeforge::policy::ComputeRevealSplit(funding, vsize, fee_rate, {},
                                             runeforge::policy::kDustThreshold, &split,
                                             &error)) {
    throw std::runtime_error(error);
  }
  const nlohmann::json out = {
      {"miner_fee", split.miner_fee},
      {"service_fee", split.service_fee},
      {"recipient_value", split.recipient_value},
      {"service_fee_address", runeforge::config::GetNetworkConfig().service_fee_address},
  };
  std::cout << out.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    runeforge::config::NetworkType net = runeforge::config::NetworkType::kMainnet;
    if (!runeforge::config::NetworkFromString(opts.network, &net)) {
      throw std::runtime_error("unknown network: " + opts.network);
    }
    runeforge::config::SelectNetwork(net);
    if (opts.args.empty()) {
      PrintUsage();
      return 1;
    }
    const auto& command = opts.args.front();
    if (command == "encode") return HandleEncode(opts);
    if (command == "decode") return HandleDecode(opts);
    if (command == "name") return HandleName(opts);
    if (command == "fees") return HandleFees(opts);
    throw std::runtime_error("unknown command: " + command);
  } catch (const std::exception& ex) {
    std::cerr << "runeforge-cli: " << ex.what() << "\n";
    return 1;
  }
}
