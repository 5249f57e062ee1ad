#include "config/network.hpp"

#include <utility>

namespace runeforge::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string hrp,
                          std::string service_fee_address) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.bech32_hrp = std::move(hrp);
  cfg.service_fee_address = std::move(service_fee_address);
  return cfg;
}

NetworkConfig g_network_config = ConfigFor(NetworkType::kMainnet);

}  // namespace

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet = BuildConfig(
      NetworkType::kMainnet, "mainnet", "bc", "bc1qf704dxmvfrwul8gf9dm972h99glsfhm647fky2");
  static const NetworkConfig testnet = BuildConfig(
      NetworkType::kTestnet, "testnet", "tb", "tb1qf704dxmvfrwul8gf9dm972h99glsfhm6lcj9le");
  static const NetworkConfig regtest = BuildConfig(
      NetworkType::kRegtest, "regtest", "bcrt", "bcrt1qf704dxmvfrwul8gf9dm972h99glsfhm6a3tggs");
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

const NetworkConfig& GetNetworkConfig() { return g_network_config; }

void SelectNetwork(NetworkType type) { g_network_config = ConfigFor(type); }

bool NetworkFromString(std::string_view name, NetworkType* type) {
  if (name == "mainnet" || name == "main") {
    *type = NetworkType::kMainnet;
  } else if (name == "testnet" || name == "test") {
    *type = NetworkType::kTestnet;
  } else if (name == "regtest" || name == "reg") {
    *type = NetworkType::kRegtest;
  } else {
    return false;
  }
  return true;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kRegtest:
      return "regtest";
  }
  return "mainnet";
}

}  // namespace runeforge::config
