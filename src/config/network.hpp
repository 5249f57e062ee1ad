#pragma once

#include <string>
#include <string_view>

namespace runeforge::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  std::string bech32_hrp{"bc"};
  // P2WPKH address that collects the reveal service fee.
  std::string service_fee_address;
};

const NetworkConfig& ConfigFor(NetworkType type);
const NetworkConfig& GetNetworkConfig();
void SelectNetwork(NetworkType type);
// Accepts the long and short names ("mainnet"/"main"). Returns false for
// anything else and leaves |type| untouched.
bool NetworkFromString(std::string_view name, NetworkType* type);
std::string_view NetworkName(NetworkType type);

}  // namespace runeforge::config
