#include "config/network.hpp"

namespace sealcoin::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::uint16_t rpc_port) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.rpc_port = rpc_port;
  return cfg;
}

NetworkConfig g_network_config = BuildConfig(NetworkType::kMainnet, "mainnet", 12037);

NetworkConfig ConfigFor(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return BuildConfig(NetworkType::kMainnet, "mainnet", 12037);
    case NetworkType::kTestnet:
      return BuildConfig(NetworkType::kTestnet, "testnet", 13037);
    case NetworkType::kRegtest:
      return BuildConfig(NetworkType::kRegtest, "regtest", 14037);
  }
  return BuildConfig(NetworkType::kMainnet, "mainnet", 12037);
}

}  // namespace

const NetworkConfig& GetNetworkConfig() { return g_network_config; }

NetworkConfig& GetMutableNetworkConfig() { return g_network_config; }

void SelectNetwork(NetworkType type) {
  const auto data_dir = g_network_config.data_dir;
  g_network_config = ConfigFor(type);
  g_network_config.data_dir = data_dir;
}

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

}  // namespace sealcoin::config
