#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sealcoin::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  std::uint16_t rpc_port{12037};
  // Base data directory for the block store and snapshots. Empty keeps the
  // chain in memory only.
  std::string data_dir;
  // Whether accepted pool transactions are forwarded to the wallet.
  bool wallet_mempool_notifications{true};
  // Coin selection used when funding wallet sends: largest, oldest or all.
  std::string wallet_coin_selection{"largest"};
};

const NetworkConfig& GetNetworkConfig();
NetworkConfig& GetMutableNetworkConfig();
void SelectNetwork(NetworkType type);
bool NetworkFromString(std::string_view name, NetworkType* type);
std::string_view NetworkName(NetworkType type);

}  // namespace sealcoin::config
