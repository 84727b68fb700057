#pragma once

#include <cstdint>
#include <string>

#include "config/network.hpp"
#include "primitives/amount.hpp"
#include "primitives/block.hpp"
#include "primitives/hash.hpp"

namespace sealcoin::consensus {

// Name-auction timing. All windows are measured in blocks from the height
// of the block that mined the OPEN.
struct NameParams {
  std::uint32_t tree_interval{0};
  std::uint32_t bidding_period{0};
  std::uint32_t reveal_period{0};
  std::uint32_t renewal_window{0};
  std::uint32_t transfer_lockup{0};
  std::uint32_t max_name_size{63};
  std::uint32_t max_resource_size{512};

  // OPENING lasts one full tree interval plus the block that mined the OPEN.
  [[nodiscard]] std::uint32_t OpenPeriod() const noexcept { return tree_interval + 1; }
};

struct ChainParams {
  config::NetworkType network{config::NetworkType::kMainnet};
  std::string network_id;
  std::uint32_t target_block_time_seconds{0};
  std::uint32_t rpc_default_port{0};
  primitives::Amount max_supply_grains{0};
  primitives::Amount initial_subsidy_grains{0};
  std::uint32_t halving_interval_blocks{0};
  std::uint32_t coinbase_maturity{0};
  // Consensus cap on the fully serialized block, witnesses included.
  std::uint32_t max_block_serialized_bytes{0};
  // Minimum relay fee in grains per serialized byte (mempool policy).
  primitives::Amount min_relay_fee_per_byte{0};
  NameParams names{};
  std::uint32_t genesis_time{0};
  std::string genesis_message;
  primitives::CBlock genesis_block;
  primitives::Hash256 genesis_hash;
};

const ChainParams& Params(config::NetworkType type);

}  // namespace sealcoin::consensus
