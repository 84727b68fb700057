#include "consensus/params.hpp"

#include <span>
#include <string_view>

#include "consensus/block_hash.hpp"
#include "consensus/monetary.hpp"
#include "crypto/hash.hpp"
#include "primitives/merkle.hpp"
#include "script/p2qh.hpp"

namespace sealcoin::consensus {

namespace {

constexpr std::uint32_t kMaxBlockSerializedBytes = 4u * 1024u * 1024u;  // 4 MiB

// Genesis pays to H3("SEAL-GENESIS-PAYOUT|<network>"), a program nobody holds
// a key for.
script::WitnessProgram GenesisPayoutProgram(std::string_view network_id) {
  std::string preimage = "SEAL-GENESIS-PAYOUT|";
  preimage.append(network_id);
  return crypto::Sha3_256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(preimage.data()), preimage.size()));
}

primitives::CBlock CreateGenesisBlock(std::string_view network_id, primitives::Amount reward,
                                      std::uint32_t timestamp) {
  primitives::CTransaction coinbase;
  coinbase.version = 1;
  coinbase.vin.resize(1);
  coinbase.vin[0].prevout = primitives::COutPoint::Null();
  coinbase.lock_time = 0;
  coinbase.vout.resize(1);
  coinbase.vout[0].value = reward;
  coinbase.vout[0].locking_descriptor =
      script::CreateP2QHScript(GenesisPayoutProgram(network_id)).data;

  primitives::CBlock genesis;
  genesis.transactions = {coinbase};
  genesis.header.version = 1;
  genesis.header.timestamp = timestamp;
  genesis.header.previous_block_hash.fill(0);
  genesis.header.merkle_root = primitives::ComputeMerkleRoot(genesis.transactions);
  genesis.header.witness_root = primitives::ComputeWitnessMerkleRoot(genesis.transactions);
  return genesis;
}

ChainParams BuildParams(config::NetworkType network, std::string network_id,
                        std::uint32_t rpc_port, std::uint32_t timestamp,
                        std::uint32_t halving_interval, std::uint32_t coinbase_maturity,
                        NameParams names, std::string timestamp_msg) {
  ChainParams params{};
  params.network = network;
  params.network_id = std::move(network_id);
  params.target_block_time_seconds = kTargetBlockSpacingSeconds;
  params.rpc_default_port = rpc_port;
  params.max_supply_grains = primitives::kMaxMoney;
  params.initial_subsidy_grains = kInitialSubsidy;
  params.halving_interval_blocks = halving_interval;
  params.coinbase_maturity = coinbase_maturity;
  params.max_block_serialized_bytes = kMaxBlockSerializedBytes;
  params.min_relay_fee_per_byte = 1;
  params.names = names;
  params.genesis_time = timestamp;
  params.genesis_message = std::move(timestamp_msg);
  params.genesis_block =
      CreateGenesisBlock(params.network_id, params.initial_subsidy_grains, timestamp);
  params.genesis_hash = ComputeBlockHash(params.genesis_block.header);
  return params;
}

}  // namespace

const ChainParams& Params(config::NetworkType type) {
  static const ChainParams mainnet =
      BuildParams(config::NetworkType::kMainnet, "mainnet", 12037, 1580745078, 170'000, 100,
                  NameParams{.tree_interval = 36,
                             .bidding_period = 720,
                             .reveal_period = 1440,
                             .renewal_window = 105'120,
                             .transfer_lockup = 288},
                  "SealCoin genesis - mainnet");
  static const ChainParams testnet =
      BuildParams(config::NetworkType::kTestnet, "testnet", 13037, 1580745079, 170'000, 100,
                  NameParams{.tree_interval = 18,
                             .bidding_period = 36,
                             .reveal_period = 72,
                             .renewal_window = 4'320,
                             .transfer_lockup = 36},
                  "SealCoin genesis - testnet");
  // Short windows so tests can walk a name through every phase quickly.
  static const ChainParams regtest =
      BuildParams(config::NetworkType::kRegtest, "regtest", 14037, 1580745080, 2'500, 2,
                  NameParams{.tree_interval = 5,
                             .bidding_period = 5,
                             .reveal_period = 10,
                             .renewal_window = 5'000,
                             .transfer_lockup = 10},
                  "SealCoin genesis - regtest");

  switch (type) {
    case config::NetworkType::kMainnet:
      return mainnet;
    case config::NetworkType::kTestnet:
      return testnet;
    case config::NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

}  // namespace sealcoin::consensus
