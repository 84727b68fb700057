#include "node/block_builder.hpp"

#include <iostream>
#include <vector>

#include "consensus/covenant.hpp"
#include "consensus/covenant_rules.hpp"
#include "consensus/monetary.hpp"
#include "consensus/tx_validator.hpp"
#include "primitives/merkle.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "script/p2qh.hpp"
#include "util/hex.hpp"

namespace sealcoin::node {

namespace {

// Room left for the coinbase and block header.
constexpr std::size_t kCoinbaseReserveBytes = 1'000;

primitives::CTransaction CreateCoinbase(std::uint32_t height, primitives::Amount value,
                                        const script::WitnessProgram& reward) {
  primitives::CTransaction tx;
  tx.version = 1;
  tx.vin.resize(1);
  tx.vin[0].prevout = primitives::COutPoint::Null();
  tx.vin[0].sequence = 0xFFFFFFFF;
  // Consensus requires lock_time == height, which keeps coinbase txids
  // unique across heights.
  tx.lock_time = height;
  tx.vout.resize(1);
  tx.vout[0].value = value;
  tx.vout[0].locking_descriptor = script::CreateP2QHScript(reward).data;
  return tx;
}

// Copies the current states of every name |tx| carries a covenant for.
bool CollectTouchedNames(const primitives::CTransaction& tx, const consensus::NameRegistry& names,
                         consensus::NameRegistry* scratch) {
  for (const auto& out : tx.vout) {
    if (out.covenant.IsNone()) {
      continue;
    }
    consensus::Covenant covenant;
    if (!consensus::DecodeCovenant(out.covenant, &covenant, nullptr)) {
      return false;
    }
    const auto* state = names.GetState(*consensus::NameHashOf(covenant));
    if (state != nullptr) {
      scratch->Put(*state);
    }
  }
  return true;
}

}  // namespace

bool BuildBlockTemplate(const ChainState& chain, const Mempool& pool,
                        const script::WitnessProgram& reward, BlockTemplate* out,
                        std::string* error) {
  if (!out) return false;
  const auto tip = chain.Tip();
  if (!tip) {
    if (error) *error = "chain not initialized";
    return false;
  }
  const auto& params = chain.Params();
  BlockTemplate templ;
  templ.height = static_cast<std::uint32_t>(tip->height + 1);
  templ.block.header.version = 1;
  templ.block.header.previous_block_hash = tip->hash;
  templ.block.header.timestamp = tip->header.timestamp + params.target_block_time_seconds;
  templ.block.header.nonce = 0;

  consensus::UTXOSet working = chain.SnapshotUtxo();
  consensus::NameRegistry working_names = chain.SnapshotNames();
  std::vector<primitives::CTransaction> selected;
  std::size_t block_bytes = kCoinbaseReserveBytes;
  primitives::Amount fees = 0;

  for (const auto& entry : pool.Entries()) {
    if (params.max_block_serialized_bytes != 0 &&
        block_bytes + entry.size_bytes > params.max_block_serialized_bytes) {
      continue;
    }
    std::string tx_error;
    primitives::Amount fee = 0;
    if (!consensus::ValidateTransaction(entry.tx, working, templ.height, params.coinbase_maturity,
                                        &fee, &tx_error)) {
      std::cerr << "[miner] warn: skipping " << util::HexEncode(entry.txid) << ": " << tx_error
                << "\n";
      continue;
    }
    consensus::NameRegistry scratch;
    consensus::AuctionError auction_error;
    if (!CollectTouchedNames(entry.tx, working_names, &scratch) ||
        !consensus::ApplyTransactionCovenants(entry.tx, entry.txid, working, templ.height,
                                              params.names, &scratch, &auction_error)) {
      std::cerr << "[miner] warn: skipping " << util::HexEncode(entry.txid) << ": "
                << auction_error.message << "\n";
      continue;
    }
    primitives::Amount next_fees = 0;
    if (!primitives::CheckedAdd(fees, fee, &next_fees)) {
      continue;
    }
    fees = next_fees;
    scratch.ForEach([&](const primitives::Hash256&, const consensus::NameState& state) {
      working_names.Put(state);
      return true;
    });
    for (const auto& in : entry.tx.vin) {
      working.SpendCoin(in.prevout);
    }
    for (std::size_t i = 0; i < entry.tx.vout.size(); ++i) {
      consensus::Coin coin;
      coin.out = entry.tx.vout[i];
      coin.height = templ.height;
      working.AddCoin(primitives::COutPoint{entry.txid, static_cast<std::uint32_t>(i)},
                      std::move(coin));
    }
    block_bytes += entry.size_bytes;
    selected.push_back(entry.tx);
  }

  const auto subsidy = consensus::CalculateBlockSubsidy(templ.height, params.halving_interval_blocks);
  templ.block.transactions.reserve(selected.size() + 1);
  templ.block.transactions.push_back(CreateCoinbase(templ.height, subsidy + fees, reward));
  for (auto& tx : selected) {
    templ.block.transactions.push_back(std::move(tx));
  }
  templ.block.header.merkle_root = primitives::ComputeMerkleRoot(templ.block.transactions);
  templ.block.header.witness_root = primitives::ComputeWitnessMerkleRoot(templ.block.transactions);
  templ.fees = fees;
  *out = std::move(templ);
  return true;
}

bool GenerateBlocks(ChainState& chain, Mempool& pool, const script::WitnessProgram& reward,
                    std::uint32_t count, const BlockConnectedFn& on_connected,
                    std::vector<primitives::Hash256>* hashes, std::string* error) {
  for (std::uint32_t i = 0; i < count; ++i) {
    BlockTemplate templ;
    if (!BuildBlockTemplate(chain, pool, reward, &templ, error)) {
      return false;
    }
    if (!chain.ConnectBlock(templ.block, error)) {
      return false;
    }
    std::vector<primitives::Hash256> evicted;
    pool.RemoveForBlock(templ.block, &evicted);
    if (on_connected) {
      on_connected(templ.block, templ.height, evicted);
    }
    if (hashes) {
      const auto tip = chain.Tip();
      if (tip) hashes->push_back(tip->hash);
    }
  }
  return true;
}

}  // namespace sealcoin::node
