#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "consensus/auction_error.hpp"
#include "consensus/name_registry.hpp"
#include "consensus/name_state.hpp"
#include "consensus/params.hpp"
#include "consensus/utxo.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::node {

struct BlockRecord {
  primitives::CBlockHeader header{};
  primitives::Hash256 hash{};
  std::string hash_hex;
  std::size_t height{0};
};

struct ChainTelemetry {
  std::uint64_t utxo_snapshot_failures{0};
  bool utxo_snapshot_dirty{false};
  std::uint64_t name_snapshot_failures{0};
  bool name_snapshot_dirty{false};
  // Times Initialize() replayed the block store because snapshots were
  // missing, stale or corrupt.
  std::uint64_t rebuilds{0};
};

// Inputs for validating a transaction against the next block height.
struct TxCheckContext {
  // Coins created by unconfirmed parents; consulted before the chain's UTXO set.
  const consensus::UTXOSet* extra_coins{nullptr};
  // Name states that already include pending covenants; consulted before
  // the chain's registry.
  const consensus::NameRegistry* pending_names{nullptr};
};

struct TxCheckResult {
  primitives::Amount fee{0};
  // Successor states of every name the transaction's covenants touched.
  consensus::NameRegistry touched_names;
  std::string error;
  consensus::AuctionError auction_error;
};

// Linear chain of validated blocks plus the UTXO set and name registry they
// produce. Single writer: ConnectBlock takes the exclusive lock, queries take
// shared locks.
class ChainState {
 public:
  using UtxoSnapshotSaverFn = bool (*)(const consensus::UTXOSet& view,
                                       const consensus::ChainParams& params,
                                       std::uint32_t tip_height,
                                       const primitives::Hash256& tip_hash,
                                       const std::string& path, std::string* error);

  // Empty paths keep the chain in memory. The name snapshot lives beside
  // the UTXO snapshot with a ".names" suffix.
  explicit ChainState(const consensus::ChainParams& params, std::string block_path = {},
                      std::string utxo_path = {});

  bool Initialize(std::string* error);

  const consensus::ChainParams& Params() const noexcept { return params_; }
  std::size_t BlockCount() const;
  std::uint32_t Height() const;
  std::optional<BlockRecord> Tip() const;
  bool GetBlock(std::size_t height, primitives::CBlock* block) const;
  std::size_t UtxoEntries() const;
  std::size_t NameEntries() const;

  bool GetCoin(const primitives::COutPoint& outpoint, consensus::Coin* coin) const;
  bool GetNameState(std::string_view name, consensus::NameState* state) const;
  consensus::UTXOSet SnapshotUtxo() const;
  consensus::NameRegistry SnapshotNames() const;

  // Full validation of a loose transaction at Height() + 1, covenants
  // included. Nothing in the chain changes.
  bool CheckTransaction(const primitives::CTransaction& tx, const TxCheckContext& context,
                        TxCheckResult* result) const;

  // Validates |block| as the child of the current tip and, on success,
  // commits its UTXO and name changes atomically. A rejected block leaves
  // every piece of state untouched.
  bool ConnectBlock(const primitives::CBlock& block, std::string* error);

  ChainTelemetry GetTelemetry() const;

  // Test-only hook: override how UTXO snapshots are persisted so tests can
  // simulate IO failures without relying on filesystem behavior.
  void SetSnapshotSaverForTest(UtxoSnapshotSaverFn saver);

 private:
  bool LoadBlocksLocked(std::vector<primitives::CBlock>* blocks, std::string* error);
  bool ConnectLocked(const primitives::CBlock& block, bool persist, std::string* error);
  // Copies the coins and name states |block| reads into a sparse overlay
  // and lists every outpoint it can create or spend.
  void CollectBlockViewLocked(const primitives::CBlock& block, consensus::UTXOSet* view,
                              consensus::NameRegistry* names,
                              std::vector<primitives::COutPoint>* touched) const;
  bool TryLoadSnapshotsLocked(const std::vector<primitives::CBlock>& stored);
  bool ReplayLocked(const std::vector<primitives::CBlock>& blocks, std::string* error);
  void SaveSnapshotsLocked();
  void ResetLocked();
  std::string NameSnapshotPath() const { return utxo_path_ + ".names"; }

  const consensus::ChainParams& params_;
  std::string block_path_;
  std::string utxo_path_;
  std::vector<BlockRecord> records_;
  std::vector<primitives::CBlock> blocks_;
  consensus::UTXOSet utxo_;
  consensus::NameRegistry names_;
  std::uint64_t utxo_snapshot_failures_{0};
  bool utxo_snapshot_dirty_{false};
  std::uint64_t name_snapshot_failures_{0};
  bool name_snapshot_dirty_{false};
  std::uint64_t rebuilds_{0};
  UtxoSnapshotSaverFn snapshot_saver_{nullptr};
  mutable std::shared_mutex mutex_;
};

}  // namespace sealcoin::node
