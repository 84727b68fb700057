#include "node/chain_state.hpp"

#include <iostream>
#include <mutex>
#include <utility>

#include "consensus/block_hash.hpp"
#include "consensus/block_validator.hpp"
#include "consensus/covenant.hpp"
#include "consensus/covenant_rules.hpp"
#include "consensus/tx_validator.hpp"
#include "primitives/txid.hpp"
#include "storage/block_store.hpp"
#include "storage/name_snapshot.hpp"
#include "storage/utxo_snapshot.hpp"
#include "util/hex.hpp"

namespace sealcoin::node {

ChainState::ChainState(const consensus::ChainParams& params, std::string block_path,
                       std::string utxo_path)
    : params_(params),
      block_path_(std::move(block_path)),
      utxo_path_(std::move(utxo_path)),
      snapshot_saver_(&storage::SaveUTXOSnapshot) {}

void ChainState::SetSnapshotSaverForTest(UtxoSnapshotSaverFn saver) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  snapshot_saver_ = saver ? saver : &storage::SaveUTXOSnapshot;
}

bool ChainState::Initialize(std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ResetLocked();
  std::vector<primitives::CBlock> stored;
  if (!block_path_.empty() && !LoadBlocksLocked(&stored, error)) {
    return false;
  }
  if (stored.empty()) {
    if (!ConnectLocked(params_.genesis_block, /*persist=*/true, error)) {
      return false;
    }
    SaveSnapshotsLocked();
    return true;
  }
  if (consensus::ComputeBlockHash(stored.front().header) != params_.genesis_hash) {
    if (error) *error = "block store does not start at this network's genesis";
    return false;
  }

  // Index the stored chain first; state comes from the snapshots when they
  // match the stored tip and from a full replay otherwise.
  if (TryLoadSnapshotsLocked(stored)) {
    return true;
  }
  ++rebuilds_;
  std::cerr << "[chain] info: rebuilding UTXO and name state from " << stored.size()
            << " stored blocks\n";
  if (!ReplayLocked(stored, error)) {
    return false;
  }
  SaveSnapshotsLocked();
  return true;
}

void ChainState::ResetLocked() {
  records_.clear();
  blocks_.clear();
  utxo_ = consensus::UTXOSet{};
  names_ = consensus::NameRegistry{};
}

bool ChainState::LoadBlocksLocked(std::vector<primitives::CBlock>* blocks, std::string* error) {
  storage::BlockStore store(block_path_);
  return store.LoadAll(blocks, error);
}

bool ChainState::TryLoadSnapshotsLocked(const std::vector<primitives::CBlock>& stored) {
  if (utxo_path_.empty()) {
    return false;
  }
  const auto tip_hash = consensus::ComputeBlockHash(stored.back().header);
  const auto tip_height = static_cast<std::uint32_t>(stored.size() - 1);

  consensus::UTXOSet utxo;
  storage::SnapshotHeader utxo_header;
  std::string load_error;
  if (!storage::LoadUTXOSnapshot(&utxo, params_, utxo_path_, &utxo_header, &load_error)) {
    std::cerr << "[chain] warn: " << load_error << "\n";
    return false;
  }
  consensus::NameRegistry names;
  storage::SnapshotHeader name_header;
  if (!storage::LoadNameSnapshot(&names, params_, NameSnapshotPath(), &name_header,
                                 &load_error)) {
    std::cerr << "[chain] warn: " << load_error << "\n";
    return false;
  }
  if (utxo_header.tip_hash != tip_hash || utxo_header.tip_height != tip_height ||
      name_header.tip_hash != tip_hash || name_header.tip_height != tip_height) {
    std::cerr << "[chain] warn: snapshots do not match the stored tip\n";
    return false;
  }

  for (std::size_t height = 0; height < stored.size(); ++height) {
    BlockRecord record;
    record.header = stored[height].header;
    record.hash = consensus::ComputeBlockHash(record.header);
    record.hash_hex = util::HexEncode(record.hash);
    record.height = height;
    if (height > 0 && record.header.previous_block_hash != records_.back().hash) {
      ResetLocked();
      return false;
    }
    records_.push_back(std::move(record));
    blocks_.push_back(stored[height]);
  }
  utxo_ = std::move(utxo);
  names_ = std::move(names);
  return true;
}

bool ChainState::ReplayLocked(const std::vector<primitives::CBlock>& blocks, std::string* error) {
  ResetLocked();
  for (const auto& block : blocks) {
    std::string replay_error;
    if (!ConnectLocked(block, /*persist=*/false, &replay_error)) {
      if (error) {
        *error = "stored block " + std::to_string(records_.size()) +
                 " failed validation: " + replay_error;
      }
      return false;
    }
  }
  return true;
}

bool ChainState::ConnectLocked(const primitives::CBlock& block, bool persist,
                               std::string* error) {
  const auto height = static_cast<std::uint32_t>(records_.size());
  const auto hash = consensus::ComputeBlockHash(block.header);
  if (height == 0) {
    if (hash != params_.genesis_hash) {
      if (error) *error = "first block must be the genesis block";
      return false;
    }
  } else if (block.header.previous_block_hash != records_.back().hash) {
    if (error) *error = "block does not extend the current tip";
    return false;
  }

  consensus::UTXOSet working;
  consensus::NameRegistry working_names;
  std::vector<primitives::COutPoint> touched;
  CollectBlockViewLocked(block, &working, &working_names, &touched);
  std::string validation_error;
  if (!consensus::ValidateAndApplyBlock(block, height, params_, &working, &working_names,
                                        &validation_error)) {
    if (error) *error = "validation failed: " + validation_error;
    return false;
  }
  if (persist && !block_path_.empty()) {
    storage::BlockStore store(block_path_);
    if (!store.Append(block, error)) {
      return false;
    }
  }

  // Fold the overlay back: every coin the block read or wrote either
  // survived in the overlay or is gone.
  for (const auto& outpoint : touched) {
    if (const auto* coin = working.GetCoin(outpoint)) {
      utxo_.AddCoin(outpoint, *coin);
    } else {
      utxo_.SpendCoin(outpoint);
    }
  }
  working_names.ForEach([&](const primitives::Hash256&, const consensus::NameState& state) {
    names_.Put(state);
    return true;
  });

  BlockRecord record;
  record.header = block.header;
  record.hash = hash;
  record.hash_hex = util::HexEncode(hash);
  record.height = height;
  records_.push_back(std::move(record));
  blocks_.push_back(block);
  return true;
}

void ChainState::CollectBlockViewLocked(const primitives::CBlock& block,
                                        consensus::UTXOSet* view,
                                        consensus::NameRegistry* names,
                                        std::vector<primitives::COutPoint>* touched) const {
  auto add_name = [&](const primitives::CCovenant& raw) {
    if (raw.IsNone()) {
      return;
    }
    consensus::Covenant covenant;
    if (!consensus::DecodeCovenant(raw, &covenant, nullptr)) {
      return;
    }
    const auto* name_hash = consensus::NameHashOf(covenant);
    if (name_hash == nullptr || names->GetState(*name_hash) != nullptr) {
      return;
    }
    if (const auto* state = names_.GetState(*name_hash)) {
      names->Put(*state);
    }
  };
  for (const auto& tx : block.transactions) {
    if (!tx.IsCoinbase()) {
      for (const auto& in : tx.vin) {
        touched->push_back(in.prevout);
        if (const auto* coin = utxo_.GetCoin(in.prevout)) {
          view->AddCoin(in.prevout, *coin);
          add_name(coin->out.covenant);
        }
      }
    }
    // Existing coins under this txid must stay visible for the collision check.
    const auto txid = primitives::ComputeTxId(tx);
    for (std::size_t i = 0; i < tx.vout.size(); ++i) {
      const primitives::COutPoint outpoint{txid, static_cast<std::uint32_t>(i)};
      touched->push_back(outpoint);
      if (const auto* coin = utxo_.GetCoin(outpoint)) {
        view->AddCoin(outpoint, *coin);
      }
      add_name(tx.vout[i].covenant);
    }
  }
}

void ChainState::SaveSnapshotsLocked() {
  if (utxo_path_.empty() || records_.empty()) {
    return;
  }
  // Persistence is best-effort: once a block is connected it stays
  // connected even if snapshot IO fails.
  const auto& tip = records_.back();
  const auto tip_height = static_cast<std::uint32_t>(tip.height);
  std::string save_error;
  if (snapshot_saver_ &&
      snapshot_saver_(utxo_, params_, tip_height, tip.hash, utxo_path_, &save_error)) {
    utxo_snapshot_dirty_ = false;
  } else {
    ++utxo_snapshot_failures_;
    utxo_snapshot_dirty_ = true;
    std::cerr << "[chain] warn: failed to update UTXO snapshot; restart will replay blocks: "
              << save_error << "\n";
  }
  save_error.clear();
  if (storage::SaveNameSnapshot(names_, params_, tip_height, tip.hash, NameSnapshotPath(),
                                &save_error)) {
    name_snapshot_dirty_ = false;
  } else {
    ++name_snapshot_failures_;
    name_snapshot_dirty_ = true;
    std::cerr << "[chain] warn: failed to update name snapshot; restart will replay blocks: "
              << save_error << "\n";
  }
}

bool ChainState::ConnectBlock(const primitives::CBlock& block, std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (records_.empty()) {
    if (error) *error = "chain not initialized";
    return false;
  }
  if (!ConnectLocked(block, /*persist=*/true, error)) {
    return false;
  }
  SaveSnapshotsLocked();
  return true;
}

bool ChainState::CheckTransaction(const primitives::CTransaction& tx,
                                  const TxCheckContext& context, TxCheckResult* result) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto height = static_cast<std::uint32_t>(records_.size());

  // Only the coins and names this transaction touches are copied.
  consensus::UTXOSet view;
  for (const auto& in : tx.vin) {
    const consensus::Coin* coin =
        context.extra_coins ? context.extra_coins->GetCoin(in.prevout) : nullptr;
    if (coin == nullptr) {
      coin = utxo_.GetCoin(in.prevout);
    }
    if (coin != nullptr) {
      view.AddCoin(in.prevout, *coin);
    }
  }
  if (!consensus::ValidateTransaction(tx, view, height, params_.coinbase_maturity, &result->fee,
                                      &result->error)) {
    return false;
  }

  consensus::NameRegistry scratch;
  for (const auto& out : tx.vout) {
    if (out.covenant.IsNone()) {
      continue;
    }
    consensus::Covenant covenant;
    if (!consensus::DecodeCovenant(out.covenant, &covenant, &result->error)) {
      consensus::Fail(&result->auction_error, consensus::AuctionErrorKind::kInvalidTransition,
                      result->error);
      return false;
    }
    const auto* name_hash = consensus::NameHashOf(covenant);
    if (scratch.GetState(*name_hash) != nullptr) {
      continue;
    }
    const consensus::NameState* state =
        context.pending_names ? context.pending_names->GetState(*name_hash) : nullptr;
    if (state == nullptr) {
      state = names_.GetState(*name_hash);
    }
    if (state != nullptr) {
      scratch.Put(*state);
    }
  }
  if (!consensus::ApplyTransactionCovenants(tx, primitives::ComputeTxId(tx), view, height,
                                            params_.names, &scratch, &result->auction_error)) {
    result->error = std::string(consensus::AuctionErrorKindName(result->auction_error.kind)) +
                    ": " + result->auction_error.message;
    return false;
  }
  result->touched_names = std::move(scratch);
  return true;
}

std::size_t ChainState::BlockCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_.size();
}

std::uint32_t ChainState::Height() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_.empty() ? 0 : static_cast<std::uint32_t>(records_.size() - 1);
}

std::optional<BlockRecord> ChainState::Tip() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (records_.empty()) {
    return std::nullopt;
  }
  return records_.back();
}

bool ChainState::GetBlock(std::size_t height, primitives::CBlock* block) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (height >= blocks_.size()) {
    return false;
  }
  if (block) *block = blocks_[height];
  return true;
}

std::size_t ChainState::UtxoEntries() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return utxo_.Size();
}

std::size_t ChainState::NameEntries() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return names_.Size();
}

bool ChainState::GetCoin(const primitives::COutPoint& outpoint, consensus::Coin* coin) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto* found = utxo_.GetCoin(outpoint);
  if (found == nullptr) {
    return false;
  }
  if (coin) *coin = *found;
  return true;
}

bool ChainState::GetNameState(std::string_view name, consensus::NameState* state) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto* found = names_.GetStateByName(name);
  if (found == nullptr) {
    return false;
  }
  if (state) *state = *found;
  return true;
}

consensus::UTXOSet ChainState::SnapshotUtxo() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return utxo_;
}

consensus::NameRegistry ChainState::SnapshotNames() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return names_;
}

ChainTelemetry ChainState::GetTelemetry() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ChainTelemetry telemetry;
  telemetry.utxo_snapshot_failures = utxo_snapshot_failures_;
  telemetry.utxo_snapshot_dirty = utxo_snapshot_dirty_;
  telemetry.name_snapshot_failures = name_snapshot_failures_;
  telemetry.name_snapshot_dirty = name_snapshot_dirty_;
  telemetry.rebuilds = rebuilds_;
  return telemetry;
}

}  // namespace sealcoin::node
