#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "consensus/auction_error.hpp"
#include "consensus/name_registry.hpp"
#include "consensus/utxo.hpp"
#include "node/chain_state.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::node {

struct MempoolEntry {
  primitives::CTransaction tx;
  primitives::Hash256 txid{};
  std::uint64_t size_bytes{0};
  primitives::Amount fee{0};
  std::uint32_t entry_height{0};
  std::uint64_t sequence{0};
};

// Unconfirmed transactions validated against the chain tip plus their
// unconfirmed parents. Name covenants are validated against name states
// that already include every earlier pool transaction, so two pending
// OPENs (or any other conflicting covenant pair) cannot both be admitted.
class Mempool {
 public:
  using Listener =
      std::function<void(const primitives::CTransaction& tx, const primitives::Hash256& txid)>;

  explicit Mempool(const ChainState& chain);

  // Admits |tx| or fills |reject_reason|. Covenant failures also fill
  // |auction_error| with their stable kind.
  bool Submit(const primitives::CTransaction& tx, std::string* reject_reason,
              consensus::AuctionError* auction_error = nullptr);

  bool Contains(const primitives::Hash256& txid) const;
  bool Get(const primitives::Hash256& txid, primitives::CTransaction* tx) const;
  // Drops |txid| and every pool transaction that depends on it.
  bool Remove(const primitives::Hash256& txid,
              std::vector<primitives::Hash256>* removed = nullptr);
  void RemoveAll();
  std::size_t Size() const;
  // Pool contents in arrival order.
  std::vector<MempoolEntry> Entries() const;

  // Called after |block| was connected: forgets mined transactions and
  // re-validates the rest against the new tip. Transactions that no longer
  // fit are reported through |evicted|.
  void RemoveForBlock(const primitives::CBlock& block,
                      std::vector<primitives::Hash256>* evicted = nullptr);

  void SetListener(Listener listener);
  void SetNotificationsMuted(bool muted);

 private:
  bool AcceptLocked(const primitives::CTransaction& tx, const primitives::Hash256& txid,
                    std::uint64_t sequence, std::string* reject_reason,
                    consensus::AuctionError* auction_error);
  // Re-admits the surviving entries in arrival order; anything that fails
  // is appended to |dropped|.
  void RebuildLocked(std::vector<primitives::Hash256>* dropped);

  const ChainState& chain_;
  std::unordered_map<primitives::Hash256, MempoolEntry, primitives::Hash256Hasher> by_txid_;
  std::unordered_map<primitives::COutPoint, primitives::Hash256, consensus::OutPointHasher>
      spends_;
  // Outputs created by pool transactions and not yet spent inside the pool.
  consensus::UTXOSet outputs_;
  consensus::NameRegistry pending_names_;
  std::uint64_t next_sequence_{0};
  Listener listener_;
  bool muted_{false};
  mutable std::mutex mutex_;
};

}  // namespace sealcoin::node
