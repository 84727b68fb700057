#include "node/mempool.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"

namespace sealcoin::node {

namespace {

constexpr std::uint64_t kMaxMempoolTxBytes = 1'000'000;

}  // namespace

Mempool::Mempool(const ChainState& chain) : chain_(chain) {}

bool Mempool::Submit(const primitives::CTransaction& tx, std::string* reject_reason,
                     consensus::AuctionError* auction_error) {
  if (reject_reason) {
    reject_reason->clear();
  }
  const auto txid = primitives::ComputeTxId(tx);
  Listener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!AcceptLocked(tx, txid, next_sequence_, reject_reason, auction_error)) {
      return false;
    }
    ++next_sequence_;
    if (!muted_) {
      listener = listener_;
    }
  }
  if (listener) {
    listener(tx, txid);
  }
  return true;
}

bool Mempool::AcceptLocked(const primitives::CTransaction& tx, const primitives::Hash256& txid,
                           std::uint64_t sequence, std::string* reject_reason,
                           consensus::AuctionError* auction_error) {
  auto set_reject = [&](std::string reason) {
    if (reject_reason && reject_reason->empty()) {
      *reject_reason = std::move(reason);
    }
    return false;
  };
  if (tx.IsCoinbase()) {
    return set_reject("coinbase transaction");
  }
  if (by_txid_.count(txid) != 0) {
    return set_reject("transaction already in mempool");
  }
  std::vector<std::uint8_t> raw;
  primitives::serialize::SerializeTransaction(tx, &raw);
  const std::uint64_t size_bytes = raw.size();
  if (size_bytes > kMaxMempoolTxBytes) {
    return set_reject("transaction too large");
  }
  for (const auto& in : tx.vin) {
    auto it = spends_.find(in.prevout);
    if (it != spends_.end()) {
      return set_reject("input already spent by mempool transaction " +
                        util::HexEncode(it->second));
    }
  }

  TxCheckContext context;
  context.extra_coins = &outputs_;
  context.pending_names = &pending_names_;
  TxCheckResult result;
  if (!chain_.CheckTransaction(tx, context, &result)) {
    if (auction_error && !result.auction_error.ok()) {
      *auction_error = result.auction_error;
    }
    return set_reject("consensus: " + result.error);
  }
  primitives::Amount min_fee = 0;
  if (!primitives::CheckedMul(chain_.Params().min_relay_fee_per_byte, size_bytes, &min_fee) ||
      result.fee < min_fee) {
    return set_reject("fee below minimum relay fee (" + std::to_string(result.fee) + " < " +
                      std::to_string(min_fee) + ")");
  }

  const std::uint32_t entry_height = chain_.Height() + 1;
  for (const auto& in : tx.vin) {
    spends_[in.prevout] = txid;
    outputs_.SpendCoin(in.prevout);
  }
  for (std::size_t i = 0; i < tx.vout.size(); ++i) {
    consensus::Coin coin;
    coin.out = tx.vout[i];
    coin.height = entry_height;
    coin.coinbase = false;
    outputs_.AddCoin(primitives::COutPoint{txid, static_cast<std::uint32_t>(i)}, std::move(coin));
  }
  result.touched_names.ForEach([&](const primitives::Hash256&, const consensus::NameState& state) {
    pending_names_.Put(state);
    return true;
  });

  MempoolEntry entry;
  entry.tx = tx;
  entry.txid = txid;
  entry.size_bytes = size_bytes;
  entry.fee = result.fee;
  entry.entry_height = entry_height;
  entry.sequence = sequence;
  by_txid_.emplace(txid, std::move(entry));
  return true;
}

void Mempool::RebuildLocked(std::vector<primitives::Hash256>* dropped) {
  std::vector<MempoolEntry> entries;
  entries.reserve(by_txid_.size());
  for (auto& [txid, entry] : by_txid_) {
    entries.push_back(std::move(entry));
  }
  std::sort(entries.begin(), entries.end(),
            [](const MempoolEntry& a, const MempoolEntry& b) { return a.sequence < b.sequence; });
  by_txid_.clear();
  spends_.clear();
  outputs_ = consensus::UTXOSet{};
  pending_names_ = consensus::NameRegistry{};
  for (const auto& entry : entries) {
    std::string reason;
    if (!AcceptLocked(entry.tx, entry.txid, entry.sequence, &reason, nullptr)) {
      std::cerr << "[mempool] info: dropping " << util::HexEncode(entry.txid) << ": " << reason
                << "\n";
      if (dropped) dropped->push_back(entry.txid);
    }
  }
}

bool Mempool::Contains(const primitives::Hash256& txid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_txid_.count(txid) != 0;
}

bool Mempool::Get(const primitives::Hash256& txid, primitives::CTransaction* tx) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_txid_.find(txid);
  if (it == by_txid_.end()) {
    return false;
  }
  if (tx) *tx = it->second.tx;
  return true;
}

bool Mempool::Remove(const primitives::Hash256& txid,
                     std::vector<primitives::Hash256>* removed) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_txid_.find(txid);
  if (it == by_txid_.end()) {
    return false;
  }
  by_txid_.erase(it);
  if (removed) removed->push_back(txid);
  // Descendants lose their inputs and fall out during the rebuild.
  RebuildLocked(removed);
  return true;
}

void Mempool::RemoveAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  by_txid_.clear();
  spends_.clear();
  outputs_ = consensus::UTXOSet{};
  pending_names_ = consensus::NameRegistry{};
}

std::size_t Mempool::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_txid_.size();
}

std::vector<MempoolEntry> Mempool::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MempoolEntry> out;
  out.reserve(by_txid_.size());
  for (const auto& [txid, entry] : by_txid_) {
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(),
            [](const MempoolEntry& a, const MempoolEntry& b) { return a.sequence < b.sequence; });
  return out;
}

void Mempool::RemoveForBlock(const primitives::CBlock& block,
                             std::vector<primitives::Hash256>* evicted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& tx : block.transactions) {
    by_txid_.erase(primitives::ComputeTxId(tx));
  }
  RebuildLocked(evicted);
}

void Mempool::SetListener(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void Mempool::SetNotificationsMuted(bool muted) {
  std::lock_guard<std::mutex> lock(mutex_);
  muted_ = muted;
}

}  // namespace sealcoin::node
