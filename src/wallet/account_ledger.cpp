#include "wallet/account_ledger.hpp"

#include <algorithm>

#include "util/hex.hpp"

namespace sealcoin::wallet {

namespace {

bool Spendable(consensus::CovenantType covenant) {
  return covenant == consensus::CovenantType::kNone ||
         covenant == consensus::CovenantType::kRedeem;
}

}  // namespace

bool SelectionPolicyFromString(std::string_view name, SelectionPolicy* policy) {
  if (name == "largest") {
    *policy = SelectionPolicy::kLargestFirst;
  } else if (name == "oldest") {
    *policy = SelectionPolicy::kOldestFirst;
  } else if (name == "all") {
    *policy = SelectionPolicy::kAll;
  } else {
    return false;
  }
  return true;
}

bool IsLockedCoin(consensus::CovenantType covenant) {
  return consensus::IsLockedCovenant(covenant);
}

bool AccountCoinLedger::AddTransaction(const primitives::CTransaction& tx,
                                       const primitives::Hash256& txid,
                                       std::optional<std::uint32_t> height,
                                       const OwnerResolver& owner_of) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto known = txs_.find(txid);
  if (known != txs_.end() && known->second.confirmed) {
    return true;
  }
  const bool confirming = height.has_value();
  bool touched = known != txs_.end();
  TxRecord record;
  record.confirmed = confirming;
  record.height = height.value_or(0);

  if (!tx.IsCoinbase()) {
    for (const auto& in : tx.vin) {
      auto it = coins_.find(in.prevout);
      if (it == coins_.end()) {
        continue;
      }
      touched = true;
      record.spent.push_back(in.prevout);
      auto& coin = it->second;
      if (confirming) {
        coin.state = CoinState::kSpent;
        coin.spending_txid = txid;
        coin.spent_height = *height;
      } else if (coin.state != CoinState::kSpent) {
        coin.state = CoinState::kPending;
        coin.spending_txid = txid;
      }
    }
  }

  for (std::size_t i = 0; i < tx.vout.size(); ++i) {
    const auto& out = tx.vout[i];
    const auto account = owner_of(out);
    if (!account) {
      continue;
    }
    touched = true;
    const primitives::COutPoint outpoint{txid, static_cast<std::uint32_t>(i)};
    auto it = coins_.find(outpoint);
    if (it != coins_.end()) {
      if (confirming) {
        it->second.confirmed = true;
        it->second.height = *height;
      }
      continue;
    }
    AccountCoin coin;
    coin.outpoint = outpoint;
    coin.out = out;
    coin.account = *account;
    coin.covenant = static_cast<consensus::CovenantType>(out.covenant.type);
    coin.state = CoinState::kAvailable;
    coin.confirmed = confirming;
    coin.height = height.value_or(0);
    coin.coinbase = tx.IsCoinbase();
    coins_.emplace(outpoint, std::move(coin));
  }

  if (touched) {
    txs_[txid] = std::move(record);
  }
  return touched;
}

AccountBalance AccountCoinLedger::Balance(std::uint32_t account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  AccountBalance balance;
  for (const auto& [outpoint, coin] : coins_) {
    if (coin.account != account) {
      continue;
    }
    const bool locked = IsLockedCoin(coin.covenant);
    // Confirmed view: confirmed outputs not yet spent in a block.
    if (coin.confirmed && coin.state != CoinState::kSpent) {
      balance.confirmed += coin.out.value;
      if (locked) balance.locked_confirmed += coin.out.value;
    }
    // Unconfirmed view: everything not spent by any known transaction.
    if (coin.state == CoinState::kAvailable || coin.state == CoinState::kReserved) {
      balance.unconfirmed += coin.out.value;
      if (locked) balance.locked_unconfirmed += coin.out.value;
    }
  }
  return balance;
}

bool AccountCoinLedger::SelectCoins(std::uint32_t account, primitives::Amount target,
                                    SelectionPolicy policy, std::uint32_t spend_height,
                                    std::uint32_t coinbase_maturity,
                                    std::vector<AccountCoin>* selected,
                                    consensus::AuctionError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AccountCoin*> candidates;
  for (auto& [outpoint, coin] : coins_) {
    if (coin.account != account || coin.state != CoinState::kAvailable || !coin.confirmed ||
        !Spendable(coin.covenant) || coin.out.value == 0) {
      continue;
    }
    if (coin.coinbase &&
        static_cast<std::uint64_t>(spend_height) <
            static_cast<std::uint64_t>(coin.height) + coinbase_maturity) {
      continue;
    }
    candidates.push_back(&coin);
  }
  auto by_outpoint = [](const AccountCoin* a, const AccountCoin* b) {
    if (a->outpoint.txid != b->outpoint.txid) return a->outpoint.txid < b->outpoint.txid;
    return a->outpoint.index < b->outpoint.index;
  };
  switch (policy) {
    case SelectionPolicy::kLargestFirst:
      std::sort(candidates.begin(), candidates.end(), [&](const auto* a, const auto* b) {
        if (a->out.value != b->out.value) return a->out.value > b->out.value;
        if (a->height != b->height) return a->height < b->height;
        return by_outpoint(a, b);
      });
      break;
    case SelectionPolicy::kOldestFirst:
    case SelectionPolicy::kAll:
      std::sort(candidates.begin(), candidates.end(), [&](const auto* a, const auto* b) {
        if (a->height != b->height) return a->height < b->height;
        if (a->out.value != b->out.value) return a->out.value > b->out.value;
        return by_outpoint(a, b);
      });
      break;
  }

  std::vector<AccountCoin*> chosen;
  primitives::Amount total = 0;
  for (auto* coin : candidates) {
    if (policy != SelectionPolicy::kAll && total >= target && !chosen.empty()) {
      break;
    }
    chosen.push_back(coin);
    total += coin->out.value;
  }
  if (total < target || (target > 0 && chosen.empty())) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInsufficientFunds,
                           "account #" + std::to_string(account) + " has " +
                               std::to_string(total) + " grains spendable, needs " +
                               std::to_string(target));
  }
  if (selected) selected->clear();
  for (auto* coin : chosen) {
    coin->state = CoinState::kReserved;
    if (selected) selected->push_back(*coin);
  }
  return true;
}

bool AccountCoinLedger::ReserveOutpoints(std::uint32_t account,
                                         const std::vector<primitives::COutPoint>& outpoints,
                                         consensus::AuctionError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& outpoint : outpoints) {
    auto it = coins_.find(outpoint);
    if (it == coins_.end() || it->second.account != account) {
      return consensus::Fail(error, consensus::AuctionErrorKind::kOwnershipViolation,
                             "account #" + std::to_string(account) + " does not own output " +
                                 util::HexEncode(outpoint.txid) + ":" +
                                 std::to_string(outpoint.index));
    }
    if (it->second.state != CoinState::kAvailable) {
      return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidTransition,
                             "output " + util::HexEncode(outpoint.txid) + ":" +
                                 std::to_string(outpoint.index) + " is already being spent");
    }
  }
  for (const auto& outpoint : outpoints) {
    coins_[outpoint].state = CoinState::kReserved;
  }
  return true;
}

void AccountCoinLedger::ReleaseReservation(const std::vector<primitives::COutPoint>& outpoints) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& outpoint : outpoints) {
    auto it = coins_.find(outpoint);
    if (it != coins_.end() && it->second.state == CoinState::kReserved) {
      it->second.state = CoinState::kAvailable;
    }
  }
}

bool AccountCoinLedger::Abandon(const primitives::Hash256& txid,
                                consensus::AuctionError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = txs_.find(txid);
  if (it == txs_.end()) {
    return true;
  }
  if (it->second.confirmed) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidTransition,
                           "transaction " + util::HexEncode(txid) +
                               " is confirmed and cannot be abandoned");
  }
  // Children spending this transaction's outputs go first.
  std::vector<primitives::Hash256> stack{txid};
  std::vector<primitives::Hash256> order;
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();
    if (std::find(order.begin(), order.end(), current) != order.end()) {
      continue;
    }
    order.push_back(current);
    for (const auto& [outpoint, coin] : coins_) {
      if (outpoint.txid == current && coin.state == CoinState::kPending) {
        auto child = txs_.find(coin.spending_txid);
        if (child != txs_.end() && !child->second.confirmed) {
          stack.push_back(coin.spending_txid);
        }
      }
    }
  }
  for (auto rit = order.rbegin(); rit != order.rend(); ++rit) {
    auto record = txs_.find(*rit);
    if (record == txs_.end()) {
      continue;
    }
    for (const auto& outpoint : record->second.spent) {
      auto coin = coins_.find(outpoint);
      if (coin != coins_.end() && coin->second.state == CoinState::kPending &&
          coin->second.spending_txid == *rit) {
        coin->second.state = CoinState::kAvailable;
        coin->second.spending_txid = primitives::Hash256{};
      }
    }
    for (auto coin = coins_.begin(); coin != coins_.end();) {
      if (coin->first.txid == *rit && !coin->second.confirmed) {
        coin = coins_.erase(coin);
      } else {
        ++coin;
      }
    }
    txs_.erase(record);
  }
  return true;
}

void AccountCoinLedger::RollbackLocked(std::uint32_t from_height) {
  for (auto it = coins_.begin(); it != coins_.end();) {
    if (!it->second.confirmed || it->second.height >= from_height) {
      it = coins_.erase(it);
      continue;
    }
    auto& coin = it->second;
    if (coin.state == CoinState::kPending ||
        (coin.state == CoinState::kSpent && coin.spent_height >= from_height)) {
      coin.state = CoinState::kAvailable;
      coin.spending_txid = primitives::Hash256{};
      coin.spent_height = 0;
    }
    ++it;
  }
  for (auto it = txs_.begin(); it != txs_.end();) {
    if (!it->second.confirmed || it->second.height >= from_height) {
      it = txs_.erase(it);
    } else {
      ++it;
    }
  }
}

bool AccountCoinLedger::Rebuild(std::uint32_t from_height, const Replay& replay) {
  std::lock_guard<std::mutex> lock(mutex_);
  AccountCoinLedger staged;
  staged.coins_ = coins_;
  staged.txs_ = txs_;
  staged.RollbackLocked(from_height);
  if (!replay(&staged)) {
    return false;
  }
  for (const auto& [outpoint, coin] : coins_) {
    if (coin.state != CoinState::kReserved) {
      continue;
    }
    auto it = staged.coins_.find(outpoint);
    if (it != staged.coins_.end() && it->second.state == CoinState::kAvailable) {
      it->second.state = CoinState::kReserved;
    }
  }
  coins_ = std::move(staged.coins_);
  txs_ = std::move(staged.txs_);
  return true;
}

bool AccountCoinLedger::OwnsOutpoint(std::uint32_t account,
                                     const primitives::COutPoint& outpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = coins_.find(outpoint);
  return it != coins_.end() && it->second.account == account &&
         it->second.state != CoinState::kSpent;
}

std::optional<std::uint32_t> AccountCoinLedger::OwnerOf(
    const primitives::COutPoint& outpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = coins_.find(outpoint);
  if (it == coins_.end() || it->second.state == CoinState::kSpent) {
    return std::nullopt;
  }
  return it->second.account;
}

bool AccountCoinLedger::GetCoin(const primitives::COutPoint& outpoint, AccountCoin* coin) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = coins_.find(outpoint);
  if (it == coins_.end()) {
    return false;
  }
  if (coin) *coin = it->second;
  return true;
}

std::vector<AccountCoin> AccountCoinLedger::CoinsFor(std::uint32_t account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AccountCoin> out;
  for (const auto& [outpoint, coin] : coins_) {
    if (coin.account == account) {
      out.push_back(coin);
    }
  }
  std::sort(out.begin(), out.end(), [](const AccountCoin& a, const AccountCoin& b) {
    if (a.height != b.height) return a.height < b.height;
    if (a.outpoint.txid != b.outpoint.txid) return a.outpoint.txid < b.outpoint.txid;
    return a.outpoint.index < b.outpoint.index;
  });
  return out;
}

bool AccountCoinLedger::IsConfirmed(const primitives::Hash256& txid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = txs_.find(txid);
  return it != txs_.end() && it->second.confirmed;
}

bool AccountCoinLedger::Knows(const primitives::Hash256& txid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return txs_.count(txid) != 0;
}

}  // namespace sealcoin::wallet
