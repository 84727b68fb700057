#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "consensus/auction_error.hpp"
#include "consensus/covenant.hpp"
#include "consensus/utxo.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::wallet {

enum class CoinState : std::uint8_t {
  kAvailable = 0,
  kReserved = 1,  // selected by an in-flight build
  kPending = 2,   // spent by an unconfirmed wallet transaction
  kSpent = 3,     // spent by a confirmed transaction
};

struct AccountCoin {
  primitives::COutPoint outpoint{};
  primitives::CTxOut out{};
  std::uint32_t account{0};
  consensus::CovenantType covenant{consensus::CovenantType::kNone};
  CoinState state{CoinState::kAvailable};
  bool confirmed{false};
  std::uint32_t height{0};
  bool coinbase{false};
  primitives::Hash256 spending_txid{};
  std::uint32_t spent_height{0};
};

struct AccountBalance {
  primitives::Amount confirmed{0};
  primitives::Amount unconfirmed{0};
  primitives::Amount locked_confirmed{0};
  primitives::Amount locked_unconfirmed{0};
  bool operator==(const AccountBalance& other) const = default;
};

enum class SelectionPolicy {
  kLargestFirst,
  kOldestFirst,
  // Sweeps every spendable coin of the account.
  kAll,
};

// Accepts "largest", "oldest" and "all".
bool SelectionPolicyFromString(std::string_view name, SelectionPolicy* policy);

// Covenant-bearing coins that cannot fund arbitrary spends.
bool IsLockedCoin(consensus::CovenantType covenant);

// Per-account view of the wallet's coins. Every coin belongs to exactly one
// account; selection and balances never cross account boundaries.
class AccountCoinLedger {
 public:
  // Maps an output to the account whose key can spend it.
  using OwnerResolver = std::function<std::optional<std::uint32_t>(const primitives::CTxOut&)>;

  // Records |tx| as pending (no height) or confirmed at |height|: owned
  // outputs become coins and owned inputs are marked spent. Replaying a
  // known transaction only upgrades it from pending to confirmed. Returns
  // true when the transaction touched any account.
  bool AddTransaction(const primitives::CTransaction& tx, const primitives::Hash256& txid,
                      std::optional<std::uint32_t> height, const OwnerResolver& owner_of);

  AccountBalance Balance(std::uint32_t account) const;

  // Picks available, mature, confirmed NONE/REDEEM coins of |account| until
  // |target| is covered and reserves them. Nothing is reserved on failure.
  bool SelectCoins(std::uint32_t account, primitives::Amount target, SelectionPolicy policy,
                   std::uint32_t spend_height, std::uint32_t coinbase_maturity,
                   std::vector<AccountCoin>* selected, consensus::AuctionError* error);
  // Reserves specific coins (covenant inputs). All or nothing.
  bool ReserveOutpoints(std::uint32_t account, const std::vector<primitives::COutPoint>& outpoints,
                        consensus::AuctionError* error);
  void ReleaseReservation(const std::vector<primitives::COutPoint>& outpoints);

  // Forgets an unconfirmed transaction: its outputs disappear and the coins
  // it spent become available again. Unknown txids are a no-op; confirmed
  // transactions cannot be abandoned.
  bool Abandon(const primitives::Hash256& txid, consensus::AuctionError* error);

  // Fed the staged ledger of a rebuild; returns false to abandon it.
  using Replay = std::function<bool(AccountCoinLedger* staged)>;
  // Rolls a copy of the ledger back to |from_height| (everything learned
  // from blocks at or above it and every pending transaction is dropped),
  // lets |replay| refill the copy and adopts it on success. The ledger stays
  // locked until then, so selection and reservation wait for the rebuild.
  // Reservations held when the rebuild started survive it.
  bool Rebuild(std::uint32_t from_height, const Replay& replay);

  bool OwnsOutpoint(std::uint32_t account, const primitives::COutPoint& outpoint) const;
  std::optional<std::uint32_t> OwnerOf(const primitives::COutPoint& outpoint) const;
  bool GetCoin(const primitives::COutPoint& outpoint, AccountCoin* coin) const;
  std::vector<AccountCoin> CoinsFor(std::uint32_t account) const;
  bool IsConfirmed(const primitives::Hash256& txid) const;
  bool Knows(const primitives::Hash256& txid) const;

 private:
  struct TxRecord {
    bool confirmed{false};
    std::uint32_t height{0};
    std::vector<primitives::COutPoint> spent;
  };

  void RollbackLocked(std::uint32_t from_height);

  std::unordered_map<primitives::COutPoint, AccountCoin, consensus::OutPointHasher> coins_;
  std::unordered_map<primitives::Hash256, TxRecord, primitives::Hash256Hasher> txs_;
  mutable std::mutex mutex_;
};

}  // namespace sealcoin::wallet
