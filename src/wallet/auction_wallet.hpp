#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "consensus/auction_error.hpp"
#include "consensus/blind_bid.hpp"
#include "consensus/params.hpp"
#include "crypto/account_key.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "primitives/block.hpp"
#include "script/script.hpp"
#include "wallet/account_ledger.hpp"
#include "wallet/account_ref.hpp"

namespace sealcoin::wallet {

struct BlindRecord {
  consensus::BidCommitment bid;
  std::uint32_t account{0};
};

// A BID output seen on a watched name.
struct BidRecord {
  std::string name;
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  primitives::COutPoint outpoint{};
  primitives::Amount lockup{0};
  primitives::Hash256 commitment{};
  bool own{false};
  std::optional<std::uint32_t> account;
  std::optional<std::uint32_t> height;
};

struct RevealRecord {
  std::string name;
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  primitives::COutPoint outpoint{};
  primitives::Amount value{0};
  bool own{false};
  std::optional<std::uint32_t> account;
  std::optional<std::uint32_t> height;
};

// Accounts, their keys and coins, plus the auction bookkeeping (blinds,
// bids and reveals) for names the wallet takes part in.
class AuctionWallet {
 public:
  // Creates the default account (index 0, "default").
  explicit AuctionWallet(const consensus::ChainParams& params);

  AuctionWallet(const AuctionWallet&) = delete;
  AuctionWallet& operator=(const AuctionWallet&) = delete;

  bool CreateAccount(const std::string& name, std::uint32_t* index,
                     consensus::AuctionError* error);
  bool ResolveAccount(const AccountRef& ref, std::uint32_t* index,
                      consensus::AuctionError* error) const;
  std::optional<std::string> AccountName(std::uint32_t index) const;
  std::size_t AccountCount() const;
  std::optional<script::WitnessProgram> ProgramFor(std::uint32_t account) const;
  std::optional<std::uint32_t> AccountForScript(const std::vector<std::uint8_t>& script) const;

  void WatchName(std::string_view name);
  bool IsWatching(const primitives::Hash256& name_hash) const;
  std::vector<std::string> WatchedNames() const;

  void StoreBlind(const consensus::BidCommitment& bid, std::uint32_t account);
  bool GetBlind(const primitives::Hash256& commitment, BlindRecord* record) const;

  // Feeds a transaction seen in the pool (no height) or in a block.
  void AddTransaction(const primitives::CTransaction& tx, const primitives::Hash256& txid,
                      std::optional<std::uint32_t> height);
  void AddBlock(const primitives::CBlock& block, std::uint32_t height);
  bool Abandon(const primitives::Hash256& txid, consensus::AuctionError* error);
  // Rebuilds coins and auction records from |from_height| upwards, then
  // re-reads the pool when one is given.
  bool Rescan(const node::ChainState& chain, std::uint32_t from_height, const node::Mempool* pool,
              consensus::AuctionError* error);

  std::vector<BidRecord> GetBidsByName(std::string_view name) const;
  std::vector<RevealRecord> GetRevealsByName(std::string_view name) const;
  AccountBalance GetBalance(std::uint32_t account) const { return ledger_.Balance(account); }
  bool HasCoinByAccount(std::uint32_t account, const primitives::COutPoint& outpoint) const {
    return ledger_.OwnsOutpoint(account, outpoint);
  }

  // Signs input |index| with the key of |account|.
  bool SignInput(primitives::CTransaction* tx, std::size_t index, const consensus::Coin& spent,
                 std::uint32_t account, std::string* error) const;

  AccountCoinLedger& ledger() noexcept { return ledger_; }
  const AccountCoinLedger& ledger() const noexcept { return ledger_; }
  const consensus::ChainParams& params() const noexcept { return params_; }

 private:
  struct Account {
    std::uint32_t index{0};
    std::string name;
    crypto::AccountKey key;
    script::WitnessProgram program{};
  };

  using BidMap = std::unordered_map<primitives::COutPoint, BidRecord, consensus::OutPointHasher>;
  using RevealMap =
      std::unordered_map<primitives::COutPoint, RevealRecord, consensus::OutPointHasher>;

  bool CreateAccountLocked(const std::string& name, std::uint32_t* index,
                           consensus::AuctionError* error);
  std::optional<std::uint32_t> AccountForScriptLocked(
      const std::vector<std::uint8_t>& script) const;
  void ApplyTransactionLocked(AccountCoinLedger* ledger, BidMap* bids, RevealMap* reveals,
                              const primitives::CTransaction& tx, const primitives::Hash256& txid,
                              std::optional<std::uint32_t> height);
  void IndexCovenantsLocked(BidMap* bids, RevealMap* reveals, const primitives::CTransaction& tx,
                            const primitives::Hash256& txid, std::optional<std::uint32_t> height);

  const consensus::ChainParams& params_;
  AccountCoinLedger ledger_;
  std::vector<std::unique_ptr<Account>> accounts_;
  std::map<script::WitnessProgram, std::uint32_t> account_by_program_;
  std::unordered_map<primitives::Hash256, BlindRecord, primitives::Hash256Hasher> blinds_;
  // Watched name hash -> name.
  std::unordered_map<primitives::Hash256, std::string, primitives::Hash256Hasher> watched_;
  BidMap bids_;
  RevealMap reveals_;
  mutable std::mutex mutex_;
};

}  // namespace sealcoin::wallet
