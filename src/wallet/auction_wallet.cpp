#include "wallet/auction_wallet.hpp"

#include <algorithm>
#include <iostream>
#include <span>
#include <variant>

#include "consensus/covenant.hpp"
#include "consensus/sighash.hpp"
#include "consensus/name_state.hpp"
#include "primitives/txid.hpp"
#include "script/p2qh.hpp"
#include "util/hex.hpp"

namespace sealcoin::wallet {

AuctionWallet::AuctionWallet(const consensus::ChainParams& params) : params_(params) {
  std::uint32_t index = 0;
  consensus::AuctionError error;
  CreateAccountLocked(kDefaultAccountName, &index, &error);
}

bool AuctionWallet::CreateAccount(const std::string& name, std::uint32_t* index,
                                  consensus::AuctionError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  return CreateAccountLocked(name, index, error);
}

bool AuctionWallet::CreateAccountLocked(const std::string& name, std::uint32_t* index,
                                        consensus::AuctionError* error) {
  if (name.empty()) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidName,
                           "account name must not be empty");
  }
  for (const auto& account : accounts_) {
    if (account->name == name) {
      return consensus::Fail(error, consensus::AuctionErrorKind::kRejected,
                             "account '" + name + "' already exists");
    }
  }
  auto account = std::make_unique<Account>();
  account->index = static_cast<std::uint32_t>(accounts_.size());
  account->name = name;
  account->key = crypto::AccountKey::Generate();
  account->program = script::ProgramFromPublicKey(account->key.PublicKey());
  account_by_program_[account->program] = account->index;
  if (index) *index = account->index;
  accounts_.push_back(std::move(account));
  return true;
}

bool AuctionWallet::ResolveAccount(const AccountRef& ref, std::uint32_t* index,
                                   consensus::AuctionError* error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto* by_index = std::get_if<std::uint32_t>(&ref)) {
    if (*by_index >= accounts_.size()) {
      return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                             "unknown account " + DescribeAccountRef(ref));
    }
    if (index) *index = *by_index;
    return true;
  }
  const auto& name = std::get<std::string>(ref);
  for (const auto& account : accounts_) {
    if (account->name == name) {
      if (index) *index = account->index;
      return true;
    }
  }
  return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                         "unknown account " + DescribeAccountRef(ref));
}

std::optional<std::string> AuctionWallet::AccountName(std::uint32_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= accounts_.size()) {
    return std::nullopt;
  }
  return accounts_[index]->name;
}

std::size_t AuctionWallet::AccountCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accounts_.size();
}

std::optional<script::WitnessProgram> AuctionWallet::ProgramFor(std::uint32_t account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (account >= accounts_.size()) {
    return std::nullopt;
  }
  return accounts_[account]->program;
}

std::optional<std::uint32_t> AuctionWallet::AccountForScript(
    const std::vector<std::uint8_t>& script) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return AccountForScriptLocked(script);
}

std::optional<std::uint32_t> AuctionWallet::AccountForScriptLocked(
    const std::vector<std::uint8_t>& script) const {
  script::WitnessProgram program{};
  if (!script::ExtractWitnessProgram(script::ScriptPubKey{script}, &program)) {
    return std::nullopt;
  }
  auto it = account_by_program_.find(program);
  if (it == account_by_program_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void AuctionWallet::WatchName(std::string_view name) {
  std::lock_guard<std::mutex> lock(mutex_);
  watched_[consensus::HashName(name)] = std::string(name);
}

bool AuctionWallet::IsWatching(const primitives::Hash256& name_hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watched_.count(name_hash) != 0;
}

std::vector<std::string> AuctionWallet::WatchedNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(watched_.size());
  for (const auto& [hash, name] : watched_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

void AuctionWallet::StoreBlind(const consensus::BidCommitment& bid, std::uint32_t account) {
  std::lock_guard<std::mutex> lock(mutex_);
  blinds_[bid.commitment] = BlindRecord{bid, account};
}

bool AuctionWallet::GetBlind(const primitives::Hash256& commitment, BlindRecord* record) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blinds_.find(commitment);
  if (it == blinds_.end()) {
    return false;
  }
  if (record) *record = it->second;
  return true;
}

void AuctionWallet::AddTransaction(const primitives::CTransaction& tx,
                                   const primitives::Hash256& txid,
                                   std::optional<std::uint32_t> height) {
  std::lock_guard<std::mutex> lock(mutex_);
  ApplyTransactionLocked(&ledger_, &bids_, &reveals_, tx, txid, height);
}

void AuctionWallet::AddBlock(const primitives::CBlock& block, std::uint32_t height) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& tx : block.transactions) {
    ApplyTransactionLocked(&ledger_, &bids_, &reveals_, tx, primitives::ComputeTxId(tx), height);
  }
}

void AuctionWallet::ApplyTransactionLocked(AccountCoinLedger* ledger, BidMap* bids,
                                           RevealMap* reveals,
                                           const primitives::CTransaction& tx,
                                           const primitives::Hash256& txid,
                                           std::optional<std::uint32_t> height) {
  IndexCovenantsLocked(bids, reveals, tx, txid, height);
  ledger->AddTransaction(tx, txid, height, [this](const primitives::CTxOut& out) {
    return AccountForScriptLocked(out.locking_descriptor);
  });
}

void AuctionWallet::IndexCovenantsLocked(BidMap* bids, RevealMap* reveals,
                                         const primitives::CTransaction& tx,
                                         const primitives::Hash256& txid,
                                         std::optional<std::uint32_t> height) {
  for (std::size_t i = 0; i < tx.vout.size(); ++i) {
    const auto& out = tx.vout[i];
    const auto type = static_cast<consensus::CovenantType>(out.covenant.type);
    if (type != consensus::CovenantType::kBid && type != consensus::CovenantType::kReveal) {
      continue;
    }
    consensus::Covenant covenant;
    if (!consensus::DecodeCovenant(out.covenant, &covenant, nullptr)) {
      continue;
    }
    const primitives::COutPoint outpoint{txid, static_cast<std::uint32_t>(i)};
    const auto account = AccountForScriptLocked(out.locking_descriptor);
    if (const auto* bid = std::get_if<consensus::BidCovenant>(&covenant)) {
      if (account) {
        watched_.emplace(bid->name_hash, bid->name);
      } else if (watched_.count(bid->name_hash) == 0) {
        continue;
      }
      auto& record = (*bids)[outpoint];
      record.name = bid->name;
      record.name_hash = bid->name_hash;
      record.open_height = bid->open_height;
      record.outpoint = outpoint;
      record.lockup = out.value;
      record.commitment = bid->commitment;
      record.own = account.has_value();
      record.account = account;
      if (height) record.height = height;
    } else if (const auto* reveal = std::get_if<consensus::RevealCovenant>(&covenant)) {
      auto watched = watched_.find(reveal->name_hash);
      if (watched == watched_.end()) {
        continue;
      }
      auto& record = (*reveals)[outpoint];
      record.name = watched->second;
      record.name_hash = reveal->name_hash;
      record.open_height = reveal->open_height;
      record.outpoint = outpoint;
      record.value = out.value;
      record.own = account.has_value();
      record.account = account;
      if (height) record.height = height;
    }
  }
}

bool AuctionWallet::Abandon(const primitives::Hash256& txid, consensus::AuctionError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ledger_.Abandon(txid, error)) {
    return false;
  }
  auto forget = [&](auto* records) {
    for (auto it = records->begin(); it != records->end();) {
      const auto& record = it->second;
      const bool orphaned = !record.height && record.own && !ledger_.GetCoin(record.outpoint, nullptr);
      if (it->first.txid == txid || orphaned) {
        it = records->erase(it);
      } else {
        ++it;
      }
    }
  };
  forget(&bids_);
  forget(&reveals_);
  return true;
}

bool AuctionWallet::Rescan(const node::ChainState& chain, std::uint32_t from_height,
                           const node::Mempool* pool, consensus::AuctionError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto tip = chain.Height();
  if (from_height > tip + 1) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                           "rescan height " + std::to_string(from_height) +
                               " is above the chain tip " + std::to_string(tip));
  }
  std::cerr << "[wallet] info: rescanning blocks " << from_height << ".." << tip << "\n";
  // Auction records and coins are rebuilt beside the live ones and only
  // adopted once every block replayed.
  auto stale = [&](const auto& record) { return !record.height || *record.height >= from_height; };
  BidMap bids = bids_;
  RevealMap reveals = reveals_;
  std::erase_if(bids, [&](const auto& entry) { return stale(entry.second); });
  std::erase_if(reveals, [&](const auto& entry) { return stale(entry.second); });

  const bool rebuilt = ledger_.Rebuild(from_height, [&](AccountCoinLedger* staged) {
    for (std::uint32_t height = from_height; height <= tip; ++height) {
      primitives::CBlock block;
      if (!chain.GetBlock(height, &block)) {
        return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                               "block " + std::to_string(height) + " is not available");
      }
      for (const auto& tx : block.transactions) {
        ApplyTransactionLocked(staged, &bids, &reveals, tx, primitives::ComputeTxId(tx), height);
      }
    }
    if (pool != nullptr) {
      for (const auto& entry : pool->Entries()) {
        ApplyTransactionLocked(staged, &bids, &reveals, entry.tx, entry.txid, std::nullopt);
      }
    }
    return true;
  });
  if (!rebuilt) {
    return false;
  }
  bids_ = std::move(bids);
  reveals_ = std::move(reveals);
  return true;
}

std::vector<BidRecord> AuctionWallet::GetBidsByName(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto name_hash = consensus::HashName(name);
  std::vector<BidRecord> out;
  for (const auto& [outpoint, record] : bids_) {
    if (record.name_hash == name_hash) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const BidRecord& a, const BidRecord& b) {
    if (a.height != b.height) return a.height < b.height;
    if (a.outpoint.txid != b.outpoint.txid) return a.outpoint.txid < b.outpoint.txid;
    return a.outpoint.index < b.outpoint.index;
  });
  return out;
}

std::vector<RevealRecord> AuctionWallet::GetRevealsByName(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto name_hash = consensus::HashName(name);
  std::vector<RevealRecord> out;
  for (const auto& [outpoint, record] : reveals_) {
    if (record.name_hash == name_hash) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const RevealRecord& a, const RevealRecord& b) {
    if (a.height != b.height) return a.height < b.height;
    if (a.outpoint.txid != b.outpoint.txid) return a.outpoint.txid < b.outpoint.txid;
    return a.outpoint.index < b.outpoint.index;
  });
  return out;
}

bool AuctionWallet::SignInput(primitives::CTransaction* tx, std::size_t index,
                              const consensus::Coin& spent, std::uint32_t account,
                              std::string* error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (account >= accounts_.size()) {
    if (error) *error = "unknown signing account";
    return false;
  }
  if (index >= tx->vin.size()) {
    if (error) *error = "input index out of range";
    return false;
  }
  const auto& key = accounts_[account]->key;
  const auto sighash = consensus::ComputeSighash(*tx, index, spent);
  const auto msg_span = std::span<const std::uint8_t>(sighash.data(), sighash.size());
  std::vector<primitives::WitnessStackItem> witness_items;
  witness_items.push_back(primitives::WitnessStackItem{
      std::vector<std::uint8_t>(key.PublicKey().begin(), key.PublicKey().end())});
  witness_items.push_back(primitives::WitnessStackItem{key.Sign(msg_span)});
  tx->vin[index].witness_stack = std::move(witness_items);
  return true;
}

}  // namespace sealcoin::wallet
