#include "wallet/auction_orchestrator.hpp"

#include <iostream>
#include <map>
#include <variant>

#include "consensus/blind_bid.hpp"
#include "crypto/account_key.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "script/p2qh.hpp"
#include "util/hex.hpp"

namespace sealcoin::wallet {

namespace {

// Selection rounds before giving up on a fee that keeps moving.
constexpr int kMaxFundingRounds = 8;

std::string Quote(std::string_view name) { return "'" + std::string(name) + "'"; }

std::string AccountLabel(std::uint32_t index) { return "account #" + std::to_string(index); }

primitives::CTxIn InputWithPlaceholderWitness(const primitives::COutPoint& outpoint) {
  primitives::CTxIn in;
  in.prevout = outpoint;
  // ML-DSA-65 keys and signatures have fixed sizes, so a zeroed witness of
  // the same shape measures the signed transaction exactly.
  in.witness_stack.push_back(primitives::WitnessStackItem{
      std::vector<std::uint8_t>(crypto::kAccountPublicKeyBytes, 0)});
  in.witness_stack.push_back(primitives::WitnessStackItem{
      std::vector<std::uint8_t>(crypto::kAccountSignatureBytes, 0)});
  return in;
}

}  // namespace

AuctionOrchestrator::AuctionOrchestrator(node::ChainState& chain, node::Mempool& pool,
                                         AuctionWallet& wallet,
                                         std::optional<primitives::Amount> fee_per_byte)
    : chain_(chain),
      pool_(pool),
      wallet_(wallet),
      fee_per_byte_(fee_per_byte.value_or(chain.Params().min_relay_fee_per_byte)) {}

bool AuctionOrchestrator::ResolveIndex(const AccountRef& ref, std::uint32_t* index,
                                       consensus::AuctionError* error) const {
  return wallet_.ResolveAccount(ref, index, error);
}

primitives::CTxOut AuctionOrchestrator::OutputFor(std::uint32_t account,
                                                  primitives::Amount value,
                                                  const consensus::Covenant& covenant) const {
  primitives::CTxOut out;
  out.value = value;
  if (const auto program = wallet_.ProgramFor(account)) {
    out.locking_descriptor = script::CreateP2QHScript(*program).data;
  }
  out.covenant = consensus::EncodeCovenant(covenant);
  return out;
}

bool AuctionOrchestrator::CheckName(std::string_view name, consensus::AuctionError* error) const {
  if (!consensus::IsValidName(name, chain_.Params().names.max_name_size)) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidName,
                           "invalid name " + Quote(name));
  }
  return true;
}

std::optional<consensus::NameState> AuctionOrchestrator::LookupName(std::string_view name) const {
  consensus::NameState state;
  if (!chain_.GetNameState(name, &state)) {
    return std::nullopt;
  }
  return state;
}

bool AuctionOrchestrator::RequirePhase(const consensus::NameState* state, std::string_view name,
                                       consensus::NamePhase expected, std::string_view action,
                                       consensus::AuctionError* error) const {
  const auto height = NextHeight();
  const auto phase = consensus::PhaseOf(state, height, chain_.Params().names);
  if (phase != expected) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kPhaseMismatch,
                           std::string(action) + " for " + Quote(name) + " requires " +
                               std::string(consensus::NamePhaseName(expected)) + ", name is " +
                               std::string(consensus::NamePhaseName(phase)) + " at height " +
                               std::to_string(height));
  }
  return true;
}

bool AuctionOrchestrator::SendOpen(std::string_view name, const AccountRef& account,
                                   primitives::Hash256* txid, consensus::AuctionError* error) {
  std::uint32_t index = 0;
  if (!CheckName(name, error) || !ResolveIndex(account, &index, error)) {
    return false;
  }
  const auto state = LookupName(name);
  if (!RequirePhase(state ? &*state : nullptr, name, consensus::NamePhase::kAvailable, "OPEN",
                    error)) {
    return false;
  }
  wallet_.WatchName(name);
  Draft draft;
  draft.payer = index;
  draft.outputs.push_back(
      OutputFor(index, 0, consensus::OpenCovenant{consensus::HashName(name), std::string(name)}));
  return Finish(&draft, txid, error);
}

bool AuctionOrchestrator::SendBid(std::string_view name, primitives::Amount value,
                                  primitives::Amount lockup, const AccountRef& account,
                                  primitives::Hash256* txid, consensus::AuctionError* error) {
  std::uint32_t index = 0;
  if (!CheckName(name, error) || !ResolveIndex(account, &index, error)) {
    return false;
  }
  const auto state = LookupName(name);
  if (!RequirePhase(state ? &*state : nullptr, name, consensus::NamePhase::kBidding, "BID",
                    error)) {
    return false;
  }
  consensus::BidCommitment bid;
  if (!consensus::CreateBid(name, value, lockup, &bid, error)) {
    return false;
  }
  wallet_.WatchName(name);
  wallet_.StoreBlind(bid, index);
  Draft draft;
  draft.payer = index;
  draft.outputs.push_back(OutputFor(
      index, lockup,
      consensus::BidCovenant{state->name_hash, state->open_height, std::string(name),
                             bid.commitment}));
  return Finish(&draft, txid, error);
}

bool AuctionOrchestrator::AddRevealSpends(const std::string& name,
                                          const consensus::NameState& state,
                                          std::optional<std::uint32_t> account, Draft* draft,
                                          consensus::AuctionError* error) {
  for (const auto& record : wallet_.GetBidsByName(name)) {
    if (!record.own || !record.account || record.open_height != state.open_height) {
      continue;
    }
    if (account && *record.account != *account) {
      continue;
    }
    AccountCoin coin;
    if (!wallet_.ledger().GetCoin(record.outpoint, &coin) || !coin.confirmed ||
        coin.state != CoinState::kAvailable || coin.covenant != consensus::CovenantType::kBid) {
      continue;
    }
    BlindRecord blind;
    if (!wallet_.GetBlind(record.commitment, &blind)) {
      std::cerr << "[wallet] warn: no blind stored for bid " << util::HexEncode(record.outpoint.txid)
                << ":" << record.outpoint.index << " on " << Quote(name) << "\n";
      continue;
    }
    consensus::BidCommitment opening = blind.bid;
    opening.lockup = coin.out.value;
    consensus::OpenedBid opened;
    if (!consensus::OpenBid(opening, record.commitment, &opened, error)) {
      return false;
    }
    draft->linked.push_back(LinkedSpend{
        coin, OutputFor(coin.account, opened.value,
                        consensus::RevealCovenant{state.name_hash, state.open_height,
                                                  opening.nonce})});
  }
  return true;
}

bool AuctionOrchestrator::SendReveal(std::string_view name, const AccountRef& account,
                                     primitives::Hash256* txid, consensus::AuctionError* error) {
  std::uint32_t index = 0;
  if (!CheckName(name, error) || !ResolveIndex(account, &index, error)) {
    return false;
  }
  const auto state = LookupName(name);
  if (!RequirePhase(state ? &*state : nullptr, name, consensus::NamePhase::kReveal, "REVEAL",
                    error)) {
    return false;
  }
  Draft draft;
  draft.payer = index;
  if (!AddRevealSpends(std::string(name), *state, index, &draft, error)) {
    return false;
  }
  if (draft.linked.empty()) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                           AccountLabel(index) + " has no outstanding bids on " + Quote(name));
  }
  return Finish(&draft, txid, error);
}

bool AuctionOrchestrator::SendRevealAll(const std::optional<std::string>& name,
                                        primitives::Hash256* txid,
                                        consensus::AuctionError* error) {
  std::vector<std::string> names;
  if (name) {
    if (!CheckName(*name, error)) {
      return false;
    }
    names.push_back(*name);
  } else {
    names = wallet_.WatchedNames();
  }
  Draft draft;
  for (const auto& candidate : names) {
    const auto state = LookupName(candidate);
    const auto phase =
        consensus::PhaseOf(state ? &*state : nullptr, NextHeight(), chain_.Params().names);
    if (phase != consensus::NamePhase::kReveal) {
      if (name) {
        return RequirePhase(state ? &*state : nullptr, candidate, consensus::NamePhase::kReveal,
                            "REVEAL", error);
      }
      continue;
    }
    if (!AddRevealSpends(candidate, *state, std::nullopt, &draft, error)) {
      return false;
    }
  }
  if (draft.linked.empty()) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                           name ? "no outstanding bids on " + Quote(*name)
                                : std::string("no outstanding bids to reveal"));
  }
  draft.payer = draft.linked.front().coin.account;
  return Finish(&draft, txid, error);
}

bool AuctionOrchestrator::SendRedeem(std::string_view name, const AccountRef& account,
                                     primitives::Hash256* txid, consensus::AuctionError* error) {
  std::uint32_t index = 0;
  if (!CheckName(name, error) || !ResolveIndex(account, &index, error)) {
    return false;
  }
  const auto state = LookupName(name);
  if (!state) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                           "no auction exists for " + Quote(name));
  }
  const auto& params = chain_.Params().names;
  const bool reveal_over = NextHeight() >= consensus::RevealEnd(*state, params);
  bool waiting = false;
  Draft draft;
  draft.payer = index;
  for (const auto& record : wallet_.GetRevealsByName(name)) {
    if (!record.own || record.account != index || record.outpoint == state->owner) {
      continue;
    }
    if (record.open_height > state->open_height) {
      continue;
    }
    if (record.open_height == state->open_height && !reveal_over) {
      waiting = true;
      continue;
    }
    AccountCoin coin;
    if (!wallet_.ledger().GetCoin(record.outpoint, &coin) || !coin.confirmed ||
        coin.state != CoinState::kAvailable ||
        coin.covenant != consensus::CovenantType::kReveal) {
      continue;
    }
    draft.linked.push_back(LinkedSpend{
        coin, OutputFor(index, coin.out.value,
                        consensus::RedeemCovenant{state->name_hash, record.open_height})});
  }
  if (draft.linked.empty()) {
    if (waiting) {
      return consensus::Fail(error, consensus::AuctionErrorKind::kPhaseMismatch,
                             "REDEEM for " + Quote(name) +
                                 " is only valid after the reveal period");
    }
    return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                           AccountLabel(index) + " has no losing reveals on " + Quote(name));
  }
  return Finish(&draft, txid, error);
}

bool AuctionOrchestrator::SendUpdate(std::string_view name,
                                     const std::vector<std::uint8_t>& resource,
                                     const std::optional<AccountRef>& account,
                                     primitives::Hash256* txid, consensus::AuctionError* error) {
  return OwnerTransition(name, account, false, resource, txid, error);
}

bool AuctionOrchestrator::SendRenew(std::string_view name,
                                    const std::optional<AccountRef>& account,
                                    primitives::Hash256* txid, consensus::AuctionError* error) {
  return OwnerTransition(name, account, true, {}, txid, error);
}

bool AuctionOrchestrator::OwnerTransition(std::string_view name,
                                          const std::optional<AccountRef>& account, bool renew,
                                          const std::vector<std::uint8_t>& resource,
                                          primitives::Hash256* txid,
                                          consensus::AuctionError* error) {
  const std::string_view action = renew ? "RENEW" : "UPDATE";
  if (!CheckName(name, error)) {
    return false;
  }
  const auto state = LookupName(name);
  if (!RequirePhase(state ? &*state : nullptr, name, consensus::NamePhase::kClosed, action,
                    error)) {
    return false;
  }
  const auto owner = wallet_.ledger().OwnerOf(state->owner);
  if (account) {
    std::uint32_t index = 0;
    if (!ResolveIndex(*account, &index, error)) {
      return false;
    }
    if (!owner || *owner != index) {
      return consensus::Fail(error, consensus::AuctionErrorKind::kOwnershipViolation,
                             AccountLabel(index) + " does not own " + Quote(name));
    }
  } else if (!owner) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kOwnershipViolation,
                           "no wallet account owns " + Quote(name));
  }
  if (renew && !state->registered) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidTransition,
                           Quote(name) + " must be registered before it can be renewed");
  }
  if (resource.size() > chain_.Params().names.max_resource_size) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidTransition,
                           "resource exceeds " +
                               std::to_string(chain_.Params().names.max_resource_size) +
                               " bytes");
  }
  AccountCoin coin;
  if (!wallet_.ledger().GetCoin(state->owner, &coin)) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kNotFound,
                           "owner output of " + Quote(name) + " is not in the wallet");
  }

  consensus::Covenant covenant;
  primitives::Amount value = coin.out.value;
  if (!state->registered) {
    covenant = consensus::RegisterCovenant{state->name_hash, state->open_height, resource};
    value = state->value;
  } else if (renew) {
    covenant = consensus::RenewCovenant{state->name_hash, state->open_height};
  } else {
    covenant = consensus::UpdateCovenant{state->name_hash, state->open_height, resource};
  }
  Draft draft;
  draft.payer = *owner;
  draft.linked.push_back(LinkedSpend{coin, OutputFor(*owner, value, covenant)});
  return Finish(&draft, txid, error);
}

bool AuctionOrchestrator::Abandon(const primitives::Hash256& txid,
                                  consensus::AuctionError* error) {
  if (wallet_.ledger().IsConfirmed(txid)) {
    return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidTransition,
                           "transaction " + util::HexEncode(txid) +
                               " is confirmed and cannot be abandoned");
  }
  std::vector<primitives::Hash256> removed;
  if (!pool_.Remove(txid, &removed)) {
    removed.push_back(txid);
  }
  // Descendants first so each parent's coins come back untouched.
  for (auto it = removed.rbegin(); it != removed.rend(); ++it) {
    if (!wallet_.Abandon(*it, error)) {
      return false;
    }
  }
  return true;
}

bool AuctionOrchestrator::ReserveLinked(Draft* draft, consensus::AuctionError* error) {
  std::map<std::uint32_t, std::vector<primitives::COutPoint>> by_account;
  for (const auto& spend : draft->linked) {
    by_account[spend.coin.account].push_back(spend.coin.outpoint);
  }
  for (const auto& [account, outpoints] : by_account) {
    if (!wallet_.ledger().ReserveOutpoints(account, outpoints, error)) {
      return false;
    }
    draft->reserved.insert(draft->reserved.end(), outpoints.begin(), outpoints.end());
  }
  return true;
}

void AuctionOrchestrator::Release(const Draft& draft) {
  wallet_.ledger().ReleaseReservation(draft.reserved);
}

bool AuctionOrchestrator::Assemble(const Draft& draft, primitives::Amount fee,
                                   primitives::CTransaction* tx,
                                   std::int64_t* payer_shortfall) const {
  tx->vin.clear();
  tx->vout.clear();
  std::map<std::uint32_t, std::int64_t> balances;
  balances[draft.payer] = 0;
  for (const auto& spend : draft.linked) {
    tx->vin.push_back(InputWithPlaceholderWitness(spend.coin.outpoint));
    tx->vout.push_back(spend.out);
    balances[spend.coin.account] += static_cast<std::int64_t>(spend.coin.out.value) -
                                    static_cast<std::int64_t>(spend.out.value);
  }
  for (const auto& coin : draft.funding) {
    tx->vin.push_back(InputWithPlaceholderWitness(coin.outpoint));
    balances[draft.payer] += static_cast<std::int64_t>(coin.out.value);
  }
  for (const auto& out : draft.outputs) {
    tx->vout.push_back(out);
    balances[draft.payer] -= static_cast<std::int64_t>(out.value);
  }
  balances[draft.payer] -= static_cast<std::int64_t>(fee);

  *payer_shortfall = 0;
  for (const auto& [account, balance] : balances) {
    if (balance < 0) {
      if (account != draft.payer) {
        return false;
      }
      *payer_shortfall = -balance;
    } else if (balance > 0) {
      tx->vout.push_back(OutputFor(account, static_cast<primitives::Amount>(balance),
                                   consensus::NoCovenant{}));
    }
  }
  return true;
}

bool AuctionOrchestrator::Finish(Draft* draft, primitives::Hash256* txid,
                                 consensus::AuctionError* error) {
  if (!ReserveLinked(draft, error)) {
    Release(*draft);
    return false;
  }
  const auto& params = chain_.Params();
  primitives::CTransaction tx;
  primitives::Amount fee = 0;
  bool funded = false;
  for (int round = 0; round < kMaxFundingRounds && !funded; ++round) {
    std::int64_t shortfall = 0;
    if (!Assemble(*draft, fee, &tx, &shortfall)) {
      Release(*draft);
      return consensus::Fail(error, consensus::AuctionErrorKind::kInvalidTransition,
                             "linked outputs exceed the value of their inputs");
    }
    if (shortfall > 0) {
      std::vector<AccountCoin> selected;
      if (!wallet_.ledger().SelectCoins(draft->payer, static_cast<primitives::Amount>(shortfall),
                                        selection_, NextHeight(),
                                        params.coinbase_maturity, &selected, error)) {
        Release(*draft);
        return false;
      }
      for (const auto& coin : selected) {
        draft->reserved.push_back(coin.outpoint);
        draft->funding.push_back(coin);
      }
      continue;
    }
    std::vector<std::uint8_t> raw;
    primitives::serialize::SerializeTransaction(tx, &raw);
    const primitives::Amount required = raw.size() * fee_per_byte_;
    if (fee >= required) {
      funded = true;
    } else {
      fee = required;
    }
  }
  if (!funded) {
    Release(*draft);
    return consensus::Fail(error, consensus::AuctionErrorKind::kInsufficientFunds,
                           "could not settle the fee for " + AccountLabel(draft->payer));
  }

  const std::size_t linked_count = draft->linked.size();
  for (std::size_t i = 0; i < tx.vin.size(); ++i) {
    const AccountCoin& source =
        i < linked_count ? draft->linked[i].coin : draft->funding[i - linked_count];
    consensus::Coin spent{source.out, source.height, source.coinbase};
    std::string sign_error;
    if (!wallet_.SignInput(&tx, i, spent, source.account, &sign_error)) {
      Release(*draft);
      return consensus::Fail(error, consensus::AuctionErrorKind::kRejected,
                             "signing input " + std::to_string(i) + ": " + sign_error);
    }
  }

  std::string reason;
  consensus::AuctionError pool_error;
  if (!pool_.Submit(tx, &reason, &pool_error)) {
    Release(*draft);
    if (!pool_error.ok()) {
      return consensus::Fail(error, pool_error.kind, pool_error.message);
    }
    return consensus::Fail(error, consensus::AuctionErrorKind::kRejected,
                           "mempool rejected transaction: " + reason);
  }
  const auto id = primitives::ComputeTxId(tx);
  wallet_.AddTransaction(tx, id, std::nullopt);
  if (txid) *txid = id;
  return true;
}

}  // namespace sealcoin::wallet
