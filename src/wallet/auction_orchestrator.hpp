#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "consensus/auction_error.hpp"
#include "consensus/covenant.hpp"
#include "consensus/name_state.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "primitives/transaction.hpp"
#include "wallet/account_ref.hpp"
#include "wallet/auction_wallet.hpp"

namespace sealcoin::wallet {

// Builds, signs and submits auction transactions for wallet accounts. Holds
// no state of its own: names come from the chain, coins and blinds from the
// wallet. Every Send* call checks the name phase at the next height before
// any coin is reserved, and releases its reservations when it fails.
class AuctionOrchestrator {
 public:
  AuctionOrchestrator(node::ChainState& chain, node::Mempool& pool, AuctionWallet& wallet,
                      std::optional<primitives::Amount> fee_per_byte = std::nullopt);

  bool SendOpen(std::string_view name, const AccountRef& account, primitives::Hash256* txid,
                consensus::AuctionError* error);
  bool SendBid(std::string_view name, primitives::Amount value, primitives::Amount lockup,
               const AccountRef& account, primitives::Hash256* txid,
               consensus::AuctionError* error);
  // Reveals every outstanding bid |account| placed on |name|.
  bool SendReveal(std::string_view name, const AccountRef& account, primitives::Hash256* txid,
                  consensus::AuctionError* error);
  // One transaction revealing the outstanding bids of every account, for
  // |name| or for every watched name in its reveal period.
  bool SendRevealAll(const std::optional<std::string>& name, primitives::Hash256* txid,
                     consensus::AuctionError* error);
  // Reclaims the losing reveals of |account| on |name|.
  bool SendRedeem(std::string_view name, const AccountRef& account, primitives::Hash256* txid,
                  consensus::AuctionError* error);
  // Sets the name's resource. The first update after close registers the
  // name. Without |account| the owning account is looked up.
  bool SendUpdate(std::string_view name, const std::vector<std::uint8_t>& resource,
                  const std::optional<AccountRef>& account, primitives::Hash256* txid,
                  consensus::AuctionError* error);
  bool SendRenew(std::string_view name, const std::optional<AccountRef>& account,
                 primitives::Hash256* txid, consensus::AuctionError* error);
  // Drops an unconfirmed wallet transaction and its descendants from the
  // pool and the wallet. Unknown txids are a no-op.
  bool Abandon(const primitives::Hash256& txid, consensus::AuctionError* error);

  primitives::Amount FeePerByte() const noexcept { return fee_per_byte_; }
  void SetCoinSelection(SelectionPolicy policy) noexcept { selection_ = policy; }

 private:
  // An input linked to the output at the same index.
  struct LinkedSpend {
    AccountCoin coin;
    primitives::CTxOut out;
  };

  struct Draft {
    std::uint32_t payer{0};
    std::vector<LinkedSpend> linked;
    // Unlinked outputs, funded by |payer|.
    std::vector<primitives::CTxOut> outputs;
    std::vector<AccountCoin> funding;
    std::vector<primitives::COutPoint> reserved;
  };

  bool ResolveIndex(const AccountRef& ref, std::uint32_t* index,
                    consensus::AuctionError* error) const;
  primitives::CTxOut OutputFor(std::uint32_t account, primitives::Amount value,
                               const consensus::Covenant& covenant) const;
  bool CheckName(std::string_view name, consensus::AuctionError* error) const;
  std::optional<consensus::NameState> LookupName(std::string_view name) const;
  bool RequirePhase(const consensus::NameState* state, std::string_view name,
                    consensus::NamePhase expected, std::string_view action,
                    consensus::AuctionError* error) const;
  // Appends REVEAL spends for the outstanding bids on |name|, restricted to
  // |account| when given.
  bool AddRevealSpends(const std::string& name, const consensus::NameState& state,
                       std::optional<std::uint32_t> account, Draft* draft,
                       consensus::AuctionError* error);
  bool OwnerTransition(std::string_view name, const std::optional<AccountRef>& account,
                       bool renew, const std::vector<std::uint8_t>& resource,
                       primitives::Hash256* txid, consensus::AuctionError* error);
  // Funds, signs and submits |draft|. Releases every reservation on failure.
  bool Finish(Draft* draft, primitives::Hash256* txid, consensus::AuctionError* error);
  bool ReserveLinked(Draft* draft, consensus::AuctionError* error);
  void Release(const Draft& draft);
  // Lays out linked pairs, unlinked outputs, then one change output per
  // account left with a positive balance after |fee|.
  bool Assemble(const Draft& draft, primitives::Amount fee, primitives::CTransaction* tx,
                std::int64_t* payer_shortfall) const;

  std::uint32_t NextHeight() const { return chain_.Height() + 1; }

  node::ChainState& chain_;
  node::Mempool& pool_;
  AuctionWallet& wallet_;
  primitives::Amount fee_per_byte_;
  SelectionPolicy selection_{SelectionPolicy::kLargestFirst};
};

}  // namespace sealcoin::wallet
