#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "wallet/account_ref.hpp"
#include "wallet/auction_orchestrator.hpp"
#include "wallet/auction_wallet.hpp"

namespace sealcoin::rpc {

// JSON dispatch for the wallet and auction methods. Requests are
// {"method": ..., "params": {...}, "id": ...}; every reply carries either
// "result" or "error": {"code", "kind", "message"}. Methods that act for an
// account accept "account" as an index or a name and default to account 0.
class WalletRpc {
 public:
  // Hooks the pool's notifications into |wallet|.
  WalletRpc(node::ChainState& chain, node::Mempool& pool, wallet::AuctionWallet& wallet);

  nlohmann::json Handle(const nlohmann::json& request);

 private:
  nlohmann::json HandleCreateAccount(const nlohmann::json& params);
  nlohmann::json HandleGetBalance(const nlohmann::json& params) const;
  nlohmann::json HandleGetNewAddress(const nlohmann::json& params) const;
  nlohmann::json HandleSendOpen(const nlohmann::json& params);
  nlohmann::json HandleSendBid(const nlohmann::json& params);
  nlohmann::json HandleSendReveal(const nlohmann::json& params);
  nlohmann::json HandleSendRevealAll(const nlohmann::json& params);
  nlohmann::json HandleSendUpdate(const nlohmann::json& params);
  nlohmann::json HandleSendRedeem(const nlohmann::json& params);
  nlohmann::json HandleSendRenew(const nlohmann::json& params);
  nlohmann::json HandleAbandon(const nlohmann::json& params);
  nlohmann::json HandleGetBidsByName(const nlohmann::json& params) const;
  nlohmann::json HandleGetNameInfo(const nlohmann::json& params) const;
  nlohmann::json HandleRescan(const nlohmann::json& params);
  nlohmann::json HandleGenerateToAddress(const nlohmann::json& params);

  std::uint32_t AccountIndex(const nlohmann::json& params) const;
  std::optional<wallet::AccountRef> OptionalAccount(const nlohmann::json& params) const;

  node::ChainState& chain_;
  node::Mempool& pool_;
  wallet::AuctionWallet& wallet_;
  wallet::AuctionOrchestrator orchestrator_;
};

}  // namespace sealcoin::rpc
