#include "rpc/wallet_rpc.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/name_state.hpp"
#include "node/block_builder.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"

namespace sealcoin::rpc {

namespace {

constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Structured RPC failure: a numeric code plus a stable kind string.
struct RpcError : public std::runtime_error {
  int code;
  std::string kind;
  RpcError(int c, std::string k, const std::string& msg)
      : std::runtime_error(msg), code(c), kind(std::move(k)) {}
};

[[noreturn]] void ThrowInvalidParams(const std::string& msg) {
  throw RpcError(kInvalidParams, "InvalidParams", msg);
}

int CodeFor(consensus::AuctionErrorKind kind) {
  switch (kind) {
    case consensus::AuctionErrorKind::kPhaseMismatch:
      return -1001;
    case consensus::AuctionErrorKind::kInvalidTransition:
      return -1002;
    case consensus::AuctionErrorKind::kCommitmentMismatch:
      return -1003;
    case consensus::AuctionErrorKind::kOwnershipViolation:
      return -1004;
    case consensus::AuctionErrorKind::kInsufficientFunds:
      return -1005;
    case consensus::AuctionErrorKind::kInvalidBidValue:
      return -1006;
    case consensus::AuctionErrorKind::kInvalidName:
      return -1007;
    case consensus::AuctionErrorKind::kNotFound:
      return -1008;
    case consensus::AuctionErrorKind::kRejected:
      return -1009;
    case consensus::AuctionErrorKind::kNone:
      break;
  }
  return kInternalError;
}

[[noreturn]] void ThrowAuctionError(const consensus::AuctionError& error) {
  throw RpcError(CodeFor(error.kind), std::string(consensus::AuctionErrorKindName(error.kind)),
                 error.message);
}

std::string RequireString(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || !params.at(key).is_string()) {
    ThrowInvalidParams(std::string("missing string parameter '") + key + "'");
  }
  return params.at(key).get<std::string>();
}

primitives::Amount RequireAmount(const nlohmann::json& params, const char* key) {
  if (!params.contains(key) || !params.at(key).is_number_unsigned()) {
    ThrowInvalidParams(std::string("parameter '") + key + "' must be an amount in grains");
  }
  return params.at(key).get<primitives::Amount>();
}

// JSON integers arrive signed or unsigned depending on who built the request.
std::uint32_t RequireUint32(const nlohmann::json& value, const char* what) {
  if (value.is_number_unsigned()) {
    const auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<std::uint32_t>::max()) {
      ThrowInvalidParams(std::string(what) + " is out of range");
    }
    return static_cast<std::uint32_t>(raw);
  }
  if (value.is_number_integer()) {
    const auto raw = value.get<std::int64_t>();
    if (raw < 0) {
      ThrowInvalidParams(std::string(what) + " must not be negative");
    }
    if (raw > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
      ThrowInvalidParams(std::string(what) + " is out of range");
    }
    return static_cast<std::uint32_t>(raw);
  }
  ThrowInvalidParams(std::string(what) + " must be an integer");
}

std::string HashHex(const primitives::Hash256& hash) { return util::HexEncode(hash); }

nlohmann::json TxidResult(const primitives::Hash256& txid) {
  nlohmann::json result;
  result["txid"] = HashHex(txid);
  return result;
}

nlohmann::json OutPointJson(const primitives::COutPoint& outpoint) {
  return {{"txid", HashHex(outpoint.txid)}, {"index", outpoint.index}};
}

}  // namespace

WalletRpc::WalletRpc(node::ChainState& chain, node::Mempool& pool, wallet::AuctionWallet& wallet)
    : chain_(chain), pool_(pool), wallet_(wallet), orchestrator_(chain, pool, wallet) {
  pool_.SetListener([&wallet](const primitives::CTransaction& tx, const primitives::Hash256& txid) {
    wallet.AddTransaction(tx, txid, std::nullopt);
  });
  const auto& net = config::GetNetworkConfig();
  pool_.SetNotificationsMuted(!net.wallet_mempool_notifications);
  wallet::SelectionPolicy policy;
  if (wallet::SelectionPolicyFromString(net.wallet_coin_selection, &policy)) {
    orchestrator_.SetCoinSelection(policy);
  } else {
    std::cerr << "[wallet] warn: unknown coin selection '" << net.wallet_coin_selection
              << "', using largest\n";
  }
}

nlohmann::json WalletRpc::Handle(const nlohmann::json& request) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
  try {
    const auto method = request.at("method").get<std::string>();
    const nlohmann::json params =
        request.contains("params") ? request.at("params") : nlohmann::json::object();
    if (!params.is_object()) {
      ThrowInvalidParams("params must be an object");
    }
    if (method == "createaccount") {
      response["result"] = HandleCreateAccount(params);
    } else if (method == "getbalance") {
      response["result"] = HandleGetBalance(params);
    } else if (method == "getnewaddress") {
      response["result"] = HandleGetNewAddress(params);
    } else if (method == "sendopen") {
      response["result"] = HandleSendOpen(params);
    } else if (method == "sendbid") {
      response["result"] = HandleSendBid(params);
    } else if (method == "sendreveal") {
      response["result"] = HandleSendReveal(params);
    } else if (method == "sendrevealall") {
      response["result"] = HandleSendRevealAll(params);
    } else if (method == "sendupdate") {
      response["result"] = HandleSendUpdate(params);
    } else if (method == "sendredeem") {
      response["result"] = HandleSendRedeem(params);
    } else if (method == "sendrenew") {
      response["result"] = HandleSendRenew(params);
    } else if (method == "abandon") {
      response["result"] = HandleAbandon(params);
    } else if (method == "getbidsbyname") {
      response["result"] = HandleGetBidsByName(params);
    } else if (method == "getnameinfo") {
      response["result"] = HandleGetNameInfo(params);
    } else if (method == "rescan") {
      response["result"] = HandleRescan(params);
    } else if (method == "generatetoaddress") {
      response["result"] = HandleGenerateToAddress(params);
    } else {
      throw RpcError(kMethodNotFound, "MethodNotFound", "unknown method '" + method + "'");
    }
  } catch (const RpcError& ex) {
    response["error"] = {{"code", ex.code}, {"kind", ex.kind}, {"message", ex.what()}};
  } catch (const nlohmann::json::exception& ex) {
    response["error"] = {
        {"code", kInvalidRequest}, {"kind", "InvalidRequest"}, {"message", ex.what()}};
  } catch (const std::exception& ex) {
    response["error"] = {{"code", kInternalError}, {"kind", "Internal"}, {"message", ex.what()}};
  }
  return response;
}

std::optional<wallet::AccountRef> WalletRpc::OptionalAccount(const nlohmann::json& params) const {
  if (!params.contains("account") || params.at("account").is_null()) {
    return std::nullopt;
  }
  const auto& value = params.at("account");
  if (value.is_number()) {
    return wallet::AccountRef{RequireUint32(value, "account index")};
  }
  if (value.is_string()) {
    return wallet::AccountRef{value.get<std::string>()};
  }
  ThrowInvalidParams("account must be an index or a name");
}

std::uint32_t WalletRpc::AccountIndex(const nlohmann::json& params) const {
  const auto ref = OptionalAccount(params).value_or(wallet::AccountRef{wallet::kDefaultAccountIndex});
  std::uint32_t index = 0;
  consensus::AuctionError error;
  if (!wallet_.ResolveAccount(ref, &index, &error)) {
    ThrowAuctionError(error);
  }
  return index;
}

nlohmann::json WalletRpc::HandleCreateAccount(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  std::uint32_t index = 0;
  consensus::AuctionError error;
  if (!wallet_.CreateAccount(name, &index, &error)) {
    ThrowAuctionError(error);
  }
  nlohmann::json result;
  result["account"] = index;
  result["name"] = name;
  result["address"] = util::HexEncode(*wallet_.ProgramFor(index));
  return result;
}

nlohmann::json WalletRpc::HandleGetBalance(const nlohmann::json& params) const {
  const auto index = AccountIndex(params);
  const auto balance = wallet_.GetBalance(index);
  nlohmann::json result;
  result["account"] = index;
  result["name"] = wallet_.AccountName(index).value_or("");
  result["confirmed"] = balance.confirmed;
  result["unconfirmed"] = balance.unconfirmed;
  result["locked_confirmed"] = balance.locked_confirmed;
  result["locked_unconfirmed"] = balance.locked_unconfirmed;
  return result;
}

nlohmann::json WalletRpc::HandleGetNewAddress(const nlohmann::json& params) const {
  const auto index = AccountIndex(params);
  nlohmann::json result;
  result["account"] = index;
  result["address"] = util::HexEncode(*wallet_.ProgramFor(index));
  return result;
}

nlohmann::json WalletRpc::HandleSendOpen(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  const wallet::AccountRef account{AccountIndex(params)};
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  if (!orchestrator_.SendOpen(name, account, &txid, &error)) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

nlohmann::json WalletRpc::HandleSendBid(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  const auto value = RequireAmount(params, "value");
  const auto lockup = params.contains("lockup") ? RequireAmount(params, "lockup") : value;
  const wallet::AccountRef account{AccountIndex(params)};
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  if (!orchestrator_.SendBid(name, value, lockup, account, &txid, &error)) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

// Without an account every account's bids on the name go into one reveal.
nlohmann::json WalletRpc::HandleSendReveal(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  const auto account = OptionalAccount(params);
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  const bool ok = account ? orchestrator_.SendReveal(name, *account, &txid, &error)
                          : orchestrator_.SendRevealAll(name, &txid, &error);
  if (!ok) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

nlohmann::json WalletRpc::HandleSendRevealAll(const nlohmann::json& params) {
  std::optional<std::string> name;
  if (params.contains("name")) {
    name = RequireString(params, "name");
  }
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  if (!orchestrator_.SendRevealAll(name, &txid, &error)) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

nlohmann::json WalletRpc::HandleSendUpdate(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  std::vector<std::uint8_t> resource;
  if (params.contains("resource") && !util::HexDecode(RequireString(params, "resource"), &resource)) {
    ThrowInvalidParams("resource must be hex");
  }
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  if (!orchestrator_.SendUpdate(name, resource, OptionalAccount(params), &txid, &error)) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

nlohmann::json WalletRpc::HandleSendRedeem(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  const wallet::AccountRef account{AccountIndex(params)};
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  if (!orchestrator_.SendRedeem(name, account, &txid, &error)) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

nlohmann::json WalletRpc::HandleSendRenew(const nlohmann::json& params) {
  const auto name = RequireString(params, "name");
  primitives::Hash256 txid{};
  consensus::AuctionError error;
  if (!orchestrator_.SendRenew(name, OptionalAccount(params), &txid, &error)) {
    ThrowAuctionError(error);
  }
  return TxidResult(txid);
}

nlohmann::json WalletRpc::HandleAbandon(const nlohmann::json& params) {
  primitives::Hash256 txid{};
  if (!util::HexDecode32(RequireString(params, "txid"), &txid)) {
    ThrowInvalidParams("txid must be 32 bytes of hex");
  }
  consensus::AuctionError error;
  if (!orchestrator_.Abandon(txid, &error)) {
    ThrowAuctionError(error);
  }
  nlohmann::json result;
  result["abandoned"] = HashHex(txid);
  return result;
}

nlohmann::json WalletRpc::HandleGetBidsByName(const nlohmann::json& params) const {
  const auto name = RequireString(params, "name");
  const bool own_only = params.contains("own") && params.at("own").get<bool>();
  nlohmann::json result = nlohmann::json::array();
  for (const auto& bid : wallet_.GetBidsByName(name)) {
    if (own_only && !bid.own) {
      continue;
    }
    nlohmann::json entry;
    entry["name"] = bid.name;
    entry["outpoint"] = OutPointJson(bid.outpoint);
    entry["open_height"] = bid.open_height;
    entry["lockup"] = bid.lockup;
    entry["commitment"] = HashHex(bid.commitment);
    entry["own"] = bid.own;
    entry["account"] = bid.account ? nlohmann::json(*bid.account) : nlohmann::json(nullptr);
    entry["height"] = bid.height ? nlohmann::json(*bid.height) : nlohmann::json(nullptr);
    result.push_back(entry);
  }
  return result;
}

nlohmann::json WalletRpc::HandleGetNameInfo(const nlohmann::json& params) const {
  const auto name = RequireString(params, "name");
  const auto& names = chain_.Params().names;
  const auto height = chain_.Height();
  consensus::NameState state;
  const bool known = chain_.GetNameState(name, &state);
  nlohmann::json result;
  result["name"] = name;
  result["name_hash"] = HashHex(consensus::HashName(name));
  result["height"] = height;
  result["phase"] = std::string(
      consensus::NamePhaseName(consensus::PhaseOf(known ? &state : nullptr, height, names)));
  if (!known) {
    result["info"] = nullptr;
    return result;
  }
  nlohmann::json info;
  info["open_height"] = state.open_height;
  info["bidding_start"] = consensus::BiddingStart(state, names);
  info["reveal_start"] = consensus::RevealStart(state, names);
  info["reveal_end"] = consensus::RevealEnd(state, names);
  info["highest"] = state.highest;
  info["value"] = state.value;
  info["owner"] = state.HasOwner() ? OutPointJson(state.owner) : nlohmann::json(nullptr);
  info["registered"] = state.registered;
  info["renewal_height"] = state.renewal_height;
  info["expires_at"] = state.renewal_height + names.renewal_window;
  info["transfer_lockup"] = state.transfer_lockup;
  info["data"] = util::HexEncode(state.data);
  result["info"] = info;
  return result;
}

nlohmann::json WalletRpc::HandleRescan(const nlohmann::json& params) {
  std::uint32_t from = 0;
  if (params.contains("height")) {
    from = RequireUint32(params.at("height"), "height");
  }
  consensus::AuctionError error;
  if (!wallet_.Rescan(chain_, from, &pool_, &error)) {
    ThrowAuctionError(error);
  }
  nlohmann::json result;
  result["from"] = from;
  result["tip"] = chain_.Height();
  return result;
}

nlohmann::json WalletRpc::HandleGenerateToAddress(const nlohmann::json& params) {
  std::uint32_t blocks = 1;
  if (params.contains("blocks")) {
    blocks = RequireUint32(params.at("blocks"), "blocks");
  }
  if (blocks == 0) {
    ThrowInvalidParams("blocks must be > 0");
  }
  script::WitnessProgram reward{};
  if (params.contains("address")) {
    if (!util::HexDecode32(RequireString(params, "address"), &reward)) {
      ThrowInvalidParams("address must be a 32-byte witness program in hex");
    }
  } else {
    reward = *wallet_.ProgramFor(AccountIndex(params));
  }

  auto on_connected = [this](const primitives::CBlock& block, std::uint32_t height,
                             const std::vector<primitives::Hash256>& evicted) {
    wallet_.AddBlock(block, height);
    for (const auto& txid : evicted) {
      consensus::AuctionError abandon_error;
      if (!wallet_.Abandon(txid, &abandon_error)) {
        std::cerr << "[wallet] warn: evicted transaction " << HashHex(txid)
                  << " kept: " << abandon_error.message << "\n";
      }
    }
  };
  std::vector<primitives::Hash256> hashes;
  std::string error;
  if (!node::GenerateBlocks(chain_, pool_, reward, blocks, on_connected, &hashes, &error)) {
    throw RpcError(kInternalError, "BlockRejected", "failed to mine block: " + error);
  }
  nlohmann::json result = nlohmann::json::array();
  for (const auto& hash : hashes) {
    result.push_back(HashHex(hash));
  }
  return result;
}

}  // namespace sealcoin::rpc
