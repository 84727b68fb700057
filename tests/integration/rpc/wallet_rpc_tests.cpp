#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/network.hpp"
#include "consensus/params.hpp"
#include "nlohmann/json.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "primitives/amount.hpp"
#include "rpc/wallet_rpc.hpp"
#include "tests/unit/util/deterministic_rng.hpp"
#include "wallet/auction_wallet.hpp"

namespace {

int next_id = 0;

nlohmann::json Call(sealcoin::rpc::WalletRpc& rpc, const std::string& method,
                    nlohmann::json params = nlohmann::json::object()) {
  nlohmann::json request{{"jsonrpc", "2.0"},
                         {"id", std::to_string(++next_id)},
                         {"method", method},
                         {"params", std::move(params)}};
  return rpc.Handle(request);
}

// Returns the result or throws with the error payload.
nlohmann::json Expect(sealcoin::rpc::WalletRpc& rpc, const std::string& method,
                      nlohmann::json params = nlohmann::json::object()) {
  auto response = Call(rpc, method, std::move(params));
  if (response.contains("error")) {
    throw std::runtime_error(method + " error: " + response["error"].dump());
  }
  return response["result"];
}

bool ExpectError(const nlohmann::json& response, int code, const std::string& kind,
                 const char* what) {
  if (!response.contains("error") || response["error"]["code"].get<int>() != code ||
      response["error"]["kind"].get<std::string>() != kind) {
    std::cerr << what << ": expected error " << code << " (" << kind << "), got "
              << response.dump() << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    using namespace sealcoin;
    test::ScopedDeterministicRng rng(0x52504300ULL);
    config::SelectNetwork(config::NetworkType::kRegtest);
    const auto& params = consensus::Params(config::NetworkType::kRegtest);
    node::ChainState chain(params);
    std::string error;
    if (!chain.Initialize(&error)) {
      std::cerr << "Chain init failed: " << error << "\n";
      return EXIT_FAILURE;
    }
    node::Mempool pool(chain);
    wallet::AuctionWallet wallet(params);
    rpc::WalletRpc server(chain, pool, wallet);
    const auto seal = primitives::kGrainsPerSEAL;

    // Protocol errors.
    if (!ExpectError(Call(server, "getwalletinfo"), -32601, "MethodNotFound", "unknown method")) {
      return EXIT_FAILURE;
    }
    if (!ExpectError(server.Handle(nlohmann::json{{"id", 1}}), -32600, "InvalidRequest",
                     "request without method")) {
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "getbalance", nlohmann::json::array({1})), -32602,
                     "InvalidParams", "positional params")) {
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "getbalance", {{"account", "nobody"}}), -1008, "NotFound",
                     "unknown account")) {
      return EXIT_FAILURE;
    }
    // Account indices are 32-bit; nothing wraps around to the default account.
    if (!ExpectError(Call(server, "getbalance", {{"account", 4294967296ULL}}), -32602,
                     "InvalidParams", "account index above 32 bits") ||
        !ExpectError(Call(server, "getbalance", {{"account", -1}}), -32602, "InvalidParams",
                     "negative account index") ||
        !ExpectError(Call(server, "getbalance", {{"account", 4294967295ULL}}), -1008,
                     "NotFound", "largest account index") ||
        !ExpectError(Call(server, "getbalance", {{"account", 1.5}}), -32602, "InvalidParams",
                     "fractional account index")) {
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "generatetoaddress", {{"blocks", 4294967296ULL}}), -32602,
                     "InvalidParams", "block count above 32 bits") ||
        !ExpectError(Call(server, "rescan", {{"height", -1}}), -32602, "InvalidParams",
                     "negative rescan height")) {
      return EXIT_FAILURE;
    }
    if (chain.Height() != 0) {
      std::cerr << "rejected requests mined blocks\n";
      return EXIT_FAILURE;
    }

    const auto created = Expect(server, "createaccount", {{"name", "alice"}});
    if (created["account"].get<std::uint32_t>() != 1 ||
        created["address"].get<std::string>().size() != 64) {
      std::cerr << "createaccount returned " << created.dump() << "\n";
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "createaccount", {{"name", "alice"}}), -1009, "Rejected",
                     "duplicate account")) {
      return EXIT_FAILURE;
    }
    const auto address = Expect(server, "getnewaddress", {{"account", "alice"}});
    if (address["address"] != created["address"]) {
      std::cerr << "getnewaddress disagrees with createaccount\n";
      return EXIT_FAILURE;
    }

    if (!ExpectError(Call(server, "generatetoaddress", {{"blocks", 0}}), -32602,
                     "InvalidParams", "zero blocks")) {
      return EXIT_FAILURE;
    }
    const auto hashes = Expect(server, "generatetoaddress", {{"blocks", 10}, {"account", "alice"}});
    if (!hashes.is_array() || hashes.size() != 10 || chain.Height() != 10) {
      std::cerr << "generatetoaddress returned " << hashes.dump() << "\n";
      return EXIT_FAILURE;
    }
    const auto balance = Expect(server, "getbalance", {{"account", "alice"}});
    if (balance["confirmed"].get<primitives::Amount>() != 20'000 * seal ||
        balance["name"].get<std::string>() != "alice") {
      std::cerr << "getbalance returned " << balance.dump() << "\n";
      return EXIT_FAILURE;
    }

    // OPEN, then BID too early.
    Expect(server, "sendopen", {{"name", "example"}, {"account", "alice"}});
    Expect(server, "generatetoaddress", {{"blocks", 1}});
    auto info = Expect(server, "getnameinfo", {{"name", "example"}});
    if (info["phase"] != "OPENING" || info["info"]["open_height"].get<std::uint32_t>() != 11 ||
        info["info"]["bidding_start"].get<std::uint32_t>() != 17) {
      std::cerr << "getnameinfo after OPEN returned " << info.dump() << "\n";
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "sendbid",
                          {{"name", "example"}, {"value", 100 * seal}, {"account", "alice"}}),
                     -1001, "PhaseMismatch", "early bid")) {
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "sendbid", {{"name", "example"}, {"value", -5}}), -32602,
                     "InvalidParams", "negative bid value")) {
      return EXIT_FAILURE;
    }
    Expect(server, "generatetoaddress", {{"blocks", params.names.tree_interval}});

    Expect(server, "sendbid",
           {{"name", "example"}, {"value", 100 * seal}, {"lockup", 150 * seal},
            {"account", "alice"}});
    Expect(server, "generatetoaddress", {{"blocks", params.names.bidding_period}});
    const auto bids = Expect(server, "getbidsbyname", {{"name", "example"}, {"own", true}});
    if (bids.size() != 1 || bids[0]["lockup"].get<primitives::Amount>() != 150 * seal ||
        bids[0]["account"].get<std::uint32_t>() != 1 || bids[0]["height"].is_null()) {
      std::cerr << "getbidsbyname returned " << bids.dump() << "\n";
      return EXIT_FAILURE;
    }

    Expect(server, "sendrevealall");
    Expect(server, "generatetoaddress", {{"blocks", params.names.reveal_period}});
    if (!ExpectError(Call(server, "sendupdate", {{"name", "example"}, {"resource", "zz"}}),
                     -32602, "InvalidParams", "non-hex resource")) {
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "sendupdate",
                          {{"name", "example"}, {"resource", "abcd"}, {"account", 0}}),
                     -1004, "OwnershipViolation", "update from another account")) {
      return EXIT_FAILURE;
    }
    Expect(server, "sendupdate", {{"name", "example"}, {"resource", "abcd"}});
    Expect(server, "generatetoaddress", {{"blocks", 1}});

    info = Expect(server, "getnameinfo", {{"name", "example"}});
    if (info["phase"] != "CLOSED" || !info["info"]["registered"].get<bool>() ||
        info["info"]["data"] != "abcd" ||
        info["info"]["highest"].get<primitives::Amount>() != 100 * seal ||
        info["info"]["value"].get<primitives::Amount>() != 0 || info["info"]["owner"].is_null()) {
      std::cerr << "getnameinfo after REGISTER returned " << info.dump() << "\n";
      return EXIT_FAILURE;
    }
    const auto unknown = Expect(server, "getnameinfo", {{"name", "unclaimed"}});
    if (unknown["phase"] != "AVAILABLE" || !unknown["info"].is_null()) {
      std::cerr << "getnameinfo for an unknown name returned " << unknown.dump() << "\n";
      return EXIT_FAILURE;
    }

    if (!ExpectError(Call(server, "abandon", {{"txid", "nothex"}}), -32602, "InvalidParams",
                     "malformed abandon txid")) {
      return EXIT_FAILURE;
    }

    // sendreveal without an account reveals every account's bids together.
    const auto bob = Expect(server, "createaccount", {{"name", "bob"}});
    Expect(server, "generatetoaddress", {{"blocks", 4}, {"account", "bob"}});
    Expect(server, "sendopen", {{"name", "shared"}, {"account", "bob"}});
    Expect(server, "generatetoaddress", {{"blocks", 1}});
    Expect(server, "generatetoaddress", {{"blocks", params.names.tree_interval}});
    Expect(server, "sendbid",
           {{"name", "shared"}, {"value", 30 * seal}, {"lockup", 40 * seal},
            {"account", "alice"}});
    Expect(server, "sendbid",
           {{"name", "shared"}, {"value", 50 * seal}, {"lockup", 50 * seal},
            {"account", bob["account"]}});
    Expect(server, "generatetoaddress", {{"blocks", params.names.bidding_period}});
    const auto joint = Expect(server, "sendreveal", {{"name", "shared"}});
    if (pool.Size() != 1 || joint["txid"].get<std::string>().size() != 64) {
      std::cerr << "sendreveal without account returned " << joint.dump() << " with "
                << pool.Size() << " pool transactions\n";
      return EXIT_FAILURE;
    }
    Expect(server, "generatetoaddress", {{"blocks", params.names.reveal_period}});
    const auto shared_reveals = wallet.GetRevealsByName("shared");
    if (shared_reveals.size() != 2 ||
        shared_reveals[0].outpoint.txid != shared_reveals[1].outpoint.txid ||
        shared_reveals[0].account == shared_reveals[1].account) {
      std::cerr << "sendreveal without account did not reveal both accounts in one transaction\n";
      return EXIT_FAILURE;
    }
    info = Expect(server, "getnameinfo", {{"name", "shared"}});
    if (info["info"]["highest"].get<primitives::Amount>() != 50 * seal ||
        info["info"]["value"].get<primitives::Amount>() != 30 * seal) {
      std::cerr << "getnameinfo after joint reveal returned " << info.dump() << "\n";
      return EXIT_FAILURE;
    }

    // A full rescan rebuilds the same balances.
    const auto before = Expect(server, "getbalance", {{"account", "alice"}});
    const auto rescan = Expect(server, "rescan", {{"height", 0}});
    if (rescan["tip"].get<std::uint32_t>() != chain.Height()) {
      std::cerr << "rescan returned " << rescan.dump() << "\n";
      return EXIT_FAILURE;
    }
    const auto after = Expect(server, "getbalance", {{"account", "alice"}});
    if (before != after) {
      std::cerr << "rescan changed balance: " << before.dump() << " -> " << after.dump() << "\n";
      return EXIT_FAILURE;
    }
    if (!ExpectError(Call(server, "rescan", {{"height", 1000}}), -1008, "NotFound",
                     "rescan above tip")) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "wallet_rpc_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
