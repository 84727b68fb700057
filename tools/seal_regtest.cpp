#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/params.hpp"
#include "nlohmann/json.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "rpc/wallet_rpc.hpp"
#include "wallet/auction_wallet.hpp"

namespace {

struct DriverOptions {
  std::string data_dir;
  std::string name{"example"};
  std::string coin_selection{"largest"};
  bool raw{false};
};

DriverOptions ParseOptions(int argc, char** argv) {
  DriverOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--data-dir") {
      if (++i >= argc) throw std::runtime_error("missing value for --data-dir");
      opts.data_dir = argv[i];
    } else if (arg == "--name") {
      if (++i >= argc) throw std::runtime_error("missing value for --name");
      opts.name = argv[i];
    } else if (arg == "--coin-selection") {
      if (++i >= argc) throw std::runtime_error("missing value for --coin-selection");
      opts.coin_selection = argv[i];
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "usage: seal-regtest [--data-dir DIR] [--name NAME] [--raw]\n"
                << "                    [--coin-selection largest|oldest|all]\n"
                << "Runs a two-account name auction on an in-process regtest chain.\n";
      std::exit(0);
    } else {
      throw std::runtime_error("unknown option " + arg);
    }
  }
  return opts;
}

class Script {
 public:
  Script(sealcoin::rpc::WalletRpc& rpc, bool raw) : rpc_(rpc), raw_(raw) {}

  nlohmann::json Call(const std::string& method, nlohmann::json params = nlohmann::json::object()) {
    nlohmann::json request;
    request["jsonrpc"] = "2.0";
    request["id"] = ++id_;
    request["method"] = method;
    request["params"] = std::move(params);
    auto response = rpc_.Handle(request);
    if (raw_) {
      std::cout << request.dump() << "\n" << response.dump(2) << "\n";
    } else if (response.contains("error")) {
      std::cout << method << " -> error " << response["error"].dump() << "\n";
    } else {
      std::cout << method << " -> " << response["result"].dump() << "\n";
    }
    if (response.contains("error")) {
      throw std::runtime_error(method + " failed: " +
                               response["error"].value("message", std::string{"?"}));
    }
    return response["result"];
  }

  void Mine(std::uint32_t blocks, const std::string& account) {
    Call("generatetoaddress", {{"blocks", blocks}, {"account", account}});
  }

 private:
  sealcoin::rpc::WalletRpc& rpc_;
  bool raw_;
  int id_{0};
};

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    sealcoin::config::SelectNetwork(sealcoin::config::NetworkType::kRegtest);
    sealcoin::config::GetMutableNetworkConfig().data_dir = opts.data_dir;
    sealcoin::config::GetMutableNetworkConfig().wallet_coin_selection = opts.coin_selection;
    const auto& params = sealcoin::consensus::Params(sealcoin::config::NetworkType::kRegtest);

    std::string block_path;
    std::string utxo_path;
    if (!opts.data_dir.empty()) {
      std::filesystem::create_directories(opts.data_dir);
      block_path = (std::filesystem::path(opts.data_dir) / "blocks.dat").string();
      utxo_path = (std::filesystem::path(opts.data_dir) / "utxo.snapshot").string();
    }
    sealcoin::node::ChainState chain(params, block_path, utxo_path);
    std::string error;
    if (!chain.Initialize(&error)) {
      std::cerr << "seal-regtest: chain init failed: " << error << "\n";
      return EXIT_FAILURE;
    }
    sealcoin::node::Mempool pool(chain);
    sealcoin::wallet::AuctionWallet wallet(params);
    sealcoin::rpc::WalletRpc rpc(chain, pool, wallet);
    Script script(rpc, opts.raw);

    const auto& names = params.names;
    script.Call("createaccount", {{"name", "alice"}});
    script.Call("createaccount", {{"name", "bob"}});
    script.Mine(10, "alice");
    script.Mine(10, "bob");

    script.Call("sendopen", {{"name", opts.name}, {"account", "alice"}});
    script.Mine(names.OpenPeriod(), "default");

    const auto seal = sealcoin::primitives::kGrainsPerSEAL;
    script.Call("sendbid", {{"name", opts.name},
                            {"value", 1000 * seal},
                            {"lockup", 1500 * seal},
                            {"account", "alice"}});
    script.Call("sendbid", {{"name", opts.name},
                            {"value", 800 * seal},
                            {"lockup", 1000 * seal},
                            {"account", "bob"}});
    script.Mine(names.bidding_period, "default");
    script.Call("getbidsbyname", {{"name", opts.name}});

    script.Call("sendrevealall", {{"name", opts.name}});
    script.Mine(names.reveal_period, "default");

    script.Call("sendupdate", {{"name", opts.name}, {"resource", "0102"}});
    script.Call("sendredeem", {{"name", opts.name}, {"account", "bob"}});
    script.Mine(1, "default");

    script.Call("getnameinfo", {{"name", opts.name}});
    script.Call("getbalance", {{"account", "alice"}});
    script.Call("getbalance", {{"account", "bob"}});
  } catch (const std::exception& ex) {
    std::cerr << "seal-regtest: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
