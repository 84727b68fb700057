#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "consensus/auction_error.hpp"
#include "consensus/covenant.hpp"
#include "consensus/name_state.hpp"
#include "consensus/params.hpp"
#include "consensus/sighash.hpp"
#include "crypto/account_key.hpp"
#include "node/block_builder.hpp"
#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "primitives/transaction.hpp"
#include "primitives/txid.hpp"
#include "script/p2qh.hpp"
#include "tests/unit/util/deterministic_rng.hpp"

using namespace sealcoin;

namespace {

struct Funder {
  crypto::AccountKey key;
  script::WitnessProgram program{};
};

// Builds a signed OPEN for |name| spending the coinbase mined at |height|.
// Everything but |fee| returns as change.
bool BuildOpen(const node::ChainState& chain, const Funder& funder, std::size_t height,
               const std::string& name, primitives::Amount fee, primitives::CTransaction* out) {
  primitives::CBlock block;
  if (!chain.GetBlock(height, &block)) return false;
  const primitives::COutPoint prevout{primitives::ComputeTxId(block.transactions.front()), 0};
  consensus::Coin coin;
  if (!chain.GetCoin(prevout, &coin)) return false;

  const auto script = script::CreateP2QHScript(funder.program);
  primitives::CTransaction tx;
  tx.vin.resize(1);
  tx.vin[0].prevout = prevout;
  tx.vout.resize(2);
  tx.vout[0].locking_descriptor = script.data;
  tx.vout[0].covenant =
      consensus::EncodeCovenant(consensus::OpenCovenant{consensus::HashName(name), name});
  tx.vout[1].value = coin.out.value - fee;
  tx.vout[1].locking_descriptor = script.data;

  const auto sighash = consensus::ComputeSighash(tx, 0, coin);
  const auto public_key = funder.key.PublicKey();
  primitives::WitnessStackItem key_item{
      std::vector<std::uint8_t>(public_key.begin(), public_key.end())};
  primitives::WitnessStackItem sig_item{
      funder.key.Sign(std::span<const std::uint8_t>(sighash.data(), sighash.size()))};
  tx.vin[0].witness_stack = {key_item, sig_item};
  *out = std::move(tx);
  return true;
}

constexpr primitives::Amount kFee = 20'000;

// Spends output |index| of the unconfirmed |parent| back to the funder.
primitives::CTransaction BuildChild(const Funder& funder, const primitives::CTransaction& parent,
                                    std::uint32_t index) {
  consensus::Coin coin;
  coin.out = parent.vout[index];
  primitives::CTransaction tx;
  tx.vin.resize(1);
  tx.vin[0].prevout = primitives::COutPoint{primitives::ComputeTxId(parent), index};
  tx.vout.resize(1);
  tx.vout[0].value = coin.out.value - kFee;
  tx.vout[0].locking_descriptor = script::CreateP2QHScript(funder.program).data;

  const auto sighash = consensus::ComputeSighash(tx, 0, coin);
  const auto public_key = funder.key.PublicKey();
  tx.vin[0].witness_stack = {
      primitives::WitnessStackItem{std::vector<std::uint8_t>(public_key.begin(), public_key.end())},
      primitives::WitnessStackItem{funder.key.Sign(sighash)}};
  return tx;
}

bool RunNameConflictTest() {
  test::ScopedDeterministicRng rng(0x0BE7'0BE7ULL);
  const auto& params = consensus::Params(config::NetworkType::kRegtest);
  node::ChainState chain(params);
  std::string error;
  if (!chain.Initialize(&error)) {
    std::cerr << "mempool_name_conflict_tests: init failed: " << error << "\n";
    return false;
  }
  Funder funder{.key = crypto::AccountKey::Generate()};
  funder.program = script::ProgramFromPublicKey(funder.key.PublicKey());

  node::Mempool pool(chain);
  if (!node::GenerateBlocks(chain, pool, funder.program, 4, nullptr, nullptr, &error)) {
    std::cerr << "mempool_name_conflict_tests: mining failed: " << error << "\n";
    return false;
  }

  primitives::CTransaction open_a;
  primitives::CTransaction open_b;
  primitives::CTransaction respend;
  primitives::CTransaction cheap;
  if (!BuildOpen(chain, funder, 1, "example", kFee, &open_a) ||
      !BuildOpen(chain, funder, 2, "example", kFee, &open_b) ||
      !BuildOpen(chain, funder, 1, "another", kFee, &respend) ||
      !BuildOpen(chain, funder, 3, "cheap", 1, &cheap)) {
    std::cerr << "mempool_name_conflict_tests: failed to build OPENs\n";
    return false;
  }

  std::string reason;
  if (!pool.Submit(open_a, &reason)) {
    std::cerr << "mempool_name_conflict_tests: first OPEN rejected: " << reason << "\n";
    return false;
  }

  consensus::AuctionError auction_error;
  if (pool.Submit(open_b, &reason, &auction_error) ||
      auction_error.kind != consensus::AuctionErrorKind::kPhaseMismatch ||
      reason.find("consensus") == std::string::npos) {
    std::cerr << "mempool_name_conflict_tests: competing OPEN admitted or misreported: "
              << reason << "\n";
    return false;
  }

  if (pool.Submit(respend, &reason) ||
      reason.find("input already spent") == std::string::npos) {
    std::cerr << "mempool_name_conflict_tests: mempool double spend not detected: " << reason
              << "\n";
    return false;
  }

  if (pool.Submit(cheap, &reason) || reason.find("fee below minimum") == std::string::npos) {
    std::cerr << "mempool_name_conflict_tests: low-fee OPEN admitted: " << reason << "\n";
    return false;
  }

  // Dropping the pending OPEN frees the name for the competitor.
  std::vector<primitives::Hash256> removed;
  if (!pool.Remove(primitives::ComputeTxId(open_a), &removed) || removed.size() != 1) {
    std::cerr << "mempool_name_conflict_tests: remove failed\n";
    return false;
  }
  if (!pool.Submit(open_b, &reason)) {
    std::cerr << "mempool_name_conflict_tests: OPEN rejected after remove: " << reason << "\n";
    return false;
  }

  if (!node::GenerateBlocks(chain, pool, funder.program, 1, nullptr, nullptr, &error)) {
    std::cerr << "mempool_name_conflict_tests: mining OPEN failed: " << error << "\n";
    return false;
  }
  consensus::NameState state;
  if (pool.Size() != 0 || !chain.GetNameState("example", &state) ||
      state.open_height != chain.Height()) {
    std::cerr << "mempool_name_conflict_tests: mined OPEN not reflected in chain state\n";
    return false;
  }
  return true;
}

bool RunEvictionTest() {
  test::ScopedDeterministicRng rng(0xE71C'7000ULL);
  const auto& params = consensus::Params(config::NetworkType::kRegtest);
  node::ChainState chain(params);
  std::string error;
  if (!chain.Initialize(&error)) {
    std::cerr << "mempool_name_conflict_tests: init failed: " << error << "\n";
    return false;
  }
  Funder funder{.key = crypto::AccountKey::Generate()};
  funder.program = script::ProgramFromPublicKey(funder.key.PublicKey());

  node::Mempool local(chain);
  node::Mempool remote(chain);
  if (!node::GenerateBlocks(chain, local, funder.program, 4, nullptr, nullptr, &error)) {
    std::cerr << "mempool_name_conflict_tests: mining failed: " << error << "\n";
    return false;
  }

  primitives::CTransaction ours;
  primitives::CTransaction theirs;
  if (!BuildOpen(chain, funder, 1, "contested", kFee, &ours) ||
      !BuildOpen(chain, funder, 2, "contested", kFee, &theirs)) {
    std::cerr << "mempool_name_conflict_tests: failed to build OPENs\n";
    return false;
  }
  std::string reason;
  if (!local.Submit(ours, &reason) || !remote.Submit(theirs, &reason)) {
    std::cerr << "mempool_name_conflict_tests: OPEN rejected: " << reason << "\n";
    return false;
  }

  // Another miner confirms the competing OPEN first.
  node::BlockTemplate templ;
  if (!node::BuildBlockTemplate(chain, remote, funder.program, &templ, &error) ||
      templ.block.transactions.size() != 2 || !chain.ConnectBlock(templ.block, &error)) {
    std::cerr << "mempool_name_conflict_tests: remote block failed: " << error << "\n";
    return false;
  }

  std::vector<primitives::Hash256> evicted;
  local.RemoveForBlock(templ.block, &evicted);
  const auto ours_txid = primitives::ComputeTxId(ours);
  if (local.Size() != 0 ||
      std::find(evicted.begin(), evicted.end(), ours_txid) == evicted.end()) {
    std::cerr << "mempool_name_conflict_tests: conflicting OPEN not evicted\n";
    return false;
  }
  remote.RemoveForBlock(templ.block);
  if (remote.Size() != 0) {
    std::cerr << "mempool_name_conflict_tests: mined OPEN left in pool\n";
    return false;
  }
  return true;
}

// Listener delivery honours the mute switch, a parent and its child mined in
// one block leave only the child's output behind, and RemoveAll forgets
// both spends and pending names.
bool RunNotificationAndResetTest() {
  test::ScopedDeterministicRng rng(0x5E7'0FF5ULL);
  const auto& params = consensus::Params(config::NetworkType::kRegtest);
  node::ChainState chain(params);
  std::string error;
  if (!chain.Initialize(&error)) {
    std::cerr << "mempool_name_conflict_tests: init failed: " << error << "\n";
    return false;
  }
  Funder funder{.key = crypto::AccountKey::Generate()};
  funder.program = script::ProgramFromPublicKey(funder.key.PublicKey());

  node::Mempool pool(chain);
  if (!node::GenerateBlocks(chain, pool, funder.program, 4, nullptr, nullptr, &error)) {
    std::cerr << "mempool_name_conflict_tests: mining failed: " << error << "\n";
    return false;
  }
  std::vector<primitives::Hash256> heard;
  pool.SetListener([&heard](const primitives::CTransaction&, const primitives::Hash256& txid) {
    heard.push_back(txid);
  });

  primitives::CTransaction quiet;
  primitives::CTransaction loud;
  primitives::CTransaction later;
  if (!BuildOpen(chain, funder, 1, "quiet", kFee, &quiet) ||
      !BuildOpen(chain, funder, 2, "loud", kFee, &loud) ||
      !BuildOpen(chain, funder, 3, "later", kFee, &later)) {
    std::cerr << "mempool_name_conflict_tests: failed to build OPENs\n";
    return false;
  }
  std::string reason;
  pool.SetNotificationsMuted(true);
  if (!pool.Submit(quiet, &reason) || !heard.empty()) {
    std::cerr << "mempool_name_conflict_tests: muted pool notified or rejected: " << reason
              << "\n";
    return false;
  }
  pool.SetNotificationsMuted(false);
  const auto child = BuildChild(funder, loud, 1);
  if (!pool.Submit(loud, &reason) || !pool.Submit(child, &reason) || heard.size() != 2 ||
      heard[0] != primitives::ComputeTxId(loud) || heard[1] != primitives::ComputeTxId(child)) {
    std::cerr << "mempool_name_conflict_tests: unmuted submits not delivered: " << reason
              << "\n";
    return false;
  }

  if (!node::GenerateBlocks(chain, pool, funder.program, 1, nullptr, nullptr, &error)) {
    std::cerr << "mempool_name_conflict_tests: mining chained spend failed: " << error << "\n";
    return false;
  }
  const primitives::COutPoint spent_change{primitives::ComputeTxId(loud), 1};
  const primitives::COutPoint child_out{primitives::ComputeTxId(child), 0};
  consensus::Coin coin;
  if (pool.Size() != 0 || chain.GetCoin(spent_change, &coin) || !chain.GetCoin(child_out, &coin) ||
      coin.height != chain.Height()) {
    std::cerr << "mempool_name_conflict_tests: in-block spend not folded into the UTXO set\n";
    return false;
  }

  if (!pool.Submit(later, &reason)) {
    std::cerr << "mempool_name_conflict_tests: OPEN rejected: " << reason << "\n";
    return false;
  }
  pool.RemoveAll();
  if (pool.Size() != 0 || pool.Contains(primitives::ComputeTxId(later))) {
    std::cerr << "mempool_name_conflict_tests: RemoveAll left entries behind\n";
    return false;
  }
  if (!pool.Submit(later, &reason) || heard.size() != 4) {
    std::cerr << "mempool_name_conflict_tests: resubmit after RemoveAll rejected: " << reason
              << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!RunNameConflictTest()) {
    return EXIT_FAILURE;
  }
  if (!RunEvictionTest()) {
    return EXIT_FAILURE;
  }
  if (!RunNotificationAndResetTest()) {
    return EXIT_FAILURE;
  }
  std::cout << "mempool_name_conflict_tests: OK\n";
  return EXIT_SUCCESS;
}
