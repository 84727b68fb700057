#include <cstdlib>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/block_validator.hpp"
#include "consensus/covenant.hpp"
#include "consensus/monetary.hpp"
#include "consensus/name_state.hpp"
#include "consensus/params.hpp"
#include "consensus/sighash.hpp"
#include "crypto/account_key.hpp"
#include "primitives/amount.hpp"
#include "primitives/merkle.hpp"
#include "primitives/transaction.hpp"
#include "script/p2qh.hpp"
#include "tests/unit/util/deterministic_rng.hpp"

using namespace sealcoin;

namespace {

using sealcoin::test::ScopedDeterministicRng;

const consensus::ChainParams& Regtest() {
  return consensus::Params(config::NetworkType::kRegtest);
}

primitives::CTransaction BuildCoinbase(std::uint32_t height, primitives::Amount value) {
  primitives::CTransaction tx;
  tx.version = 1;
  tx.vin.resize(1);
  tx.vin[0].prevout = primitives::COutPoint::Null();
  tx.vin[0].sequence = 0xFFFFFFFFu;
  tx.lock_time = height;
  tx.vout.resize(1);
  tx.vout[0].value = value;
  script::WitnessProgram program{};
  program.fill(0x0C);
  tx.vout[0].locking_descriptor = script::CreateP2QHScript(program).data;
  return tx;
}

void FinalizeRoots(primitives::CBlock* block) {
  block->header.merkle_root = primitives::ComputeMerkleRoot(block->transactions);
  block->header.witness_root = primitives::ComputeWitnessMerkleRoot(block->transactions);
}

struct SpendContext {
  crypto::AccountKey key;
  script::ScriptPubKey script;
};

SpendContext BuildSpendContext() {
  SpendContext ctx{
      .key = crypto::AccountKey::Generate(),
  };
  ctx.script = script::CreateP2QHScript(script::ProgramFromPublicKey(ctx.key.PublicKey()));
  return ctx;
}

bool SignSpend(const SpendContext& ctx, const consensus::Coin& coin,
               primitives::CTransaction* tx) {
  if (!tx || tx->vin.empty()) return false;
  const auto sighash = consensus::ComputeSighash(*tx, 0, coin);
  auto sig = ctx.key.Sign(std::span<const std::uint8_t>(sighash.data(), sighash.size()));
  const auto public_key = ctx.key.PublicKey();
  primitives::WitnessStackItem key_item{
      std::vector<std::uint8_t>(public_key.begin(), public_key.end())};
  primitives::WitnessStackItem sig_item{sig};
  tx->vin[0].witness_stack = {key_item, sig_item};
  return true;
}

// Funds |ctx| with a 10 SEAL coin and returns a signed transaction opening
// |name| with 9 SEAL of change.
bool BuildOpenSpend(const SpendContext& ctx, std::uint8_t fill, const std::string& name,
                    consensus::UTXOSet* view, primitives::CTransaction* out) {
  consensus::Coin coin;
  coin.out.value = 10 * primitives::kGrainsPerSEAL;
  coin.out.locking_descriptor = ctx.script.data;
  coin.height = 0;

  primitives::COutPoint prevout{};
  prevout.txid.fill(fill);
  prevout.index = 0;
  view->AddCoin(prevout, coin);

  primitives::CTransaction spend;
  spend.version = 1;
  spend.vin.resize(1);
  spend.vin[0].prevout = prevout;
  spend.vout.resize(2);
  spend.vout[0].value = 0;
  spend.vout[0].locking_descriptor = ctx.script.data;
  spend.vout[0].covenant =
      consensus::EncodeCovenant(consensus::OpenCovenant{consensus::HashName(name), name});
  spend.vout[1].value = 9 * primitives::kGrainsPerSEAL;
  spend.vout[1].locking_descriptor = ctx.script.data;
  if (!SignSpend(ctx, coin, &spend)) {
    return false;
  }
  *out = std::move(spend);
  return true;
}

primitives::CBlock BlockWith(std::uint32_t height, primitives::Amount coinbase_value,
                             std::vector<primitives::CTransaction> txs) {
  primitives::CBlock block;
  block.header.version = 1;
  block.header.timestamp = 1'700'000'000ULL + height;
  block.transactions.push_back(BuildCoinbase(height, coinbase_value));
  for (auto& tx : txs) {
    block.transactions.push_back(std::move(tx));
  }
  FinalizeRoots(&block);
  return block;
}

bool ExpectRejected(const primitives::CBlock& block, std::uint32_t height,
                    consensus::UTXOSet view, consensus::NameRegistry names,
                    const std::string& needle, const char* what) {
  std::string error;
  if (consensus::ValidateAndApplyBlock(block, height, Regtest(), &view, &names, &error)) {
    std::cerr << "Expected " << what << " to be rejected\n";
    return false;
  }
  if (error.find(needle) == std::string::npos) {
    std::cerr << "Unexpected error for " << what << ": " << error << "\n";
    return false;
  }
  return true;
}

bool TestOpenBlockApplies() {
  ScopedDeterministicRng rng(0xC0FFEE1234567890ULL);
  auto ctx = BuildSpendContext();
  consensus::UTXOSet view;
  consensus::NameRegistry names;
  primitives::CTransaction open;
  if (!BuildOpenSpend(ctx, 0x42, "example", &view, &open)) {
    std::cerr << "Failed to build OPEN spend\n";
    return false;
  }
  const std::uint32_t height = 12;
  const auto& params = Regtest();
  const auto fee = 1 * primitives::kGrainsPerSEAL;
  const auto block = BlockWith(
      height, consensus::CalculateBlockSubsidy(height, params.halving_interval_blocks) + fee,
      {open});

  std::string error;
  primitives::Amount fees = 0;
  if (!consensus::ValidateAndApplyBlock(block, height, params, &view, &names, &error, &fees)) {
    std::cerr << "OPEN block rejected: " << error << "\n";
    return false;
  }
  if (fees != fee) {
    std::cerr << "Unexpected block fees " << fees << "\n";
    return false;
  }
  const auto* state = names.GetStateByName("example");
  if (state == nullptr || state->open_height != height ||
      consensus::PhaseOf(state, height, params.names) != consensus::NamePhase::kOpening) {
    std::cerr << "OPEN did not start an auction\n";
    return false;
  }
  // Coinbase + two OPEN outputs; the funding coin is gone.
  if (view.Size() != 3) {
    std::cerr << "Unexpected UTXO count " << view.Size() << "\n";
    return false;
  }
  return true;
}

bool TestCovenantFailureRejectsBlock() {
  ScopedDeterministicRng rng(0x1234ULL);
  auto ctx = BuildSpendContext();
  consensus::UTXOSet view;
  consensus::NameRegistry names;
  primitives::CTransaction first;
  primitives::CTransaction second;
  if (!BuildOpenSpend(ctx, 0x51, "example", &view, &first) ||
      !BuildOpenSpend(ctx, 0x52, "example", &view, &second)) {
    std::cerr << "Failed to build OPEN spends\n";
    return false;
  }
  // Two OPENs for one name in a block: the second sees OPENING.
  const std::uint32_t height = 3;
  const auto subsidy = consensus::CalculateBlockSubsidy(height, Regtest().halving_interval_blocks);
  return ExpectRejected(BlockWith(height, subsidy, {first, second}), height, view, names,
                        "tx invalid: PhaseMismatch", "double OPEN block");
}

bool TestStructuralChecks() {
  ScopedDeterministicRng rng(0x5678ULL);
  auto ctx = BuildSpendContext();
  consensus::UTXOSet view;
  consensus::NameRegistry names;
  primitives::CTransaction open;
  if (!BuildOpenSpend(ctx, 0x61, "example", &view, &open)) {
    std::cerr << "Failed to build OPEN spend\n";
    return false;
  }
  const std::uint32_t height = 4;
  const auto subsidy = consensus::CalculateBlockSubsidy(height, Regtest().halving_interval_blocks);

  auto bad_merkle = BlockWith(height, subsidy, {open});
  bad_merkle.header.merkle_root[0] ^= 0x01;
  if (!ExpectRejected(bad_merkle, height, view, names, "merkle root mismatch", "bad merkle root")) {
    return false;
  }

  auto stripped = BlockWith(height, subsidy, {open});
  stripped.transactions[1].vin[0].witness_stack.clear();
  stripped.header.merkle_root = primitives::ComputeMerkleRoot(stripped.transactions);
  if (!ExpectRejected(stripped, height, view, names, "witness root mismatch",
                      "witness stripped after commitment")) {
    return false;
  }

  if (!ExpectRejected(BlockWith(height, subsidy + 1, {}), height, view, names,
                      "coinbase exceeds subsidy + fees", "overpaying coinbase")) {
    return false;
  }

  auto wrong_height = BlockWith(height, subsidy, {});
  if (!ExpectRejected(wrong_height, height + 1, view, names, "lock_time must equal",
                      "coinbase for another height")) {
    return false;
  }

  auto covenant_coinbase = BlockWith(height, subsidy, {});
  covenant_coinbase.transactions[0].vout[0].covenant =
      consensus::EncodeCovenant(consensus::OpenCovenant{consensus::HashName("example"), "example"});
  FinalizeRoots(&covenant_coinbase);
  if (!ExpectRejected(covenant_coinbase, height, view, names, "cannot carry covenants",
                      "coinbase with covenant")) {
    return false;
  }

  if (!ExpectRejected(BlockWith(height, subsidy, {open, open}), height, view, names,
                      "bad-txns-inputs-missingorspent", "double spend within block")) {
    return false;
  }

  primitives::CBlock empty;
  return ExpectRejected(empty, height, view, names, "empty block", "empty block");
}

}  // namespace

int main() {
  if (!TestOpenBlockApplies()) {
    return EXIT_FAILURE;
  }
  if (!TestCovenantFailureRejectsBlock()) {
    return EXIT_FAILURE;
  }
  if (!TestStructuralChecks()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
