#include "consensus/tx_validator.hpp"

#include <span>
#include <string>
#include <unordered_set>
#include <utility>

#include "consensus/sighash.hpp"
#include "script/p2qh.hpp"

namespace sealcoin::consensus {

namespace {

bool Reject(std::string* error, std::string reason) {
  if (error) *error = std::move(reason);
  return false;
}

std::string InputReason(const char* reason, std::size_t index) {
  return std::string(reason) + " (input " + std::to_string(index) + ")";
}

}  // namespace

bool CheckTransactionShape(const primitives::CTransaction& tx, std::string* error) {
  if (tx.vin.empty()) return Reject(error, "bad-txns-vin-empty");
  if (tx.vout.empty()) return Reject(error, "bad-txns-vout-empty");

  primitives::Amount total = 0;
  for (const auto& out : tx.vout) {
    if (!primitives::MoneyRange(out.value)) return Reject(error, "bad-txns-vout-toolarge");
    if (!primitives::CheckedAdd(total, out.value, &total)) {
      return Reject(error, "bad-txns-txouttotal-toolarge");
    }
  }

  std::unordered_set<primitives::COutPoint, OutPointHasher> spent;
  spent.reserve(tx.vin.size());
  for (const auto& in : tx.vin) {
    if (!spent.insert(in.prevout).second) return Reject(error, "bad-txns-inputs-duplicate");
  }
  return true;
}

bool ValidateTransaction(const primitives::CTransaction& tx, const UTXOSet& view,
                         std::uint32_t spending_height, std::uint32_t coinbase_maturity,
                         primitives::Amount* fee, std::string* error) {
  if (tx.IsCoinbase()) return Reject(error, "bad-txns-coinbase-position");
  if (!CheckTransactionShape(tx, error)) return false;

  const SighashCache sighashes(tx);
  primitives::Amount value_in = 0;
  for (std::size_t i = 0; i < tx.vin.size(); ++i) {
    const auto& in = tx.vin[i];
    const Coin* coin = view.GetCoin(in.prevout);
    if (coin == nullptr) return Reject(error, InputReason("bad-txns-inputs-missingorspent", i));
    if (coin->coinbase &&
        static_cast<std::uint64_t>(spending_height) <
            static_cast<std::uint64_t>(coin->height) + coinbase_maturity) {
      return Reject(error, InputReason("bad-txns-premature-spend-of-coinbase", i));
    }
    if (!primitives::CheckedAdd(value_in, coin->out.value, &value_in)) {
      return Reject(error, "bad-txns-inputvalues-outofrange");
    }

    const auto digest = sighashes.Compute(i, *coin);
    std::string script_error;
    if (!script::VerifyP2QHWitness(script::ScriptPubKey{coin->out.locking_descriptor},
                                   in.witness_stack,
                                   std::span<const std::uint8_t>(digest.data(), digest.size()),
                                   &script_error)) {
      return Reject(error, InputReason("bad-witness", i) + ": " + script_error);
    }
  }

  primitives::Amount value_out = 0;
  for (const auto& out : tx.vout) {
    value_out += out.value;
  }
  if (value_out > value_in) return Reject(error, "bad-txns-in-belowout");
  if (fee) *fee = value_in - value_out;
  return true;
}

}  // namespace sealcoin::consensus
