#include "consensus/block_validator.hpp"

#include <unordered_set>
#include <vector>

#include "consensus/covenant_rules.hpp"
#include "consensus/monetary.hpp"
#include "consensus/tx_validator.hpp"
#include "primitives/merkle.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"

namespace sealcoin::consensus {

namespace {

bool SumOutputsChecked(const primitives::CTransaction& tx, primitives::Amount* total) {
  if (!total) return false;
  primitives::Amount sum = 0;
  for (const auto& out : tx.vout) {
    if (!primitives::MoneyRange(out.value)) {
      return false;
    }
    primitives::Amount next = 0;
    if (!primitives::CheckedAdd(sum, out.value, &next)) {
      return false;
    }
    sum = next;
  }
  *total = sum;
  return true;
}

bool AddOutputs(const primitives::CTransaction& tx, const primitives::Hash256& txid,
                std::uint32_t height, bool coinbase, UTXOSet* view, std::string* error) {
  for (std::size_t out_index = 0; out_index < tx.vout.size(); ++out_index) {
    primitives::COutPoint outpoint;
    outpoint.txid = txid;
    outpoint.index = static_cast<std::uint32_t>(out_index);
    if (view->GetCoin(outpoint) != nullptr) {
      if (error) *error = "txid collision would overwrite an existing UTXO";
      return false;
    }
    Coin coin;
    coin.out = tx.vout[out_index];
    coin.height = height;
    coin.coinbase = coinbase;
    view->AddCoin(outpoint, std::move(coin));
  }
  return true;
}

}  // namespace

bool ValidateAndApplyBlock(const primitives::CBlock& block, std::uint32_t height,
                           const ChainParams& params, UTXOSet* view, NameRegistry* names,
                           std::string* error, primitives::Amount* fees_out) {
  if (!view || !names) {
    if (error) *error = "invalid validation state";
    return false;
  }
  if (block.transactions.empty()) {
    if (error) *error = "empty block";
    return false;
  }
  if (!block.transactions.front().IsCoinbase()) {
    if (error) *error = "missing coinbase";
    return false;
  }

  const auto merkle = primitives::ComputeMerkleRoot(block.transactions);
  if (merkle != block.header.merkle_root) {
    if (error) *error = "merkle root mismatch";
    return false;
  }
  const auto witness_root = primitives::ComputeWitnessMerkleRoot(block.transactions);
  if (witness_root != block.header.witness_root) {
    if (error) *error = "witness root mismatch";
    return false;
  }

  if (params.max_block_serialized_bytes != 0) {
    std::vector<std::uint8_t> raw;
    primitives::serialize::SerializeBlock(block, &raw);
    if (raw.size() > params.max_block_serialized_bytes) {
      if (error) {
        *error = "block exceeds max serialized size (" + std::to_string(raw.size()) + " > " +
                 std::to_string(params.max_block_serialized_bytes) + ")";
      }
      return false;
    }
  }

  const auto& coinbase = block.transactions.front();
  if (coinbase.vin.front().sequence != 0xFFFFFFFFu) {
    if (error) *error = "coinbase sequence must be final";
    return false;
  }
  // Height commitment: keeps coinbase txids unique across heights.
  if (coinbase.lock_time != height) {
    if (error) *error = "coinbase lock_time must equal the block height";
    return false;
  }
  for (const auto& out : coinbase.vout) {
    if (!out.covenant.IsNone()) {
      if (error) *error = "coinbase outputs cannot carry covenants";
      return false;
    }
  }

  primitives::Amount fees = 0;
  std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> seen_txids;
  seen_txids.reserve(block.transactions.size());

  for (std::size_t tx_index = 1; tx_index < block.transactions.size(); ++tx_index) {
    const auto& tx = block.transactions[tx_index];
    if (tx.IsCoinbase()) {
      if (error) *error = "additional coinbase";
      return false;
    }
    std::string tx_error;
    primitives::Amount fee = 0;
    if (!ValidateTransaction(tx, *view, height, params.coinbase_maturity, &fee, &tx_error)) {
      if (error) *error = "tx invalid: " + tx_error;
      return false;
    }
    const auto txid = primitives::ComputeTxId(tx);
    if (!seen_txids.insert(txid).second) {
      if (error) *error = "duplicate txid within block";
      return false;
    }
    AuctionError auction_error;
    if (!ApplyTransactionCovenants(tx, txid, *view, height, params.names, names,
                                   &auction_error)) {
      if (error) {
        *error = "tx invalid: " + std::string(AuctionErrorKindName(auction_error.kind)) + ": " +
                 auction_error.message;
      }
      return false;
    }
    primitives::Amount next_fees = 0;
    if (!primitives::CheckedAdd(fees, fee, &next_fees)) {
      if (error) *error = "fee total out of range";
      return false;
    }
    fees = next_fees;
    for (const auto& in : tx.vin) {
      view->SpendCoin(in.prevout);
    }
    if (!AddOutputs(tx, txid, height, false, view, error)) {
      return false;
    }
  }

  primitives::Amount coinbase_total = 0;
  if (!SumOutputsChecked(coinbase, &coinbase_total)) {
    if (error) *error = "coinbase output out of range";
    return false;
  }
  const primitives::Amount subsidy =
      CalculateBlockSubsidy(height, params.halving_interval_blocks);
  primitives::Amount subsidy_plus_fees = 0;
  if (!primitives::CheckedAdd(subsidy, fees, &subsidy_plus_fees)) {
    if (error) *error = "subsidy+fees out of range";
    return false;
  }
  if (coinbase_total > subsidy_plus_fees) {
    if (error) *error = "coinbase exceeds subsidy + fees";
    return false;
  }
  const auto coinbase_id = primitives::ComputeTxId(coinbase);
  if (!seen_txids.insert(coinbase_id).second) {
    if (error) *error = "duplicate txid within block (coinbase)";
    return false;
  }
  if (!AddOutputs(coinbase, coinbase_id, height, true, view, error)) {
    return false;
  }
  if (fees_out) *fees_out = fees;
  return true;
}

}  // namespace sealcoin::consensus
