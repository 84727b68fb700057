#pragma once

#include <cstdint>

#include "consensus/auction_error.hpp"
#include "consensus/covenant.hpp"
#include "consensus/name_registry.hpp"
#include "consensus/name_state.hpp"
#include "consensus/params.hpp"
#include "consensus/utxo.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::consensus {

// Everything a single covenant output is judged against besides the prior
// name state.
struct CovenantContext {
  std::uint32_t height{0};
  const NameParams* params{nullptr};
  // The output carrying the covenant.
  primitives::COutPoint outpoint{};
  primitives::Amount value{0};
  // Input at the same index as the output, when one exists.
  const primitives::COutPoint* spent_outpoint{nullptr};
  const Coin* spent_coin{nullptr};
};

// Checks one covenant against the prior state without side effects.
bool ValidateCovenant(const Covenant& covenant, const NameState* prior,
                      const CovenantContext& context, AuctionError* error);

// Validates and, on success, writes the successor state to |next|. For
// covenants that do not move the state (BID, REDEEM) |next| is a copy of
// |prior|.
bool ApplyCovenant(const Covenant& covenant, const NameState* prior,
                   const CovenantContext& context, NameState* next, AuctionError* error);

// Applies every covenant of |tx| in output order against |names|, after
// checking that each spent locked covenant output is followed by an allowed
// successor at the same index. On failure |names| may hold a partial update,
// so callers pass a scratch copy.
bool ApplyTransactionCovenants(const primitives::CTransaction& tx,
                               const primitives::Hash256& txid, const UTXOSet& view,
                               std::uint32_t height, const NameParams& params,
                               NameRegistry* names, AuctionError* error);

}  // namespace sealcoin::consensus
