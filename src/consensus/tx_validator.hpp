#pragma once

#include <cstdint>
#include <string>

#include "consensus/utxo.hpp"
#include "primitives/amount.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::consensus {

// Context-free shape checks: inputs and outputs present, output values in
// range, no outpoint spent twice. |error| receives a bad-txns-* reason.
bool CheckTransactionShape(const primitives::CTransaction& tx, std::string* error);

// Full check of a non-coinbase transaction against |view|, which must hold
// every coin it spends. |spending_height| is the height of the block that
// would include it. Covenant rules are ApplyTransactionCovenants' job.
// On success |fee| receives inputs minus outputs.
bool ValidateTransaction(const primitives::CTransaction& tx, const UTXOSet& view,
                         std::uint32_t spending_height, std::uint32_t coinbase_maturity,
                         primitives::Amount* fee, std::string* error);

}  // namespace sealcoin::consensus
