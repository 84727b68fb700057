#pragma once

#include <cstdint>
#include <string>

#include "consensus/name_registry.hpp"
#include "consensus/params.hpp"
#include "consensus/utxo.hpp"
#include "primitives/amount.hpp"
#include "primitives/block.hpp"

namespace sealcoin::consensus {

// Validate a block's transactions and apply them to the provided UTXO view
// and name registry. Both are left partially updated on failure, so callers
// pass a scratch view holding at least the coins and names the block
// touches and fold it back only on success.
bool ValidateAndApplyBlock(const primitives::CBlock& block, std::uint32_t height,
                           const ChainParams& params, UTXOSet* view, NameRegistry* names,
                           std::string* error, primitives::Amount* fees_out = nullptr);

}  // namespace sealcoin::consensus
