#pragma once

#include "primitives/block.hpp"

namespace sealcoin::primitives {

// The txid excludes witness data so signatures never change an outpoint.
Hash256 ComputeTxId(const CTransaction& tx);
Hash256 ComputeWTxId(const CTransaction& tx);

}  // namespace sealcoin::primitives
