#pragma once

#include "primitives/block.hpp"

namespace sealcoin::consensus {

primitives::Hash256 ComputeBlockHash(const primitives::CBlockHeader& header);

}  // namespace sealcoin::consensus
