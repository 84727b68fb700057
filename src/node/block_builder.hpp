#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "node/chain_state.hpp"
#include "node/mempool.hpp"
#include "primitives/block.hpp"
#include "script/script.hpp"

namespace sealcoin::node {

struct BlockTemplate {
  primitives::CBlock block;
  std::uint32_t height{0};
  primitives::Amount fees{0};
};

// Builds the next block on the chain tip. Pool transactions are taken in
// arrival order and applied against working copies of the UTXO set and name
// registry; any that no longer validate are skipped. The coinbase pays
// subsidy + fees to |reward|.
bool BuildBlockTemplate(const ChainState& chain, const Mempool& pool,
                        const script::WitnessProgram& reward, BlockTemplate* out,
                        std::string* error);

using BlockConnectedFn = std::function<void(const primitives::CBlock& block, std::uint32_t height,
                                            const std::vector<primitives::Hash256>& evicted)>;

// Regtest mining: builds, connects and reports |count| blocks in sequence.
// Mined and evicted transactions leave the pool after each block.
bool GenerateBlocks(ChainState& chain, Mempool& pool, const script::WitnessProgram& reward,
                    std::uint32_t count, const BlockConnectedFn& on_connected,
                    std::vector<primitives::Hash256>* hashes, std::string* error);

}  // namespace sealcoin::node
