#pragma once

#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::primitives {

struct CBlockHeader {
  std::uint32_t version{1};
  Hash256 previous_block_hash{};
  Hash256 merkle_root{};
  Hash256 witness_root{};
  std::uint64_t timestamp{0};
  std::uint32_t nonce{0};
};

struct CBlock {
  CBlockHeader header{};
  std::vector<CTransaction> transactions{};
};

}  // namespace sealcoin::primitives
