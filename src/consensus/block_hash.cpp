#include "consensus/block_hash.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealcoin::consensus {

primitives::Hash256 ComputeBlockHash(const primitives::CBlockHeader& header) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(112);
  primitives::serialize::SerializeBlockHeader(header, &buffer);
  return crypto::DoubleSha3_256(buffer);
}

}  // namespace sealcoin::consensus
