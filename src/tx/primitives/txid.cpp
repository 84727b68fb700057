#include "primitives/txid.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealcoin::primitives {

Hash256 ComputeTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/false);
  return crypto::Sha3_256(buffer);
}

Hash256 ComputeWTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/true);
  return crypto::Sha3_256(buffer);
}

}  // namespace sealcoin::primitives
