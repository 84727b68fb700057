#pragma once

#include <cstddef>
#include <cstdint>

#include "consensus/utxo.hpp"
#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::consensus {

// Every input signs the whole transaction. Kept in the preimage so a later
// single-output mode cannot collide with today's digests.
inline constexpr std::uint32_t kSighashAll = 1;

// Per-transaction digests shared by all of its inputs. The transaction must
// outlive the cache and stay unmodified while it is in use.
class SighashCache {
 public:
  explicit SighashCache(const primitives::CTransaction& tx);

  // Digest signed by |input_index|. Commits to the spent coin's script,
  // value and covenant so a signature cannot be replayed against a
  // different name state. Throws std::out_of_range on a bad index.
  primitives::Hash256 Compute(std::size_t input_index, const Coin& spent_coin) const;

 private:
  const primitives::CTransaction& tx_;
  primitives::Hash256 prevouts_{};
  primitives::Hash256 sequences_{};
  primitives::Hash256 outputs_{};
};

primitives::Hash256 ComputeSighash(const primitives::CTransaction& tx, std::size_t input_index,
                                   const Coin& spent_coin);

}  // namespace sealcoin::consensus
