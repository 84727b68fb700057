#include "consensus/sighash.hpp"

#include <stdexcept>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealcoin::consensus {

namespace {

namespace ser = primitives::serialize;

constexpr std::string_view kSighashTag = "SEAL-SIGHASH-V1";

void AppendHash(std::vector<std::uint8_t>* out, const primitives::Hash256& hash) {
  out->insert(out->end(), hash.begin(), hash.end());
}

void AppendScript(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& script) {
  ser::WriteVarInt(out, script.size());
  out->insert(out->end(), script.begin(), script.end());
}

}  // namespace

SighashCache::SighashCache(const primitives::CTransaction& tx) : tx_(tx) {
  std::vector<std::uint8_t> prevouts;
  std::vector<std::uint8_t> sequences;
  prevouts.reserve(tx.vin.size() * 36);
  sequences.reserve(tx.vin.size() * 4);
  for (const auto& in : tx.vin) {
    AppendHash(&prevouts, in.prevout.txid);
    ser::WriteUint32(&prevouts, in.prevout.index);
    ser::WriteUint32(&sequences, in.sequence);
  }
  std::vector<std::uint8_t> outputs;
  for (const auto& out : tx.vout) {
    ser::WriteUint64(&outputs, out.value);
    AppendScript(&outputs, out.locking_descriptor);
    ser::SerializeCovenant(out.covenant, &outputs);
  }
  prevouts_ = crypto::Sha3_256(prevouts);
  sequences_ = crypto::Sha3_256(sequences);
  outputs_ = crypto::Sha3_256(outputs);
}

primitives::Hash256 SighashCache::Compute(std::size_t input_index,
                                          const Coin& spent_coin) const {
  if (input_index >= tx_.vin.size()) {
    throw std::out_of_range("sighash input index out of range");
  }
  const auto& in = tx_.vin[input_index];
  std::vector<std::uint8_t> preimage(kSighashTag.begin(), kSighashTag.end());
  ser::WriteUint32(&preimage, tx_.version);
  AppendHash(&preimage, prevouts_);
  AppendHash(&preimage, sequences_);
  AppendHash(&preimage, in.prevout.txid);
  ser::WriteUint32(&preimage, in.prevout.index);
  AppendScript(&preimage, spent_coin.out.locking_descriptor);
  ser::WriteUint64(&preimage, spent_coin.out.value);
  ser::SerializeCovenant(spent_coin.out.covenant, &preimage);
  ser::WriteUint32(&preimage, in.sequence);
  AppendHash(&preimage, outputs_);
  ser::WriteUint32(&preimage, tx_.lock_time);
  ser::WriteUint32(&preimage, kSighashAll);
  return crypto::Sha3_256(preimage);
}

primitives::Hash256 ComputeSighash(const primitives::CTransaction& tx, std::size_t input_index,
                                   const Coin& spent_coin) {
  return SighashCache(tx).Compute(input_index, spent_coin);
}

}  // namespace sealcoin::consensus
