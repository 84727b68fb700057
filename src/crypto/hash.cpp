#include "crypto/hash.hpp"

#include <oqs/sha3.h>

namespace sealcoin::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Sha3_256Hash DoubleSha3_256(std::span<const std::uint8_t> data) {
  const auto first = Sha3_256(data);
  return Sha3_256(std::span<const std::uint8_t>(first.data(), first.size()));
}

std::vector<std::uint8_t> Sha3_256Vector(std::span<const std::uint8_t> data) {
  const auto hash = Sha3_256(data);
  return std::vector<std::uint8_t>(hash.begin(), hash.end());
}

}  // namespace sealcoin::crypto
