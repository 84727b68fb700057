#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace sealcoin::primitives {

using Hash256 = std::array<std::uint8_t, 32>;

// Hash256 values are already uniformly distributed; the first machine word
// is enough for unordered containers.
struct Hash256Hasher {
  std::size_t operator()(const Hash256& hash) const noexcept {
    std::size_t out = 0;
    std::memcpy(&out, hash.data(), sizeof(out));
    return out;
  }
};

}  // namespace sealcoin::primitives
