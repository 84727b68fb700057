#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace sealcoin::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);
Sha3_256Hash DoubleSha3_256(std::span<const std::uint8_t> data);

std::vector<std::uint8_t> Sha3_256Vector(std::span<const std::uint8_t> data);

}  // namespace sealcoin::crypto
