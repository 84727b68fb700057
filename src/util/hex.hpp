#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealcoin::util {

std::string HexEncode(std::span<const std::uint8_t> data);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Decodes exactly 32 bytes (txids, name hashes, commitments).
bool HexDecode32(std::string_view hex, std::array<std::uint8_t, 32>* out);

}  // namespace sealcoin::util
