#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealcoin::util {

// Overwrite memory through a volatile pointer so the store is not elided.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::vector<std::uint8_t>& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::vector<std::uint8_t>().swap(data);
}

template <typename T, std::size_t N>
inline void SecureWipe(std::array<T, N>& data) noexcept {
  SecureWipe(data.data(), data.size() * sizeof(T));
}

}  // namespace sealcoin::util
