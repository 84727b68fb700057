#pragma once

#include <cstdint>

namespace sealcoin::primitives {

using Amount = std::uint64_t;  // Amounts denominated in grains (1e-6 SEAL).

inline constexpr Amount kGrainsPerSEAL = 1'000'000ULL;
inline constexpr Amount kMaxMoney = 2'040'000'000ULL * kGrainsPerSEAL;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

inline bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (a > kMaxMoney - b) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

inline bool CheckedSub(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (b > a) {
    return false;
  }
  if (out) {
    *out = a - b;
  }
  return true;
}

inline bool CheckedMul(Amount a, std::uint64_t b, Amount* out) noexcept {
  if (!MoneyRange(a)) {
    return false;
  }
  if (b == 0) {
    if (out) {
      *out = 0;
    }
    return true;
  }
  if (a > kMaxMoney / b) {
    return false;
  }
  if (out) {
    *out = static_cast<Amount>(a * b);
  }
  return true;
}

}  // namespace sealcoin::primitives
