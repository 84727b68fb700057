#pragma once

#include <cstdint>

#include "primitives/amount.hpp"

namespace sealcoin::consensus {

inline constexpr std::uint32_t kTargetBlockSpacingSeconds = 600;
inline constexpr primitives::Amount kInitialSubsidy = 2'000ULL * primitives::kGrainsPerSEAL;

// Subsidy halves every |halving_interval| blocks; zero disables halving.
primitives::Amount CalculateBlockSubsidy(std::uint32_t height, std::uint32_t halving_interval);

}  // namespace sealcoin::consensus
