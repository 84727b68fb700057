#include "consensus/monetary.hpp"

namespace sealcoin::consensus {

primitives::Amount CalculateBlockSubsidy(std::uint32_t height, std::uint32_t halving_interval) {
  if (halving_interval == 0) {
    return kInitialSubsidy;
  }
  const auto halvings = height / halving_interval;
  if (halvings >= 64) {
    return 0;
  }
  return kInitialSubsidy >> halvings;
}

}  // namespace sealcoin::consensus
