#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "consensus/params.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::consensus {

enum class NamePhase {
  kOpening,
  kBidding,
  kReveal,
  kClosed,
  kAvailable,
};

std::string_view NamePhaseName(NamePhase phase);

struct NameState {
  std::string name;
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  primitives::Amount highest{0};
  // Second-highest revealed bid: the price the winner pays.
  primitives::Amount value{0};
  primitives::COutPoint owner{primitives::COutPoint::Null()};
  bool registered{false};
  std::uint32_t renewal_height{0};
  std::uint32_t transfer_lockup{0};
  std::vector<std::uint8_t> data;

  [[nodiscard]] bool HasOwner() const noexcept { return !owner.IsNull(); }
  bool operator==(const NameState& other) const = default;
};

// 1..max_name_size characters of [a-z0-9-_], not starting or ending in
// '-' or '_'.
bool IsValidName(std::string_view name, std::uint32_t max_name_size = 63);
primitives::Hash256 HashName(std::string_view name);

std::uint32_t BiddingStart(const NameState& state, const NameParams& params);
std::uint32_t RevealStart(const NameState& state, const NameParams& params);
std::uint32_t RevealEnd(const NameState& state, const NameParams& params);

bool IsExpired(const NameState& state, std::uint32_t height, const NameParams& params);

// Pure function of (state, height, params). A null state is AVAILABLE.
NamePhase PhaseOf(const NameState* state, std::uint32_t height, const NameParams& params);

// Applies one revealed bid in chain order: a strictly greater value takes
// ownership, otherwise it may raise the second price. Equal values never
// displace an earlier reveal.
void RecordReveal(NameState* state, const primitives::COutPoint& outpoint,
                  primitives::Amount value);

}  // namespace sealcoin::consensus
