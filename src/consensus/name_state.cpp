#include "consensus/name_state.hpp"

#include <span>

#include "crypto/hash.hpp"

namespace sealcoin::consensus {

namespace {

bool IsNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

}  // namespace

std::string_view NamePhaseName(NamePhase phase) {
  switch (phase) {
    case NamePhase::kOpening:
      return "OPENING";
    case NamePhase::kBidding:
      return "BIDDING";
    case NamePhase::kReveal:
      return "REVEAL";
    case NamePhase::kClosed:
      return "CLOSED";
    case NamePhase::kAvailable:
      return "AVAILABLE";
  }
  return "UNKNOWN";
}

bool IsValidName(std::string_view name, std::uint32_t max_name_size) {
  if (name.empty() || name.size() > max_name_size) {
    return false;
  }
  for (char c : name) {
    if (!IsNameChar(c)) {
      return false;
    }
  }
  const char first = name.front();
  const char last = name.back();
  return first != '-' && first != '_' && last != '-' && last != '_';
}

primitives::Hash256 HashName(std::string_view name) {
  return crypto::Sha3_256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(name.data()), name.size()));
}

std::uint32_t BiddingStart(const NameState& state, const NameParams& params) {
  return state.open_height + params.OpenPeriod();
}

std::uint32_t RevealStart(const NameState& state, const NameParams& params) {
  return BiddingStart(state, params) + params.bidding_period;
}

std::uint32_t RevealEnd(const NameState& state, const NameParams& params) {
  return RevealStart(state, params) + params.reveal_period;
}

bool IsExpired(const NameState& state, std::uint32_t height, const NameParams& params) {
  if (height < RevealEnd(state, params)) {
    return false;
  }
  if (!state.HasOwner()) {
    return true;
  }
  return static_cast<std::uint64_t>(height) >=
         static_cast<std::uint64_t>(state.renewal_height) + params.renewal_window;
}

NamePhase PhaseOf(const NameState* state, std::uint32_t height, const NameParams& params) {
  if (state == nullptr) {
    return NamePhase::kAvailable;
  }
  if (height < BiddingStart(*state, params)) {
    return NamePhase::kOpening;
  }
  if (height < RevealStart(*state, params)) {
    return NamePhase::kBidding;
  }
  if (height < RevealEnd(*state, params)) {
    return NamePhase::kReveal;
  }
  if (IsExpired(*state, height, params)) {
    return NamePhase::kAvailable;
  }
  return NamePhase::kClosed;
}

void RecordReveal(NameState* state, const primitives::COutPoint& outpoint,
                  primitives::Amount value) {
  if (!state->HasOwner() || value > state->highest) {
    state->value = state->highest;
    state->highest = value;
    state->owner = outpoint;
  } else if (value > state->value) {
    state->value = value;
  }
}

}  // namespace sealcoin::consensus
