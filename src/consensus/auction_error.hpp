#pragma once

#include <string>
#include <string_view>

namespace sealcoin::consensus {

enum class AuctionErrorKind {
  kNone,
  kPhaseMismatch,
  kInvalidTransition,
  kCommitmentMismatch,
  kOwnershipViolation,
  kInsufficientFunds,
  kInvalidBidValue,
  kInvalidName,
  kNotFound,
  kRejected,
};

// Stable failure kind plus a human readable context message naming the
// name and/or account involved.
struct AuctionError {
  AuctionErrorKind kind{AuctionErrorKind::kNone};
  std::string message;

  [[nodiscard]] bool ok() const noexcept { return kind == AuctionErrorKind::kNone; }
};

std::string_view AuctionErrorKindName(AuctionErrorKind kind);

// Fills |error| (when non-null) and returns false so call sites can write
// `return Fail(error, kind, "...")`.
bool Fail(AuctionError* error, AuctionErrorKind kind, std::string message);

}  // namespace sealcoin::consensus
