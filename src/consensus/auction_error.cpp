#include "consensus/auction_error.hpp"

namespace sealcoin::consensus {

std::string_view AuctionErrorKindName(AuctionErrorKind kind) {
  switch (kind) {
    case AuctionErrorKind::kNone:
      return "none";
    case AuctionErrorKind::kPhaseMismatch:
      return "PhaseMismatch";
    case AuctionErrorKind::kInvalidTransition:
      return "InvalidTransition";
    case AuctionErrorKind::kCommitmentMismatch:
      return "CommitmentMismatch";
    case AuctionErrorKind::kOwnershipViolation:
      return "OwnershipViolation";
    case AuctionErrorKind::kInsufficientFunds:
      return "InsufficientFunds";
    case AuctionErrorKind::kInvalidBidValue:
      return "InvalidBidValue";
    case AuctionErrorKind::kInvalidName:
      return "InvalidName";
    case AuctionErrorKind::kNotFound:
      return "NotFound";
    case AuctionErrorKind::kRejected:
      return "Rejected";
  }
  return "unknown";
}

bool Fail(AuctionError* error, AuctionErrorKind kind, std::string message) {
  if (error) {
    error->kind = kind;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace sealcoin::consensus
