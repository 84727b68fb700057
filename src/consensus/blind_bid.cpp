#include "consensus/blind_bid.hpp"

#include <span>
#include <string>

#include "consensus/name_state.hpp"
#include "crypto/deterministic_rng.hpp"
#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealcoin::consensus {

namespace {

constexpr std::string_view kBlindTag = "SEAL-BLIND-V1";

}  // namespace

primitives::Hash256 ComputeCommitment(const primitives::Hash256& name_hash,
                                      primitives::Amount value,
                                      const primitives::Hash256& nonce) {
  std::vector<std::uint8_t> preimage;
  preimage.reserve(kBlindTag.size() + name_hash.size() + 8 + nonce.size());
  preimage.insert(preimage.end(), kBlindTag.begin(), kBlindTag.end());
  preimage.insert(preimage.end(), name_hash.begin(), name_hash.end());
  primitives::serialize::WriteUint64(&preimage, value);
  preimage.insert(preimage.end(), nonce.begin(), nonce.end());
  return crypto::Sha3_256(preimage);
}

bool CreateBid(std::string_view name, primitives::Amount value, primitives::Amount lockup,
               BidCommitment* out, AuctionError* error) {
  primitives::Hash256 nonce{};
  crypto::FillRandomBytes(nonce);
  return CreateBidWithNonce(name, value, lockup, nonce, out, error);
}

bool CreateBidWithNonce(std::string_view name, primitives::Amount value,
                        primitives::Amount lockup, const primitives::Hash256& nonce,
                        BidCommitment* out, AuctionError* error) {
  if (!IsValidName(name)) {
    return Fail(error, AuctionErrorKind::kInvalidName,
                "invalid name '" + std::string(name) + "'");
  }
  if (!primitives::MoneyRange(value) || !primitives::MoneyRange(lockup)) {
    return Fail(error, AuctionErrorKind::kInvalidBidValue, "bid amount out of range");
  }
  if (lockup < value) {
    return Fail(error, AuctionErrorKind::kInvalidBidValue,
                "lockup " + std::to_string(lockup) + " is below bid value " +
                    std::to_string(value) + " for '" + std::string(name) + "'");
  }
  BidCommitment bid;
  bid.name_hash = HashName(name);
  bid.value = value;
  bid.lockup = lockup;
  bid.blind = lockup - value;
  bid.nonce = nonce;
  bid.commitment = ComputeCommitment(bid.name_hash, value, nonce);
  *out = bid;
  return true;
}

bool OpenBid(const BidCommitment& bid, const primitives::Hash256& stored_commitment,
             OpenedBid* out, AuctionError* error) {
  const auto recomputed = ComputeCommitment(bid.name_hash, bid.value, bid.nonce);
  if (recomputed != stored_commitment) {
    return Fail(error, AuctionErrorKind::kCommitmentMismatch,
                "revealed value and nonce do not match the bid commitment");
  }
  if (bid.lockup < bid.value) {
    return Fail(error, AuctionErrorKind::kInvalidBidValue, "revealed value exceeds lockup");
  }
  if (out) {
    out->value = bid.value;
    out->blind = bid.lockup - bid.value;
  }
  return true;
}

AuctionOutcome SettleAuction(const std::vector<RevealedBid>& reveals) {
  AuctionOutcome outcome;
  outcome.refunds.reserve(reveals.size());
  NameState scratch;
  for (std::size_t i = 0; i < reveals.size(); ++i) {
    if (!scratch.HasOwner() || reveals[i].value > scratch.highest) {
      outcome.winner_index = i;
    }
    RecordReveal(&scratch, reveals[i].outpoint, reveals[i].value);
    outcome.refunds.push_back(reveals[i].value);
  }
  if (reveals.empty()) {
    return outcome;
  }
  outcome.has_winner = true;
  outcome.winner = scratch.owner;
  outcome.highest = scratch.highest;
  outcome.price = scratch.value;
  outcome.refunds[outcome.winner_index] = ExcessOf(scratch.highest, scratch.value);
  return outcome;
}

primitives::Amount ExcessOf(primitives::Amount bid_value, primitives::Amount second_highest) {
  return bid_value > second_highest ? bid_value - second_highest : 0;
}

}  // namespace sealcoin::consensus
