#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "consensus/auction_error.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::consensus {

// A sealed bid. Only |lockup| and |commitment| go on chain with the BID;
// |value| and |nonce| stay in the bidder's wallet until REVEAL.
struct BidCommitment {
  primitives::Hash256 name_hash{};
  primitives::Amount value{0};
  primitives::Amount lockup{0};
  primitives::Amount blind{0};  // lockup - value
  primitives::Hash256 nonce{};
  primitives::Hash256 commitment{};
};

struct OpenedBid {
  primitives::Amount value{0};
  primitives::Amount blind{0};
};

// H3("SEAL-BLIND-V1" || name_hash || LE64(value) || nonce)
primitives::Hash256 ComputeCommitment(const primitives::Hash256& name_hash,
                                      primitives::Amount value,
                                      const primitives::Hash256& nonce);

// Draws a fresh 32-byte blinding nonce.
bool CreateBid(std::string_view name, primitives::Amount value, primitives::Amount lockup,
               BidCommitment* out, AuctionError* error);
bool CreateBidWithNonce(std::string_view name, primitives::Amount value,
                        primitives::Amount lockup, const primitives::Hash256& nonce,
                        BidCommitment* out, AuctionError* error);

// Recomputes the commitment from the bid's opening data and compares it to
// the commitment stored in the BID covenant.
bool OpenBid(const BidCommitment& bid, const primitives::Hash256& stored_commitment,
             OpenedBid* out, AuctionError* error);

struct RevealedBid {
  primitives::COutPoint outpoint{};
  primitives::Amount value{0};
};

struct AuctionOutcome {
  bool has_winner{false};
  std::size_t winner_index{0};
  primitives::COutPoint winner{};
  primitives::Amount highest{0};
  primitives::Amount price{0};
  // Refundable amount per reveal, parallel to the input: the full value for
  // losers and value - price for the winner.
  std::vector<primitives::Amount> refunds;
};

// Second-price settlement over reveals in chain order.
AuctionOutcome SettleAuction(const std::vector<RevealedBid>& reveals);

primitives::Amount ExcessOf(primitives::Amount bid_value, primitives::Amount second_highest);

}  // namespace sealcoin::consensus
