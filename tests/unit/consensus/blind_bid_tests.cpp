#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "consensus/blind_bid.hpp"
#include "consensus/name_state.hpp"
#include "tests/unit/util/deterministic_rng.hpp"

using namespace sealcoin;

namespace {

using consensus::AuctionErrorKind;

primitives::COutPoint OutPoint(std::uint8_t fill) {
  primitives::COutPoint outpoint;
  outpoint.txid.fill(fill);
  outpoint.index = 0;
  return outpoint;
}

bool ExpectOpenFails(const consensus::BidCommitment& bid, const primitives::Hash256& stored,
                     AuctionErrorKind expected, const char* what) {
  consensus::AuctionError error;
  if (consensus::OpenBid(bid, stored, nullptr, &error)) {
    std::cerr << "blind_bid_tests: " << what << " opened\n";
    return false;
  }
  if (error.kind != expected) {
    std::cerr << "blind_bid_tests: " << what << " failed as "
              << consensus::AuctionErrorKindName(error.kind) << "\n";
    return false;
  }
  return true;
}

bool TestCommitmentBindsOpening() {
  consensus::BidCommitment bid;
  consensus::AuctionError error;
  {
    test::ScopedDeterministicRng rng(7);
    if (!consensus::CreateBid("example", 1000, 1500, &bid, &error)) {
      std::cerr << "blind_bid_tests: CreateBid failed: " << error.message << "\n";
      return false;
    }
  }
  if (bid.blind != 500 || bid.name_hash != consensus::HashName("example") ||
      bid.commitment != consensus::ComputeCommitment(bid.name_hash, 1000, bid.nonce)) {
    std::cerr << "blind_bid_tests: commitment fields inconsistent\n";
    return false;
  }
  consensus::OpenedBid opened;
  if (!consensus::OpenBid(bid, bid.commitment, &opened, &error) || opened.value != 1000 ||
      opened.blind != 500) {
    std::cerr << "blind_bid_tests: honest opening rejected\n";
    return false;
  }

  auto wrong_value = bid;
  wrong_value.value = 1001;
  auto wrong_nonce = bid;
  wrong_nonce.nonce[31] ^= 0x01;
  auto wrong_name = bid;
  wrong_name.name_hash = consensus::HashName("examplf");
  return ExpectOpenFails(wrong_value, bid.commitment, AuctionErrorKind::kCommitmentMismatch,
                         "altered value") &&
         ExpectOpenFails(wrong_nonce, bid.commitment, AuctionErrorKind::kCommitmentMismatch,
                         "altered nonce") &&
         ExpectOpenFails(wrong_name, bid.commitment, AuctionErrorKind::kCommitmentMismatch,
                         "altered name");
}

bool TestNoncesAreFresh() {
  consensus::BidCommitment a;
  consensus::BidCommitment b;
  if (!consensus::CreateBid("example", 10, 10, &a, nullptr) ||
      !consensus::CreateBid("example", 10, 10, &b, nullptr)) {
    std::cerr << "blind_bid_tests: CreateBid failed\n";
    return false;
  }
  if (a.nonce == b.nonce || a.commitment == b.commitment) {
    std::cerr << "blind_bid_tests: identical bids must not share a commitment\n";
    return false;
  }
  return true;
}

bool TestCreateBidRejects() {
  consensus::BidCommitment bid;
  consensus::AuctionError error;
  if (consensus::CreateBid("example", 2000, 1500, &bid, &error) ||
      error.kind != AuctionErrorKind::kInvalidBidValue) {
    std::cerr << "blind_bid_tests: lockup below value must be rejected\n";
    return false;
  }
  error = {};
  if (consensus::CreateBid("Not-Valid", 1, 1, &bid, &error) ||
      error.kind != AuctionErrorKind::kInvalidName) {
    std::cerr << "blind_bid_tests: invalid name must be rejected\n";
    return false;
  }
  return true;
}

bool TestSecondPriceSettlement() {
  const auto outcome = consensus::SettleAuction({{OutPoint(0x01), 100'000},
                                                 {OutPoint(0x02), 50'000}});
  if (!outcome.has_winner || outcome.winner_index != 0 || outcome.winner != OutPoint(0x01) ||
      outcome.highest != 100'000 || outcome.price != 50'000) {
    std::cerr << "blind_bid_tests: winner pays the second price\n";
    return false;
  }
  if (outcome.refunds != std::vector<primitives::Amount>{50'000, 50'000}) {
    std::cerr << "blind_bid_tests: refunds should be excess and full loser value\n";
    return false;
  }

  const auto single = consensus::SettleAuction({{OutPoint(0x03), 7}});
  if (!single.has_winner || single.price != 0 || single.refunds.front() != 7) {
    std::cerr << "blind_bid_tests: a lone bid wins for free\n";
    return false;
  }

  const auto tie = consensus::SettleAuction({{OutPoint(0x04), 300}, {OutPoint(0x05), 300}});
  if (tie.winner_index != 0 || tie.price != 300 ||
      tie.refunds != std::vector<primitives::Amount>{0, 300}) {
    std::cerr << "blind_bid_tests: ties go to the earlier reveal at full price\n";
    return false;
  }

  const auto late_winner = consensus::SettleAuction(
      {{OutPoint(0x06), 10}, {OutPoint(0x07), 40}, {OutPoint(0x08), 25}});
  if (late_winner.winner_index != 1 || late_winner.price != 25 ||
      late_winner.refunds != std::vector<primitives::Amount>{10, 15, 25}) {
    std::cerr << "blind_bid_tests: price must track the runner-up across reveals\n";
    return false;
  }

  if (consensus::SettleAuction({}).has_winner) {
    std::cerr << "blind_bid_tests: no reveals means no winner\n";
    return false;
  }
  if (consensus::ExcessOf(90, 60) != 30 || consensus::ExcessOf(5, 9) != 0) {
    std::cerr << "blind_bid_tests: ExcessOf mismatch\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestCommitmentBindsOpening()) return EXIT_FAILURE;
  if (!TestNoncesAreFresh()) return EXIT_FAILURE;
  if (!TestCreateBidRejects()) return EXIT_FAILURE;
  if (!TestSecondPriceSettlement()) return EXIT_FAILURE;
  return EXIT_SUCCESS;
}
