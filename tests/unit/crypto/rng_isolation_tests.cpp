#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#include "consensus/blind_bid.hpp"
#include "crypto/deterministic_rng.hpp"
#include "crypto/account_key.hpp"
#include "primitives/amount.hpp"

namespace {

using namespace sealcoin;

std::array<std::uint8_t, 32> Seed(const char* label) {
  std::array<std::uint8_t, 32> seed{};
  std::memcpy(seed.data(), label, std::min<std::size_t>(std::strlen(label), seed.size()));
  return seed;
}

std::vector<std::uint8_t> KeyFingerprint(const crypto::AccountKey& key) {
  return {key.PublicKey().begin(), key.PublicKey().end()};
}

primitives::Hash256 BidNonce() {
  consensus::BidCommitment bid;
  consensus::AuctionError error;
  if (!consensus::CreateBid("example", primitives::kGrainsPerSEAL, primitives::kGrainsPerSEAL,
                            &bid, &error)) {
    std::cerr << "rng_isolation_tests: CreateBid failed: " << error.message << "\n";
    return {};
  }
  return bid.nonce;
}

bool TestSeedReplaysKeysAndNonces() {
  const auto seed = Seed("SEAL-WALLET-RNG-SEED");
  std::vector<std::uint8_t> pk1;
  std::vector<std::uint8_t> pk2;
  primitives::Hash256 nonce1{};
  primitives::Hash256 nonce2{};
  {
    crypto::DeterministicOqsRng rng(seed);
    pk1 = KeyFingerprint(crypto::AccountKey::Generate());
    nonce1 = BidNonce();
  }
  {
    crypto::DeterministicOqsRng rng(seed);
    pk2 = KeyFingerprint(crypto::AccountKey::Generate());
    nonce2 = BidNonce();
  }
  if (pk1 != pk2 || nonce1 != nonce2) {
    std::cerr << "rng_isolation_tests: seeded stream did not replay keys and nonces\n";
    return false;
  }
  {
    crypto::DeterministicOqsRng rng(Seed("ANOTHER-SEED"));
    if (KeyFingerprint(crypto::AccountKey::Generate()) == pk1) {
      std::cerr << "rng_isolation_tests: different seeds produced the same key\n";
      return false;
    }
  }
  return true;
}

bool TestSigningLeavesStreamUntouched() {
  const auto seed = Seed("SIGNING-SEED");
  const std::array<std::uint8_t, 4> message{1, 2, 3, 4};
  primitives::Hash256 after_sign{};
  primitives::Hash256 without_sign{};
  {
    crypto::DeterministicOqsRng rng(seed);
    auto key = crypto::AccountKey::Generate();
    (void)key.Sign(message);
    after_sign = BidNonce();
  }
  {
    crypto::DeterministicOqsRng rng(seed);
    auto key = crypto::AccountKey::Generate();
    without_sign = BidNonce();
  }
  if (after_sign != without_sign) {
    std::cerr << "rng_isolation_tests: signing consumed deterministic bytes\n";
    return false;
  }
  return true;
}

bool TestNestedScopesRestoreOuterStream() {
  const auto outer_seed = Seed("OUTER");
  primitives::Hash256 first{};
  primitives::Hash256 second{};
  {
    crypto::DeterministicOqsRng outer(outer_seed);
    first = BidNonce();
    {
      crypto::DeterministicOqsRng inner(Seed("INNER"));
      (void)BidNonce();
    }
    second = BidNonce();
  }
  crypto::DeterministicOqsRng replay(outer_seed);
  if (BidNonce() != first || BidNonce() != second) {
    std::cerr << "rng_isolation_tests: inner scope disturbed the outer stream\n";
    return false;
  }
  if (crypto::DeterministicOqsRng::CurrentInstance() != &replay) {
    std::cerr << "rng_isolation_tests: active instance not tracked\n";
    return false;
  }
  return true;
}

bool TestOtherThreadsUseSystemRandomness() {
  crypto::DeterministicOqsRng rng(Seed("THREAD-SEED"));
  const auto local = KeyFingerprint(crypto::AccountKey::Generate());

  std::vector<std::vector<std::uint8_t>> remote;
  bool saw_instance = false;
  std::thread worker([&]() {
    saw_instance = crypto::DeterministicOqsRng::CurrentInstance() != nullptr;
    for (int i = 0; i < 4; ++i) {
      remote.push_back(KeyFingerprint(crypto::AccountKey::Generate()));
    }
  });
  worker.join();

  if (saw_instance) {
    std::cerr << "rng_isolation_tests: deterministic stream leaked across threads\n";
    return false;
  }
  for (std::size_t i = 0; i < remote.size(); ++i) {
    if (remote[i] == local ||
        std::count(remote.begin(), remote.end(), remote[i]) != 1) {
      std::cerr << "rng_isolation_tests: worker keys repeated\n";
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  if (!TestSeedReplaysKeysAndNonces()) {
    return EXIT_FAILURE;
  }
  if (!TestSigningLeavesStreamUntouched()) {
    return EXIT_FAILURE;
  }
  if (!TestNestedScopesRestoreOuterStream()) {
    return EXIT_FAILURE;
  }
  if (!TestOtherThreadsUseSystemRandomness()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
