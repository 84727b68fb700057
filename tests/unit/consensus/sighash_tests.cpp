#include <cstdlib>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "consensus/sighash.hpp"
#include "crypto/hash.hpp"
#include "primitives/transaction.hpp"
#include "util/hex.hpp"

using namespace sealcoin;

namespace {

std::span<const std::uint8_t> Bytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

primitives::CTxOut PayTo(std::string_view tag, primitives::Amount seal) {
  primitives::CTxOut out;
  out.value = seal * primitives::kGrainsPerSEAL;
  const auto program = crypto::Sha3_256(Bytes(tag));
  out.locking_descriptor = {0x51, 0x20};
  out.locking_descriptor.insert(out.locking_descriptor.end(), program.begin(), program.end());
  return out;
}

// Two inputs; the second output opens "example" and the second spent coin
// is a BID, so both covenant commitments are exercised.
struct Fixture {
  primitives::CTransaction tx;
  consensus::Coin plain;
  consensus::Coin bid;

  Fixture() {
    tx.version = 3;
    tx.lock_time = 0x01020304;
    tx.vin.resize(2);
    tx.vin[0].prevout.txid.fill(0x11);
    tx.vin[0].prevout.index = 1;
    tx.vin[0].sequence = 0xFFFFFFFE;
    tx.vin[1].prevout.txid.fill(0x22);
    tx.vin[1].prevout.txid[0] = 0xAB;
    tx.vin[1].prevout.index = 7;
    tx.vin[1].sequence = 0xFFFFFFFD;

    tx.vout = {PayTo("tx-output-0", 7), PayTo("tx-output-1", 13)};
    tx.vout[1].covenant.type = 2;
    tx.vout[1].covenant.items = {std::vector<std::uint8_t>(32, 0x33),
                                 {'e', 'x', 'a', 'm', 'p', 'l', 'e'}};

    plain.out = PayTo("utxo-0", 12);
    bid.out = PayTo("utxo-1", 21);
    bid.out.covenant.type = 3;
    bid.out.covenant.items = {std::vector<std::uint8_t>(32, 0x33), {0x04, 0x00, 0x00, 0x00},
                              std::vector<std::uint8_t>(32, 0x44)};
  }
};

bool TestKnownDigests() {
  const Fixture f;
  const consensus::SighashCache cache(f.tx);
  const auto first = util::HexEncode(cache.Compute(0, f.plain));
  const auto second = util::HexEncode(cache.Compute(1, f.bid));
  if (first != "e17b3e7cf339ac0663e8719bb02c58d6ddf322ad78c7f7901d5532ecad4b85ed" ||
      second != "b96d46d371a8c9c2dc8ce4aabe619e5688518504a3f9f4de0ca78ddaa655d3bc") {
    std::cerr << "sighash_tests: digest vectors changed: " << first << " " << second << "\n";
    return false;
  }
  if (consensus::ComputeSighash(f.tx, 1, f.bid) != cache.Compute(1, f.bid)) {
    std::cerr << "sighash_tests: one-shot digest differs from the cached one\n";
    return false;
  }
  return true;
}

bool TestDigestCoversEveryField() {
  const Fixture f;
  const auto base = consensus::ComputeSighash(f.tx, 0, f.plain);

  struct Mutation {
    const char* what;
    void (*apply)(Fixture*);
  };
  const Mutation mutations[] = {
      {"version", [](Fixture* x) { x->tx.version = 4; }},
      {"lock time", [](Fixture* x) { x->tx.lock_time = 0; }},
      {"other input's outpoint", [](Fixture* x) { x->tx.vin[1].prevout.index = 8; }},
      {"other input's sequence", [](Fixture* x) { x->tx.vin[1].sequence = 0; }},
      {"output value", [](Fixture* x) { x->tx.vout[0].value += 1; }},
      {"covenant tag", [](Fixture* x) { x->tx.vout[1].covenant.type = 3; }},
      {"covenant item", [](Fixture* x) { x->tx.vout[1].covenant.items[1].back() = 'f'; }},
      {"spent value", [](Fixture* x) { x->plain.out.value -= 1; }},
      {"spent covenant", [](Fixture* x) { x->plain.out.covenant.type = 1; }},
  };
  for (const auto& mutation : mutations) {
    Fixture changed;
    mutation.apply(&changed);
    if (consensus::ComputeSighash(changed.tx, 0, changed.plain) == base) {
      std::cerr << "sighash_tests: digest ignores the " << mutation.what << "\n";
      return false;
    }
  }

  // Witnesses are filled in after signing and must not feed back.
  Fixture witnessed;
  witnessed.tx.vin[1].witness_stack = {primitives::WitnessStackItem{{0x01, 0x02}}};
  if (consensus::ComputeSighash(witnessed.tx, 0, witnessed.plain) != base) {
    std::cerr << "sighash_tests: digest depends on witness data\n";
    return false;
  }
  return true;
}

bool TestInputIndexBounds() {
  const Fixture f;
  try {
    (void)consensus::ComputeSighash(f.tx, f.tx.vin.size(), f.plain);
  } catch (const std::out_of_range&) {
    return true;
  }
  std::cerr << "sighash_tests: out-of-range input index accepted\n";
  return false;
}

}  // namespace

int main() {
  if (!TestKnownDigests()) {
    return EXIT_FAILURE;
  }
  if (!TestDigestCoversEveryField()) {
    return EXIT_FAILURE;
  }
  if (!TestInputIndexBounds()) {
    return EXIT_FAILURE;
  }
  std::cout << "sighash_tests: OK\n";
  return EXIT_SUCCESS;
}
