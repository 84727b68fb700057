#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace sealcoin::primitives {

struct COutPoint {
  Hash256 txid{};
  std::uint32_t index{0};
  bool operator==(const COutPoint& other) const = default;

  [[nodiscard]] bool IsNull() const noexcept {
    return std::all_of(txid.begin(), txid.end(), [](std::uint8_t b) { return b == 0; }) &&
           index == std::numeric_limits<std::uint32_t>::max();
  }

  static COutPoint Null() {
    COutPoint out{};
    out.index = std::numeric_limits<std::uint32_t>::max();
    return out;
  }
};

struct WitnessStackItem {
  std::vector<std::uint8_t> data;
  bool operator==(const WitnessStackItem& other) const = default;
};

// Wire form of a name covenant. The typed view lives in
// consensus/covenant.hpp; this struct only carries the tag and raw items.
struct CCovenant {
  std::uint8_t type{0};
  std::vector<std::vector<std::uint8_t>> items{};
  bool operator==(const CCovenant& other) const = default;

  [[nodiscard]] bool IsNone() const noexcept { return type == 0; }
};

struct CTxIn {
  COutPoint prevout{};
  std::vector<WitnessStackItem> witness_stack{};  // [pubkey, ML-DSA signature]
  std::uint32_t sequence{0xFFFFFFFF};
};

struct CTxOut {
  Amount value{0};  // In grains.
  std::vector<std::uint8_t> locking_descriptor{};  // ScriptPubKey bytes.
  CCovenant covenant{};
};

struct CTransaction {
  std::uint32_t version{1};
  std::vector<CTxIn> vin{};
  std::vector<CTxOut> vout{};
  std::uint32_t lock_time{0};

  [[nodiscard]] bool IsCoinbase() const noexcept {
    return vin.size() == 1 && vin.front().prevout.IsNull();
  }
};

}  // namespace sealcoin::primitives
