#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::consensus {

// Wire tags. Values are consensus critical.
enum class CovenantType : std::uint8_t {
  kNone = 0,
  kOpen = 2,
  kBid = 3,
  kReveal = 4,
  kRedeem = 5,
  kRegister = 6,
  kUpdate = 7,
  kRenew = 8,
};

struct NoCovenant {
  bool operator==(const NoCovenant&) const = default;
};

struct OpenCovenant {
  primitives::Hash256 name_hash{};
  std::string name;
  bool operator==(const OpenCovenant&) const = default;
};

struct BidCovenant {
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  std::string name;
  primitives::Hash256 commitment{};
  bool operator==(const BidCovenant&) const = default;
};

struct RevealCovenant {
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  primitives::Hash256 nonce{};
  bool operator==(const RevealCovenant&) const = default;
};

struct RedeemCovenant {
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  bool operator==(const RedeemCovenant&) const = default;
};

struct RegisterCovenant {
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  std::vector<std::uint8_t> resource;
  bool operator==(const RegisterCovenant&) const = default;
};

struct UpdateCovenant {
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  std::vector<std::uint8_t> resource;
  bool operator==(const UpdateCovenant&) const = default;
};

struct RenewCovenant {
  primitives::Hash256 name_hash{};
  std::uint32_t open_height{0};
  bool operator==(const RenewCovenant&) const = default;
};

using Covenant = std::variant<NoCovenant, OpenCovenant, BidCovenant, RevealCovenant,
                              RedeemCovenant, RegisterCovenant, UpdateCovenant, RenewCovenant>;

CovenantType TypeOf(const Covenant& covenant);
std::string_view CovenantTypeName(CovenantType type);

// Name hash the covenant refers to, or nullptr for NONE.
const primitives::Hash256* NameHashOf(const Covenant& covenant);

// Outputs carrying one of these can only be spent into a linked successor
// covenant at the same output index.
bool IsLockedCovenant(CovenantType type);

// Allowed successor tags for a spent locked covenant.
bool IsAllowedSuccessor(CovenantType spent, CovenantType next);

primitives::CCovenant EncodeCovenant(const Covenant& covenant);
bool DecodeCovenant(const primitives::CCovenant& raw, Covenant* out, std::string* error);

}  // namespace sealcoin::consensus
