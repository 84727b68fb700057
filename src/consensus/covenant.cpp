#include "consensus/covenant.hpp"

#include <algorithm>
#include <type_traits>

namespace sealcoin::consensus {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

using Item = std::vector<std::uint8_t>;

Item HashItem(const primitives::Hash256& hash) { return Item(hash.begin(), hash.end()); }

Item HeightItem(std::uint32_t height) {
  Item out(4);
  for (int i = 0; i < 4; ++i) {
    out[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((height >> (8 * i)) & 0xFF);
  }
  return out;
}

Item StringItem(const std::string& value) { return Item(value.begin(), value.end()); }

bool ReadHash(const Item& item, primitives::Hash256* out) {
  if (item.size() != out->size()) return false;
  std::copy(item.begin(), item.end(), out->begin());
  return true;
}

bool ReadHeight(const Item& item, std::uint32_t* out) {
  if (item.size() != 4) return false;
  *out = static_cast<std::uint32_t>(item[0]) | (static_cast<std::uint32_t>(item[1]) << 8) |
         (static_cast<std::uint32_t>(item[2]) << 16) | (static_cast<std::uint32_t>(item[3]) << 24);
  return true;
}

bool ExpectItems(const primitives::CCovenant& raw, std::size_t count, std::string* error) {
  if (raw.items.size() != count) {
    if (error) {
      *error = std::string(CovenantTypeName(static_cast<CovenantType>(raw.type))) +
               " covenant expects " + std::to_string(count) + " items";
    }
    return false;
  }
  return true;
}

bool Malformed(std::string* error, std::string_view field) {
  if (error) *error = "malformed covenant " + std::string(field);
  return false;
}

}  // namespace

CovenantType TypeOf(const Covenant& covenant) {
  return std::visit(Overloaded{
                        [](const NoCovenant&) { return CovenantType::kNone; },
                        [](const OpenCovenant&) { return CovenantType::kOpen; },
                        [](const BidCovenant&) { return CovenantType::kBid; },
                        [](const RevealCovenant&) { return CovenantType::kReveal; },
                        [](const RedeemCovenant&) { return CovenantType::kRedeem; },
                        [](const RegisterCovenant&) { return CovenantType::kRegister; },
                        [](const UpdateCovenant&) { return CovenantType::kUpdate; },
                        [](const RenewCovenant&) { return CovenantType::kRenew; },
                    },
                    covenant);
}

std::string_view CovenantTypeName(CovenantType type) {
  switch (type) {
    case CovenantType::kNone:
      return "NONE";
    case CovenantType::kOpen:
      return "OPEN";
    case CovenantType::kBid:
      return "BID";
    case CovenantType::kReveal:
      return "REVEAL";
    case CovenantType::kRedeem:
      return "REDEEM";
    case CovenantType::kRegister:
      return "REGISTER";
    case CovenantType::kUpdate:
      return "UPDATE";
    case CovenantType::kRenew:
      return "RENEW";
  }
  return "UNKNOWN";
}

const primitives::Hash256* NameHashOf(const Covenant& covenant) {
  return std::visit(
      [](const auto& payload) -> const primitives::Hash256* {
        if constexpr (std::is_same_v<std::decay_t<decltype(payload)>, NoCovenant>) {
          return nullptr;
        } else {
          return &payload.name_hash;
        }
      },
      covenant);
}

bool IsLockedCovenant(CovenantType type) {
  switch (type) {
    case CovenantType::kBid:
    case CovenantType::kReveal:
    case CovenantType::kRegister:
    case CovenantType::kUpdate:
    case CovenantType::kRenew:
      return true;
    case CovenantType::kNone:
    case CovenantType::kOpen:
    case CovenantType::kRedeem:
      return false;
  }
  return false;
}

bool IsAllowedSuccessor(CovenantType spent, CovenantType next) {
  switch (spent) {
    case CovenantType::kBid:
      return next == CovenantType::kReveal;
    case CovenantType::kReveal:
      return next == CovenantType::kRedeem || next == CovenantType::kRegister;
    case CovenantType::kRegister:
    case CovenantType::kUpdate:
    case CovenantType::kRenew:
      return next == CovenantType::kUpdate || next == CovenantType::kRenew;
    case CovenantType::kNone:
    case CovenantType::kOpen:
    case CovenantType::kRedeem:
      return true;
  }
  return false;
}

primitives::CCovenant EncodeCovenant(const Covenant& covenant) {
  primitives::CCovenant raw;
  raw.type = static_cast<std::uint8_t>(TypeOf(covenant));
  std::visit(Overloaded{
                 [&](const NoCovenant&) {},
                 [&](const OpenCovenant& c) {
                   raw.items = {HashItem(c.name_hash), StringItem(c.name)};
                 },
                 [&](const BidCovenant& c) {
                   raw.items = {HashItem(c.name_hash), HeightItem(c.open_height),
                                StringItem(c.name), HashItem(c.commitment)};
                 },
                 [&](const RevealCovenant& c) {
                   raw.items = {HashItem(c.name_hash), HeightItem(c.open_height),
                                HashItem(c.nonce)};
                 },
                 [&](const RedeemCovenant& c) {
                   raw.items = {HashItem(c.name_hash), HeightItem(c.open_height)};
                 },
                 [&](const RegisterCovenant& c) {
                   raw.items = {HashItem(c.name_hash), HeightItem(c.open_height), c.resource};
                 },
                 [&](const UpdateCovenant& c) {
                   raw.items = {HashItem(c.name_hash), HeightItem(c.open_height), c.resource};
                 },
                 [&](const RenewCovenant& c) {
                   raw.items = {HashItem(c.name_hash), HeightItem(c.open_height)};
                 },
             },
             covenant);
  return raw;
}

bool DecodeCovenant(const primitives::CCovenant& raw, Covenant* out, std::string* error) {
  const auto& items = raw.items;
  switch (static_cast<CovenantType>(raw.type)) {
    case CovenantType::kNone:
      if (!ExpectItems(raw, 0, error)) return false;
      *out = NoCovenant{};
      return true;
    case CovenantType::kOpen: {
      if (!ExpectItems(raw, 2, error)) return false;
      OpenCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      c.name.assign(items[1].begin(), items[1].end());
      *out = std::move(c);
      return true;
    }
    case CovenantType::kBid: {
      if (!ExpectItems(raw, 4, error)) return false;
      BidCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      if (!ReadHeight(items[1], &c.open_height)) return Malformed(error, "height");
      c.name.assign(items[2].begin(), items[2].end());
      if (!ReadHash(items[3], &c.commitment)) return Malformed(error, "commitment");
      *out = std::move(c);
      return true;
    }
    case CovenantType::kReveal: {
      if (!ExpectItems(raw, 3, error)) return false;
      RevealCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      if (!ReadHeight(items[1], &c.open_height)) return Malformed(error, "height");
      if (!ReadHash(items[2], &c.nonce)) return Malformed(error, "nonce");
      *out = c;
      return true;
    }
    case CovenantType::kRedeem: {
      if (!ExpectItems(raw, 2, error)) return false;
      RedeemCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      if (!ReadHeight(items[1], &c.open_height)) return Malformed(error, "height");
      *out = c;
      return true;
    }
    case CovenantType::kRegister: {
      if (!ExpectItems(raw, 3, error)) return false;
      RegisterCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      if (!ReadHeight(items[1], &c.open_height)) return Malformed(error, "height");
      c.resource = items[2];
      *out = std::move(c);
      return true;
    }
    case CovenantType::kUpdate: {
      if (!ExpectItems(raw, 3, error)) return false;
      UpdateCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      if (!ReadHeight(items[1], &c.open_height)) return Malformed(error, "height");
      c.resource = items[2];
      *out = std::move(c);
      return true;
    }
    case CovenantType::kRenew: {
      if (!ExpectItems(raw, 2, error)) return false;
      RenewCovenant c;
      if (!ReadHash(items[0], &c.name_hash)) return Malformed(error, "name hash");
      if (!ReadHeight(items[1], &c.open_height)) return Malformed(error, "height");
      *out = c;
      return true;
    }
  }
  if (error) *error = "unknown covenant type " + std::to_string(raw.type);
  return false;
}

}  // namespace sealcoin::consensus
