#include "consensus/covenant_rules.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "consensus/blind_bid.hpp"
#include "util/hex.hpp"

namespace sealcoin::consensus {

namespace {

std::string NameLabel(const NameState* prior, const primitives::Hash256& name_hash) {
  if (prior != nullptr && !prior->name.empty()) {
    return "'" + prior->name + "'";
  }
  return util::HexEncode(name_hash).substr(0, 16);
}

bool RequirePhase(const NameState* prior, const primitives::Hash256& name_hash,
                  const CovenantContext& ctx, NamePhase expected, std::string_view action,
                  AuctionError* error) {
  const auto phase = PhaseOf(prior, ctx.height, *ctx.params);
  if (phase != expected) {
    return Fail(error, AuctionErrorKind::kPhaseMismatch,
                std::string(action) + " for " + NameLabel(prior, name_hash) + " requires " +
                    std::string(NamePhaseName(expected)) + ", name is " +
                    std::string(NamePhaseName(phase)) + " at height " +
                    std::to_string(ctx.height));
  }
  return true;
}

bool RequireAuction(const NameState* prior, const primitives::Hash256& name_hash,
                    std::uint32_t open_height, AuctionError* error) {
  if (prior == nullptr) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "no auction exists for " + NameLabel(prior, name_hash));
  }
  if (prior->open_height != open_height) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "covenant refers to auction opened at " + std::to_string(open_height) +
                    ", current auction for " + NameLabel(prior, name_hash) + " opened at " +
                    std::to_string(prior->open_height));
  }
  return true;
}

// Decodes the covenant of the linked spent coin and checks it is |expected|
// for the same name and auction.
template <typename Payload>
bool RequireLinkedInput(const CovenantContext& ctx, CovenantType expected,
                        const primitives::Hash256& name_hash, std::uint32_t open_height,
                        std::string_view action, Payload* payload, AuctionError* error) {
  if (ctx.spent_coin == nullptr || ctx.spent_outpoint == nullptr) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " must spend a linked " +
                    std::string(CovenantTypeName(expected)) + " input");
  }
  Covenant spent;
  std::string decode_error;
  if (!DecodeCovenant(ctx.spent_coin->out.covenant, &spent, &decode_error)) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "linked input covenant: " + decode_error);
  }
  const auto* typed = std::get_if<Payload>(&spent);
  if (typed == nullptr) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " must spend a " + std::string(CovenantTypeName(expected)) +
                    " output, linked input is " +
                    std::string(CovenantTypeName(TypeOf(spent))));
  }
  if (typed->name_hash != name_hash || typed->open_height != open_height) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " spends an output of a different name or auction");
  }
  if (payload) *payload = *typed;
  return true;
}

// Current owner output may carry REGISTER, UPDATE or RENEW (or REVEAL before
// registration). The linked input must be exactly that outpoint.
bool RequireOwnerSpend(const NameState& prior, const CovenantContext& ctx,
                       std::string_view action, AuctionError* error) {
  if (ctx.spent_outpoint == nullptr || *ctx.spent_outpoint != prior.owner) {
    return Fail(error, AuctionErrorKind::kOwnershipViolation,
                std::string(action) + " for '" + prior.name +
                    "' must spend the current owner output");
  }
  return true;
}

bool CheckResource(const std::vector<std::uint8_t>& resource, const NameParams& params,
                   AuctionError* error) {
  if (resource.size() > params.max_resource_size) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "resource exceeds " + std::to_string(params.max_resource_size) + " bytes");
  }
  return true;
}

bool ValidateOpen(const OpenCovenant& c, const NameState* prior, const CovenantContext& ctx,
                  AuctionError* error) {
  if (!IsValidName(c.name, ctx.params->max_name_size)) {
    return Fail(error, AuctionErrorKind::kInvalidName, "invalid name '" + c.name + "'");
  }
  if (HashName(c.name) != c.name_hash) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "name hash does not match '" + c.name + "'");
  }
  if (ctx.value != 0) {
    return Fail(error, AuctionErrorKind::kInvalidTransition, "OPEN output must carry zero value");
  }
  return RequirePhase(prior, c.name_hash, ctx, NamePhase::kAvailable, "OPEN", error);
}

bool ValidateBid(const BidCovenant& c, const NameState* prior, const CovenantContext& ctx,
                 AuctionError* error) {
  if (!IsValidName(c.name, ctx.params->max_name_size) || HashName(c.name) != c.name_hash) {
    return Fail(error, AuctionErrorKind::kInvalidName, "BID carries an invalid name");
  }
  if (!RequirePhase(prior, c.name_hash, ctx, NamePhase::kBidding, "BID", error)) {
    return false;
  }
  return RequireAuction(prior, c.name_hash, c.open_height, error);
}

bool ValidateReveal(const RevealCovenant& c, const NameState* prior, const CovenantContext& ctx,
                    AuctionError* error) {
  if (!RequirePhase(prior, c.name_hash, ctx, NamePhase::kReveal, "REVEAL", error) ||
      !RequireAuction(prior, c.name_hash, c.open_height, error)) {
    return false;
  }
  BidCovenant bid;
  if (!RequireLinkedInput(ctx, CovenantType::kBid, c.name_hash, c.open_height, "REVEAL", &bid,
                          error)) {
    return false;
  }
  BidCommitment opening;
  opening.name_hash = c.name_hash;
  opening.value = ctx.value;
  opening.lockup = ctx.spent_coin->out.value;
  opening.nonce = c.nonce;
  return OpenBid(opening, bid.commitment, nullptr, error);
}

bool ValidateRedeem(const RedeemCovenant& c, const NameState* prior, const CovenantContext& ctx,
                    AuctionError* error) {
  if (prior == nullptr) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "no auction exists for " + NameLabel(prior, c.name_hash));
  }
  if (!RequireLinkedInput<RevealCovenant>(ctx, CovenantType::kReveal, c.name_hash,
                                          c.open_height, "REDEEM", nullptr, error)) {
    return false;
  }
  // Reveals left over from an auction that has since been superseded by a
  // re-open are always redeemable.
  if (c.open_height < prior->open_height) {
    return true;
  }
  if (c.open_height != prior->open_height) {
    return RequireAuction(prior, c.name_hash, c.open_height, error);
  }
  if (ctx.height < RevealEnd(*prior, *ctx.params)) {
    return Fail(error, AuctionErrorKind::kPhaseMismatch,
                "REDEEM for '" + prior->name + "' is only valid after the reveal period");
  }
  if (*ctx.spent_outpoint == prior->owner) {
    return Fail(error, AuctionErrorKind::kOwnershipViolation,
                "winning reveal for '" + prior->name + "' cannot be redeemed");
  }
  return true;
}

bool ValidateRegister(const RegisterCovenant& c, const NameState* prior,
                      const CovenantContext& ctx, AuctionError* error) {
  if (!RequirePhase(prior, c.name_hash, ctx, NamePhase::kClosed, "REGISTER", error) ||
      !RequireAuction(prior, c.name_hash, c.open_height, error) ||
      !CheckResource(c.resource, *ctx.params, error)) {
    return false;
  }
  if (prior->registered) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "'" + prior->name + "' is already registered");
  }
  if (!RequireLinkedInput<RevealCovenant>(ctx, CovenantType::kReveal, c.name_hash,
                                          c.open_height, "REGISTER", nullptr, error) ||
      !RequireOwnerSpend(*prior, ctx, "REGISTER", error)) {
    return false;
  }
  if (ctx.value != prior->value) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                "REGISTER must lock exactly the second price " + std::to_string(prior->value));
  }
  return true;
}

// UPDATE and RENEW share the owner-chain rules.
bool ValidateOwnerTransition(const primitives::Hash256& name_hash, std::uint32_t open_height,
                             const NameState* prior, const CovenantContext& ctx,
                             std::string_view action, AuctionError* error) {
  if (!RequirePhase(prior, name_hash, ctx, NamePhase::kClosed, action, error) ||
      !RequireAuction(prior, name_hash, open_height, error)) {
    return false;
  }
  if (!prior->registered) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " requires '" + prior->name + "' to be registered");
  }
  if (!RequireOwnerSpend(*prior, ctx, action, error)) {
    return false;
  }
  if (ctx.spent_coin == nullptr) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " spends an unknown output");
  }
  if (!IsAllowedSuccessor(static_cast<CovenantType>(ctx.spent_coin->out.covenant.type),
                          CovenantType::kUpdate)) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " must spend a REGISTER, UPDATE or RENEW output");
  }
  if (ctx.value != ctx.spent_coin->out.value) {
    return Fail(error, AuctionErrorKind::kInvalidTransition,
                std::string(action) + " must preserve the locked name value");
  }
  return true;
}

}  // namespace

bool ValidateCovenant(const Covenant& covenant, const NameState* prior,
                      const CovenantContext& context, AuctionError* error) {
  if (context.params == nullptr) {
    return Fail(error, AuctionErrorKind::kInvalidTransition, "missing name parameters");
  }
  if (const auto* hash = NameHashOf(covenant); hash != nullptr && prior != nullptr &&
                                               prior->name_hash != *hash) {
    return Fail(error, AuctionErrorKind::kInvalidTransition, "prior state is for another name");
  }
  return std::visit(
      [&](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, NoCovenant>) {
          return true;
        } else if constexpr (std::is_same_v<T, OpenCovenant>) {
          return ValidateOpen(c, prior, context, error);
        } else if constexpr (std::is_same_v<T, BidCovenant>) {
          return ValidateBid(c, prior, context, error);
        } else if constexpr (std::is_same_v<T, RevealCovenant>) {
          return ValidateReveal(c, prior, context, error);
        } else if constexpr (std::is_same_v<T, RedeemCovenant>) {
          return ValidateRedeem(c, prior, context, error);
        } else if constexpr (std::is_same_v<T, RegisterCovenant>) {
          return ValidateRegister(c, prior, context, error);
        } else if constexpr (std::is_same_v<T, UpdateCovenant>) {
          return CheckResource(c.resource, *context.params, error) &&
                 ValidateOwnerTransition(c.name_hash, c.open_height, prior, context, "UPDATE",
                                         error);
        } else {
          return ValidateOwnerTransition(c.name_hash, c.open_height, prior, context, "RENEW",
                                         error);
        }
      },
      covenant);
}

bool ApplyCovenant(const Covenant& covenant, const NameState* prior,
                   const CovenantContext& context, NameState* next, AuctionError* error) {
  if (!ValidateCovenant(covenant, prior, context, error)) {
    return false;
  }
  if (prior != nullptr) {
    *next = *prior;
  }
  std::visit(
      [&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, OpenCovenant>) {
          NameState fresh;
          fresh.name = c.name;
          fresh.name_hash = c.name_hash;
          fresh.open_height = context.height;
          fresh.renewal_height = context.height;
          fresh.transfer_lockup = context.params->transfer_lockup;
          *next = std::move(fresh);
        } else if constexpr (std::is_same_v<T, RevealCovenant>) {
          RecordReveal(next, context.outpoint, context.value);
        } else if constexpr (std::is_same_v<T, RegisterCovenant>) {
          next->registered = true;
          next->data = c.resource;
          next->renewal_height = context.height;
          next->owner = context.outpoint;
        } else if constexpr (std::is_same_v<T, UpdateCovenant>) {
          next->data = c.resource;
          next->owner = context.outpoint;
        } else if constexpr (std::is_same_v<T, RenewCovenant>) {
          next->renewal_height = context.height;
          next->owner = context.outpoint;
        }
      },
      covenant);
  return true;
}

bool ApplyTransactionCovenants(const primitives::CTransaction& tx,
                               const primitives::Hash256& txid, const UTXOSet& view,
                               std::uint32_t height, const NameParams& params,
                               NameRegistry* names, AuctionError* error) {
  // Locked outputs may only move forward into their linked successor.
  for (std::size_t i = 0; i < tx.vin.size(); ++i) {
    const Coin* coin = view.GetCoin(tx.vin[i].prevout);
    if (coin == nullptr) {
      return Fail(error, AuctionErrorKind::kInvalidTransition, "missing UTXO for covenant check");
    }
    const auto spent_type = static_cast<CovenantType>(coin->out.covenant.type);
    if (!IsLockedCovenant(spent_type)) {
      continue;
    }
    const auto next_type = i < tx.vout.size()
                               ? static_cast<CovenantType>(tx.vout[i].covenant.type)
                               : CovenantType::kNone;
    if (!IsAllowedSuccessor(spent_type, next_type)) {
      return Fail(error, AuctionErrorKind::kInvalidTransition,
                  "input " + std::to_string(i) + " spends a " +
                      std::string(CovenantTypeName(spent_type)) + " output into " +
                      std::string(CovenantTypeName(next_type)));
    }
  }

  for (std::size_t i = 0; i < tx.vout.size(); ++i) {
    const auto& out = tx.vout[i];
    if (out.covenant.IsNone()) {
      continue;
    }
    Covenant covenant;
    std::string decode_error;
    if (!DecodeCovenant(out.covenant, &covenant, &decode_error)) {
      return Fail(error, AuctionErrorKind::kInvalidTransition, decode_error);
    }
    const auto* name_hash = NameHashOf(covenant);
    CovenantContext ctx;
    ctx.height = height;
    ctx.params = &params;
    ctx.outpoint = primitives::COutPoint{txid, static_cast<std::uint32_t>(i)};
    ctx.value = out.value;
    if (i < tx.vin.size()) {
      ctx.spent_outpoint = &tx.vin[i].prevout;
      ctx.spent_coin = view.GetCoin(tx.vin[i].prevout);
    }
    const NameState* prior = names->GetState(*name_hash);
    NameState next;
    if (!ApplyCovenant(covenant, prior, ctx, &next, error)) {
      return false;
    }
    names->Put(std::move(next));
  }
  return true;
}

}  // namespace sealcoin::consensus
