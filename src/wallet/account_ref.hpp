#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace sealcoin::wallet {

// Names an account either by index or by name. Resolved once, at the
// orchestrator boundary, into an index.
using AccountRef = std::variant<std::uint32_t, std::string>;

inline constexpr std::uint32_t kDefaultAccountIndex = 0;
inline constexpr const char* kDefaultAccountName = "default";

std::string DescribeAccountRef(const AccountRef& ref);

}  // namespace sealcoin::wallet
