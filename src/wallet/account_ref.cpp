#include "wallet/account_ref.hpp"

namespace sealcoin::wallet {

std::string DescribeAccountRef(const AccountRef& ref) {
  if (const auto* index = std::get_if<std::uint32_t>(&ref)) {
    return "#" + std::to_string(*index);
  }
  return "'" + std::get<std::string>(ref) + "'";
}

}  // namespace sealcoin::wallet
