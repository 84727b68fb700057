#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sealcoin::crypto {

// ML-DSA-65 sizes are fixed by consensus; witnesses of any other length are
// rejected before liboqs is consulted.
inline constexpr std::size_t kAccountPublicKeyBytes = 1952;
inline constexpr std::size_t kAccountSecretKeyBytes = 4032;
inline constexpr std::size_t kAccountSignatureBytes = 3309;

// Signing key owned by a single wallet account. Move-only; the secret half
// is wiped when the key is destroyed or overwritten.
class AccountKey {
 public:
  AccountKey() = default;
  ~AccountKey();
  AccountKey(const AccountKey&) = delete;
  AccountKey& operator=(const AccountKey&) = delete;
  AccountKey(AccountKey&& other) noexcept;
  AccountKey& operator=(AccountKey&& other) noexcept;

  // Draws from the thread's DeterministicOqsRng when one is installed.
  static AccountKey Generate();

  bool Empty() const noexcept { return public_key_.empty(); }
  std::span<const std::uint8_t> PublicKey() const noexcept { return public_key_; }

  // Signs a 32-byte sighash. Throws std::runtime_error on an empty key.
  std::vector<std::uint8_t> Sign(std::span<const std::uint8_t> digest) const;

 private:
  std::vector<std::uint8_t> secret_;
  std::vector<std::uint8_t> public_key_;
};

bool VerifyAccountSignature(std::span<const std::uint8_t> digest,
                            std::span<const std::uint8_t> signature,
                            std::span<const std::uint8_t> public_key);

}  // namespace sealcoin::crypto
