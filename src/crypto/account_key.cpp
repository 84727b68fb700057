#include "crypto/account_key.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <oqs/oqs.h>
#include <oqs/rand.h>

#include "crypto/deterministic_rng.hpp"
#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace sealcoin::crypto {

namespace {

// Set only while OQS_SIG_keypair runs. ML-DSA signing is hedged and must not
// consume the seeded stream, otherwise a replayed wallet would drift after
// its first signature.
thread_local bool g_in_keygen = false;

void AccountRandombytes(std::uint8_t* out, std::size_t outlen) {
  if (outlen == 0) {
    return;
  }
  auto* stream = DeterministicOqsRng::CurrentInstance();
  if (g_in_keygen && stream != nullptr) {
    stream->Generate(out, outlen);
    return;
  }
  util::FillSecureRandomBytesOrAbort(std::span<std::uint8_t>(out, outlen));
}

struct SigDeleter {
  void operator()(OQS_SIG* sig) const { OQS_SIG_free(sig); }
};

// liboqs keeps a process-wide randombytes hook, so it is installed together
// with the scheme handle on first use.
const OQS_SIG& Scheme() {
  static const std::unique_ptr<OQS_SIG, SigDeleter> scheme = [] {
    OQS_randombytes_custom_algorithm(&AccountRandombytes);
    std::unique_ptr<OQS_SIG, SigDeleter> sig(OQS_SIG_new(OQS_SIG_alg_ml_dsa_65));
    if (!sig) {
      throw std::runtime_error("liboqs was built without ML-DSA-65");
    }
    if (sig->length_public_key != kAccountPublicKeyBytes ||
        sig->length_secret_key != kAccountSecretKeyBytes ||
        sig->length_signature != kAccountSignatureBytes) {
      throw std::runtime_error("liboqs ML-DSA-65 sizes disagree with consensus");
    }
    return sig;
  }();
  return *scheme;
}

}  // namespace

AccountKey::~AccountKey() { util::SecureWipe(secret_); }

AccountKey::AccountKey(AccountKey&& other) noexcept
    : secret_(std::move(other.secret_)), public_key_(std::move(other.public_key_)) {
  other.secret_.clear();
  other.public_key_.clear();
}

AccountKey& AccountKey::operator=(AccountKey&& other) noexcept {
  if (this != &other) {
    util::SecureWipe(secret_);
    secret_ = std::move(other.secret_);
    public_key_ = std::move(other.public_key_);
    other.secret_.clear();
    other.public_key_.clear();
  }
  return *this;
}

AccountKey AccountKey::Generate() {
  const auto& scheme = Scheme();
  AccountKey key;
  key.public_key_.resize(scheme.length_public_key);
  key.secret_.resize(scheme.length_secret_key);
  g_in_keygen = true;
  const auto status = OQS_SIG_keypair(&scheme, key.public_key_.data(), key.secret_.data());
  g_in_keygen = false;
  if (status != OQS_SUCCESS) {
    throw std::runtime_error("account key generation failed");
  }
  return key;
}

std::vector<std::uint8_t> AccountKey::Sign(std::span<const std::uint8_t> digest) const {
  if (Empty()) {
    throw std::runtime_error("cannot sign with an empty account key");
  }
  const auto& scheme = Scheme();
  std::vector<std::uint8_t> signature(scheme.length_signature);
  std::size_t written = 0;
  if (OQS_SIG_sign(&scheme, signature.data(), &written, digest.data(), digest.size(),
                   secret_.data()) != OQS_SUCCESS ||
      written != signature.size()) {
    throw std::runtime_error("account signing failed");
  }
  return signature;
}

bool VerifyAccountSignature(std::span<const std::uint8_t> digest,
                            std::span<const std::uint8_t> signature,
                            std::span<const std::uint8_t> public_key) {
  if (public_key.size() != kAccountPublicKeyBytes ||
      signature.size() != kAccountSignatureBytes) {
    return false;
  }
  const auto& scheme = Scheme();
  return OQS_SIG_verify(&scheme, digest.data(), digest.size(), signature.data(),
                        signature.size(), public_key.data()) == OQS_SUCCESS;
}

}  // namespace sealcoin::crypto
