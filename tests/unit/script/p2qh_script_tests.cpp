#include <array>
#include <cstdlib>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/account_key.hpp"
#include "script/p2qh.hpp"
#include "tests/unit/util/deterministic_rng.hpp"

namespace {

using sealcoin::test::ScopedDeterministicRng;

std::vector<std::uint8_t> Sha3Bytes(std::string_view str) {
  const auto hash = sealcoin::crypto::Sha3_256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(str.data()), str.size()));
  return {hash.begin(), hash.end()};
}

std::vector<sealcoin::primitives::WitnessStackItem> Witness(
    const sealcoin::crypto::AccountKey& key, std::span<const std::uint8_t> message) {
  const auto public_key = key.PublicKey();
  sealcoin::primitives::WitnessStackItem key_item{
      std::vector<std::uint8_t>(public_key.begin(), public_key.end())};
  sealcoin::primitives::WitnessStackItem sig_item{key.Sign(message)};
  return {key_item, sig_item};
}

bool TestScriptLayout() {
  sealcoin::script::WitnessProgram program{};
  program.fill(0x5C);
  const auto script = sealcoin::script::CreateP2QHScript(program);
  if (script.data.size() != 34 || script.data[0] != sealcoin::script::kOp1 ||
      script.data[1] != 0x20) {
    std::cerr << "P2QH script has unexpected layout\n";
    return false;
  }
  sealcoin::script::WitnessProgram extracted{};
  if (!sealcoin::script::ExtractWitnessProgram(script, &extracted) || extracted != program) {
    std::cerr << "Failed to extract witness program\n";
    return false;
  }

  auto truncated = script;
  truncated.data.pop_back();
  auto wrong_version = script;
  wrong_version.data[0] = sealcoin::script::kOp0;
  if (sealcoin::script::ExtractWitnessProgram(truncated, nullptr) ||
      sealcoin::script::ExtractWitnessProgram(wrong_version, nullptr)) {
    std::cerr << "Accepted a non-standard locking script\n";
    return false;
  }
  return true;
}

bool TestProgramIsKeyHash() {
  ScopedDeterministicRng rng(0x1111'2222ULL);
  auto key = sealcoin::crypto::AccountKey::Generate();
  const auto program = sealcoin::script::ProgramFromPublicKey(key.PublicKey());
  const auto expected = sealcoin::crypto::Sha3_256(key.PublicKey());
  if (program != expected) {
    std::cerr << "Witness program is not SHA3-256 of the public key\n";
    return false;
  }
  if (program == sealcoin::script::WitnessProgram{} ||
      std::vector<std::uint8_t>(program.begin(), program.end()) == Sha3Bytes("")) {
    std::cerr << "Witness program degenerate\n";
    return false;
  }
  return true;
}

bool TestWitnessVerification() {
  ScopedDeterministicRng rng(0x5555'6666ULL);
  auto key = sealcoin::crypto::AccountKey::Generate();
  auto other = sealcoin::crypto::AccountKey::Generate();
  const auto script =
      sealcoin::script::CreateP2QHScript(sealcoin::script::ProgramFromPublicKey(key.PublicKey()));
  const auto message = Sha3Bytes("seal-p2qh-message");
  std::string error;

  const auto witness = Witness(key, message);
  if (!sealcoin::script::VerifyP2QHWitness(script, witness, message, &error)) {
    std::cerr << "Valid witness rejected: " << error << "\n";
    return false;
  }

  const auto wrong_message = Sha3Bytes("another-message");
  if (sealcoin::script::VerifyP2QHWitness(script, witness, wrong_message, &error) ||
      error.find("signature") == std::string::npos) {
    std::cerr << "Signature over a different message accepted\n";
    return false;
  }

  if (sealcoin::script::VerifyP2QHWitness(script, Witness(other, message), message, &error) ||
      error.find("witness program") == std::string::npos) {
    std::cerr << "Foreign key accepted: " << error << "\n";
    return false;
  }

  auto short_stack = witness;
  short_stack.pop_back();
  if (sealcoin::script::VerifyP2QHWitness(script, short_stack, message, &error)) {
    std::cerr << "Witness without a signature accepted\n";
    return false;
  }

  auto truncated_key = witness;
  truncated_key[0].data.pop_back();
  if (sealcoin::script::VerifyP2QHWitness(script, truncated_key, message, &error) ||
      error.find("public key size") == std::string::npos) {
    std::cerr << "Truncated public key accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestScriptLayout()) {
    return EXIT_FAILURE;
  }
  if (!TestProgramIsKeyHash()) {
    return EXIT_FAILURE;
  }
  if (!TestWitnessVerification()) {
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
