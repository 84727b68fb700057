#include "script/p2qh.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "crypto/account_key.hpp"

namespace sealcoin::script {

WitnessProgram ProgramFromPublicKey(std::span<const std::uint8_t> public_key) {
  return crypto::Sha3_256(public_key);
}

ScriptPubKey CreateP2QHScript(const WitnessProgram& program) {
  ScriptPubKey script{};
  script.data.reserve(2 + program.size());
  script.data.push_back(kOp1);
  script.data.push_back(static_cast<std::uint8_t>(kP2QHWitnessProgramSize));
  script.data.insert(script.data.end(), program.begin(), program.end());
  return script;
}

bool VerifyP2QHWitness(const ScriptPubKey& script,
                       const std::vector<primitives::WitnessStackItem>& witness_stack,
                       std::span<const std::uint8_t> message, std::string* error) {
  WitnessProgram program{};
  if (!ExtractWitnessProgram(script, &program)) {
    if (error) *error = "non-standard locking script";
    return false;
  }
  if (witness_stack.size() != 2) {
    if (error) *error = "witness must be [pubkey, signature]";
    return false;
  }
  const auto& public_key = witness_stack[0].data;
  if (public_key.size() != crypto::kAccountPublicKeyBytes) {
    if (error) *error = "invalid public key size";
    return false;
  }
  const auto derived = ProgramFromPublicKey(public_key);
  if (!std::equal(program.begin(), program.end(), derived.begin())) {
    if (error) *error = "public key does not match witness program";
    return false;
  }
  if (!crypto::VerifyAccountSignature(message, witness_stack[1].data, public_key)) {
    if (error) *error = "ML-DSA signature failure";
    return false;
  }
  return true;
}

}  // namespace sealcoin::script
