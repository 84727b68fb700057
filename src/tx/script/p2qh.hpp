#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "primitives/transaction.hpp"
#include "script/script.hpp"

namespace sealcoin::script {

// Pay-to-quantum-hash: OP_1 <SHA3-256(ML-DSA-65 public key)>.
WitnessProgram ProgramFromPublicKey(std::span<const std::uint8_t> public_key);
ScriptPubKey CreateP2QHScript(const WitnessProgram& program);

// Witness layout is [public key, signature over |message|].
bool VerifyP2QHWitness(const ScriptPubKey& script,
                       const std::vector<primitives::WitnessStackItem>& witness_stack,
                       std::span<const std::uint8_t> message, std::string* error);

}  // namespace sealcoin::script
