#include "script/script.hpp"

#include <algorithm>

namespace sealcoin::script {

bool ExtractWitnessProgram(const ScriptPubKey& script, WitnessProgram* program) {
  if (script.data.size() != 2 + kP2QHWitnessProgramSize) {
    return false;
  }
  if (script.data[0] != kOp1 || script.data[1] != kP2QHWitnessProgramSize) {
    return false;
  }
  if (program != nullptr) {
    std::copy(script.data.begin() + 2, script.data.end(), program->begin());
  }
  return true;
}

}  // namespace sealcoin::script
