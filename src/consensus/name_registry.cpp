#include "consensus/name_registry.hpp"

namespace sealcoin::consensus {

const NameState* NameRegistry::GetState(const primitives::Hash256& name_hash) const {
  const auto it = states_.find(name_hash);
  if (it == states_.end()) {
    return nullptr;
  }
  return &it->second;
}

const NameState* NameRegistry::GetStateByName(std::string_view name) const {
  return GetState(HashName(name));
}

void NameRegistry::Put(NameState state) {
  const auto hash = state.name_hash;
  states_[hash] = std::move(state);
}

bool NameRegistry::Erase(const primitives::Hash256& name_hash) {
  return states_.erase(name_hash) > 0;
}

}  // namespace sealcoin::consensus
