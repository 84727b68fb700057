#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>

#include "consensus/name_state.hpp"
#include "primitives/hash.hpp"

namespace sealcoin::consensus {

// Name states keyed by name hash.
class NameRegistry {
 public:
  const NameState* GetState(const primitives::Hash256& name_hash) const;
  const NameState* GetStateByName(std::string_view name) const;
  void Put(NameState state);
  bool Erase(const primitives::Hash256& name_hash);
  std::size_t Size() const noexcept { return states_.size(); }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& [hash, state] : states_) {
      if (!fn(hash, state)) break;
    }
  }

 private:
  std::unordered_map<primitives::Hash256, NameState, primitives::Hash256Hasher> states_;
};

}  // namespace sealcoin::consensus
