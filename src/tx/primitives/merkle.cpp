#include "primitives/merkle.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "primitives/txid.hpp"

namespace sealcoin::primitives {

namespace {

Hash256 FoldLayer(std::vector<Hash256> layer) {
  if (layer.empty()) {
    return Hash256{};
  }
  while (layer.size() > 1) {
    std::vector<Hash256> next;
    next.reserve((layer.size() + 1) / 2);
    for (std::size_t i = 0; i < layer.size(); i += 2) {
      const Hash256& left = layer[i];
      const Hash256& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
      std::vector<std::uint8_t> buffer;
      buffer.reserve(left.size() + right.size());
      buffer.insert(buffer.end(), left.begin(), left.end());
      buffer.insert(buffer.end(), right.begin(), right.end());
      next.push_back(crypto::DoubleSha3_256(buffer));
    }
    layer = std::move(next);
  }
  return layer.front();
}

}  // namespace

Hash256 ComputeMerkleRoot(const std::vector<CTransaction>& transactions) {
  std::vector<Hash256> layer;
  layer.reserve(transactions.size());
  for (const auto& tx : transactions) {
    layer.push_back(ComputeTxId(tx));
  }
  return FoldLayer(std::move(layer));
}

Hash256 ComputeWitnessMerkleRoot(const std::vector<CTransaction>& transactions) {
  std::vector<Hash256> layer;
  layer.reserve(transactions.size());
  for (std::size_t index = 0; index < transactions.size(); ++index) {
    if (index == 0 && transactions[index].IsCoinbase()) {
      // The coinbase wtxid is committed as zero.
      layer.push_back(Hash256{});
      continue;
    }
    layer.push_back(ComputeWTxId(transactions[index]));
  }
  return FoldLayer(std::move(layer));
}

}  // namespace sealcoin::primitives
