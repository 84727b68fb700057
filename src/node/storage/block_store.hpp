#pragma once

#include <string>
#include <vector>

#include "primitives/block.hpp"

namespace sealcoin::storage {

// Append-only block file in height order starting at genesis. Every record
// is [magic u32][length u32][sha3-256 of body][serialized block].
class BlockStore {
 public:
  explicit BlockStore(std::string path);

  bool Append(const primitives::CBlock& block, std::string* error);
  // Reads every record. A missing file yields no blocks. A torn last record
  // (crash during append) is dropped with a warning; a bad checksum or an
  // undecodable block anywhere is an error.
  bool LoadAll(std::vector<primitives::CBlock>* blocks, std::string* error) const;

 private:
  std::string path_;
};

}  // namespace sealcoin::storage
