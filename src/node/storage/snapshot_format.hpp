#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "primitives/hash.hpp"

namespace sealcoin::storage {

// Common envelope for on-disk state snapshots:
//   u32 magic | u16 version | varint+bytes network_id | genesis hash
//   | u32 tip height | tip hash | u64 record count
// followed by `record count` records of u32 size | payload | sha3(payload).
struct SnapshotHeader {
  std::uint32_t magic{0};
  std::uint16_t version{0};
  std::string network_id;
  primitives::Hash256 genesis_hash{};
  std::uint32_t tip_height{0};
  primitives::Hash256 tip_hash{};
  std::uint64_t record_count{0};
};

void WriteSnapshotHeader(const SnapshotHeader& header, std::vector<std::uint8_t>* out);
void WriteSnapshotRecord(const std::vector<std::uint8_t>& payload, std::vector<std::uint8_t>* out);

bool ReadSnapshotFile(const std::string& path, std::vector<std::uint8_t>* out);
bool ReadSnapshotHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        SnapshotHeader* header);
// Reads one record and verifies its checksum.
bool ReadSnapshotRecord(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        std::vector<std::uint8_t>* payload);

}  // namespace sealcoin::storage
