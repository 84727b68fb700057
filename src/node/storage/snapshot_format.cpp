#include "storage/snapshot_format.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealcoin::storage {

namespace {

constexpr std::uint32_t kMaxRecordSize = 4 * 1024 * 1024;
constexpr std::size_t kMaxNetworkIdSize = 64;

bool ReadFixed(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint8_t* out,
               std::size_t len) {
  if (*offset > data.size() || data.size() - *offset < len) return false;
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), len, out);
  *offset += len;
  return true;
}

}  // namespace

void WriteSnapshotHeader(const SnapshotHeader& header, std::vector<std::uint8_t>* out) {
  primitives::serialize::WriteUint32(out, header.magic);
  out->push_back(static_cast<std::uint8_t>(header.version & 0xFFu));
  out->push_back(static_cast<std::uint8_t>((header.version >> 8) & 0xFFu));
  primitives::serialize::WriteBytes(
      out, std::vector<std::uint8_t>(header.network_id.begin(), header.network_id.end()));
  out->insert(out->end(), header.genesis_hash.begin(), header.genesis_hash.end());
  primitives::serialize::WriteUint32(out, header.tip_height);
  out->insert(out->end(), header.tip_hash.begin(), header.tip_hash.end());
  primitives::serialize::WriteUint64(out, header.record_count);
}

void WriteSnapshotRecord(const std::vector<std::uint8_t>& payload,
                         std::vector<std::uint8_t>* out) {
  primitives::serialize::WriteUint32(out, static_cast<std::uint32_t>(payload.size()));
  out->insert(out->end(), payload.begin(), payload.end());
  const auto digest = crypto::Sha3_256(payload);
  out->insert(out->end(), digest.begin(), digest.end());
}

bool ReadSnapshotFile(const std::string& path, std::vector<std::uint8_t>* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

bool ReadSnapshotHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        SnapshotHeader* header) {
  if (!primitives::serialize::ReadUint32(data, offset, &header->magic)) return false;
  std::uint8_t version[2] = {0, 0};
  if (!ReadFixed(data, offset, version, sizeof(version))) return false;
  header->version =
      static_cast<std::uint16_t>(version[0] | (static_cast<std::uint16_t>(version[1]) << 8));
  std::vector<std::uint8_t> network_id;
  if (!primitives::serialize::ReadBytes(data, offset, &network_id, kMaxNetworkIdSize)) {
    return false;
  }
  header->network_id.assign(network_id.begin(), network_id.end());
  if (!ReadFixed(data, offset, header->genesis_hash.data(), header->genesis_hash.size())) {
    return false;
  }
  if (!primitives::serialize::ReadUint32(data, offset, &header->tip_height)) return false;
  if (!ReadFixed(data, offset, header->tip_hash.data(), header->tip_hash.size())) return false;
  return primitives::serialize::ReadUint64(data, offset, &header->record_count);
}

bool ReadSnapshotRecord(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        std::vector<std::uint8_t>* payload) {
  std::uint32_t size = 0;
  if (!primitives::serialize::ReadUint32(data, offset, &size)) return false;
  if (size == 0 || size > kMaxRecordSize) return false;
  payload->resize(size);
  if (!ReadFixed(data, offset, payload->data(), payload->size())) return false;
  crypto::Sha3_256Hash expected{};
  if (!ReadFixed(data, offset, expected.data(), expected.size())) return false;
  return crypto::Sha3_256(*payload) == expected;
}

}  // namespace sealcoin::storage
