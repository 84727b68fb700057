#include "storage/name_snapshot.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "consensus/name_state.hpp"
#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"

namespace sealcoin::storage {

namespace {

constexpr std::uint32_t kNameMagic = 0x4D414E53;  // 'SNAM' (little-endian uint32)
constexpr std::uint16_t kNameVersion = 1;
constexpr std::size_t kMaxDataSize = 64 * 1024;

void EncodeState(const consensus::NameState& state, std::vector<std::uint8_t>* buffer) {
  buffer->insert(buffer->end(), state.name_hash.begin(), state.name_hash.end());
  primitives::serialize::WriteBytes(
      buffer, std::vector<std::uint8_t>(state.name.begin(), state.name.end()));
  primitives::serialize::WriteUint32(buffer, state.open_height);
  primitives::serialize::WriteUint64(buffer, state.highest);
  primitives::serialize::WriteUint64(buffer, state.value);
  buffer->insert(buffer->end(), state.owner.txid.begin(), state.owner.txid.end());
  primitives::serialize::WriteUint32(buffer, state.owner.index);
  buffer->push_back(static_cast<std::uint8_t>(state.registered));
  primitives::serialize::WriteUint32(buffer, state.renewal_height);
  primitives::serialize::WriteUint32(buffer, state.transfer_lockup);
  primitives::serialize::WriteBytes(buffer, state.data);
}

bool ReadHash(const std::vector<std::uint8_t>& buffer, std::size_t* offset,
              primitives::Hash256* out) {
  if (*offset > buffer.size() || buffer.size() - *offset < out->size()) return false;
  std::copy_n(buffer.begin() + static_cast<std::ptrdiff_t>(*offset), out->size(), out->begin());
  *offset += out->size();
  return true;
}

bool DecodeState(const std::vector<std::uint8_t>& buffer, const consensus::NameParams& params,
                 consensus::NameState* state) {
  std::size_t offset = 0;
  if (!ReadHash(buffer, &offset, &state->name_hash)) return false;
  std::vector<std::uint8_t> name;
  if (!primitives::serialize::ReadBytes(buffer, &offset, &name, params.max_name_size)) {
    return false;
  }
  state->name.assign(name.begin(), name.end());
  if (consensus::HashName(state->name) != state->name_hash) return false;
  if (!primitives::serialize::ReadUint32(buffer, &offset, &state->open_height) ||
      !primitives::serialize::ReadUint64(buffer, &offset, &state->highest) ||
      !primitives::serialize::ReadUint64(buffer, &offset, &state->value) ||
      !ReadHash(buffer, &offset, &state->owner.txid) ||
      !primitives::serialize::ReadUint32(buffer, &offset, &state->owner.index)) {
    return false;
  }
  if (offset >= buffer.size()) return false;
  state->registered = buffer[offset++] != 0;
  if (!primitives::serialize::ReadUint32(buffer, &offset, &state->renewal_height) ||
      !primitives::serialize::ReadUint32(buffer, &offset, &state->transfer_lockup) ||
      !primitives::serialize::ReadBytes(buffer, &offset, &state->data, kMaxDataSize)) {
    return false;
  }
  return offset == buffer.size();
}

}  // namespace

bool SaveNameSnapshot(const consensus::NameRegistry& names, const consensus::ChainParams& params,
                      std::uint32_t tip_height, const primitives::Hash256& tip_hash,
                      const std::string& path, std::string* error) {
  SnapshotHeader header;
  header.magic = kNameMagic;
  header.version = kNameVersion;
  header.network_id = params.network_id;
  header.genesis_hash = params.genesis_hash;
  header.tip_height = tip_height;
  header.tip_hash = tip_hash;
  header.record_count = names.Size();

  std::vector<std::uint8_t> contents;
  WriteSnapshotHeader(header, &contents);
  std::vector<std::uint8_t> record;
  names.ForEach([&](const primitives::Hash256&, const consensus::NameState& state) {
    record.clear();
    EncodeState(state, &record);
    WriteSnapshotRecord(record, &contents);
    return true;
  });
  return util::AtomicWriteFile(std::filesystem::path(path), contents, error);
}

bool LoadNameSnapshot(consensus::NameRegistry* names, const consensus::ChainParams& params,
                      const std::string& path, SnapshotHeader* header_out,
                      std::string* error) {
  std::vector<std::uint8_t> contents;
  if (!ReadSnapshotFile(path, &contents)) {
    if (error) *error = "unable to read " + path;
    return false;
  }
  std::size_t offset = 0;
  SnapshotHeader header;
  if (!ReadSnapshotHeader(contents, &offset, &header) || header.magic != kNameMagic ||
      header.version != kNameVersion) {
    if (error) *error = "malformed name snapshot header";
    return false;
  }
  if (header.network_id != params.network_id || header.genesis_hash != params.genesis_hash) {
    if (error) *error = "name snapshot belongs to another network";
    return false;
  }
  consensus::NameRegistry loaded;
  std::vector<std::uint8_t> record;
  for (std::uint64_t i = 0; i < header.record_count; ++i) {
    consensus::NameState state;
    if (!ReadSnapshotRecord(contents, &offset, &record) ||
        !DecodeState(record, params.names, &state)) {
      if (error) *error = "corrupt name snapshot record " + std::to_string(i);
      return false;
    }
    loaded.Put(std::move(state));
  }
  if (offset != contents.size()) {
    if (error) *error = "trailing bytes in name snapshot";
    return false;
  }
  *names = std::move(loaded);
  if (header_out) *header_out = header;
  return true;
}

}  // namespace sealcoin::storage
