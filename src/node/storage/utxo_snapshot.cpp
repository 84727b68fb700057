#include "storage/utxo_snapshot.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"

namespace sealcoin::storage {

namespace {

constexpr std::uint32_t kUtxoMagic = 0x4F585453;  // 'STXO' (little-endian uint32)
constexpr std::uint16_t kUtxoVersion = 1;
constexpr std::size_t kMaxScriptSize = 10'000;

void EncodeCoin(const primitives::COutPoint& outpoint, const consensus::Coin& coin,
                std::vector<std::uint8_t>* buffer) {
  buffer->insert(buffer->end(), outpoint.txid.begin(), outpoint.txid.end());
  primitives::serialize::WriteUint32(buffer, outpoint.index);
  primitives::serialize::WriteUint32(buffer, coin.height);
  buffer->push_back(static_cast<std::uint8_t>(coin.coinbase));
  primitives::serialize::WriteUint64(buffer, coin.out.value);
  primitives::serialize::WriteBytes(buffer, coin.out.locking_descriptor);
  primitives::serialize::SerializeCovenant(coin.out.covenant, buffer);
}

bool DecodeCoin(const std::vector<std::uint8_t>& buffer, primitives::COutPoint* outpoint,
                consensus::Coin* coin) {
  if (buffer.size() < outpoint->txid.size()) return false;
  std::copy_n(buffer.begin(), outpoint->txid.size(), outpoint->txid.begin());
  std::size_t offset = outpoint->txid.size();
  if (!primitives::serialize::ReadUint32(buffer, &offset, &outpoint->index)) return false;
  if (!primitives::serialize::ReadUint32(buffer, &offset, &coin->height)) return false;
  if (offset >= buffer.size()) return false;
  coin->coinbase = buffer[offset++] != 0;
  if (!primitives::serialize::ReadUint64(buffer, &offset, &coin->out.value)) return false;
  if (!primitives::serialize::ReadBytes(buffer, &offset, &coin->out.locking_descriptor,
                                        kMaxScriptSize)) {
    return false;
  }
  if (!primitives::serialize::DeserializeCovenant(buffer, &offset, &coin->out.covenant)) {
    return false;
  }
  return offset == buffer.size();
}

}  // namespace

bool SaveUTXOSnapshot(const consensus::UTXOSet& view, const consensus::ChainParams& params,
                      std::uint32_t tip_height, const primitives::Hash256& tip_hash,
                      const std::string& path, std::string* error) {
  SnapshotHeader header;
  header.magic = kUtxoMagic;
  header.version = kUtxoVersion;
  header.network_id = params.network_id;
  header.genesis_hash = params.genesis_hash;
  header.tip_height = tip_height;
  header.tip_hash = tip_hash;
  header.record_count = view.Size();

  std::vector<std::uint8_t> contents;
  WriteSnapshotHeader(header, &contents);
  std::vector<std::uint8_t> record;
  record.reserve(512);
  view.ForEach([&](const primitives::COutPoint& outpoint, const consensus::Coin& coin) {
    record.clear();
    EncodeCoin(outpoint, coin, &record);
    WriteSnapshotRecord(record, &contents);
    return true;
  });
  return util::AtomicWriteFile(std::filesystem::path(path), contents, error);
}

bool LoadUTXOSnapshot(consensus::UTXOSet* view, const consensus::ChainParams& params,
                      const std::string& path, SnapshotHeader* header_out,
                      std::string* error) {
  std::vector<std::uint8_t> contents;
  if (!ReadSnapshotFile(path, &contents)) {
    if (error) *error = "unable to read " + path;
    return false;
  }
  std::size_t offset = 0;
  SnapshotHeader header;
  if (!ReadSnapshotHeader(contents, &offset, &header) || header.magic != kUtxoMagic ||
      header.version != kUtxoVersion) {
    if (error) *error = "malformed UTXO snapshot header";
    return false;
  }
  if (header.network_id != params.network_id || header.genesis_hash != params.genesis_hash) {
    if (error) *error = "UTXO snapshot belongs to another network";
    return false;
  }
  consensus::UTXOSet loaded;
  loaded.Reserve(static_cast<std::size_t>(std::min<std::uint64_t>(header.record_count, 1u << 20)));
  std::vector<std::uint8_t> record;
  for (std::uint64_t i = 0; i < header.record_count; ++i) {
    primitives::COutPoint outpoint;
    consensus::Coin coin;
    if (!ReadSnapshotRecord(contents, &offset, &record) ||
        !DecodeCoin(record, &outpoint, &coin)) {
      if (error) *error = "corrupt UTXO snapshot record " + std::to_string(i);
      return false;
    }
    loaded.AddCoin(outpoint, std::move(coin));
  }
  if (offset != contents.size()) {
    if (error) *error = "trailing bytes in UTXO snapshot";
    return false;
  }
  *view = std::move(loaded);
  if (header_out) *header_out = header;
  return true;
}

}  // namespace sealcoin::storage
