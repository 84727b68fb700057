#include "storage/block_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealcoin::storage {

namespace {

constexpr std::uint32_t kBlockMagic = 0x4B4C4253;  // "SBLK" little-endian
constexpr std::uint32_t kMaxBlockRecordSize = 8 * 1024 * 1024;
constexpr std::size_t kRecordHeaderSize = 8 + 32;

bool SetError(std::string* error, std::string message) {
  if (error) *error = std::move(message);
  return false;
}

}  // namespace

BlockStore::BlockStore(std::string path) : path_(std::move(path)) {}

bool BlockStore::Append(const primitives::CBlock& block, std::string* error) {
  std::vector<std::uint8_t> body;
  primitives::serialize::SerializeBlock(block, &body);
  if (body.size() > kMaxBlockRecordSize) {
    return SetError(error, "block record too large for " + path_);
  }
  std::vector<std::uint8_t> record;
  record.reserve(kRecordHeaderSize + body.size());
  primitives::serialize::WriteUint32(&record, kBlockMagic);
  primitives::serialize::WriteUint32(&record, static_cast<std::uint32_t>(body.size()));
  const auto checksum = crypto::Sha3_256(body);
  record.insert(record.end(), checksum.begin(), checksum.end());
  record.insert(record.end(), body.begin(), body.end());

  const auto parent = std::filesystem::path(path_).parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  std::ofstream out(path_, std::ios::binary | std::ios::app);
  out.write(reinterpret_cast<const char*>(record.data()),
            static_cast<std::streamsize>(record.size()));
  out.flush();
  if (!out) {
    return SetError(error, "failed to append block to " + path_);
  }
  return true;
}

bool BlockStore::LoadAll(std::vector<primitives::CBlock>* blocks, std::string* error) const {
  blocks->clear();
  std::ifstream in(path_, std::ios::binary);
  if (!in.is_open()) {
    return true;
  }
  const std::vector<std::uint8_t> file((std::istreambuf_iterator<char>(in)),
                                       std::istreambuf_iterator<char>());
  std::size_t offset = 0;
  bool torn = false;
  while (offset < file.size()) {
    const std::size_t record_start = offset;
    std::uint32_t magic = 0;
    std::uint32_t size = 0;
    if (!primitives::serialize::ReadUint32(file, &offset, &magic) ||
        !primitives::serialize::ReadUint32(file, &offset, &size)) {
      torn = true;
      break;
    }
    if (magic != kBlockMagic || size == 0 || size > kMaxBlockRecordSize) {
      return SetError(error, "bad block record header at offset " +
                                 std::to_string(record_start) + " in " + path_);
    }
    if (file.size() - offset < 32 + static_cast<std::size_t>(size)) {
      torn = true;
      break;
    }
    crypto::Sha3_256Hash expected{};
    std::copy_n(file.begin() + static_cast<std::ptrdiff_t>(offset), expected.size(),
                expected.begin());
    offset += expected.size();
    const std::vector<std::uint8_t> body(file.begin() + static_cast<std::ptrdiff_t>(offset),
                                         file.begin() + static_cast<std::ptrdiff_t>(offset + size));
    offset += size;
    if (crypto::Sha3_256(body) != expected) {
      return SetError(error, "checksum mismatch for block " + std::to_string(blocks->size()) +
                                 " in " + path_);
    }
    primitives::CBlock block;
    std::size_t cursor = 0;
    if (!primitives::serialize::DeserializeBlock(body, &cursor, &block) ||
        cursor != body.size()) {
      return SetError(error, "undecodable block " + std::to_string(blocks->size()) + " in " +
                                 path_);
    }
    blocks->push_back(std::move(block));
  }
  if (torn) {
    std::cerr << "[storage] warn: ignoring torn record at the end of " << path_ << "\n";
  }
  return true;
}

}  // namespace sealcoin::storage
