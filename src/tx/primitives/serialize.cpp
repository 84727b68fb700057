#include "primitives/serialize.hpp"

#include <algorithm>
#include <limits>

namespace sealcoin::primitives::serialize {

namespace {

constexpr std::uint64_t kMinInputBytes = 32 + 4 + 4;
constexpr std::uint64_t kMinOutputBytes = 8 + 1 + 1 + 1;
constexpr std::uint64_t kMaxWitnessItemsPerInput = 64;
constexpr std::uint64_t kMaxCovenantItems = 16;
constexpr std::size_t kMaxCovenantItemSize = 512;
constexpr std::size_t kMaxScriptSize = 10'000;
constexpr std::size_t kMaxWitnessItemSize = 16'384;

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

bool HasWitness(const CTransaction& tx) {
  return std::any_of(tx.vin.begin(), tx.vin.end(),
                     [](const CTxIn& in) { return !in.witness_stack.empty(); });
}

void SerializeInputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  for (const auto& in : tx.vin) {
    out->insert(out->end(), in.prevout.txid.begin(), in.prevout.txid.end());
    WriteUint32(out, in.prevout.index);
    WriteUint32(out, in.sequence);
  }
}

void SerializeOutputs(const CTransaction& tx, std::vector<std::uint8_t>* out) {
  for (const auto& txout : tx.vout) {
    WriteUint64(out, txout.value);
    WriteBytes(out, txout.locking_descriptor);
    SerializeCovenant(txout.covenant, out);
  }
}

bool DeserializeInputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                       CTransaction* tx) {
  for (auto& in : tx->vin) {
    if (!Require(data, *offset, in.prevout.txid.size())) return false;
    std::copy_n(data.begin() + *offset, in.prevout.txid.size(), in.prevout.txid.begin());
    *offset += in.prevout.txid.size();
    if (!ReadUint32(data, offset, &in.prevout.index)) return false;
    if (!ReadUint32(data, offset, &in.sequence)) return false;
  }
  return true;
}

bool DeserializeOutputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        CTransaction* tx) {
  for (auto& txout : tx->vout) {
    if (!ReadUint64(data, offset, &txout.value)) return false;
    if (!ReadBytes(data, offset, &txout.locking_descriptor, kMaxScriptSize)) return false;
    if (!DeserializeCovenant(data, offset, &txout.covenant)) return false;
  }
  return true;
}

// Rejects counts that could not possibly fit in the remaining buffer.
bool PlausibleCount(const std::vector<std::uint8_t>& data, std::size_t offset,
                    std::uint64_t count, std::uint64_t min_bytes_each) {
  const std::size_t remaining = (offset <= data.size()) ? data.size() - offset : 0;
  return count <= remaining / min_bytes_each;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes) {
  WriteVarInt(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  std::uint32_t result = 0;
  for (int i = 0; i < 4; ++i) {
    result |= static_cast<std::uint32_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    // Non-canonical encodings are rejected.
    if (v16 < 0xFD) return false;
    *value = v16;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp)) return false;
    if (tmp <= 0xFFFFu) return false;
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp)) return false;
  if (tmp <= 0xFFFFFFFFULL) return false;
  *value = tmp;
  return true;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* out, std::size_t max_len) {
  std::uint64_t size = 0;
  if (!ReadVarInt(data, offset, &size) || size > max_len ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  const std::size_t len = static_cast<std::size_t>(size);
  out->assign(data.begin() + *offset, data.begin() + *offset + len);
  *offset += len;
  return true;
}

void SerializeCovenant(const CCovenant& covenant, std::vector<std::uint8_t>* out) {
  out->push_back(covenant.type);
  WriteVarInt(out, covenant.items.size());
  for (const auto& item : covenant.items) {
    WriteBytes(out, item);
  }
}

bool DeserializeCovenant(const std::vector<std::uint8_t>& data, std::size_t* offset,
                         CCovenant* covenant) {
  if (!Require(data, *offset, 1)) return false;
  covenant->type = data[(*offset)++];
  std::uint64_t count = 0;
  if (!ReadVarInt(data, offset, &count) || count > kMaxCovenantItems) return false;
  covenant->items.resize(static_cast<std::size_t>(count));
  for (auto& item : covenant->items) {
    if (!ReadBytes(data, offset, &item, kMaxCovenantItemSize)) return false;
  }
  return true;
}

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness) {
  const bool has_witness = include_witness && HasWitness(tx);
  WriteUint32(out, tx.version);
  if (has_witness) {
    out->push_back(0x00);  // marker
    out->push_back(0x01);  // flag
  }
  WriteVarInt(out, tx.vin.size());
  SerializeInputs(tx, out);
  WriteVarInt(out, tx.vout.size());
  SerializeOutputs(tx, out);
  if (has_witness) {
    for (const auto& in : tx.vin) {
      WriteVarInt(out, in.witness_stack.size());
      for (const auto& item : in.witness_stack) {
        WriteBytes(out, item.data);
      }
    }
  }
  WriteUint32(out, tx.lock_time);
}

bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx, bool expect_witness) {
  std::size_t cursor = *offset;
  CTransaction out;
  if (!ReadUint32(data, &cursor, &out.version)) return false;
  bool has_witness = false;
  if (Require(data, cursor, 2) && data[cursor] == 0x00) {
    if (!expect_witness || data[cursor + 1] != 0x01) {
      return false;
    }
    has_witness = true;
    cursor += 2;
  }

  std::uint64_t vin_count = 0;
  if (!ReadVarInt(data, &cursor, &vin_count)) return false;
  if (vin_count == 0 || !PlausibleCount(data, cursor, vin_count, kMinInputBytes)) return false;
  out.vin.resize(static_cast<std::size_t>(vin_count));
  if (!DeserializeInputs(data, &cursor, &out)) return false;

  std::uint64_t vout_count = 0;
  if (!ReadVarInt(data, &cursor, &vout_count)) return false;
  if (!PlausibleCount(data, cursor, vout_count, kMinOutputBytes)) return false;
  out.vout.resize(static_cast<std::size_t>(vout_count));
  if (!DeserializeOutputs(data, &cursor, &out)) return false;

  if (has_witness) {
    for (auto& in : out.vin) {
      std::uint64_t witness_items = 0;
      if (!ReadVarInt(data, &cursor, &witness_items)) return false;
      if (witness_items > kMaxWitnessItemsPerInput) return false;
      in.witness_stack.resize(static_cast<std::size_t>(witness_items));
      for (auto& item : in.witness_stack) {
        if (!ReadBytes(data, &cursor, &item.data, kMaxWitnessItemSize)) return false;
      }
    }
  }
  if (!ReadUint32(data, &cursor, &out.lock_time)) return false;
  *tx = std::move(out);
  *offset = cursor;
  return true;
}

void SerializeBlockHeader(const CBlockHeader& header, std::vector<std::uint8_t>* out) {
  WriteUint32(out, header.version);
  out->insert(out->end(), header.previous_block_hash.begin(), header.previous_block_hash.end());
  out->insert(out->end(), header.merkle_root.begin(), header.merkle_root.end());
  out->insert(out->end(), header.witness_root.begin(), header.witness_root.end());
  WriteUint64(out, header.timestamp);
  WriteUint32(out, header.nonce);
}

bool DeserializeBlockHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CBlockHeader* header) {
  if (!ReadUint32(data, offset, &header->version)) return false;
  for (Hash256* field : {&header->previous_block_hash, &header->merkle_root,
                         &header->witness_root}) {
    if (!Require(data, *offset, field->size())) return false;
    std::copy_n(data.begin() + *offset, field->size(), field->begin());
    *offset += field->size();
  }
  if (!ReadUint64(data, offset, &header->timestamp)) return false;
  return ReadUint32(data, offset, &header->nonce);
}

void SerializeBlock(const CBlock& block, std::vector<std::uint8_t>* out) {
  SerializeBlockHeader(block.header, out);
  WriteVarInt(out, block.transactions.size());
  for (const auto& tx : block.transactions) {
    SerializeTransaction(tx, out, /*include_witness=*/true);
  }
}

bool DeserializeBlock(const std::vector<std::uint8_t>& data, std::size_t* offset, CBlock* block) {
  if (!DeserializeBlockHeader(data, offset, &block->header)) return false;
  std::uint64_t tx_count = 0;
  if (!ReadVarInt(data, offset, &tx_count)) return false;
  constexpr std::uint64_t kMinTransactionBytes = 10;
  if (!PlausibleCount(data, *offset, tx_count, kMinTransactionBytes)) return false;
  block->transactions.resize(static_cast<std::size_t>(tx_count));
  for (auto& tx : block->transactions) {
    if (!DeserializeTransaction(data, offset, &tx, /*expect_witness=*/true)) {
      return false;
    }
  }
  return true;
}

}  // namespace sealcoin::primitives::serialize
