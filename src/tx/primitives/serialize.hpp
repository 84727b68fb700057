#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "primitives/block.hpp"
#include "primitives/transaction.hpp"

namespace sealcoin::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
// Reads a varint length prefix followed by that many bytes (at most |max_len|).
bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* out, std::size_t max_len);

// Covenant wire form: type byte, varint item count, varint-prefixed items.
void SerializeCovenant(const CCovenant& covenant, std::vector<std::uint8_t>* out);
bool DeserializeCovenant(const std::vector<std::uint8_t>& data, std::size_t* offset,
                         CCovenant* covenant);

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness = true);
bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CTransaction* tx, bool expect_witness = true);
void SerializeBlockHeader(const CBlockHeader& header, std::vector<std::uint8_t>* out);
bool DeserializeBlockHeader(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            CBlockHeader* header);
void SerializeBlock(const CBlock& block, std::vector<std::uint8_t>* out);
bool DeserializeBlock(const std::vector<std::uint8_t>& data, std::size_t* offset, CBlock* block);

}  // namespace sealcoin::primitives::serialize
