#include <cstdint>
#include <iostream>
#include <vector>

#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"

namespace {

bool ExpectEq(const std::vector<std::uint8_t>& actual, const std::vector<std::uint8_t>& expected,
              const char* label) {
  if (actual != expected) {
    std::cerr << label << ": mismatch (size " << actual.size() << " vs " << expected.size()
              << ")\n";
    return false;
  }
  return true;
}

sealcoin::primitives::CTransaction CovenantTransaction() {
  sealcoin::primitives::CTransaction tx;
  tx.version = 1;
  tx.vin.resize(1);
  tx.vin[0].prevout.txid.fill(0x7A);
  tx.vin[0].prevout.index = 3;
  tx.vin[0].witness_stack.push_back({std::vector<std::uint8_t>(40, 0x01)});
  tx.vin[0].witness_stack.push_back({std::vector<std::uint8_t>(300, 0x02)});
  tx.vout.resize(2);
  tx.vout[0].value = 1'500'000;
  tx.vout[0].locking_descriptor = {0x51, 0x20};
  tx.vout[0].locking_descriptor.resize(34, 0x9C);
  tx.vout[0].covenant.type = 3;
  tx.vout[0].covenant.items = {std::vector<std::uint8_t>(32, 0xAA), {0x0A, 0x00, 0x00, 0x00},
                               {'a', 'b', 'c'}, std::vector<std::uint8_t>(32, 0xBB)};
  tx.vout[1].value = 42;
  tx.vout[1].locking_descriptor = tx.vout[0].locking_descriptor;
  tx.lock_time = 17;
  return tx;
}

}  // namespace

int main() {
  using namespace sealcoin::primitives::serialize;

  {
    std::vector<std::uint8_t> out;
    WriteVarInt(&out, 0xFC);
    if (!ExpectEq(out, {0xFC}, "encode 0xFC")) return 1;
  }

  {
    std::vector<std::uint8_t> out;
    WriteVarInt(&out, 0xFD);
    if (!ExpectEq(out, {0xFD, 0xFD, 0x00}, "encode 0xFD")) return 1;
  }

  {
    std::vector<std::uint8_t> out;
    WriteVarInt(&out, 300);
    if (!ExpectEq(out, {0xFD, 0x2C, 0x01}, "encode 300")) return 1;
  }

  // Non-canonical encodings should be rejected.
  {
    const std::vector<std::uint8_t> non_canonical = {0xFD, 0xFC, 0x00};  // 0xFC must be 1 byte
    std::size_t offset = 0;
    std::uint64_t value = 0;
    if (ReadVarInt(non_canonical, &offset, &value)) {
      std::cerr << "non-canonical 0xFC accepted\n";
      return 1;
    }
  }

  {
    const std::vector<std::uint8_t> non_canonical = {0xFE, 0xFF, 0xFF, 0x00, 0x00};  // 0xFFFF
    std::size_t offset = 0;
    std::uint64_t value = 0;
    if (ReadVarInt(non_canonical, &offset, &value)) {
      std::cerr << "non-canonical 0xFFFF accepted\n";
      return 1;
    }
  }

  // Covenant wire form: tag, item count, length-prefixed items.
  {
    sealcoin::primitives::CCovenant covenant;
    covenant.type = 5;
    covenant.items = {{0x01, 0x02}, {}};
    std::vector<std::uint8_t> out;
    SerializeCovenant(covenant, &out);
    if (!ExpectEq(out, {0x05, 0x02, 0x02, 0x01, 0x02, 0x00}, "encode covenant")) return 1;

    const std::vector<std::uint8_t> too_many = {0x02, 0x11};
    std::size_t offset = 0;
    sealcoin::primitives::CCovenant decoded;
    if (DeserializeCovenant(too_many, &offset, &decoded)) {
      std::cerr << "covenant with 17 items accepted\n";
      return 1;
    }
  }

  {
    const auto tx = CovenantTransaction();
    std::vector<std::uint8_t> raw;
    SerializeTransaction(tx, &raw);
    std::size_t offset = 0;
    sealcoin::primitives::CTransaction decoded;
    if (!DeserializeTransaction(raw, &offset, &decoded) || offset != raw.size()) {
      std::cerr << "covenant transaction failed to decode\n";
      return 1;
    }
    if (decoded.vout[0].covenant != tx.vout[0].covenant || !decoded.vout[1].covenant.IsNone() ||
        decoded.vin[0].witness_stack != tx.vin[0].witness_stack) {
      std::cerr << "covenant transaction changed across the wire\n";
      return 1;
    }

    // Truncating anywhere must fail cleanly.
    for (std::size_t cut = 0; cut < raw.size(); cut += 7) {
      std::vector<std::uint8_t> partial(raw.begin(), raw.begin() + cut);
      std::size_t partial_offset = 0;
      sealcoin::primitives::CTransaction ignored;
      if (DeserializeTransaction(partial, &partial_offset, &ignored)) {
        std::cerr << "truncated transaction accepted at " << cut << "\n";
        return 1;
      }
    }

    // Witness data never moves the txid; covenants do.
    auto stripped = tx;
    stripped.vin[0].witness_stack.clear();
    if (sealcoin::primitives::ComputeTxId(stripped) != sealcoin::primitives::ComputeTxId(tx) ||
        sealcoin::primitives::ComputeWTxId(stripped) == sealcoin::primitives::ComputeWTxId(tx)) {
      std::cerr << "txid/wtxid witness commitment mismatch\n";
      return 1;
    }
    auto recovenanted = tx;
    recovenanted.vout[0].covenant.items[2].push_back('d');
    if (sealcoin::primitives::ComputeTxId(recovenanted) == sealcoin::primitives::ComputeTxId(tx)) {
      std::cerr << "txid does not commit to covenants\n";
      return 1;
    }
  }

  return 0;
}
