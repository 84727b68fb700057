#pragma once

#include <string>

#include "consensus/params.hpp"
#include "consensus/utxo.hpp"
#include "storage/snapshot_format.hpp"

namespace sealcoin::storage {

// Snapshots are bound to a network (id + genesis) and to the chain tip they
// were taken at; the loader reports the tip so callers can detect a stale
// snapshot.
bool SaveUTXOSnapshot(const consensus::UTXOSet& view, const consensus::ChainParams& params,
                      std::uint32_t tip_height, const primitives::Hash256& tip_hash,
                      const std::string& path, std::string* error = nullptr);
bool LoadUTXOSnapshot(consensus::UTXOSet* view, const consensus::ChainParams& params,
                      const std::string& path, SnapshotHeader* header_out,
                      std::string* error = nullptr);

}  // namespace sealcoin::storage
