#pragma once

#include <string>

#include "consensus/name_registry.hpp"
#include "consensus/params.hpp"
#include "storage/snapshot_format.hpp"

namespace sealcoin::storage {

bool SaveNameSnapshot(const consensus::NameRegistry& names, const consensus::ChainParams& params,
                      std::uint32_t tip_height, const primitives::Hash256& tip_hash,
                      const std::string& path, std::string* error = nullptr);
bool LoadNameSnapshot(consensus::NameRegistry* names, const consensus::ChainParams& params,
                      const std::string& path, SnapshotHeader* header_out,
                      std::string* error = nullptr);

}  // namespace sealcoin::storage
