#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace sealcoin::util {

// Replaces |path| with |data| in one rename: the bytes go to a sibling temp
// file first, so readers see either the old contents or the new ones.
bool AtomicWriteFile(const std::filesystem::path& path, std::span<const std::uint8_t> data,
                     std::string* error = nullptr);

}  // namespace sealcoin::util
