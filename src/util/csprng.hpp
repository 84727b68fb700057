#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace sealcoin::util {

// Fills `out` from the operating system CSPRNG (getrandom, then /dev/urandom).
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Aborts the process if secure randomness is unavailable.
void FillSecureRandomBytesOrAbort(std::span<std::uint8_t> out);

}  // namespace sealcoin::util
