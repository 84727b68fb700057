#include "util/csprng.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif

namespace sealcoin::util {

namespace {

bool ReadDevUrandom(std::span<std::uint8_t> out, std::size_t filled, std::string* error) {
  const int fd = ::open("/dev/urandom", O_RDONLY);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      ::close(fd);
      if (error) {
        *error = n == 0 ? std::string("read(/dev/urandom) returned EOF")
                        : std::string("read(/dev/urandom) failed: ") + std::strerror(errno);
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

}  // namespace

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  if (out.empty()) {
    return true;
  }
  std::size_t filled = 0;
#if defined(__linux__)
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  if (filled == out.size()) {
    return true;
  }
#endif
  return ReadDevUrandom(out, filled, error);
}

void FillSecureRandomBytesOrAbort(std::span<std::uint8_t> out) {
  std::string err;
  if (!FillSecureRandomBytes(out, &err)) {
    // Keys and blinding nonces must never come from a degraded source.
    std::cerr << "[util] fatal: secure randomness unavailable: " << err << "\n";
    std::abort();
  }
}

}  // namespace sealcoin::util
