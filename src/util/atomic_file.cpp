#include "util/atomic_file.hpp"

#include <atomic>
#include <fstream>
#include <system_error>

namespace sealcoin::util {

namespace {

std::atomic<std::uint64_t> g_temp_sequence{0};

bool Fail(std::string* error, const std::filesystem::path& path, const std::string& what) {
  if (error) *error = what + " (" + path.string() + ")";
  return false;
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path, std::span<const std::uint8_t> data,
                     std::string* error) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Fail(error, path, "cannot create directory: " + ec.message());
    }
  }
  auto tmp_path = path;
  tmp_path += ".tmp" + std::to_string(g_temp_sequence.fetch_add(1));

  std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return Fail(error, tmp_path, "cannot open temp file");
  }
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) {
    std::filesystem::remove(tmp_path, ec);
    return Fail(error, tmp_path, "short write");
  }
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    const auto reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return Fail(error, path, "rename failed: " + reason);
  }
  return true;
}

}  // namespace sealcoin::util
