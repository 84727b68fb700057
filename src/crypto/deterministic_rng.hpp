#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace sealcoin::crypto {

// SHA3-256 counter-mode byte stream. While an instance is alive it becomes
// the thread's active source for key generation and blinding nonces, so
// tests and regtest tooling can replay wallets byte for byte.
class DeterministicOqsRng {
 public:
  explicit DeterministicOqsRng(std::span<const std::uint8_t> seed);
  DeterministicOqsRng(const DeterministicOqsRng&) = delete;
  DeterministicOqsRng& operator=(const DeterministicOqsRng&) = delete;
  ~DeterministicOqsRng();

  static DeterministicOqsRng* CurrentInstance();

  // Fill |out| with |len| bytes from the active stream. No-op when no
  // instance is installed; callers fall back to system randomness.
  void Generate(std::uint8_t* out, std::size_t len);

 private:
  static DeterministicOqsRng*& Instance();
  void Fill(std::uint8_t* out, std::size_t len);
  void Refill();

  DeterministicOqsRng* prev_instance_{nullptr};
  std::array<std::uint8_t, 32> buffer_{};
  std::size_t buffer_index_{0};
  std::array<std::uint8_t, 32> seed_material_{};
  std::uint64_t counter_{0};
};

// Fills |out| from the active DeterministicOqsRng, or the OS CSPRNG.
void FillRandomBytes(std::span<std::uint8_t> out);

}  // namespace sealcoin::crypto
