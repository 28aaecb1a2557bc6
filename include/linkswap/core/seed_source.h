#pragma once

#include <cstdint>

namespace linkswap::core {

// Abstract entropy interface for seeding pseudo-random state.
// Allows production code to draw from wall-clock time and process identity while
// tests inject a fixed seed.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class ISeedSource {
 public:
  virtual ~ISeedSource() = default;

  // Return a fresh 32-bit seed. Zero is a legal return value.
  virtual std::uint32_t seed() = 0;

 protected:
  ISeedSource() = default;
  ISeedSource(const ISeedSource&) = default;
  ISeedSource& operator=(const ISeedSource&) = default;
  ISeedSource(ISeedSource&&) = default;
  ISeedSource& operator=(ISeedSource&&) = default;
};

// Production seed source: (current time in nanoseconds + process id), truncated to 32 bits.
// Thread-safe (stateless).
class SystemSeedSource final : public ISeedSource {
 public:
  SystemSeedSource() = default;
  ~SystemSeedSource() override = default;

  SystemSeedSource(const SystemSeedSource&) = default;
  SystemSeedSource& operator=(const SystemSeedSource&) = default;
  SystemSeedSource(SystemSeedSource&&) = default;
  SystemSeedSource& operator=(SystemSeedSource&&) = default;

  std::uint32_t seed() override;
};

// Fixed seed source: returns a constant for deterministic tests.
class FixedSeedSource final : public ISeedSource {
 public:
  explicit FixedSeedSource(std::uint32_t fixed_seed) : fixed_seed_(fixed_seed) {}
  ~FixedSeedSource() override = default;

  FixedSeedSource(const FixedSeedSource&) = default;
  FixedSeedSource& operator=(const FixedSeedSource&) = default;
  FixedSeedSource(FixedSeedSource&&) = default;
  FixedSeedSource& operator=(FixedSeedSource&&) = default;

  std::uint32_t seed() override;

 private:
  std::uint32_t fixed_seed_;
};

// Combine a nanosecond timestamp with a process id the way SystemSeedSource does.
// Exposed so the derivation can be checked without depending on the wall clock.
[[nodiscard]] std::uint32_t derive_seed(std::int64_t unix_nanos, std::int64_t pid);

}  // namespace linkswap::core
