#pragma once

#include "linkswap/core/seed_source.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace linkswap::naming {

// Numerical Recipes LCG constants. State arithmetic is modulo 2^32.
constexpr std::uint32_t kLcgMultiplier = 1664525U;
constexpr std::uint32_t kLcgIncrement = 1013904223U;

// Every suffix is exactly this many decimal digits, leading zeros preserved.
constexpr std::size_t kSuffixWidth = 9;

// lcg_step advances a raw state by one step of the recurrence.
[[nodiscard]] constexpr std::uint32_t lcg_step(const std::uint32_t state) noexcept {
  return state * kLcgMultiplier + kLcgIncrement;
}

// format_suffix renders (state mod 10^9) as a zero-padded 9-digit string.
// Example: 7 -> "000000007", 1015568748 -> "015568748".
[[nodiscard]] std::string format_suffix(std::uint32_t state);

// ISuffixGenerator produces short disambiguating filename suffixes.
// The allocator depends only on this seam; it has no knowledge of how suffixes are derived.
class ISuffixGenerator {
 public:
  virtual ~ISuffixGenerator() = default;

  // Contract: returns a kSuffixWidth-character string of decimal digits.
  // Never fails.
  virtual std::string next_suffix() = 0;

  // Replace the generator trajectory with one derived from fresh entropy.
  virtual void reseed() = 0;

 protected:
  ISuffixGenerator() = default;
  ISuffixGenerator(const ISuffixGenerator&) = default;
  ISuffixGenerator& operator=(const ISuffixGenerator&) = default;
  ISuffixGenerator(ISuffixGenerator&&) = default;
  ISuffixGenerator& operator=(ISuffixGenerator&&) = default;
};

// LcgSuffixGenerator owns one 32-bit LCG state guarded by one mutex.
//
// Lifecycle of the state:
// - 0 means "unseeded"; the first advance() seeds it from the seed source.
// - Every advance() applies lcg_step() and publishes the new value.
// - reseed() overwrites it with a fresh seed (which may itself be 0, in which case the
//   next advance() seeds again).
//
// Thread-safety: advance() and reseed() hold the mutex only for the read-modify-write of
// the state. Suffix formatting happens after the lock is released.
class LcgSuffixGenerator final : public ISuffixGenerator {
 public:
  explicit LcgSuffixGenerator(core::ISeedSource& seeds);

  // Start from a known state. A non-zero initial_state makes the sequence reproducible
  // without ever consulting the seed source.
  LcgSuffixGenerator(core::ISeedSource& seeds, std::uint32_t initial_state);

  ~LcgSuffixGenerator() override = default;

  // Not copyable or movable (contains mutex)
  LcgSuffixGenerator(const LcgSuffixGenerator&) = delete;
  LcgSuffixGenerator& operator=(const LcgSuffixGenerator&) = delete;
  LcgSuffixGenerator(LcgSuffixGenerator&&) = delete;
  LcgSuffixGenerator& operator=(LcgSuffixGenerator&&) = delete;

  std::string next_suffix() override;
  void reseed() override;

  // Seed if needed, step once, and return the new raw state.
  std::uint32_t advance();

  // Snapshot of the raw state (0 if never seeded).
  [[nodiscard]] std::uint32_t state() const;

 private:
  core::ISeedSource& seeds_;
  mutable std::mutex mutex_;
  std::uint32_t state_{0};
};

// process_suffix_generator returns the process-wide generator seeded from
// SystemSeedSource. Constructed on first use; lives until process exit.
LcgSuffixGenerator& process_suffix_generator();

}  // namespace linkswap::naming
