#include "linkswap/core/seed_source.h"

#include <chrono>

#include <unistd.h>

namespace linkswap::core {

std::uint32_t derive_seed(const std::int64_t unix_nanos, const std::int64_t pid) {
  // Sum in unsigned 64-bit space so overflow wraps instead of being undefined.
  const auto sum = static_cast<std::uint64_t>(unix_nanos) + static_cast<std::uint64_t>(pid);
  return static_cast<std::uint32_t>(sum);
}

std::uint32_t SystemSeedSource::seed() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return derive_seed(static_cast<std::int64_t>(nanos), static_cast<std::int64_t>(::getpid()));
}

std::uint32_t FixedSeedSource::seed() {
  return fixed_seed_;
}

}  // namespace linkswap::core
