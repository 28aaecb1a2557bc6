#include "linkswap/naming/suffix_generator.h"

namespace linkswap::naming {

namespace {

constexpr std::uint32_t kSuffixModulus = 1000000000U;

}  // namespace

std::string format_suffix(const std::uint32_t state) {
  // 10^9 + (state mod 10^9) always has ten digits and fits in 32 bits; dropping the
  // leading '1' keeps the zero padding.
  const std::uint32_t padded = kSuffixModulus + state % kSuffixModulus;
  return std::to_string(padded).substr(1);
}

LcgSuffixGenerator::LcgSuffixGenerator(core::ISeedSource& seeds) : seeds_(seeds) {}

LcgSuffixGenerator::LcgSuffixGenerator(core::ISeedSource& seeds,
                                       const std::uint32_t initial_state)
    : seeds_(seeds), state_(initial_state) {}

std::uint32_t LcgSuffixGenerator::advance() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::uint32_t r = state_;
  if (r == 0) {
    r = seeds_.seed();
  }
  r = lcg_step(r);
  state_ = r;
  return r;
}

std::string LcgSuffixGenerator::next_suffix() {
  return format_suffix(advance());
}

void LcgSuffixGenerator::reseed() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = seeds_.seed();
}

std::uint32_t LcgSuffixGenerator::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

LcgSuffixGenerator& process_suffix_generator() {
  static core::SystemSeedSource seeds;
  static LcgSuffixGenerator generator(seeds);
  return generator;
}

}  // namespace linkswap::naming
