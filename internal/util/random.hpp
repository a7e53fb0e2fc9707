#pragma once

#include <cstdint>
#include <random>

namespace docrev::util {

/*
  Injectable source of uniform integers.

  The timeline generator draws every interval from here so tests can
  substitute a deterministic sequence.
*/
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniform integer in the closed range [lo, hi].
  virtual int64_t UniformInt(int64_t lo, int64_t hi) = 0;
};

class Mt19937RandomSource final : public RandomSource {
 public:
  Mt19937RandomSource();
  explicit Mt19937RandomSource(uint64_t seed);

  int64_t UniformInt(int64_t lo, int64_t hi) override;

 private:
  std::mt19937_64 rng_;
};

} // namespace docrev::util
