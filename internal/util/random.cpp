#include "random.hpp"

namespace docrev::util {

Mt19937RandomSource::Mt19937RandomSource() : rng_(std::random_device{}()) {
}

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed) : rng_(seed) {
}

int64_t Mt19937RandomSource::UniformInt(int64_t lo, int64_t hi) {
  std::uniform_int_distribution<int64_t> dist(lo, hi);
  return dist(rng_);
}

} // namespace docrev::util
