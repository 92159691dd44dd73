#ifndef RANDOM_H
#define RANDOM_H

#include <algorithm> // std::swap()
#include <functional> // std::function<>, std::bind(), std::ref()
#include <numeric> // std::iota()
#include <random>
#include <stdexcept>
#include <vector>
// Choosing the random number generator. (mt19937: Mersenne-Twister)
typedef std::mt19937 base_generator_type;
// defined in <functional>
using std::bind;
using std::ref;

template <typename GeneratorType = base_generator_type>
struct RandomNumberGenerator {

  GeneratorType generator;

  RandomNumberGenerator(long seed) {
    generator.seed(seed);
  }

  /** Uniform real values in [min, max). */
  std::function<double()> getRandomFunctionDouble(double min, double max) {
    if (!(max > min)) {
      throw std::invalid_argument("getRandomFunctionDouble: max must be greater than min");
    }
    std::uniform_real_distribution<> dist(min, max);
    return bind(dist, ref(generator));
  }

  /** Uniform integer values in [min, max]. */
  template <typename T>
  std::function<T()> getRandomFunctionInt(T min, T max) {
    std::uniform_int_distribution<T> dist(min, max);
    return bind(dist, ref(generator));
  }

  /**
   * Draw k distinct indices from [0, n) without replacement
   * (partial Fisher-Yates shuffle).
   * Indices are returned in the order they were drawn.
   */
  std::vector<size_t>
  sampleIndices (
    size_t n,
    size_t k
  )
  {
    if (k > n) {
      throw std::invalid_argument("sampleIndices: cannot draw more indices than available");
    }
    std::vector<size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    for (size_t i=0; i<k; ++i) {
      std::uniform_int_distribution<size_t> dist(i, n-1);
      std::swap(idx[i], idx[dist(generator)]);
    }
    idx.resize(k);
    return idx;
  }
};

#endif /* RANDOM_H */
