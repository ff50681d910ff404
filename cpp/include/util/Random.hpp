#pragma once

#include <concepts>
#include <iterator>
#include <random>

/*
 * A thin wrapper around STL's random machinery.
 *
 * There is one process-wide default prng, seeded from the clock unless --seed is passed:
 *
 * util::Random::Params random_params;
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, ac, av);
 * util::Random::init(random_params);
 *
 * The default prng is not thread-safe. Code that samples from multiple threads (e.g., the a3c
 * workers) should own a std::mt19937 obtained from spawn_prng() before the threads start, and use
 * the overloads that accept a prng as the first argument.
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  // Uniformly picks a value in the half-open range [lower, upper). Requires lower < upper.
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  // Uniformly picks a real value in [left, right).
  template <typename FloatType>
  static FloatType uniform_real(std::mt19937& prng, FloatType left, FloatType right);

  template <typename FloatType>
  static FloatType uniform_real(FloatType left, FloatType right);

  /*
   * Given an array A of n nonnegative weights, produces a random integer on the interval [0, n),
   * where integer i is chosen with probability proportional to A[i].
   *
   * Example:
   *
   * std::array<float, 3> arr = {1, 2, 3};
   * int k = util::Random::weighted_sample(prng, arr.begin(), arr.end());
   */
  template <typename InputIt>
  static int weighted_sample(std::mt19937& prng, InputIt begin, InputIt end);

  template <typename InputIt>
  static int weighted_sample(InputIt begin, InputIt end);

  // Returns a new prng seeded from the default prng.
  static std::mt19937 spawn_prng();

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
