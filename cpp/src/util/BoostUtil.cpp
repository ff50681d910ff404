#include "util/BoostUtil.hpp"

#include "util/Random.hpp"

namespace boost_util {

int get_random_set_index(std::mt19937& prng, const boost::dynamic_bitset<>& bitset) {
  int count = bitset.count();
  if (count == 0) return -1;

  // Walk to the k-th set bit.
  int k = util::Random::uniform_sample(prng, 0, count);
  auto index = bitset.find_first();
  for (; k > 0; --k) {
    index = bitset.find_next(index);
  }
  return index;
}

int get_random_set_index(const boost::dynamic_bitset<>& bitset) {
  return get_random_set_index(util::Random::default_prng(), bitset);
}

}  // namespace boost_util
