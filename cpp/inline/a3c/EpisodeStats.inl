#include "a3c/EpisodeStats.hpp"

namespace a3c {

inline int64_t EpisodeStats::record_episode(float reward) {
  int64_t n = ++total_episodes_;

  float prev_max = max_score_.load();
  while (reward > prev_max && !max_score_.compare_exchange_weak(prev_max, reward)) {
  }

  // Incremental mean over the process-wide episode count.
  float prev_avg = running_avg_score_.load();
  float next_avg;
  do {
    next_avg = prev_avg + (reward - prev_avg) / n;
  } while (!running_avg_score_.compare_exchange_weak(prev_avg, next_avg));
  return n;
}

}  // namespace a3c
