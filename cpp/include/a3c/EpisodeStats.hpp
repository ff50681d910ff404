#pragma once

#include <atomic>
#include <cstdint>
#include <limits>

namespace a3c {

/*
 * Process-wide training statistics, shared by every worker.
 *
 * Each field is updated atomically on its own. A reader may see max_score() and
 * running_avg_score() reflect different sets of episodes.
 */
class EpisodeStats {
 public:
  void add_steps(int64_t n) { total_steps_ += n; }

  // Records a finished episode and returns the process-wide episode count including it.
  int64_t record_episode(float reward);

  void record_degenerate_distribution() { degenerate_distributions_++; }
  void record_failed_worker() { failed_workers_++; }

  int64_t total_steps() const { return total_steps_; }
  int64_t total_episodes() const { return total_episodes_; }
  int64_t degenerate_distributions() const { return degenerate_distributions_; }
  int64_t failed_workers() const { return failed_workers_; }
  // 0 until the first episode is recorded.
  float max_score() const {
    float score = max_score_;
    return score == -std::numeric_limits<float>::infinity() ? 0.f : score;
  }
  float running_avg_score() const { return running_avg_score_; }

 private:
  std::atomic<int64_t> total_steps_ = 0;
  std::atomic<int64_t> total_episodes_ = 0;
  std::atomic<int64_t> degenerate_distributions_ = 0;
  std::atomic<int64_t> failed_workers_ = 0;
  std::atomic<float> max_score_ = -std::numeric_limits<float>::infinity();
  std::atomic<float> running_avg_score_ = 0;
};

}  // namespace a3c

#include "inline/a3c/EpisodeStats.inl"
