#pragma once

#include "a3c/AdvantageEstimator.hpp"
#include "a3c/PolicyValueNet.hpp"
#include "a3c/Types.hpp"
#include "sc2/BasicTypes.hpp"
#include "sc2/ObservationEncoder.hpp"

#include <Eigen/Core>

#include <memory>
#include <vector>

namespace a3c {

struct RolloutStep {
  std::shared_ptr<const sc2::EncodedObservation> observation;
  sc2::action_index_t base_action;
  ArgSamples arg_samples;
  float reward;
  std::shared_ptr<const sc2::EncodedObservation> next_observation;
  bool done;
  float value_estimate;
};

// The ordered transitions a worker has collected since its last training step.
class Rollout {
 public:
  void push_back(RolloutStep step) { steps_.push_back(std::move(step)); }
  void clear() { steps_.clear(); }

  int size() const { return steps_.size(); }
  bool empty() const { return steps_.empty(); }
  const std::vector<RolloutStep>& steps() const { return steps_; }

  // Drops the oldest size()/2 steps, keeping the most recent ones in order.
  void truncate_to_recent_half();

  Eigen::VectorXf rewards() const;
  Eigen::VectorXf values() const;

  // The batch references this rollout's observations; it must not outlive the rollout.
  TrainingBatch make_batch(const AdvantageEstimator::Targets& targets) const;

 private:
  std::vector<RolloutStep> steps_;
};

}  // namespace a3c
