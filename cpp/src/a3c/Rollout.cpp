#include "a3c/Rollout.hpp"

namespace a3c {

void Rollout::truncate_to_recent_half() {
  steps_.erase(steps_.begin(), steps_.begin() + steps_.size() / 2);
}

Eigen::VectorXf Rollout::rewards() const {
  Eigen::VectorXf out(steps_.size());
  for (size_t i = 0; i < steps_.size(); ++i) out[i] = steps_[i].reward;
  return out;
}

Eigen::VectorXf Rollout::values() const {
  Eigen::VectorXf out(steps_.size());
  for (size_t i = 0; i < steps_.size(); ++i) out[i] = steps_[i].value_estimate;
  return out;
}

TrainingBatch Rollout::make_batch(const AdvantageEstimator::Targets& targets) const {
  TrainingBatch batch;
  for (const RolloutStep& step : steps_) {
    batch.observations.push_back(step.observation.get());
    batch.actions.push_back(step.base_action);
    batch.arg_samples.push_back(step.arg_samples);
  }
  batch.discounted_returns = targets.discounted_returns;
  batch.advantages = targets.advantages;
  return batch;
}

}  // namespace a3c
