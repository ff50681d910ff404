#include "a3c/AdvantageEstimator.hpp"

#include "util/Asserts.hpp"

namespace a3c {

Eigen::VectorXf AdvantageEstimator::discount(const Eigen::VectorXf& x, float gamma) {
  int n = x.size();
  Eigen::VectorXf y(n);
  float running = 0;
  for (int i = n - 1; i >= 0; --i) {
    running = x[i] + gamma * running;
    y[i] = running;
  }
  return y;
}

AdvantageEstimator::Targets AdvantageEstimator::compute(const Eigen::VectorXf& rewards,
                                                        const Eigen::VectorXf& values,
                                                        float bootstrap_value, float gamma) {
  RELEASE_ASSERT(rewards.size() == values.size(), "rewards/values size mismatch ({} vs {})",
                 rewards.size(), values.size());
  int n = rewards.size();

  Targets targets;
  if (n == 0) return targets;

  Eigen::VectorXf rewards_plus(n + 1);
  rewards_plus << rewards, bootstrap_value;
  Eigen::VectorXf values_plus(n + 1);
  values_plus << values, bootstrap_value;

  targets.discounted_returns = discount(rewards_plus, gamma).head(n);

  Eigen::VectorXf td_residuals = rewards + gamma * values_plus.tail(n) - values_plus.head(n);
  targets.advantages = discount(td_residuals, gamma);
  return targets;
}

}  // namespace a3c
