#pragma once

#include <Eigen/Core>

namespace a3c {

/*
 * Discounted returns and generalized advantage estimates for one rollout.
 *
 * The same gamma discounts both the returns and the TD residuals (GAE with lambda folded into
 * gamma). Advantages are returned unnormalized.
 */
class AdvantageEstimator {
 public:
  struct Targets {
    Eigen::VectorXf discounted_returns;
    Eigen::VectorXf advantages;
  };

  // y[i] = x[i] + gamma * y[i+1], with y[n] = 0.
  static Eigen::VectorXf discount(const Eigen::VectorXf& x, float gamma);

  // rewards and values must have equal length.
  static Targets compute(const Eigen::VectorXf& rewards, const Eigen::VectorXf& values,
                         float bootstrap_value, float gamma);
};

}  // namespace a3c
