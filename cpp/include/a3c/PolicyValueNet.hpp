#pragma once

#include "a3c/Types.hpp"
#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/BasicTypes.hpp"
#include "sc2/ObservationEncoder.hpp"

#include <Eigen/Core>

#include <random>
#include <vector>

namespace a3c {

struct NetworkOutput {
  Distribution base;
  ArgDistributions args;
  float value = 0;
};

/*
 * Everything the loss needs for one rollout. All vectors have one entry per step. arg_samples
 * entries equal to ActionCodec::kUnusedArgument mark argument heads with no target on that step.
 */
struct TrainingBatch {
  std::vector<const sc2::EncodedObservation*> observations;
  std::vector<sc2::action_index_t> actions;
  std::vector<ArgSamples> arg_samples;
  Eigen::VectorXf discounted_returns;
  Eigen::VectorXf advantages;

  int size() const { return observations.size(); }
};

// Loss terms averaged over the rollout, plus the norm of the parameters they were computed at.
struct LossReport {
  float value_loss = 0;
  float policy_loss = 0;
  float entropy = 0;
  float var_norm = 0;
};

/*
 * A policy-value network as a pure function of a flat parameter vector. Implementations hold no
 * trainable state, so one instance is shared by every worker.
 *
 * The loss minimized by compute_gradients() is, summed over the rollout:
 *
 * 0.5 * value_loss + policy_loss - kEntropyWeight * entropy
 *
 * value_loss  = 0.5 * sum (R - v)^2
 * policy_loss = -sum A * log(max(p, kProbabilityFloor)), over the base head and every argument
 *               head with a target
 * entropy     = sum over all heads of -sum p * log(max(p, kProbabilityFloor))
 */
class PolicyValueNetwork {
 public:
  static constexpr float kEntropyWeight = 0.01f;
  static constexpr float kProbabilityFloor = 1e-20f;

  virtual ~PolicyValueNetwork() = default;

  virtual int num_parameters() const = 0;
  virtual ParameterVector initial_parameters(std::mt19937& prng) const = 0;

  virtual NetworkOutput evaluate(const ParameterVector& params,
                                 const sc2::EncodedObservation& obs) const = 0;

  // Writes d(loss)/d(params) to gradients (resized as needed) and returns the loss terms.
  virtual LossReport compute_gradients(const ParameterVector& params, const TrainingBatch& batch,
                                       ParameterVector& gradients) const = 0;
};

/*
 * A small fully-connected policy-value network:
 *
 * x = signed_log1p([nonspatial | avg-pooled screen | avg-pooled minimap])
 * h = tanh(W x + b)
 * one softmax head per action-space head (base action first), and a linear value head.
 *
 * Each spatial channel is average-pooled to a pool_cells x pool_cells grid.
 */
class DensePolicyValueNet : public PolicyValueNetwork {
 public:
  struct Params {
    auto make_options_description();

    int hidden_size = 64;
    int pool_cells = 4;
  };

  DensePolicyValueNet(const Params& params, const sc2::ActionSpaceDescriptor& descriptor);

  int num_parameters() const override { return num_parameters_; }
  ParameterVector initial_parameters(std::mt19937& prng) const override;

  NetworkOutput evaluate(const ParameterVector& params,
                         const sc2::EncodedObservation& obs) const override;

  LossReport compute_gradients(const ParameterVector& params, const TrainingBatch& batch,
                               ParameterVector& gradients) const override;

  int input_size() const { return input_size_; }
  Eigen::VectorXf featurize(const sc2::EncodedObservation& obs) const;

 private:
  // Offsets of one dense layer inside the flat parameter vector.
  struct Layer {
    int weights;  // rows x cols, column-major
    int bias;
    int rows;
    int cols;
  };

  struct Activations {
    Eigen::VectorXf x;
    Eigen::VectorXf h;
    std::vector<Eigen::VectorXf> probs;  // [0] = base head, [1 + k] = descriptor head k
    float value;
  };

  Layer add_layer(int rows, int cols);
  Activations forward(const ParameterVector& params, const sc2::EncodedObservation& obs) const;
  void pool(const sc2::SpatialTensor& grid, float* out) const;

  static Eigen::Map<const Eigen::MatrixXf> weights(const ParameterVector& p, const Layer& l);
  static Eigen::Map<const Eigen::VectorXf> bias(const ParameterVector& p, const Layer& l);
  static Eigen::Map<Eigen::MatrixXf> weights(ParameterVector& p, const Layer& l);
  static Eigen::Map<Eigen::VectorXf> bias(ParameterVector& p, const Layer& l);

  const Params params_;
  const sc2::ActionSpaceDescriptor& descriptor_;
  const int nonspatial_size_;
  const int input_size_;

  int num_parameters_ = 0;
  Layer hidden_;
  std::vector<Layer> policy_heads_;  // [0] = base head, [1 + k] = descriptor head k
  Layer value_head_;
};

}  // namespace a3c

#include "inline/a3c/PolicyValueNet.inl"
