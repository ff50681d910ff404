#pragma once

#include "a3c/Types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace a3c {

/*
 * Owns the canonical trainable parameters. This is the only object through which workers
 * interact with each other.
 *
 * push() clips the incoming gradient to a maximum global norm and then applies one Adam step.
 * Pushes are serialized against each other and against pull(), so a pull never observes a torn
 * update. Nothing ties a push to the snapshot its gradient was computed from: gradients computed
 * against stale parameters are applied as-is.
 */
class ParameterStore {
 public:
  struct Params {
    auto make_options_description();

    float learning_rate = 1e-4;
    float max_grad_norm = 40.0;
    float adam_beta1 = 0.9;
    float adam_beta2 = 0.999;
    float adam_epsilon = 1e-8;
  };

  ParameterStore(const Params& params, const ParameterVector& initial);

  ParameterSnapshot pull() const;

  /*
   * Applies one clipped optimizer step and returns the gradient's global norm before clipping.
   *
   * Throws ParameterStoreUnavailable if the gradient has the wrong width or contains non-finite
   * values. The parameters are left untouched in that case.
   */
  float push(const ParameterVector& gradients);

  // Replaces the parameters (e.g. from a checkpoint) and resets the optimizer state.
  void restore(const ParameterVector& values);

  int num_parameters() const { return num_parameters_; }
  int64_t version() const { return version_; }
  int64_t num_pushes() const { return num_pushes_; }

 private:
  const Params params_;
  const int num_parameters_;

  mutable std::mutex mutex_;
  ParameterVector values_;
  ParameterVector adam_m_;
  ParameterVector adam_v_;
  int64_t adam_step_ = 0;

  std::atomic<int64_t> version_ = 0;
  std::atomic<int64_t> num_pushes_ = 0;
};

}  // namespace a3c

#include "inline/a3c/ParameterStore.inl"
