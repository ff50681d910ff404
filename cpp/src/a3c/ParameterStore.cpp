#include "a3c/ParameterStore.hpp"

#include "a3c/Exceptions.hpp"
#include "util/EigenUtil.hpp"

#include <algorithm>
#include <cmath>

namespace a3c {

ParameterStore::ParameterStore(const Params& params, const ParameterVector& initial)
    : params_(params),
      num_parameters_(initial.size()),
      values_(initial),
      adam_m_(ParameterVector::Zero(initial.size())),
      adam_v_(ParameterVector::Zero(initial.size())) {}

ParameterSnapshot ParameterStore::pull() const {
  std::unique_lock lock(mutex_);
  return ParameterSnapshot{values_, version_};
}

float ParameterStore::push(const ParameterVector& gradients) {
  if (gradients.size() != num_parameters_) {
    throw ParameterStoreUnavailable("Gradient has {} entries (expected {})", gradients.size(),
                                    num_parameters_);
  }
  if (!gradients.allFinite()) {
    throw ParameterStoreUnavailable("Refusing to apply a non-finite gradient");
  }

  float norm = eigen_util::global_norm(gradients);
  float scale = params_.max_grad_norm / std::max(norm, params_.max_grad_norm);

  const float b1 = params_.adam_beta1;
  const float b2 = params_.adam_beta2;

  std::unique_lock lock(mutex_);
  adam_step_++;
  float t = adam_step_;
  float lr = params_.learning_rate * std::sqrt(1 - std::pow(b2, t)) / (1 - std::pow(b1, t));

  adam_m_ = b1 * adam_m_ + (1 - b1) * scale * gradients;
  adam_v_ = b2 * adam_v_ + (1 - b2) * (scale * gradients).array().square().matrix();
  values_.array() -= lr * adam_m_.array() / (adam_v_.array().sqrt() + params_.adam_epsilon);

  version_++;
  num_pushes_++;
  return norm;
}

void ParameterStore::restore(const ParameterVector& values) {
  if (values.size() != num_parameters_) {
    throw ParameterStoreUnavailable("Cannot restore {} parameters into a store of {}",
                                    values.size(), num_parameters_);
  }
  std::unique_lock lock(mutex_);
  values_ = values;
  adam_m_.setZero();
  adam_v_.setZero();
  adam_step_ = 0;
  version_++;
}

}  // namespace a3c
