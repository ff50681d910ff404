#include "a3c/PolicyValueNet.hpp"

#include "a3c/ActionCodec.hpp"
#include "sc2/Exceptions.hpp"
#include "sc2/FeatureSpec.hpp"
#include "util/Asserts.hpp"
#include "util/EigenUtil.hpp"
#include "util/Random.hpp"

#include <cmath>

namespace a3c {

namespace {

// Scales every row of w (one output unit) to have L2 norm std.
void normalize_rows(Eigen::Map<Eigen::MatrixXf> w, float std, std::mt19937& prng) {
  std::normal_distribution<float> dist(0, 1);
  for (int r = 0; r < w.rows(); ++r) {
    for (int c = 0; c < w.cols(); ++c) {
      w(r, c) = dist(prng);
    }
    float norm = w.row(r).norm();
    if (norm > 0) w.row(r) *= std / norm;
  }
}

}  // namespace

DensePolicyValueNet::DensePolicyValueNet(const Params& params,
                                         const sc2::ActionSpaceDescriptor& descriptor)
    : params_(params),
      descriptor_(descriptor),
      nonspatial_size_(sc2::ObservationEncoder::nonspatial_size(descriptor)),
      input_size_(nonspatial_size_ +
                  (sc2::ScreenChannel::kNumChannels + sc2::MinimapChannel::kNumChannels) *
                    params.pool_cells * params.pool_cells) {
  CLEAN_ASSERT(params.hidden_size > 0, "hidden-size must be positive (got {})",
               params.hidden_size);
  CLEAN_ASSERT(params.pool_cells > 0, "pool-cells must be positive (got {})", params.pool_cells);

  int hidden = params.hidden_size;
  hidden_ = add_layer(hidden, input_size_);
  policy_heads_.push_back(add_layer(descriptor.action_count(), hidden));
  for (const sc2::Head& head : descriptor.heads()) {
    policy_heads_.push_back(add_layer(head.size, hidden));
  }
  value_head_ = add_layer(1, hidden);
}

ParameterVector DensePolicyValueNet::initial_parameters(std::mt19937& prng) const {
  ParameterVector p = ParameterVector::Zero(num_parameters_);

  // Glorot-uniform hidden layer.
  float limit = std::sqrt(6.f / (hidden_.rows + hidden_.cols));
  auto w = weights(p, hidden_);
  for (int c = 0; c < w.cols(); ++c) {
    for (int r = 0; r < w.rows(); ++r) {
      w(r, c) = util::Random::uniform_real(prng, -limit, limit);
    }
  }

  for (const Layer& layer : policy_heads_) {
    normalize_rows(weights(p, layer), 0.01f, prng);
  }
  normalize_rows(weights(p, value_head_), 1.0f, prng);
  return p;
}

NetworkOutput DensePolicyValueNet::evaluate(const ParameterVector& params,
                                            const sc2::EncodedObservation& obs) const {
  Activations a = forward(params, obs);

  NetworkOutput out;
  out.base = a.probs[0];
  out.args.resize(descriptor_.num_arg_types());
  const auto& heads = descriptor_.heads();
  for (size_t k = 0; k < heads.size(); ++k) {
    out.args[heads[k].arg_type].push_back(a.probs[1 + k]);
  }
  out.value = a.value;
  return out;
}

LossReport DensePolicyValueNet::compute_gradients(const ParameterVector& params,
                                                  const TrainingBatch& batch,
                                                  ParameterVector& gradients) const {
  int n = batch.size();
  RELEASE_ASSERT((int)batch.actions.size() == n && (int)batch.arg_samples.size() == n &&
                   batch.discounted_returns.size() == n && batch.advantages.size() == n,
                 "Inconsistent training batch of {} steps", n);

  gradients = ParameterVector::Zero(num_parameters_);
  LossReport report;
  if (n == 0) return report;

  const auto& heads = descriptor_.heads();
  double value_loss = 0;
  double policy_loss = 0;
  double entropy = 0;

  for (int t = 0; t < n; ++t) {
    Activations a = forward(params, *batch.observations[t]);
    float R = batch.discounted_returns[t];
    float A = batch.advantages[t];

    value_loss += 0.5 * (R - a.value) * (R - a.value);
    float dv = 0.5f * (a.value - R);
    Eigen::VectorXf dh = weights(params, value_head_).transpose() * dv;
    weights(gradients, value_head_) += dv * a.h.transpose();
    bias(gradients, value_head_)[0] += dv;

    for (size_t k = 0; k < policy_heads_.size(); ++k) {
      const Layer& layer = policy_heads_[k];
      const Eigen::VectorXf& p = a.probs[k];
      Eigen::ArrayXf log_p = p.array().max(kProbabilityFloor).log();
      float h = -(p.array() * log_p).sum();
      entropy += h;

      // d(-w * H)/dz_i = w * p_i * (log p_i + H)
      Eigen::VectorXf dz = (kEntropyWeight * p.array() * (log_p + h)).matrix();

      int target;
      if (k == 0) {
        target = batch.actions[t];
      } else {
        const sc2::Head& head = heads[k - 1];
        target = batch.arg_samples[t].at(head.arg_type).at(head.dim);
      }
      if (target != ActionCodec::kUnusedArgument) {
        if (target < 0 || target >= layer.rows) {
          throw sc2::IndexOutOfRange("Training target {} out of range [0, {}) for head {}", target,
                                     layer.rows, k);
        }
        policy_loss += -A * log_p[target];
        if (p[target] >= kProbabilityFloor) {
          // d(-A log p_a)/dz = -A * (onehot(a) - p)
          dz += A * p;
          dz[target] -= A;
        }
      }

      weights(gradients, layer) += dz * a.h.transpose();
      bias(gradients, layer) += dz;
      dh += weights(params, layer).transpose() * dz;
    }

    Eigen::VectorXf da = (dh.array() * (1 - a.h.array().square())).matrix();
    weights(gradients, hidden_) += da * a.x.transpose();
    bias(gradients, hidden_) += da;
  }

  report.value_loss = value_loss / n;
  report.policy_loss = policy_loss / n;
  report.entropy = entropy / n;
  report.var_norm = eigen_util::global_norm(params);
  return report;
}

Eigen::VectorXf DensePolicyValueNet::featurize(const sc2::EncodedObservation& obs) const {
  if (obs.nonspatial.size() != nonspatial_size_) {
    throw sc2::IndexOutOfRange("Nonspatial input has {} entries (expected {})",
                               obs.nonspatial.size(), nonspatial_size_);
  }
  if (obs.screen.dimension(2) != sc2::ScreenChannel::kNumChannels ||
      obs.minimap.dimension(2) != sc2::MinimapChannel::kNumChannels) {
    throw sc2::IndexOutOfRange("Spatial inputs have {}/{} channels (expected {}/{})",
                               obs.screen.dimension(2), obs.minimap.dimension(2),
                               int(sc2::ScreenChannel::kNumChannels),
                               int(sc2::MinimapChannel::kNumChannels));
  }

  int cells = params_.pool_cells * params_.pool_cells;
  Eigen::VectorXf x(input_size_);
  x.head(nonspatial_size_) = obs.nonspatial;
  pool(obs.screen, x.data() + nonspatial_size_);
  pool(obs.minimap, x.data() + nonspatial_size_ + sc2::ScreenChannel::kNumChannels * cells);
  return eigen_util::signed_log1p(x);
}

DensePolicyValueNet::Layer DensePolicyValueNet::add_layer(int rows, int cols) {
  Layer layer{num_parameters_, num_parameters_ + rows * cols, rows, cols};
  num_parameters_ += rows * cols + rows;
  return layer;
}

DensePolicyValueNet::Activations DensePolicyValueNet::forward(
  const ParameterVector& params, const sc2::EncodedObservation& obs) const {
  if (params.size() != num_parameters_) {
    throw sc2::IndexOutOfRange("Got {} parameters (expected {})", params.size(), num_parameters_);
  }

  Activations a;
  a.x = featurize(obs);
  a.h = (weights(params, hidden_) * a.x + bias(params, hidden_)).array().tanh().matrix();
  for (const Layer& layer : policy_heads_) {
    Eigen::VectorXf logits = weights(params, layer) * a.h + bias(params, layer);
    a.probs.push_back(eigen_util::softmax(logits));
  }
  a.value = weights(params, value_head_).row(0).dot(a.h) + bias(params, value_head_)[0];
  return a;
}

void DensePolicyValueNet::pool(const sc2::SpatialTensor& grid, float* out) const {
  int height = grid.dimension(0);
  int width = grid.dimension(1);
  int channels = grid.dimension(2);
  int p = params_.pool_cells;

  for (int c = 0; c < channels; ++c) {
    for (int i = 0; i < p; ++i) {
      int y0 = i * height / p;
      int y1 = (i + 1) * height / p;
      for (int j = 0; j < p; ++j) {
        int x0 = j * width / p;
        int x1 = (j + 1) * width / p;
        float sum = 0;
        for (int y = y0; y < y1; ++y) {
          for (int x = x0; x < x1; ++x) {
            sum += grid(y, x, c);
          }
        }
        int count = (y1 - y0) * (x1 - x0);
        out[(c * p + i) * p + j] = count > 0 ? sum / count : 0;
      }
    }
  }
}

Eigen::Map<const Eigen::MatrixXf> DensePolicyValueNet::weights(const ParameterVector& p,
                                                               const Layer& l) {
  return Eigen::Map<const Eigen::MatrixXf>(p.data() + l.weights, l.rows, l.cols);
}

Eigen::Map<const Eigen::VectorXf> DensePolicyValueNet::bias(const ParameterVector& p,
                                                            const Layer& l) {
  return Eigen::Map<const Eigen::VectorXf>(p.data() + l.bias, l.rows);
}

Eigen::Map<Eigen::MatrixXf> DensePolicyValueNet::weights(ParameterVector& p, const Layer& l) {
  return Eigen::Map<Eigen::MatrixXf>(p.data() + l.weights, l.rows, l.cols);
}

Eigen::Map<Eigen::VectorXf> DensePolicyValueNet::bias(ParameterVector& p, const Layer& l) {
  return Eigen::Map<Eigen::VectorXf>(p.data() + l.bias, l.rows);
}

}  // namespace a3c
