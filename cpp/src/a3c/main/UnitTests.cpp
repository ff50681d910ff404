#include "a3c/ActionCodec.hpp"
#include "a3c/AdvantageEstimator.hpp"
#include "a3c/Checkpointer.hpp"
#include "a3c/Coordinator.hpp"
#include "a3c/EpisodeStats.hpp"
#include "a3c/Exceptions.hpp"
#include "a3c/ParameterStore.hpp"
#include "a3c/PolicyValueNet.hpp"
#include "a3c/Rollout.hpp"
#include "a3c/Worker.hpp"
#include "sc2/ActionCatalogue.hpp"
#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/Environment.hpp"
#include "sc2/Exceptions.hpp"
#include "sc2/FeatureSpec.hpp"
#include "sc2/ObservationEncoder.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>
#include <mutex>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using C = sc2::ActionCatalogue;
namespace fs = boost::filesystem;

const sc2::SpatialConfig kSmallSpatial{8, 8};

a3c::ArgDistributions uniform_args(const sc2::ActionSpaceDescriptor& descriptor) {
  a3c::ArgDistributions out;
  for (const auto& arg_type : descriptor.arg_types()) {
    std::vector<a3c::Distribution> dims;
    for (int size : arg_type.dims) {
      dims.push_back(a3c::Distribution::Constant(size, 1.0f / size));
    }
    out.push_back(dims);
  }
  return out;
}

a3c::Distribution one_hot(int size, int index) {
  a3c::Distribution d = a3c::Distribution::Zero(size);
  d[index] = 1;
  return d;
}

// Always offers no_op and select_army. Rewards alternate 1, 0, 1, ... and the episode ends after
// episode_length steps. Optionally throws on a given step.
class ScriptedEnv : public sc2::Environment {
 public:
  explicit ScriptedEnv(int episode_length, int throw_on_step = -1)
      : episode_length_(episode_length), throw_on_step_(throw_on_step) {}

  sc2::TimeStep reset() override {
    num_resets_++;
    step_count_ = 0;
    return make_time_step(sc2::StepType::kFirst, 0);
  }

  sc2::TimeStep step(const sc2::FunctionCall& call) override {
    step_count_++;
    if (step_count_ == throw_on_step_) {
      throw std::runtime_error("scripted failure");
    }
    calls_.push_back(call.function);
    float reward = step_count_ % 2 == 1 ? 1 : 0;
    bool last = step_count_ >= episode_length_;
    return make_time_step(last ? sc2::StepType::kLast : sc2::StepType::kMid, reward);
  }

  int num_resets() const { return num_resets_; }
  const std::vector<sc2::function_id_t>& calls() const { return calls_; }

 private:
  sc2::TimeStep make_time_step(sc2::StepType step_type, float reward) const {
    sc2::TimeStep ts;
    ts.step_type = step_type;
    ts.reward = reward;
    ts.observation.screen =
      sc2::FeatureLayers(sc2::ScreenChannel::kNumChannels, kSmallSpatial.screen_size,
                         kSmallSpatial.screen_size);
    ts.observation.screen.setZero();
    ts.observation.minimap =
      sc2::FeatureLayers(sc2::MinimapChannel::kNumChannels, kSmallSpatial.minimap_size,
                         kSmallSpatial.minimap_size);
    ts.observation.minimap.setZero();
    ts.observation.available_actions = {C::kNoOp, C::kSelectArmy};
    ts.observation.fields["game_loop"] = sc2::FieldArray::Constant(1, 1, step_count_);
    return ts;
  }

  const int episode_length_;
  const int throw_on_step_;
  int step_count_ = 0;
  int num_resets_ = 0;
  std::vector<sc2::function_id_t> calls_;
};

// Uniform distributions, constant value, and a constant gradient. Records every training batch.
class RecordingNetwork : public a3c::PolicyValueNetwork {
 public:
  static constexpr int kNumParameters = 3;
  static constexpr float kValue = 0.5f;

  explicit RecordingNetwork(const sc2::ActionSpaceDescriptor& descriptor)
      : descriptor_(descriptor) {}

  int num_parameters() const override { return kNumParameters; }

  a3c::ParameterVector initial_parameters(std::mt19937&) const override {
    return a3c::ParameterVector::Zero(kNumParameters);
  }

  a3c::NetworkOutput evaluate(const a3c::ParameterVector&,
                              const sc2::EncodedObservation& obs) const override {
    EXPECT_EQ(obs.nonspatial.size(), sc2::ObservationEncoder::nonspatial_size(descriptor_));
    a3c::NetworkOutput out;
    int n = descriptor_.action_count();
    out.base = a3c::Distribution::Constant(n, 1.0f / n);
    out.args = uniform_args(descriptor_);
    out.value = kValue;
    return out;
  }

  a3c::LossReport compute_gradients(const a3c::ParameterVector&, const a3c::TrainingBatch& batch,
                                    a3c::ParameterVector& gradients) const override {
    std::unique_lock lock(mutex_);
    batch_sizes_.push_back(batch.size());
    returns_.push_back(batch.discounted_returns);
    advantages_.push_back(batch.advantages);
    gradients = a3c::ParameterVector::Constant(kNumParameters, 0.01f);
    return a3c::LossReport{};
  }

  std::vector<int> batch_sizes() const {
    std::unique_lock lock(mutex_);
    return batch_sizes_;
  }
  const std::vector<Eigen::VectorXf>& returns() const { return returns_; }
  const std::vector<Eigen::VectorXf>& advantages() const { return advantages_; }

 private:
  const sc2::ActionSpaceDescriptor& descriptor_;
  mutable std::mutex mutex_;
  mutable std::vector<int> batch_sizes_;
  mutable std::vector<Eigen::VectorXf> returns_;
  mutable std::vector<Eigen::VectorXf> advantages_;
};

class RecordingCheckpointer : public a3c::Checkpointer {
 public:
  void save_snapshot(const a3c::ParameterVector&, int64_t episode) override {
    episodes.push_back(episode);
  }
  std::vector<int64_t> episodes;
};

class RecordingTelemetry : public a3c::TelemetrySink {
 public:
  void record_summary(int worker_index, const Metrics& metrics, int64_t episode) override {
    workers.push_back(worker_index);
    summaries.push_back(metrics);
    episodes.push_back(episode);
  }
  std::vector<int> workers;
  std::vector<Metrics> summaries;
  std::vector<int64_t> episodes;
};

// Everything a Worker borrows from its Coordinator.
struct WorkerFixture {
  explicit WorkerFixture(const a3c::ParameterStore::Params& store_params = {})
      : descriptor(sc2::Race::kTerran, kSmallSpatial),
        network(descriptor),
        store(store_params, a3c::ParameterVector::Zero(RecordingNetwork::kNumParameters)) {}

  a3c::Worker::Shared shared(int64_t max_episodes = 0) {
    return a3c::Worker::Shared{descriptor,       network,        store,      stats, stop,
                               global_episodes, &checkpointer, &telemetry, max_episodes};
  }

  sc2::ActionSpaceDescriptor descriptor;
  RecordingNetwork network;
  a3c::ParameterStore store;
  a3c::EpisodeStats stats;
  std::atomic<bool> stop = false;
  std::atomic<int64_t> global_episodes = 0;
  RecordingCheckpointer checkpointer;
  RecordingTelemetry telemetry;
};

std::shared_ptr<sc2::EncodedObservation> random_observation(
  const sc2::ActionSpaceDescriptor& descriptor, std::mt19937& prng) {
  std::uniform_real_distribution<float> dist(0, 2);
  auto obs = std::make_shared<sc2::EncodedObservation>();
  obs->nonspatial = Eigen::VectorXf::Zero(sc2::ObservationEncoder::nonspatial_size(descriptor));
  for (int i = 0; i < 64; ++i) obs->nonspatial[i] = dist(prng);

  const auto& cfg = descriptor.spatial_config();
  obs->screen = sc2::SpatialTensor(cfg.screen_size, cfg.screen_size,
                                   sc2::ScreenChannel::kNumChannels);
  obs->minimap = sc2::SpatialTensor(cfg.minimap_size, cfg.minimap_size,
                                    sc2::MinimapChannel::kNumChannels);
  for (int i = 0; i < obs->screen.size(); ++i) obs->screen.data()[i] = dist(prng);
  for (int i = 0; i < obs->minimap.size(); ++i) obs->minimap.data()[i] = dist(prng);
  return obs;
}

// Sum over the batch of the loss minimized by compute_gradients().
double total_loss(const a3c::PolicyValueNetwork& net, const a3c::ParameterVector& params,
                  const a3c::TrainingBatch& batch) {
  a3c::ParameterVector unused;
  a3c::LossReport r = net.compute_gradients(params, batch, unused);
  return batch.size() *
         (0.5 * r.value_loss + r.policy_loss - a3c::PolicyValueNetwork::kEntropyWeight * r.entropy);
}

fs::path make_temp_dir() {
  fs::path dir = fs::temp_directory_path() / fs::unique_path("a3c-test-%%%%-%%%%-%%%%");
  fs::create_directories(dir);
  return dir;
}

}  // namespace

/////////////////////////////////////
// Begin tests for AdvantageEstimator
/////////////////////////////////////

TEST(AdvantageEstimator, discount) {
  Eigen::VectorXf x = Eigen::VectorXf::Ones(3);
  Eigen::VectorXf y = a3c::AdvantageEstimator::discount(x, 0.5);
  ASSERT_EQ(y.size(), 3);
  EXPECT_FLOAT_EQ(y[0], 1.75);
  EXPECT_FLOAT_EQ(y[1], 1.5);
  EXPECT_FLOAT_EQ(y[2], 1.0);
}

TEST(AdvantageEstimator, returns_include_bootstrap) {
  Eigen::VectorXf rewards(2);
  rewards << 1, 2;
  Eigen::VectorXf values = Eigen::VectorXf::Zero(2);

  auto targets = a3c::AdvantageEstimator::compute(rewards, values, 10, 0.5);
  ASSERT_EQ(targets.discounted_returns.size(), 2);
  EXPECT_FLOAT_EQ(targets.discounted_returns[1], 2 + 0.5 * 10);
  EXPECT_FLOAT_EQ(targets.discounted_returns[0], 1 + 0.5 * 7);
}

TEST(AdvantageEstimator, constant_td_residual) {
  constexpr int n = 6;
  constexpr float r = 1.0;
  constexpr float v = 2.0;
  constexpr float g = 0.9;
  const float c = r + (g - 1) * v;

  Eigen::VectorXf rewards = Eigen::VectorXf::Constant(n, r);
  Eigen::VectorXf values = Eigen::VectorXf::Constant(n, v);
  auto targets = a3c::AdvantageEstimator::compute(rewards, values, v, g);
  ASSERT_EQ(targets.advantages.size(), n);

  // The last advantage is the TD residual itself; earlier ones discount-accumulate it.
  EXPECT_FLOAT_EQ(targets.advantages[n - 1], c);
  for (int i = 0; i < n; ++i) {
    float expected = c * (1 - std::pow(g, n - i)) / (1 - g);
    EXPECT_NEAR(targets.advantages[i], expected, 1e-5);
  }

  // With gamma = 0 every advantage equals the residual.
  targets = a3c::AdvantageEstimator::compute(rewards, values, v, 0);
  for (int i = 0; i < n; ++i) {
    EXPECT_FLOAT_EQ(targets.advantages[i], r - v);
  }

  // A zero residual gives zero advantages everywhere.
  Eigen::VectorXf balanced = Eigen::VectorXf::Constant(n, (1 - 0.5f) * 4);
  targets = a3c::AdvantageEstimator::compute(balanced, Eigen::VectorXf::Constant(n, 4), 4, 0.5);
  for (int i = 0; i < n; ++i) {
    EXPECT_FLOAT_EQ(targets.advantages[i], 0);
  }
}

TEST(AdvantageEstimator, empty) {
  auto targets = a3c::AdvantageEstimator::compute(Eigen::VectorXf(), Eigen::VectorXf(), 1, 0.9);
  EXPECT_EQ(targets.discounted_returns.size(), 0);
  EXPECT_EQ(targets.advantages.size(), 0);
}

/////////////////////////////////////
// Begin tests for ActionCodec     //
/////////////////////////////////////

TEST(ActionCodec, mask_and_renormalize) {
  std::mt19937 prng(11);
  std::uniform_real_distribution<float> dist(0.01, 1);

  for (int trial = 0; trial < 50; ++trial) {
    a3c::Distribution d(12);
    for (int i = 0; i < d.size(); ++i) d[i] = dist(prng);
    d /= d.sum();

    sc2::ActionMask mask(12);
    for (int i = 0; i < 12; ++i) {
      if (prng() % 3 == 0) mask.set(i);
    }
    if (mask.none()) mask.set(trial % 12);

    ASSERT_TRUE(a3c::ActionCodec::mask_and_renormalize(d, mask));
    EXPECT_NEAR(d.sum(), 1.0, 1e-5);
    for (int i = 0; i < 12; ++i) {
      if (!mask[i]) {
        EXPECT_EQ(d[i], 0);
      } else {
        EXPECT_GT(d[i], 0);
      }
    }
  }
}

TEST(ActionCodec, mask_with_no_mass) {
  a3c::Distribution d(3);
  d << 0.5, 0.5, 0;
  sc2::ActionMask mask(3);
  mask.set(2);

  EXPECT_FALSE(a3c::ActionCodec::mask_and_renormalize(d, mask));
  EXPECT_FLOAT_EQ(d[0], 0.5);
  EXPECT_FLOAT_EQ(d[1], 0.5);

  sc2::ActionMask wrong_size(4);
  EXPECT_THROW(a3c::ActionCodec::mask_and_renormalize(d, wrong_size), sc2::IndexOutOfRange);
}

TEST(ActionCodec, tiny_surviving_mass_is_renormalized) {
  a3c::Distribution d(3);
  d << 1, 1e-12f, 0;
  sc2::ActionMask mask(3);
  mask.set(1);

  ASSERT_TRUE(a3c::ActionCodec::mask_and_renormalize(d, mask));
  EXPECT_EQ(d[0], 0);
  EXPECT_FLOAT_EQ(d[1], 1);
  EXPECT_EQ(d[2], 0);
}

TEST(ActionCodec, select_respects_mask) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::ActionCodec codec(descriptor);
  std::mt19937 prng(5);

  int n = descriptor.action_count();
  a3c::Distribution base = a3c::Distribution::Constant(n, 1.0f / n);
  auto args = uniform_args(descriptor);

  for (int i = 0; i < 200; ++i) {
    auto selection = codec.select(base, args, std::vector<int>{C::kNoOp, C::kMoveScreen}, prng);
    EXPECT_FALSE(selection.degenerate);
    EXPECT_TRUE(selection.call.function == C::kNoOp || selection.call.function == C::kMoveScreen);
  }
}

TEST(ActionCodec, degenerate_falls_back_to_unmasked) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::ActionCodec codec(descriptor);
  std::mt19937 prng(6);

  int stop = descriptor.index_of(C::kStopQuick);
  a3c::Distribution base = one_hot(descriptor.action_count(), stop);

  auto selection = codec.select(base, uniform_args(descriptor), std::vector<int>{C::kNoOp}, prng);
  EXPECT_TRUE(selection.degenerate);
  EXPECT_EQ(selection.base_action, stop);
  EXPECT_EQ(selection.call.function, C::kStopQuick);
}

TEST(ActionCodec, sentinel_exclusion) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::ActionCodec codec(descriptor);
  std::mt19937 prng(7);

  int m = descriptor.num_heads();
  for (sc2::function_id_t id : {C::kNoOp, C::kMoveScreen, C::kSelectRect, C::kSelectArmy}) {
    int index = descriptor.index_of(id);
    a3c::Distribution base = one_hot(descriptor.action_count(), index);
    auto selection = codec.select(base, uniform_args(descriptor), descriptor.mask_of({id}), prng);

    ASSERT_EQ(selection.base_action, index);
    const sc2::ActionSpec& spec = descriptor.resolve(index);

    int k = 0;
    for (int a : spec.arg_types) k += descriptor.arg_types()[a].dims.size();

    int sentinels = 0;
    int genuine = 0;
    for (const auto& dims : selection.training_samples) {
      for (int s : dims) {
        if (s == a3c::ActionCodec::kUnusedArgument) {
          sentinels++;
        } else {
          genuine++;
        }
      }
    }
    EXPECT_EQ(sentinels, m - k) << spec.name;
    EXPECT_EQ(genuine, k) << spec.name;

    ASSERT_EQ(selection.call.arguments.size(), spec.arg_types.size());
    for (size_t i = 0; i < spec.arg_types.size(); ++i) {
      EXPECT_EQ(selection.call.arguments[i], selection.training_samples[spec.arg_types[i]]);
    }
  }
}

TEST(ActionCodec, shape_mismatch) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::ActionCodec codec(descriptor);
  std::mt19937 prng(8);

  int n = descriptor.action_count();
  a3c::Distribution base = a3c::Distribution::Constant(n, 1.0f / n);
  auto args = uniform_args(descriptor);
  std::vector<int> available{C::kNoOp};

  a3c::Distribution short_base = a3c::Distribution::Constant(n - 1, 1.0f / (n - 1));
  EXPECT_THROW(codec.select(short_base, args, available, prng), sc2::IndexOutOfRange);

  auto bad_args = args;
  bad_args[C::kScreen][1] = a3c::Distribution::Constant(3, 1.0f / 3);
  EXPECT_THROW(codec.select(base, bad_args, available, prng), sc2::IndexOutOfRange);

  bad_args = args;
  bad_args.pop_back();
  EXPECT_THROW(codec.select(base, bad_args, available, prng), sc2::IndexOutOfRange);
}

/////////////////////////////////////
// Begin tests for Rollout         //
/////////////////////////////////////

TEST(Rollout, truncate_to_recent_half) {
  constexpr int kCutoff = 30;
  a3c::Rollout rollout;
  for (int i = 0; i < kCutoff; ++i) {
    rollout.push_back(a3c::RolloutStep{nullptr, i, {}, float(i), nullptr, false, 0});
  }
  rollout.truncate_to_recent_half();

  ASSERT_EQ(rollout.size(), kCutoff - kCutoff / 2);
  for (int i = 0; i < rollout.size(); ++i) {
    EXPECT_EQ(rollout.steps()[i].base_action, kCutoff / 2 + i);
  }
  EXPECT_EQ(rollout.rewards()[0], 15);

  a3c::Rollout odd;
  for (int i = 0; i < 5; ++i) {
    odd.push_back(a3c::RolloutStep{nullptr, i, {}, 0, nullptr, false, 0});
  }
  odd.truncate_to_recent_half();
  ASSERT_EQ(odd.size(), 3);
  EXPECT_EQ(odd.steps()[0].base_action, 2);
}

/////////////////////////////////////
// Begin tests for ParameterStore  //
/////////////////////////////////////

TEST(ParameterStore, adam_step) {
  a3c::ParameterStore::Params params;
  params.learning_rate = 0.1;
  params.max_grad_norm = 1;
  a3c::ParameterStore store(params, a3c::ParameterVector::Zero(3));

  a3c::ParameterVector g(3);
  g << 3, -4, 0;
  float norm = store.push(g);
  EXPECT_FLOAT_EQ(norm, 5);

  // The first bias-corrected Adam step moves each coordinate by ~learning_rate against the
  // gradient's sign, whatever the clipped magnitude.
  a3c::ParameterSnapshot snapshot = store.pull();
  EXPECT_NEAR(snapshot.values[0], -0.1, 1e-4);
  EXPECT_NEAR(snapshot.values[1], 0.1, 1e-4);
  EXPECT_EQ(snapshot.values[2], 0);
  EXPECT_EQ(snapshot.version, 1);
  EXPECT_EQ(store.num_pushes(), 1);
}

TEST(ParameterStore, rejects_bad_gradients) {
  a3c::ParameterStore store({}, a3c::ParameterVector::Ones(3));

  EXPECT_THROW(store.push(a3c::ParameterVector::Ones(4)), a3c::ParameterStoreUnavailable);

  a3c::ParameterVector g = a3c::ParameterVector::Ones(3);
  g[1] = std::numeric_limits<float>::quiet_NaN();
  EXPECT_THROW(store.push(g), a3c::ParameterStoreUnavailable);

  g[1] = std::numeric_limits<float>::infinity();
  EXPECT_THROW(store.push(g), a3c::ParameterStoreUnavailable);

  EXPECT_EQ(store.version(), 0);
  EXPECT_EQ(store.num_pushes(), 0);
  EXPECT_TRUE(store.pull().values.isApprox(a3c::ParameterVector::Ones(3)));
}

TEST(ParameterStore, restore) {
  a3c::ParameterStore store({}, a3c::ParameterVector::Zero(2));
  a3c::ParameterVector values(2);
  values << 1.5, -2;
  store.restore(values);
  EXPECT_EQ(store.pull().values, values);
  EXPECT_THROW(store.restore(a3c::ParameterVector::Zero(3)), a3c::ParameterStoreUnavailable);
}

TEST(ParameterStore, concurrent_pushes) {
  constexpr int kThreads = 4;
  constexpr int kPushes = 100;
  a3c::ParameterStore store({}, a3c::ParameterVector::Zero(50));

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPushes; ++i) {
        store.push(a3c::ParameterVector::Ones(50));
        a3c::ParameterSnapshot snapshot = store.pull();
        // All coordinates receive identical updates, so a consistent snapshot is uniform.
        EXPECT_EQ(snapshot.values.maxCoeff(), snapshot.values.minCoeff());
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(store.num_pushes(), kThreads * kPushes);
  EXPECT_EQ(store.version(), kThreads * kPushes);
}

/////////////////////////////////////
// Begin tests for EpisodeStats    //
/////////////////////////////////////

TEST(EpisodeStats, record_episode) {
  a3c::EpisodeStats stats;
  EXPECT_EQ(stats.record_episode(3), 1);
  EXPECT_EQ(stats.record_episode(1), 2);
  EXPECT_EQ(stats.record_episode(2), 3);

  EXPECT_EQ(stats.total_episodes(), 3);
  EXPECT_FLOAT_EQ(stats.max_score(), 3);
  EXPECT_FLOAT_EQ(stats.running_avg_score(), 2);
}

TEST(EpisodeStats, max_score_before_and_after_first_episode) {
  a3c::EpisodeStats stats;
  EXPECT_EQ(stats.max_score(), 0);

  stats.record_episode(-4);
  EXPECT_FLOAT_EQ(stats.max_score(), -4);
  stats.record_episode(-7);
  EXPECT_FLOAT_EQ(stats.max_score(), -4);
}

TEST(EpisodeStats, concurrent_updates) {
  a3c::EpisodeStats stats;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&stats, t] {
      for (int i = 0; i < 250; ++i) {
        stats.record_episode(t * 1000 + i);
        stats.add_steps(2);
        stats.record_degenerate_distribution();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(stats.total_episodes(), 1000);
  EXPECT_EQ(stats.total_steps(), 2000);
  EXPECT_EQ(stats.degenerate_distributions(), 1000);
  EXPECT_FLOAT_EQ(stats.max_score(), 3249);
}

/////////////////////////////////////
// Begin tests for PolicyValueNet  //
/////////////////////////////////////

TEST(DensePolicyValueNet, evaluate_shapes) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kZerg, kSmallSpatial);
  a3c::DensePolicyValueNet::Params params;
  params.hidden_size = 8;
  params.pool_cells = 2;
  a3c::DensePolicyValueNet net(params, descriptor);

  std::mt19937 prng(1);
  a3c::ParameterVector p = net.initial_parameters(prng);
  ASSERT_EQ(p.size(), net.num_parameters());

  auto obs = random_observation(descriptor, prng);
  a3c::NetworkOutput out = net.evaluate(p, *obs);

  a3c::ActionCodec codec(descriptor);
  EXPECT_NO_THROW(codec.validate_shapes(out.base, out.args));
  EXPECT_NEAR(out.base.sum(), 1, 1e-5);
  for (const auto& dims : out.args) {
    for (const auto& d : dims) {
      EXPECT_NEAR(d.sum(), 1, 1e-5);
    }
  }
  EXPECT_TRUE(std::isfinite(out.value));

  EXPECT_THROW(net.evaluate(a3c::ParameterVector::Zero(5), *obs), sc2::IndexOutOfRange);
}

TEST(DensePolicyValueNet, gradient_matches_finite_differences) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::DensePolicyValueNet::Params params;
  params.hidden_size = 4;
  params.pool_cells = 2;
  a3c::DensePolicyValueNet net(params, descriptor);

  std::mt19937 prng(2);
  std::uniform_real_distribution<float> noise(-0.05, 0.05);
  a3c::ParameterVector p = net.initial_parameters(prng);
  for (int i = 0; i < p.size(); ++i) p[i] += noise(prng);

  auto obs0 = random_observation(descriptor, prng);
  auto obs1 = random_observation(descriptor, prng);

  int move = descriptor.index_of(C::kMoveScreen);
  a3c::ArgSamples samples0(descriptor.num_arg_types());
  for (int a = 0; a < descriptor.num_arg_types(); ++a) {
    samples0[a].assign(descriptor.arg_types()[a].dims.size(), a3c::ActionCodec::kUnusedArgument);
  }
  a3c::ArgSamples samples1 = samples0;
  samples0[C::kQueued] = {1};
  samples0[C::kScreen] = {3, 5};

  a3c::TrainingBatch batch;
  batch.observations = {obs0.get(), obs1.get()};
  batch.actions = {move, descriptor.index_of(C::kNoOp)};
  batch.arg_samples = {samples0, samples1};
  batch.discounted_returns = Eigen::Vector2f(1.0, -0.5);
  batch.advantages = Eigen::Vector2f(0.7, -1.3);

  a3c::ParameterVector analytic;
  net.compute_gradients(p, batch, analytic);
  ASSERT_EQ(analytic.size(), p.size());

  // Check the largest gradient entries plus a random sample of the rest.
  std::vector<int> order(p.size());
  std::iota(order.begin(), order.end(), 0);
  std::partial_sort(order.begin(), order.begin() + 30, order.end(),
                    [&](int a, int b) { return std::abs(analytic[a]) > std::abs(analytic[b]); });
  std::vector<int> checked(order.begin(), order.begin() + 30);
  for (int i = 0; i < 30; ++i) {
    checked.push_back(prng() % p.size());
  }

  constexpr float eps = 1e-2;
  for (int i : checked) {
    a3c::ParameterVector plus = p;
    a3c::ParameterVector minus = p;
    plus[i] += eps;
    minus[i] -= eps;
    double numeric = (total_loss(net, plus, batch) - total_loss(net, minus, batch)) / (2 * eps);
    EXPECT_NEAR(numeric, analytic[i], 2e-3 + 2e-2 * std::abs(analytic[i])) << "parameter " << i;
  }
}

TEST(DensePolicyValueNet, sentinel_heads_carry_no_policy_loss) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::DensePolicyValueNet::Params params;
  params.hidden_size = 4;
  params.pool_cells = 2;
  a3c::DensePolicyValueNet net(params, descriptor);

  std::mt19937 prng(3);
  a3c::ParameterVector p = net.initial_parameters(prng);
  auto obs = random_observation(descriptor, prng);

  a3c::ArgSamples samples(descriptor.num_arg_types());
  for (int a = 0; a < descriptor.num_arg_types(); ++a) {
    samples[a].assign(descriptor.arg_types()[a].dims.size(), a3c::ActionCodec::kUnusedArgument);
  }

  int no_op = descriptor.index_of(C::kNoOp);
  a3c::TrainingBatch batch;
  batch.observations = {obs.get()};
  batch.actions = {no_op};
  batch.arg_samples = {samples};
  batch.discounted_returns = Eigen::VectorXf::Constant(1, 0.25);
  batch.advantages = Eigen::VectorXf::Constant(1, 2.0);

  a3c::ParameterVector gradients;
  a3c::LossReport report = net.compute_gradients(p, batch, gradients);

  float p_base = net.evaluate(p, *obs).base[no_op];
  EXPECT_NEAR(report.policy_loss, -2.0 * std::log(p_base), 1e-4);
  EXPECT_GT(report.entropy, 0);
  EXPECT_NEAR(report.var_norm, p.norm(), 1e-3);
}

TEST(DensePolicyValueNet, saturated_probabilities_stay_finite) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  a3c::DensePolicyValueNet::Params params;
  params.hidden_size = 4;
  params.pool_cells = 2;
  a3c::DensePolicyValueNet net(params, descriptor);

  std::mt19937 prng(4);
  a3c::ParameterVector p = net.initial_parameters(prng) * 1e5f;
  auto obs = random_observation(descriptor, prng);

  a3c::ArgSamples samples(descriptor.num_arg_types());
  for (int a = 0; a < descriptor.num_arg_types(); ++a) {
    samples[a].assign(descriptor.arg_types()[a].dims.size(), 0);
  }

  a3c::TrainingBatch batch;
  batch.observations = {obs.get()};
  batch.actions = {0};
  batch.arg_samples = {samples};
  batch.discounted_returns = Eigen::VectorXf::Constant(1, 1);
  batch.advantages = Eigen::VectorXf::Constant(1, 1);

  a3c::ParameterVector gradients;
  a3c::LossReport report = net.compute_gradients(p, batch, gradients);
  EXPECT_TRUE(std::isfinite(report.policy_loss));
  EXPECT_TRUE(std::isfinite(report.entropy));
  EXPECT_TRUE(gradients.allFinite());
}

/////////////////////////////////////
// Begin tests for Checkpointer    //
/////////////////////////////////////

TEST(FileCheckpointer, save_prune_and_load) {
  fs::path dir = make_temp_dir();
  a3c::FileCheckpointer checkpointer(dir / "models", 2);
  EXPECT_FALSE(checkpointer.load_latest().has_value());

  for (int64_t episode : {100, 200, 300}) {
    checkpointer.save_snapshot(a3c::ParameterVector::Constant(4, episode), episode);
  }

  // Unrelated files are ignored.
  std::ofstream((dir / "models" / "notes.txt").string()) << "hello";

  auto snapshots = checkpointer.list_snapshots();
  ASSERT_EQ(snapshots.size(), 2u);
  EXPECT_EQ(snapshots[0].filename().string(), "model-200.bin");
  EXPECT_EQ(snapshots[1].filename().string(), "model-300.bin");

  auto latest = checkpointer.load_latest();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->episode, 300);
  EXPECT_EQ(latest->values, a3c::ParameterVector::Constant(4, 300));

  fs::remove_all(dir);
}

TEST(FileCheckpointer, ignores_non_ascii_names) {
  fs::path dir = make_temp_dir();
  a3c::FileCheckpointer checkpointer(dir, 5);
  checkpointer.save_snapshot(a3c::ParameterVector::Ones(2), 7);

  std::ofstream((dir / "model-\xe9\xe9.bin").string()) << "x";
  std::ofstream((dir / "model-1\xb2.bin").string()) << "x";

  auto snapshots = checkpointer.list_snapshots();
  ASSERT_EQ(snapshots.size(), 1u);
  EXPECT_EQ(snapshots[0].filename().string(), "model-7.bin");

  fs::remove_all(dir);
}

TEST(FileCheckpointer, read_errors) {
  fs::path dir = make_temp_dir();
  EXPECT_THROW(a3c::FileCheckpointer::read(dir / "missing.bin"), util::Exception);

  fs::path garbage = dir / "model-1.bin";
  std::ofstream(garbage.string()) << "not a snapshot";
  EXPECT_THROW(a3c::FileCheckpointer::read(garbage), util::Exception);

  fs::path truncated = dir / "model-2.bin";
  a3c::FileCheckpointer::write(truncated, a3c::ParameterVector::Ones(100), 2);
  fs::resize_file(truncated, fs::file_size(truncated) - 8);
  EXPECT_THROW(a3c::FileCheckpointer::read(truncated), util::Exception);

  fs::remove_all(dir);
}

TEST(JsonTelemetryWriter, appends_json_lines) {
  fs::path dir = make_temp_dir();
  a3c::JsonTelemetryWriter writer(dir);

  writer.record_summary(1, {{"Perf/Reward", 2.5f}, {"Losses/Entropy", 0.75f}}, 5);
  writer.record_summary(1, {{"Perf/Reward", 3.5f}}, 10);

  std::ifstream file(writer.summary_path(1).string());
  std::vector<std::string> lines;
  for (std::string line; std::getline(file, line);) lines.push_back(line);
  ASSERT_EQ(lines.size(), 2u);

  boost::json::object first = boost::json::parse(lines[0]).as_object();
  EXPECT_EQ(first.at("episode").as_int64(), 5);
  EXPECT_EQ(first.at("worker").as_int64(), 1);
  EXPECT_DOUBLE_EQ(first.at("Perf/Reward").as_double(), 2.5);
  EXPECT_DOUBLE_EQ(first.at("Losses/Entropy").as_double(), 0.75);

  boost::json::object second = boost::json::parse(lines[1]).as_object();
  EXPECT_EQ(second.at("episode").as_int64(), 10);

  fs::remove_all(dir);
}

/////////////////////////////////////
// Begin tests for Worker          //
/////////////////////////////////////

TEST(Worker, end_to_end_single_episode) {
  WorkerFixture f;
  a3c::Worker::Params params;
  auto env = std::make_unique<ScriptedEnv>(5);
  ScriptedEnv* env_ptr = env.get();
  a3c::Worker worker(0, params, f.shared(), std::move(env), std::mt19937(1));

  a3c::Worker::EpisodeSummary summary = worker.run_episode();
  EXPECT_EQ(summary.length, 5);
  EXPECT_EQ(summary.reward, 3);
  EXPECT_FLOAT_EQ(summary.mean_value, RecordingNetwork::kValue);

  ASSERT_EQ(f.network.batch_sizes(), std::vector<int>{5});
  const Eigen::VectorXf& returns = f.network.returns()[0];
  ASSERT_EQ(returns.size(), 5);
  EXPECT_FLOAT_EQ(returns[4], 1);
  EXPECT_FLOAT_EQ(returns[3], 0.99);
  EXPECT_FLOAT_EQ(returns[2], 1 + 0.99 * 0.99);
  EXPECT_NEAR(returns[0], 1 + 0.99 * (0.99 * (1 + 0.99 * 0.99)), 1e-5);

  EXPECT_EQ(f.store.num_pushes(), 1);
  EXPECT_EQ(worker.num_train_steps(), 1);
  EXPECT_EQ(f.stats.total_episodes(), 1);
  EXPECT_EQ(f.stats.total_steps(), 5);
  EXPECT_EQ(f.global_episodes.load(), 1);
  EXPECT_EQ(env_ptr->num_resets(), 1);
  EXPECT_EQ(env_ptr->calls().size(), 5u);
  for (sc2::function_id_t id : env_ptr->calls()) {
    EXPECT_TRUE(id == C::kNoOp || id == C::kSelectArmy);
  }
}

TEST(Worker, mid_episode_train_keeps_recent_half) {
  WorkerFixture f;
  a3c::Worker::Params params;
  params.rollout_length = 30;
  a3c::Worker worker(1, params, f.shared(), std::make_unique<ScriptedEnv>(40), std::mt19937(2));

  worker.run_episode();

  // 30 steps trained mid-episode, then the last 15 of them plus the final 10.
  EXPECT_EQ(f.network.batch_sizes(), (std::vector<int>{30, 25}));
  EXPECT_EQ(f.store.num_pushes(), 2);

  // The mid-episode batch bootstraps from the value of the latest state.
  const Eigen::VectorXf& mid_advantages = f.network.advantages()[0];
  float last_residual = 0 + 0.99f * RecordingNetwork::kValue - RecordingNetwork::kValue;
  EXPECT_NEAR(mid_advantages[29], last_residual, 1e-6);

  // Only worker 0 advances the global counter.
  EXPECT_EQ(f.global_episodes.load(), 0);
  EXPECT_EQ(f.stats.total_episodes(), 1);
}

TEST(Worker, no_mid_episode_train_one_step_before_limit) {
  WorkerFixture f;
  a3c::Worker::Params params;
  params.rollout_length = 30;
  params.max_episode_length = 31;
  a3c::Worker worker(0, params, f.shared(), std::make_unique<ScriptedEnv>(100), std::mt19937(3));

  a3c::Worker::EpisodeSummary summary = worker.run_episode();
  EXPECT_EQ(summary.length, 31);
  EXPECT_EQ(f.network.batch_sizes(), std::vector<int>{31});
}

TEST(Worker, summary_and_checkpoint_cadence) {
  WorkerFixture f;
  a3c::Worker::Params params;
  params.summary_interval = 2;
  params.checkpoint_interval = 4;
  a3c::Worker worker(0, params, f.shared(), std::make_unique<ScriptedEnv>(5), std::mt19937(4));

  for (int i = 0; i < 8; ++i) worker.run_episode();

  EXPECT_EQ(f.telemetry.episodes, (std::vector<int64_t>{2, 4, 6, 8}));
  EXPECT_EQ(f.checkpointer.episodes, (std::vector<int64_t>{4, 8}));

  const auto& metrics = f.telemetry.summaries.back();
  EXPECT_EQ(metrics.size(), 8u);
  EXPECT_FLOAT_EQ(metrics.at("Perf/Reward"), 3);
  EXPECT_FLOAT_EQ(metrics.at("Perf/Length"), 5);
  EXPECT_FLOAT_EQ(metrics.at("Perf/Value"), RecordingNetwork::kValue);
  EXPECT_TRUE(metrics.count("Losses/Grad Norm"));
}

TEST(Worker, history_keeps_one_summary_window) {
  WorkerFixture f;
  a3c::Worker::Params params;
  params.summary_interval = 2;
  a3c::Worker worker(1, params, f.shared(), std::make_unique<ScriptedEnv>(5), std::mt19937(10));

  for (int i = 0; i < 5; ++i) worker.run_episode();
  EXPECT_EQ(worker.episode_count(), 5);
  EXPECT_EQ(worker.history().size(), 2u);
  EXPECT_EQ(f.telemetry.episodes, (std::vector<int64_t>{2, 4}));
}

TEST(Worker, worker_zero_continues_global_episode_count) {
  WorkerFixture f;
  f.global_episodes = 100;
  a3c::Worker::Params params;
  params.summary_interval = 1;
  params.checkpoint_interval = 2;
  a3c::Worker worker(0, params, f.shared(), std::make_unique<ScriptedEnv>(5), std::mt19937(11));

  for (int i = 0; i < 4; ++i) worker.run_episode();
  EXPECT_EQ(worker.episode_count(), 4);
  EXPECT_EQ(f.global_episodes.load(), 104);
  EXPECT_EQ(f.checkpointer.episodes, (std::vector<int64_t>{102, 104}));
  EXPECT_EQ(f.telemetry.episodes, (std::vector<int64_t>{101, 102, 103, 104}));
}

TEST(Worker, only_worker_zero_checkpoints) {
  WorkerFixture f;
  a3c::Worker::Params params;
  params.summary_interval = 1;
  params.checkpoint_interval = 1;
  a3c::Worker worker(2, params, f.shared(), std::make_unique<ScriptedEnv>(5), std::mt19937(5));

  for (int i = 0; i < 3; ++i) worker.run_episode();

  EXPECT_TRUE(f.checkpointer.episodes.empty());
  EXPECT_EQ(f.telemetry.workers, (std::vector<int>{2, 2, 2}));
}

TEST(Worker, environment_failure_is_fatal) {
  WorkerFixture f;
  a3c::Worker worker(0, {}, f.shared(), std::make_unique<ScriptedEnv>(5, 3), std::mt19937(6));

  worker.run();
  EXPECT_TRUE(worker.failed());
  EXPECT_EQ(worker.state(), a3c::Worker::kFailed);
  EXPECT_EQ(f.stats.failed_workers(), 1);
  EXPECT_EQ(f.stats.total_episodes(), 0);
}

TEST(Worker, environment_failure_type) {
  WorkerFixture f;
  a3c::Worker worker(0, {}, f.shared(), std::make_unique<ScriptedEnv>(5, 2), std::mt19937(7));
  EXPECT_THROW(worker.run_episode(), sc2::EnvironmentFailure);
}

TEST(Worker, stop_is_checked_between_episodes) {
  WorkerFixture f;
  a3c::Worker worker(0, {}, f.shared(), std::make_unique<ScriptedEnv>(5), std::mt19937(8));

  f.stop = true;
  worker.run();
  EXPECT_EQ(worker.state(), a3c::Worker::kStopped);
  EXPECT_EQ(worker.episode_count(), 0);
}

TEST(Worker, max_episodes) {
  WorkerFixture f;
  a3c::Worker worker(0, {}, f.shared(3), std::make_unique<ScriptedEnv>(5), std::mt19937(9));

  worker.run();
  EXPECT_EQ(worker.state(), a3c::Worker::kStopped);
  EXPECT_EQ(worker.episode_count(), 3);
  EXPECT_TRUE(f.stop.load());
}

/////////////////////////////////////
// Begin tests for Coordinator     //
/////////////////////////////////////

TEST(Coordinator, runs_workers_until_max_episodes) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  RecordingNetwork network(descriptor);

  a3c::Coordinator::Params params;
  params.num_workers = 3;
  params.startup_stagger_ms = 1;
  params.max_episodes = 6;

  std::atomic<int> envs_created = 0;
  sc2::EnvironmentFactory factory = [&](int) -> std::unique_ptr<sc2::Environment> {
    envs_created++;
    return std::make_unique<ScriptedEnv>(5);
  };

  a3c::Coordinator coordinator(params, {}, {}, descriptor, network, factory);
  EXPECT_EQ(envs_created.load(), 3);
  EXPECT_EQ(coordinator.num_workers(), 3);

  a3c::Coordinator::Result result = coordinator.run();
  EXPECT_FALSE(result.any_failed());
  EXPECT_EQ(result.worker_failed.size(), 3u);

  // Workers only check the limit between episodes, so each may finish one more.
  EXPECT_GE(result.total_episodes, 6);
  EXPECT_LE(result.total_episodes, 6 + 2);
  EXPECT_EQ(result.total_steps, 5 * result.total_episodes);
  EXPECT_EQ(coordinator.store().num_pushes(), result.total_episodes);
  EXPECT_EQ(coordinator.global_episodes(), coordinator.worker(0).episode_count());
  EXPECT_FLOAT_EQ(result.max_score, 3);
}

TEST(Coordinator, reports_failed_workers) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  RecordingNetwork network(descriptor);

  a3c::Coordinator::Params params;
  params.num_workers = 2;
  params.startup_stagger_ms = 0;
  params.max_episodes = 4;

  sc2::EnvironmentFactory factory = [](int worker_index) -> std::unique_ptr<sc2::Environment> {
    return std::make_unique<ScriptedEnv>(5, worker_index == 1 ? 2 : -1);
  };

  a3c::Coordinator coordinator(params, {}, {}, descriptor, network, factory);
  a3c::Coordinator::Result result = coordinator.run();

  EXPECT_TRUE(result.any_failed());
  EXPECT_EQ(result.num_failed(), 1);
  EXPECT_FALSE(result.worker_failed[0]);
  EXPECT_TRUE(result.worker_failed[1]);
  EXPECT_GE(result.total_episodes, 4);
}

TEST(Coordinator, request_stop) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  RecordingNetwork network(descriptor);

  a3c::Coordinator::Params params;
  params.num_workers = 2;
  params.startup_stagger_ms = 0;

  sc2::EnvironmentFactory factory = [](int) -> std::unique_ptr<sc2::Environment> {
    return std::make_unique<ScriptedEnv>(5);
  };

  a3c::Coordinator coordinator(params, {}, {}, descriptor, network, factory);
  coordinator.request_stop();
  a3c::Coordinator::Result result = coordinator.run();
  EXPECT_FALSE(result.any_failed());
  EXPECT_EQ(result.total_episodes, 0);
  EXPECT_EQ(result.max_score, 0);
  EXPECT_EQ(result.running_avg_score, 0);
}

TEST(Coordinator, restore_continues_snapshot_numbering) {
  fs::path dir = make_temp_dir();
  a3c::FileCheckpointer checkpointer(dir, 2);
  for (int64_t episode : {100, 200, 300}) {
    checkpointer.save_snapshot(
      a3c::ParameterVector::Constant(RecordingNetwork::kNumParameters, episode), episode);
  }

  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  RecordingNetwork network(descriptor);

  a3c::Coordinator::Params params;
  params.num_workers = 1;
  params.startup_stagger_ms = 0;
  params.max_episodes = 2;

  a3c::Worker::Params worker_params;
  worker_params.summary_interval = 1;
  worker_params.checkpoint_interval = 1;

  sc2::EnvironmentFactory factory = [](int) -> std::unique_ptr<sc2::Environment> {
    return std::make_unique<ScriptedEnv>(5);
  };

  a3c::Coordinator coordinator(params, worker_params, {}, descriptor, network, factory,
                               &checkpointer);
  auto latest = checkpointer.load_latest();
  ASSERT_TRUE(latest.has_value());
  coordinator.restore(*latest);
  EXPECT_EQ(coordinator.global_episodes(), 300);
  EXPECT_EQ(coordinator.store().pull().values,
            a3c::ParameterVector::Constant(RecordingNetwork::kNumParameters, 300));

  a3c::Coordinator::Result result = coordinator.run();
  EXPECT_FALSE(result.any_failed());
  EXPECT_EQ(result.total_episodes, 2);
  EXPECT_EQ(coordinator.global_episodes(), 302);

  auto snapshots = checkpointer.list_snapshots();
  ASSERT_EQ(snapshots.size(), 2u);
  EXPECT_EQ(snapshots[0].filename().string(), "model-301.bin");
  EXPECT_EQ(snapshots[1].filename().string(), "model-302.bin");
  EXPECT_EQ(checkpointer.load_latest()->episode, 302);

  fs::remove_all(dir);
}

TEST(Coordinator, restore_rejects_mismatched_snapshot) {
  sc2::ActionSpaceDescriptor descriptor(sc2::Race::kTerran, kSmallSpatial);
  RecordingNetwork network(descriptor);
  sc2::EnvironmentFactory factory = [](int) -> std::unique_ptr<sc2::Environment> {
    return std::make_unique<ScriptedEnv>(5);
  };

  a3c::Coordinator coordinator({}, {}, {}, descriptor, network, factory);
  a3c::FileCheckpointer::Snapshot snapshot{
    a3c::ParameterVector::Zero(RecordingNetwork::kNumParameters + 1), 50};
  EXPECT_THROW(coordinator.restore(snapshot), util::CleanException);
  EXPECT_EQ(coordinator.global_episodes(), 0);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
