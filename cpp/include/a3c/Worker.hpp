#pragma once

#include "a3c/ActionCodec.hpp"
#include "a3c/Checkpointer.hpp"
#include "a3c/EpisodeStats.hpp"
#include "a3c/ParameterStore.hpp"
#include "a3c/PolicyValueNet.hpp"
#include "a3c/Rollout.hpp"
#include "a3c/Types.hpp"
#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/Environment.hpp"
#include "sc2/ObservationEncoder.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <random>
#include <vector>

namespace a3c {

/*
 * One A3C actor-learner. Drives a private environment with a local copy of the parameters,
 * collects a bounded rollout, and pushes gradients to the shared ParameterStore.
 *
 * Per episode: pull parameters, then step the environment until it reports a terminal step (or
 * max_episode_length steps elapse). Whenever the rollout reaches rollout_length steps mid-episode,
 * the worker trains with the value of the latest state as bootstrap, keeps only the most recent
 * half of the rollout, and pulls fresh parameters. Whatever remains at episode end is trained
 * with a bootstrap of 0.
 *
 * The stop flag is only checked between episodes.
 */
class Worker {
 public:
  struct Params {
    auto make_options_description();

    int rollout_length = 30;
    int max_episode_length = 300;
    float gamma = 0.99;
    int summary_interval = 5;
    int checkpoint_interval = 100;
  };

  enum State : int8_t {
    kIdle,
    kSyncParams,
    kRunEpisodeStep,
    kTrain,
    kEndEpisode,
    kStopped,
    kFailed
  };

  // Collaborators owned by the Coordinator and shared by every worker.
  struct Shared {
    const sc2::ActionSpaceDescriptor& descriptor;
    const PolicyValueNetwork& network;
    ParameterStore& store;
    EpisodeStats& stats;
    std::atomic<bool>& stop;
    std::atomic<int64_t>& global_episodes;  // advanced by worker 0 only; seeded on restore
    Checkpointer* checkpointer = nullptr;
    TelemetrySink* telemetry = nullptr;
    int64_t max_episodes = 0;  // 0 means unlimited
  };

  struct EpisodeSummary {
    float reward;
    int length;
    float mean_value;
  };

  Worker(int index, const Params& params, const Shared& shared,
         std::unique_ptr<sc2::Environment> env, std::mt19937 prng);

  // Runs episodes until a stop is requested or an error occurs. Never throws: errors are logged
  // and leave the worker in kFailed.
  void run();

  // Runs a single episode. Exceptions propagate.
  EpisodeSummary run_episode();

  int index() const { return index_; }
  State state() const { return state_; }
  bool failed() const { return state_ == kFailed; }

  int64_t episode_count() const { return episode_count_; }
  int64_t step_count() const { return step_count_; }
  int64_t num_train_steps() const { return num_train_steps_; }
  const LossReport& last_loss() const { return last_loss_; }
  // The most recent summary_interval episodes.
  const std::deque<EpisodeSummary>& history() const { return history_; }

 private:
  bool should_stop() const;
  void sync_params();
  void train(float bootstrap_value);
  void end_episode(const EpisodeSummary& summary);
  void write_summary(int64_t episode);
  void on_degenerate_distribution();

  sc2::TimeStep env_reset();
  sc2::TimeStep env_step(const sc2::FunctionCall& call);

  const int index_;
  const Params params_;
  const Shared shared_;
  std::unique_ptr<sc2::Environment> env_;
  std::mt19937 prng_;

  const sc2::ObservationEncoder encoder_;
  const ActionCodec codec_;
  sc2::AgentState agent_state_;
  ParameterSnapshot local_;
  Rollout rollout_;

  std::atomic<State> state_ = kIdle;
  int64_t episode_count_ = 0;
  int64_t step_count_ = 0;
  int64_t num_train_steps_ = 0;
  LossReport last_loss_;
  float last_grad_norm_ = 0;
  std::deque<EpisodeSummary> history_;
  bool warned_degenerate_ = false;
};

}  // namespace a3c

#include "inline/a3c/Worker.inl"
