#pragma once

#include "a3c/Checkpointer.hpp"
#include "a3c/EpisodeStats.hpp"
#include "a3c/ParameterStore.hpp"
#include "a3c/PolicyValueNet.hpp"
#include "a3c/Worker.hpp"
#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/Environment.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace a3c {

/*
 * Owns the ParameterStore, the shared EpisodeStats and the stop flag, and runs one thread per
 * Worker.
 *
 * Usage:
 *
 * a3c::Coordinator coordinator(params, worker_params, store_params, descriptor, network, factory);
 * a3c::Coordinator::register_signal(SIGINT);
 * a3c::Coordinator::Result result = coordinator.run();
 */
class Coordinator {
 public:
  struct Params {
    auto make_options_description();

    int num_workers = 1;
    int startup_stagger_ms = 125;
    int64_t max_episodes = 0;
  };

  struct Result {
    std::vector<bool> worker_failed;
    int64_t total_episodes = 0;
    int64_t total_steps = 0;
    int64_t degenerate_distributions = 0;
    float max_score = 0;
    float running_avg_score = 0;

    int num_failed() const;
    bool any_failed() const { return num_failed() > 0; }
  };

  // Builds every worker (and its environment) up front, on the calling thread.
  Coordinator(const Params& params, const Worker::Params& worker_params,
              const ParameterStore::Params& store_params,
              const sc2::ActionSpaceDescriptor& descriptor, const PolicyValueNetwork& network,
              const sc2::EnvironmentFactory& env_factory, Checkpointer* checkpointer = nullptr,
              TelemetrySink* telemetry = nullptr);

  ~Coordinator();

  /*
   * Resumes from a saved snapshot: loads its parameters into the store and continues the global
   * episode counter from its episode, so that later snapshots are keyed after it. Call before
   * run(). Throws util::CleanException if the parameter count does not match the network.
   */
  void restore(const FileCheckpointer::Snapshot& snapshot);

  // Starts the workers with a staggered delay and blocks until every one of them has exited.
  Result run();

  // Asks every worker to exit at its next episode boundary.
  void request_stop() { stop_ = true; }
  bool stop_requested() const { return stop_; }

  // Installs a handler that calls request_stop() on the running coordinator.
  static void register_signal(int signum);

  ParameterStore& store() { return *store_; }
  const EpisodeStats& stats() const { return stats_; }
  int64_t global_episodes() const { return global_episodes_; }
  int num_workers() const { return workers_.size(); }
  const Worker& worker(int i) const { return *workers_[i]; }

 private:
  static void signal_handler(int signum);
  void join_threads();

  static inline std::atomic<Coordinator*> active_ = nullptr;

  const Params params_;
  std::unique_ptr<ParameterStore> store_;
  EpisodeStats stats_;
  std::atomic<bool> stop_ = false;
  std::atomic<int64_t> global_episodes_ = 0;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::vector<std::thread> threads_;
};

}  // namespace a3c

#include "inline/a3c/Coordinator.inl"
