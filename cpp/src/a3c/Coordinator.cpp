#include "a3c/Coordinator.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <chrono>
#include <csignal>

namespace a3c {

int Coordinator::Result::num_failed() const {
  int n = 0;
  for (bool failed : worker_failed) n += failed;
  return n;
}

Coordinator::Coordinator(const Params& params, const Worker::Params& worker_params,
                         const ParameterStore::Params& store_params,
                         const sc2::ActionSpaceDescriptor& descriptor,
                         const PolicyValueNetwork& network,
                         const sc2::EnvironmentFactory& env_factory, Checkpointer* checkpointer,
                         TelemetrySink* telemetry)
    : params_(params) {
  CLEAN_ASSERT(params.num_workers > 0, "num-workers must be positive (got {})",
               params.num_workers);
  CLEAN_ASSERT(params.startup_stagger_ms >= 0, "startup-stagger-ms must be nonnegative");

  std::mt19937 init_prng = util::Random::spawn_prng();
  store_ = std::make_unique<ParameterStore>(store_params, network.initial_parameters(init_prng));
  LOG_INFO("Initialized {} parameters", store_->num_parameters());

  Worker::Shared shared{descriptor,   network,         *store_,      stats_,
                        stop_,        global_episodes_, checkpointer, telemetry,
                        params.max_episodes};
  for (int i = 0; i < params.num_workers; ++i) {
    workers_.push_back(std::make_unique<Worker>(i, worker_params, shared, env_factory(i),
                                                util::Random::spawn_prng()));
  }
}

Coordinator::~Coordinator() {
  request_stop();
  join_threads();
}

void Coordinator::restore(const FileCheckpointer::Snapshot& snapshot) {
  CLEAN_ASSERT(snapshot.values.size() == store_->num_parameters(),
               "Snapshot has {} parameters, expected {}", snapshot.values.size(),
               store_->num_parameters());
  CLEAN_ASSERT(snapshot.episode >= 0, "Snapshot has negative episode {}", snapshot.episode);
  store_->restore(snapshot.values);
  global_episodes_ = snapshot.episode;
  LOG_INFO("Restored {} parameters at episode {}", snapshot.values.size(), snapshot.episode);
}

Coordinator::Result Coordinator::run() {
  Coordinator* expected = nullptr;
  RELEASE_ASSERT(active_.compare_exchange_strong(expected, this),
                 "Only one Coordinator may run at a time");

  LOG_INFO("Starting {} workers", workers_.size());
  for (size_t i = 0; i < workers_.size(); ++i) {
    if (i > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(params_.startup_stagger_ms));
    }
    Worker* worker = workers_[i].get();
    threads_.emplace_back([worker] { worker->run(); });
  }

  join_threads();
  active_ = nullptr;

  Result result;
  for (const auto& worker : workers_) {
    result.worker_failed.push_back(worker->failed());
  }
  result.total_episodes = stats_.total_episodes();
  result.total_steps = stats_.total_steps();
  result.degenerate_distributions = stats_.degenerate_distributions();
  result.max_score = stats_.max_score();
  result.running_avg_score = stats_.running_avg_score();

  LOG_INFO("Training finished: episodes={} steps={} pushes={} failed workers={}",
           result.total_episodes, result.total_steps, store_->num_pushes(), result.num_failed());
  return result;
}

void Coordinator::register_signal(int signum) { std::signal(signum, signal_handler); }

void Coordinator::signal_handler(int) {
  Coordinator* coordinator = active_;
  if (coordinator) coordinator->request_stop();
}

void Coordinator::join_threads() {
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

}  // namespace a3c
