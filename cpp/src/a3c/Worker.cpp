#include "a3c/Worker.hpp"

#include "a3c/AdvantageEstimator.hpp"
#include "sc2/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <exception>
#include <utility>

namespace a3c {

Worker::Worker(int index, const Params& params, const Shared& shared,
               std::unique_ptr<sc2::Environment> env, std::mt19937 prng)
    : index_(index),
      params_(params),
      shared_(shared),
      env_(std::move(env)),
      prng_(prng),
      encoder_(shared.descriptor),
      codec_(shared.descriptor),
      agent_state_(shared.descriptor) {
  CLEAN_ASSERT(params.rollout_length > 0, "rollout-length must be positive");
  CLEAN_ASSERT(params.max_episode_length > 0, "max-episode-length must be positive");
  CLEAN_ASSERT(params.summary_interval > 0, "summary-interval must be positive");
  CLEAN_ASSERT(params.checkpoint_interval > 0, "checkpoint-interval must be positive");
  CLEAN_ASSERT(params.gamma >= 0 && params.gamma <= 1, "gamma must be in [0, 1] (got {})",
               params.gamma);
  RELEASE_ASSERT(env_ != nullptr, "worker {} has no environment", index);
}

void Worker::run() {
  LOG_INFO("Starting worker {}", index_);
  try {
    while (!should_stop()) {
      run_episode();
    }
    state_ = kStopped;
    LOG_INFO("Worker {} stopped after {} episodes ({} steps)", index_, episode_count_,
             step_count_);
  } catch (const std::exception& e) {
    state_ = kFailed;
    shared_.stats.record_failed_worker();
    LOG_ERROR("Worker {} failed at episode {} step {}: {}", index_, episode_count_, step_count_,
              e.what());
  }
}

Worker::EpisodeSummary Worker::run_episode() {
  state_ = kSyncParams;
  sync_params();

  state_ = kRunEpisodeStep;
  agent_state_.reset();
  rollout_.clear();
  sc2::EncodedStep current = encoder_.encode(env_reset(), agent_state_);

  float episode_reward = 0;
  double value_sum = 0;
  int episode_steps = 0;
  bool done = false;

  while (!done) {
    NetworkOutput out = shared_.network.evaluate(local_.values, *current.observation);
    ActionCodec::Selection selection = codec_.select(out.base, out.args, current.available, prng_);
    if (selection.degenerate) on_degenerate_distribution();

    agent_state_.act(selection.base_action);
    sc2::EncodedStep next = encoder_.encode(env_step(selection.call), agent_state_);
    done = next.terminal;

    rollout_.push_back(RolloutStep{current.observation, selection.base_action,
                                   std::move(selection.training_samples), next.reward,
                                   next.observation, done, out.value});
    episode_reward += next.reward;
    value_sum += out.value;
    episode_steps++;
    step_count_++;
    shared_.stats.add_steps(1);
    current = std::move(next);

    // No mid-episode update one step short of the length limit.
    if (rollout_.size() == params_.rollout_length && !done &&
        episode_steps != params_.max_episode_length - 1) {
      state_ = kTrain;
      float bootstrap_value = shared_.network.evaluate(local_.values, *current.observation).value;
      train(bootstrap_value);
      rollout_.truncate_to_recent_half();

      state_ = kSyncParams;
      sync_params();
      state_ = kRunEpisodeStep;
    }

    if (episode_steps >= params_.max_episode_length) break;
  }

  state_ = kEndEpisode;
  if (!rollout_.empty()) {
    train(0);
  }

  EpisodeSummary summary{episode_reward, episode_steps, float(value_sum / episode_steps)};
  end_episode(summary);
  state_ = kIdle;
  return summary;
}

bool Worker::should_stop() const {
  if (shared_.stop) return true;
  if (shared_.max_episodes > 0 && shared_.stats.total_episodes() >= shared_.max_episodes) {
    shared_.stop = true;
    return true;
  }
  return false;
}

void Worker::sync_params() { local_ = shared_.store.pull(); }

void Worker::train(float bootstrap_value) {
  AdvantageEstimator::Targets targets = AdvantageEstimator::compute(
    rollout_.rewards(), rollout_.values(), bootstrap_value, params_.gamma);
  TrainingBatch batch = rollout_.make_batch(targets);

  ParameterVector gradients;
  last_loss_ = shared_.network.compute_gradients(local_.values, batch, gradients);
  last_grad_norm_ = shared_.store.push(gradients);
  num_train_steps_++;
  LOG_DEBUG("Worker {} pushed {} steps (bootstrap={:.3f} grad_norm={:.3f} version={})", index_,
            batch.size(), bootstrap_value, last_grad_norm_, shared_.store.version());
}

void Worker::end_episode(const EpisodeSummary& summary) {
  history_.push_back(summary);
  if ((int)history_.size() > params_.summary_interval) history_.pop_front();

  int64_t total_episodes = shared_.stats.record_episode(summary.reward);
  episode_count_++;

  // Worker 0 keys its summaries and snapshots on the global counter, which carries over from a
  // restored snapshot.
  int64_t episode = episode_count_;
  if (index_ == 0) {
    episode = ++shared_.global_episodes;
  }

  LOG_INFO(
    "Worker {} episode {}: reward={} steps={} | total steps={} episodes={} max score={} avg "
    "score={:.3f}",
    index_, episode_count_, summary.reward, summary.length, shared_.stats.total_steps(),
    total_episodes, shared_.stats.max_score(), shared_.stats.running_avg_score());

  if (episode % params_.summary_interval != 0) return;

  if (index_ == 0 && shared_.checkpointer && episode % params_.checkpoint_interval == 0) {
    shared_.checkpointer->save_snapshot(shared_.store.pull().values, episode);
  }
  if (shared_.telemetry) {
    write_summary(episode);
  }
}

void Worker::write_summary(int64_t episode) {
  int n = history_.size();
  float reward = 0;
  float length = 0;
  float value = 0;
  for (const EpisodeSummary& s : history_) {
    reward += s.reward;
    length += s.length;
    value += s.mean_value;
  }

  TelemetrySink::Metrics metrics;
  metrics["Perf/Reward"] = reward / n;
  metrics["Perf/Length"] = length / n;
  metrics["Perf/Value"] = value / n;
  metrics["Losses/Value Loss"] = last_loss_.value_loss;
  metrics["Losses/Policy Loss"] = last_loss_.policy_loss;
  metrics["Losses/Entropy"] = last_loss_.entropy;
  metrics["Losses/Grad Norm"] = last_grad_norm_;
  metrics["Losses/Var Norm"] = last_loss_.var_norm;
  shared_.telemetry->record_summary(index_, metrics, episode);
}

void Worker::on_degenerate_distribution() {
  shared_.stats.record_degenerate_distribution();
  if (!warned_degenerate_) {
    LOG_WARN("Worker {}: no available action has probability mass; sampling unmasked", index_);
    warned_degenerate_ = true;
  }
}

sc2::TimeStep Worker::env_reset() {
  try {
    return env_->reset();
  } catch (const sc2::EnvironmentFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw sc2::EnvironmentFailure("reset() failed: {}", e.what());
  }
}

sc2::TimeStep Worker::env_step(const sc2::FunctionCall& call) {
  try {
    return env_->step(call);
  } catch (const sc2::EnvironmentFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw sc2::EnvironmentFailure("step(function={}) failed: {}", call.function, e.what());
  }
}

}  // namespace a3c
