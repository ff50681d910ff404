#include "a3c/Worker.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace a3c {

inline auto Worker::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Worker options");
  return desc
    .template add_option<"rollout-length">(
      po::value<int>(&rollout_length)->default_value(rollout_length),
      "train mid-episode whenever the rollout reaches this many steps")
    .template add_option<"max-episode-length">(
      po::value<int>(&max_episode_length)->default_value(max_episode_length),
      "end an episode after this many steps")
    .template add_option<"gamma">(po2::default_value("{:.3f}", &gamma),
                                  "discount factor for returns and advantages")
    .template add_option<"summary-interval">(
      po::value<int>(&summary_interval)->default_value(summary_interval),
      "write a telemetry summary every this many episodes")
    .template add_option<"checkpoint-interval">(
      po::value<int>(&checkpoint_interval)->default_value(checkpoint_interval),
      "worker 0 saves a snapshot every this many episodes (rounded to a summary boundary)");
}

}  // namespace a3c
