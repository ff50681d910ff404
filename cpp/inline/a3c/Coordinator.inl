#include "a3c/Coordinator.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace a3c {

inline auto Coordinator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Coordinator options");
  return desc
    .template add_option<"num-workers", 'n'>(
      po::value<int>(&num_workers)->default_value(num_workers), "number of worker threads")
    .template add_option<"startup-stagger-ms">(
      po::value<int>(&startup_stagger_ms)->default_value(startup_stagger_ms),
      "delay between consecutive worker starts")
    .template add_option<"max-episodes">(
      po::value<int64_t>(&max_episodes)->default_value(max_episodes),
      "stop once this many episodes have completed across all workers (0 = unlimited)");
}

}  // namespace a3c
