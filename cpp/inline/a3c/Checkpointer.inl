#include "a3c/Checkpointer.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace a3c {

inline auto PersistenceParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Checkpoint options");
  return desc
    .template add_option<"model-dir">(po::value<std::string>(&model_dir)->default_value(model_dir),
                                      "directory for parameter snapshots")
    .template add_option<"summary-dir">(
      po::value<std::string>(&summary_dir)->default_value(summary_dir),
      "directory for per-worker telemetry summaries")
    .template add_option<"max-snapshots-kept">(
      po::value<int>(&max_snapshots_kept)->default_value(max_snapshots_kept),
      "number of most recent parameter snapshots to keep");
}

}  // namespace a3c
