#include "a3c/Checkpointer.hpp"
#include "a3c/Coordinator.hpp"
#include "a3c/ParameterStore.hpp"
#include "a3c/PolicyValueNet.hpp"
#include "a3c/Worker.hpp"
#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/BasicTypes.hpp"
#include "sc2/MiniGame.hpp"
#include "util/BoostUtil.hpp"
#include "util/Asserts.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

struct Args {
  std::string map_name;
  std::string race = "T";
  int screen_size = 64;
  int minimap_size = 64;
  bool load_model = false;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"map", 'm'>(po::value<std::string>(&map_name),
                                       "map to train on (may also be given positionally)")
      .template positional<"map">()
      .template add_option<"race", 'r'>(po::value<std::string>(&race)->default_value(race),
                                        "agent race (T, P, or Z)")
      .template add_option<"screen-size">(po::value<int>(&screen_size)->default_value(screen_size),
                                          "screen resolution")
      .template add_option<"minimap-size">(
        po::value<int>(&minimap_size)->default_value(minimap_size), "minimap resolution")
      .template add_flag<"load-model", "no-load-model">(
        &load_model, "resume from the latest snapshot in --model-dir", "start from scratch");
  }
};

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    a3c::Coordinator::Params coordinator_params;
    a3c::Worker::Params worker_params;
    a3c::ParameterStore::Params store_params;
    a3c::DensePolicyValueNet::Params network_params;
    a3c::PersistenceParams persistence_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(coordinator_params.make_options_description())
                  .add(worker_params.make_options_description())
                  .add(store_params.make_options_description())
                  .add(network_params.make_options_description())
                  .add(persistence_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    CLEAN_ASSERT(!args.map_name.empty(), "Missing required option --map");

    util::Logging::init(log_params);
    util::Random::init(random_params);

    LOG_INFO("Starting process {}", getpid());

    sc2::Race race = sc2::parse_race(args.race);
    sc2::SpatialConfig spatial_config{args.screen_size, args.minimap_size};
    sc2::ActionSpaceDescriptor descriptor(race, spatial_config);
    const sc2::MapInfo& map = sc2::MapRegistry::lookup(args.map_name);

    LOG_INFO("Training on {} as {}: {} actions ({} general, {} race), {} argument heads",
             map.name, sc2::race_name(race), descriptor.action_count(),
             descriptor.num_general_actions(), descriptor.num_race_actions(),
             descriptor.num_heads());

    a3c::DensePolicyValueNet network(network_params, descriptor);
    a3c::FileCheckpointer checkpointer(persistence_params.model_dir,
                                       persistence_params.max_snapshots_kept);
    a3c::JsonTelemetryWriter telemetry(persistence_params.summary_dir);

    sc2::EnvironmentFactory env_factory = [&](int) -> std::unique_ptr<sc2::Environment> {
      return std::make_unique<sc2::MiniGameEnv>(map, spatial_config, util::Random::spawn_prng());
    };

    a3c::Coordinator coordinator(coordinator_params, worker_params, store_params, descriptor,
                                 network, env_factory, &checkpointer, &telemetry);

    if (args.load_model) {
      auto snapshot = checkpointer.load_latest();
      if (snapshot) {
        coordinator.restore(*snapshot);
      } else {
        LOG_WARN("No snapshot found in {}, starting from scratch", persistence_params.model_dir);
      }
    }

    a3c::Coordinator::register_signal(SIGINT);
    a3c::Coordinator::register_signal(SIGTERM);

    a3c::Coordinator::Result result = coordinator.run();
    if (result.any_failed()) {
      LOG_ERROR("{} of {} workers failed", result.num_failed(), result.worker_failed.size());
      return 1;
    }
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
