#include "a3c/PolicyValueNet.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace a3c {

inline auto DensePolicyValueNet::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Network options");
  return desc
    .template add_option<"hidden-size">(po::value<int>(&hidden_size)->default_value(hidden_size),
                                        "width of the hidden layer")
    .template add_hidden_option<"pool-cells">(
      po::value<int>(&pool_cells)->default_value(pool_cells),
      "each spatial channel is average-pooled to a pool-cells x pool-cells grid");
}

}  // namespace a3c
