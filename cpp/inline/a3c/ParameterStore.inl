#include "a3c/ParameterStore.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace a3c {

inline auto ParameterStore::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("ParameterStore options");
  return desc
    .template add_option<"learning-rate">(po2::default_value("{:.1e}", &learning_rate),
                                          "Adam learning rate")
    .template add_option<"max-grad-norm">(po2::default_value("{:.1f}", &max_grad_norm),
                                          "clip each pushed gradient to this global norm")
    .template add_hidden_option<"adam-beta1">(po2::default_value("{:.3f}", &adam_beta1),
                                              "Adam first-moment decay")
    .template add_hidden_option<"adam-beta2">(po2::default_value("{:.4f}", &adam_beta2),
                                              "Adam second-moment decay")
    .template add_hidden_option<"adam-epsilon">(po2::default_value("{:.1e}", &adam_epsilon),
                                                "Adam epsilon");
}

}  // namespace a3c
