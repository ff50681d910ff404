#pragma once

#include "a3c/Types.hpp"
#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/BasicTypes.hpp"
#include "sc2/Environment.hpp"

#include <random>
#include <vector>

namespace a3c {

/*
 * Turns the network's factored output into an environment call.
 *
 * The base distribution is masked down to the currently available actions and renormalized. One
 * base action is drawn from it, and every argument dimension is drawn independently from its own
 * distribution. Only the argument types declared by the chosen action make it into the call. In
 * the training samples every other argument type is overwritten with kUnusedArgument, which the
 * loss treats as "no target".
 */
class ActionCodec {
 public:
  static constexpr int kUnusedArgument = -1;

  struct Selection {
    sc2::action_index_t base_action;
    sc2::FunctionCall call;
    ArgSamples training_samples;

    // Set when the mask removed all probability mass and the base action was drawn from the
    // unmasked distribution instead.
    bool degenerate = false;
  };

  explicit ActionCodec(const sc2::ActionSpaceDescriptor& descriptor);

  /*
   * Zeroes every entry whose mask bit is clear, then rescales the survivors to sum to 1.
   *
   * If no mass survives, dist is restored to its original values and false is returned.
   */
  static bool mask_and_renormalize(Distribution& dist, const sc2::ActionMask& mask);

  Selection select(const Distribution& base_dist, const ArgDistributions& arg_dists,
                   const sc2::ActionMask& available, std::mt19937& prng) const;

  Selection select(const Distribution& base_dist, const ArgDistributions& arg_dists,
                   const std::vector<sc2::function_id_t>& available_ids,
                   std::mt19937& prng) const;

  // Throws sc2::IndexOutOfRange unless the distributions match the descriptor's shapes.
  void validate_shapes(const Distribution& base_dist, const ArgDistributions& arg_dists) const;

 private:
  const sc2::ActionSpaceDescriptor& descriptor_;
};

}  // namespace a3c
