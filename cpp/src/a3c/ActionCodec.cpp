#include "a3c/ActionCodec.hpp"

#include "sc2/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/EigenUtil.hpp"
#include "util/Random.hpp"

#include <limits>

namespace a3c {

ActionCodec::ActionCodec(const sc2::ActionSpaceDescriptor& descriptor) : descriptor_(descriptor) {}

bool ActionCodec::mask_and_renormalize(Distribution& dist, const sc2::ActionMask& mask) {
  if ((int)mask.size() != dist.size()) {
    throw sc2::IndexOutOfRange("Mask of size {} applied to distribution of size {}", mask.size(),
                               dist.size());
  }

  Distribution masked = dist;
  for (int i = 0; i < masked.size(); ++i) {
    if (!mask[i]) masked[i] = 0;
  }

  if (!eigen_util::normalize(masked, std::numeric_limits<float>::min())) return false;
  dist = masked;
  return true;
}

ActionCodec::Selection ActionCodec::select(const Distribution& base_dist,
                                           const ArgDistributions& arg_dists,
                                           const sc2::ActionMask& available,
                                           std::mt19937& prng) const {
  validate_shapes(base_dist, arg_dists);

  Selection selection;

  Distribution dist = base_dist;
  selection.degenerate = !mask_and_renormalize(dist, available);
  selection.base_action =
    util::Random::weighted_sample(prng, dist.data(), dist.data() + dist.size());
  DEBUG_ASSERT(selection.degenerate || available[selection.base_action],
               "sampled unavailable action {}", selection.base_action);

  int num_arg_types = descriptor_.num_arg_types();
  ArgSamples samples(num_arg_types);
  for (int a = 0; a < num_arg_types; ++a) {
    for (const Distribution& d : arg_dists[a]) {
      samples[a].push_back(util::Random::weighted_sample(prng, d.data(), d.data() + d.size()));
    }
  }

  const sc2::ActionSpec& spec = descriptor_.resolve(selection.base_action);
  selection.call.function = spec.id;
  std::vector<bool> used(num_arg_types, false);
  for (int a : spec.arg_types) {
    selection.call.arguments.push_back(samples[a]);
    used[a] = true;
  }

  for (int a = 0; a < num_arg_types; ++a) {
    if (used[a]) continue;
    for (int& s : samples[a]) s = kUnusedArgument;
  }
  selection.training_samples = std::move(samples);
  return selection;
}

ActionCodec::Selection ActionCodec::select(const Distribution& base_dist,
                                           const ArgDistributions& arg_dists,
                                           const std::vector<sc2::function_id_t>& available_ids,
                                           std::mt19937& prng) const {
  return select(base_dist, arg_dists, descriptor_.mask_of(available_ids), prng);
}

void ActionCodec::validate_shapes(const Distribution& base_dist,
                                  const ArgDistributions& arg_dists) const {
  if (base_dist.size() != descriptor_.action_count()) {
    throw sc2::IndexOutOfRange("Base distribution has size {} (expected {})", base_dist.size(),
                               descriptor_.action_count());
  }
  const auto& arg_types = descriptor_.arg_types();
  if (arg_dists.size() != arg_types.size()) {
    throw sc2::IndexOutOfRange("Got distributions for {} argument types (expected {})",
                               arg_dists.size(), arg_types.size());
  }
  for (size_t a = 0; a < arg_types.size(); ++a) {
    const auto& dims = arg_types[a].dims;
    if (arg_dists[a].size() != dims.size()) {
      throw sc2::IndexOutOfRange("Argument {} has {} distributions (expected {})",
                                 arg_types[a].name, arg_dists[a].size(), dims.size());
    }
    for (size_t d = 0; d < dims.size(); ++d) {
      if (arg_dists[a][d].size() != dims[d]) {
        throw sc2::IndexOutOfRange("Argument {} dim {} has size {} (expected {})",
                                   arg_types[a].name, d, arg_dists[a][d].size(), dims[d]);
      }
    }
  }
}

}  // namespace a3c
