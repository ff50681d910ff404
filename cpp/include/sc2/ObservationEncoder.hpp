#pragma once

#include "sc2/ActionSpaceDescriptor.hpp"
#include "sc2/BasicTypes.hpp"
#include "sc2/Environment.hpp"

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

#include <memory>

namespace sc2 {

// Spatial input of the network, indexed (y, x, channel).
using SpatialTensor = Eigen::Tensor<float, 3, Eigen::RowMajor>;

struct EncodedObservation {
  Eigen::VectorXf nonspatial;
  SpatialTensor screen;
  SpatialTensor minimap;
};

struct EncodedStep {
  float reward = 0;
  std::shared_ptr<const EncodedObservation> observation;
  bool terminal = false;
  ActionMask available;
};

/*
 * Per-episode running state folded into every encoded observation.
 *
 * max_units_seen() holds, per unit type, a decayed memory of the largest number of enemy units of
 * that type seen on screen: each observation multiplies the previous value by kDecay and then
 * takes the max against the fresh count.
 */
class AgentState {
 public:
  static constexpr float kDecay = 0.75f;

  // Decayed values below this snap to zero.
  static constexpr float kFloor = 1e-6f;

  explicit AgentState(const ActionSpaceDescriptor& descriptor);

  void reset();

  // Records that the given action was chosen on the current step.
  void act(action_index_t index);

  // Decay-then-max update of max_units_seen(). Index 0 (no unit) is never tracked.
  void observe_enemies(const Eigen::VectorXf& enemy_counts);

  action_index_t last_action_used() const { return last_action_used_; }
  const Eigen::VectorXf& max_units_seen() const { return max_units_seen_; }
  const Eigen::VectorXf& used_general_actions() const { return used_general_actions_; }
  const Eigen::VectorXf& used_race_actions() const { return used_race_actions_; }

 private:
  const ActionSpaceDescriptor& descriptor_;
  action_index_t last_action_used_ = 0;
  Eigen::VectorXf max_units_seen_;
  Eigen::VectorXf used_general_actions_;
  Eigen::VectorXf used_race_actions_;
};

/*
 * Converts raw observations into fixed-shape network inputs.
 *
 * The nonspatial vector is laid out as:
 *
 * [max_units_seen | general usage counts | race usage counts | availability mask |
 *  last action used | FeatureSpec::fields() in declared order]
 *
 * The network's input width depends on this order.
 */
class ObservationEncoder {
 public:
  explicit ObservationEncoder(const ActionSpaceDescriptor& descriptor);

  EncodedStep encode(const TimeStep& time_step, AgentState& state) const;

  int nonspatial_size() const { return nonspatial_size_; }

  static int nonspatial_size(const ActionSpaceDescriptor& descriptor);

  // Per unit type, the number of screen cells occupied by an enemy unit of that type. Unit types
  // outside [0, kNumUnitTypes) are ignored.
  static Eigen::VectorXf count_enemy_units(const FeatureLayers& screen);

  // (C, H, W) integer layers to (H, W, C) floats. Throws EnvironmentFailure on a channel-count
  // mismatch.
  static SpatialTensor stack_layers(const FeatureLayers& layers, int expected_channels);

 private:
  const ActionSpaceDescriptor& descriptor_;
  const int nonspatial_size_;
};

}  // namespace sc2
